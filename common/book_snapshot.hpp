#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace impactflow {

/// Depth tracked by every OFI computation: level 1 (best) .. level 5.
constexpr size_t kMaxLevels = 5;

struct BookLevel {
    double price;
    double size;
};

/// One L2 book state for a symbol, bids and asks ranked best-to-worst.
/// Only the first kMaxLevels entries of each side are consumed.
struct BookSnapshot {
    std::string symbol;
    int64_t timestamp_us = 0;
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;

    bool has_top() const { return !bids.empty() && !asks.empty(); }

    double best_bid() const { return bids.empty() ? 0.0 : bids.front().price; }
    double best_ask() const { return asks.empty() ? 0.0 : asks.front().price; }

    /// (best_bid + best_ask) / 2; only meaningful when has_top().
    double mid_price() const { return 0.5 * (best_bid() + best_ask()); }

    size_t bid_depth() const { return bids.size() < kMaxLevels ? bids.size() : kMaxLevels; }
    size_t ask_depth() const { return asks.size() < kMaxLevels ? asks.size() : kMaxLevels; }

    /// Bid prices non-increasing and ask prices non-decreasing down the ladder.
    bool ladders_ordered() const {
        for (size_t i = 1; i < bid_depth(); ++i)
            if (bids[i].price > bids[i - 1].price) return false;
        for (size_t i = 1; i < ask_depth(); ++i)
            if (asks[i].price < asks[i - 1].price) return false;
        return true;
    }
};

} // namespace impactflow
