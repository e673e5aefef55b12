#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "common/book_snapshot.hpp"

namespace impactflow {

struct CsvLoadStats {
    size_t rows_read = 0;
    size_t rows_loaded = 0;
    size_t rows_skipped = 0;   // unparsable timestamp or wrong field count
    std::string source_symbol; // value of the symbol column, if the file has one
};

/// Reads a header-described L2 snapshot CSV into BookSnapshots.
///
/// Level columns are looked up by name, either Databento MBP-10
/// (bid_px_00 .. ask_sz_04) or bid_price_1 .. ask_size_5. The timestamp comes
/// from timestamp_us, else ts_event, else ts_recv (integer ns or ISO-8601).
/// Every row is labelled with symbol. A symbol column is only checked: a file
/// mixing instruments is rejected.
/// Returns false when the header is unusable or the file holds several symbols.
bool read_snapshot_csv(std::istream& in,
                       const std::string& symbol,
                       std::vector<BookSnapshot>& out,
                       CsvLoadStats& stats,
                       std::string& error);

/// Opens path and reads it; the file stem is the symbol.
bool load_snapshot_csv(const std::string& path,
                       std::vector<BookSnapshot>& out,
                       CsvLoadStats& stats,
                       std::string& error);

/// "2024-01-02T14:30:00.123456789Z" -> microseconds since the Unix epoch (UTC).
bool parse_iso8601_us(const std::string& text, int64_t& out_us);

} // namespace impactflow
