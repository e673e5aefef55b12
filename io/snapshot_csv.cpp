#include "io/snapshot_csv.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>

#include "common/log.hpp"

namespace impactflow {

namespace {

constexpr int64_t kNanosPerMicro = 1000;

struct LevelColumns {
    int bid_px = -1;
    int bid_sz = -1;
    int ask_px = -1;
    int ask_sz = -1;
};

enum class TimestampUnit : uint8_t { MICROS, NANOS_OR_ISO };

struct CsvLayout {
    int timestamp = -1;
    TimestampUnit unit = TimestampUnit::MICROS;
    int symbol = -1;
    LevelColumns levels[kMaxLevels];
    size_t depth = 0;   // levels with all four columns present
};

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    if (e - b >= 2 && s[b] == '"' && s[e - 1] == '"') {
        ++b;
        --e;
    }
    return s.substr(b, e - b);
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) fields.push_back(trim(token));
    if (!line.empty() && line.back() == ',') fields.emplace_back();
    return fields;
}

bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parse_int64(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) return false;
    out = static_cast<int64_t>(v);
    return true;
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

/// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool read_fixed_digits(const std::string& s, size_t pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

int find_column(const std::unordered_map<std::string, int>& header, const std::string& name) {
    auto it = header.find(name);
    return it == header.end() ? -1 : it->second;
}

bool resolve_layout(const std::vector<std::string>& header_fields, CsvLayout& layout, std::string& error) {
    std::unordered_map<std::string, int> header;
    for (size_t i = 0; i < header_fields.size(); ++i) {
        header.emplace(header_fields[i], static_cast<int>(i));
    }

    if ((layout.timestamp = find_column(header, "timestamp_us")) >= 0) {
        layout.unit = TimestampUnit::MICROS;
    } else if ((layout.timestamp = find_column(header, "ts_event")) >= 0 ||
               (layout.timestamp = find_column(header, "ts_recv")) >= 0) {
        layout.unit = TimestampUnit::NANOS_OR_ISO;
    } else {
        error = "no timestamp column (timestamp_us, ts_event or ts_recv)";
        return false;
    }
    layout.symbol = find_column(header, "symbol");

    for (size_t i = 0; i < kMaxLevels; ++i) {
        char suffix[8];
        std::snprintf(suffix, sizeof(suffix), "%02zu", i);
        LevelColumns cols;
        cols.bid_px = find_column(header, std::string("bid_px_") + suffix);
        cols.bid_sz = find_column(header, std::string("bid_sz_") + suffix);
        cols.ask_px = find_column(header, std::string("ask_px_") + suffix);
        cols.ask_sz = find_column(header, std::string("ask_sz_") + suffix);

        if (cols.bid_px < 0 && cols.ask_px < 0) {
            const std::string n = std::to_string(i + 1);
            cols.bid_px = find_column(header, "bid_price_" + n);
            cols.bid_sz = find_column(header, "bid_size_" + n);
            cols.ask_px = find_column(header, "ask_price_" + n);
            cols.ask_sz = find_column(header, "ask_size_" + n);
        }

        if (cols.bid_px < 0 || cols.bid_sz < 0 || cols.ask_px < 0 || cols.ask_sz < 0) break;
        layout.levels[i] = cols;
        layout.depth = i + 1;
    }

    if (layout.depth == 0) {
        error = "no level-1 price/size columns in header";
        return false;
    }
    return true;
}

bool parse_timestamp(const std::string& field, TimestampUnit unit, int64_t& out_us) {
    if (unit == TimestampUnit::MICROS) return parse_int64(field, out_us);
    if (all_digits(field)) {
        int64_t ns = 0;
        if (!parse_int64(field, ns)) return false;
        out_us = ns / kNanosPerMicro;
        return true;
    }
    return parse_iso8601_us(field, out_us);
}

/// Walks one side of the ladder; the first empty or non-numeric cell ends it.
void read_side(const std::vector<std::string>& fields, const CsvLayout& layout, bool bid,
               std::vector<BookLevel>& side) {
    for (size_t i = 0; i < layout.depth; ++i) {
        const LevelColumns& c = layout.levels[i];
        const int px_col = bid ? c.bid_px : c.ask_px;
        const int sz_col = bid ? c.bid_sz : c.ask_sz;
        BookLevel lvl{};
        if (!parse_double(fields[static_cast<size_t>(px_col)], lvl.price) ||
            !parse_double(fields[static_cast<size_t>(sz_col)], lvl.size)) {
            break;
        }
        side.push_back(lvl);
    }
}

} // namespace

bool parse_iso8601_us(const std::string& text, int64_t& out_us) {
    // YYYY-MM-DDTHH:MM:SS
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (text.size() < 19) return false;
    if (!read_fixed_digits(text, 0, 4, year) || text[4] != '-' ||
        !read_fixed_digits(text, 5, 2, month) || text[7] != '-' ||
        !read_fixed_digits(text, 8, 2, day) || (text[10] != 'T' && text[10] != ' ') ||
        !read_fixed_digits(text, 11, 2, hour) || text[13] != ':' ||
        !read_fixed_digits(text, 14, 2, minute) || text[16] != ':' ||
        !read_fixed_digits(text, 17, 2, second)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    size_t pos = 19;
    int64_t micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) micros = micros * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return false;
        for (int d = digits; d < 6; ++d) micros *= 10;
    }

    const std::string zone = text.substr(pos);
    if (!zone.empty() && zone != "Z" && zone != "+00:00" && zone != "UTC") return false;

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
    out_us = seconds * 1'000'000 + micros;
    return true;
}

bool read_snapshot_csv(std::istream& in,
                       const std::string& symbol,
                       std::vector<BookSnapshot>& out,
                       CsvLoadStats& stats,
                       std::string& error) {
    std::string line;
    if (!std::getline(in, line)) {
        error = "empty input";
        return false;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    CsvLayout layout;
    if (!resolve_layout(split_fields(line), layout, error)) return false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        ++stats.rows_read;

        const std::vector<std::string> fields = split_fields(line);
        BookSnapshot snap;
        bool ok = true;

        // every referenced column must exist on this row
        auto has = [&](int col) { return col >= 0 && static_cast<size_t>(col) < fields.size(); };
        if (!has(layout.timestamp) || (layout.symbol >= 0 && !has(layout.symbol))) ok = false;
        for (size_t i = 0; ok && i < layout.depth; ++i) {
            const LevelColumns& c = layout.levels[i];
            ok = has(c.bid_px) && has(c.bid_sz) && has(c.ask_px) && has(c.ask_sz);
        }
        if (ok) {
            ok = parse_timestamp(fields[static_cast<size_t>(layout.timestamp)], layout.unit, snap.timestamp_us);
        }
        if (!ok) {
            ++stats.rows_skipped;
            continue;
        }

        if (layout.symbol >= 0) {
            const std::string& source = fields[static_cast<size_t>(layout.symbol)];
            if (!source.empty()) {
                if (stats.source_symbol.empty()) {
                    stats.source_symbol = source;
                } else if (source != stats.source_symbol) {
                    error = "rows for more than one symbol (" + stats.source_symbol + ", " + source + ")";
                    return false;
                }
            }
        }
        snap.symbol = symbol;
        read_side(fields, layout, true, snap.bids);
        read_side(fields, layout, false, snap.asks);

        out.push_back(std::move(snap));
        ++stats.rows_loaded;
    }

    if (stats.rows_skipped > 0) {
        log_warn("SnapshotCsv", "%s: skipped %zu malformed row(s) of %zu",
                 symbol.c_str(), stats.rows_skipped, stats.rows_read);
    }
    if (!stats.source_symbol.empty() && stats.source_symbol != symbol) {
        log_info("SnapshotCsv", "%s: symbol column reads %s, rows kept as %s",
                 symbol.c_str(), stats.source_symbol.c_str(), symbol.c_str());
    }
    return true;
}

bool load_snapshot_csv(const std::string& path,
                       std::vector<BookSnapshot>& out,
                       CsvLoadStats& stats,
                       std::string& error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error = "cannot open " + path;
        return false;
    }
    const std::string stem = std::filesystem::path(path).stem().string();
    if (!read_snapshot_csv(in, stem, out, stats, error)) {
        error = path + ": " + error;
        return false;
    }
    log_info("SnapshotCsv", "loaded %zu snapshot(s) from %s", stats.rows_loaded, path.c_str());
    return true;
}

} // namespace impactflow
