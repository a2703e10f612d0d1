#pragma once

#include "bars/price_bar.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <fstream>
#include <istream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace csv_io {

// Split one CSV line on commas, dropping trailing CR/LF and surrounding
// blanks of each field. No quoting support.
inline std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> cols;
    std::istringstream ss(line);
    std::string col;
    while (std::getline(ss, col, ',')) {
        while (!col.empty() && (col.back() == '\r' || col.back() == '\n' ||
                                col.back() == ' '))
            col.pop_back();
        size_t start = col.find_first_not_of(' ');
        cols.push_back(start == std::string::npos ? std::string() : col.substr(start));
    }
    if (!line.empty() && line.back() == ',') cols.emplace_back();
    return cols;
}

inline bool blank_line(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Column name -> position. Throws when a required column is missing.
class HeaderIndex {
public:
    explicit HeaderIndex(const std::vector<std::string>& header) {
        for (size_t i = 0; i < header.size(); ++i) index_[header[i]] = static_cast<int>(i);
    }

    int find(const std::string& name) const {
        auto it = index_.find(name);
        return it == index_.end() ? -1 : it->second;
    }

    int require(const std::string& name) const {
        int i = find(name);
        if (i < 0) throw std::invalid_argument("Missing CSV column: " + name);
        return i;
    }

private:
    std::map<std::string, int> index_;
};

inline double parse_double(const std::string& s, const std::string& what, int line_no) {
    if (s == "NaN" || s == "nan") return std::numeric_limits<double>::quiet_NaN();
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != s.size()) {
        throw std::invalid_argument("Line " + std::to_string(line_no) + ": bad " + what +
                                    " value '" + s + "'");
    }
    return v;
}

inline const std::string& field(const std::vector<std::string>& cols, int idx,
                                const std::string& what, int line_no) {
    if (idx < 0 || idx >= static_cast<int>(cols.size())) {
        throw std::invalid_argument("Line " + std::to_string(line_no) + ": missing " + what);
    }
    return cols[idx];
}

}  // namespace csv_io

// ---------------------------------------------------------------------------
// Bar CSV - symbol,timestamp,open,high,low,close[,atr,adx,sma_fast,sma_slow,bb_width]
//
// Timestamps are YYYY-MM-DD or integer epoch nanoseconds. Absent or empty
// indicator fields load as NaN. Series are returned ordered by symbol, bars
// in file order; ordering is checked later by validate_series().
// ---------------------------------------------------------------------------
inline std::vector<SymbolSeries> read_bar_csv(std::istream& in) {
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!csv_io::blank_line(line)) break;
    }
    if (csv_io::blank_line(line)) throw std::invalid_argument("Bar CSV is empty");

    csv_io::HeaderIndex header(csv_io::split_line(line));
    const int c_sym = header.require("symbol");
    const int c_ts = header.require("timestamp");
    const int c_open = header.require("open");
    const int c_high = header.require("high");
    const int c_low = header.require("low");
    const int c_close = header.require("close");
    const int c_atr = header.find("atr");
    const int c_adx = header.find("adx");
    const int c_fast = header.find("sma_fast");
    const int c_slow = header.find("sma_slow");
    const int c_bbw = header.find("bb_width");

    auto optional_col = [&](const std::vector<std::string>& cols, int idx,
                            const char* name) {
        if (idx < 0 || idx >= static_cast<int>(cols.size()) || cols[idx].empty()) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return csv_io::parse_double(cols[idx], name, line_no);
    };

    std::map<std::string, SymbolSeries> by_symbol;
    while (std::getline(in, line)) {
        ++line_no;
        if (csv_io::blank_line(line)) continue;
        auto cols = csv_io::split_line(line);

        const auto& symbol = csv_io::field(cols, c_sym, "symbol", line_no);
        PriceBar bar;
        try {
            bar.timestamp = time_utils::parse_timestamp(
                csv_io::field(cols, c_ts, "timestamp", line_no));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("Line " + std::to_string(line_no) + ": " + e.what());
        }
        bar.open = csv_io::parse_double(csv_io::field(cols, c_open, "open", line_no), "open", line_no);
        bar.high = csv_io::parse_double(csv_io::field(cols, c_high, "high", line_no), "high", line_no);
        bar.low = csv_io::parse_double(csv_io::field(cols, c_low, "low", line_no), "low", line_no);
        bar.close = csv_io::parse_double(csv_io::field(cols, c_close, "close", line_no), "close", line_no);
        bar.atr = optional_col(cols, c_atr, "atr");
        bar.adx = optional_col(cols, c_adx, "adx");
        bar.sma_fast = optional_col(cols, c_fast, "sma_fast");
        bar.sma_slow = optional_col(cols, c_slow, "sma_slow");
        bar.bb_width = optional_col(cols, c_bbw, "bb_width");

        auto& series = by_symbol[symbol];
        series.symbol = symbol;
        series.bars.push_back(bar);
    }

    std::vector<SymbolSeries> universe;
    universe.reserve(by_symbol.size());
    for (auto& [symbol, series] : by_symbol) universe.push_back(std::move(series));
    return universe;
}

inline std::vector<SymbolSeries> read_bar_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    return read_bar_csv(file);
}
