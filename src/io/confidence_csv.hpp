#pragma once

#include "io/bar_csv.hpp"
#include "models/confidence_model.hpp"
#include "time_utils.hpp"

#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Confidence CSV - symbol,timestamp,confidence
//
// Values are loaded as given; out-of-range or NaN scores are rejected later
// by the simulator with a skip reason rather than here.
// ---------------------------------------------------------------------------
inline ConfidenceTable read_confidence_csv(std::istream& in) {
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!csv_io::blank_line(line)) break;
    }
    if (csv_io::blank_line(line)) throw std::invalid_argument("Confidence CSV is empty");

    csv_io::HeaderIndex header(csv_io::split_line(line));
    const int c_sym = header.require("symbol");
    const int c_ts = header.require("timestamp");
    const int c_conf = header.require("confidence");

    ConfidenceTable table;
    while (std::getline(in, line)) {
        ++line_no;
        if (csv_io::blank_line(line)) continue;
        auto cols = csv_io::split_line(line);

        const auto& symbol = csv_io::field(cols, c_sym, "symbol", line_no);
        uint64_t ts = 0;
        try {
            ts = time_utils::parse_timestamp(csv_io::field(cols, c_ts, "timestamp", line_no));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("Line " + std::to_string(line_no) + ": " + e.what());
        }
        double c = csv_io::parse_double(csv_io::field(cols, c_conf, "confidence", line_no),
                                        "confidence", line_no);
        table.set(symbol, ts, c);
    }
    return table;
}

inline ConfidenceTable read_confidence_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    return read_confidence_csv(file);
}
