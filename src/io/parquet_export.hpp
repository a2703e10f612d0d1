#pragma once

#include "backtest/trade_record.hpp"
#include "labeling/label_engine.hpp"
#include "time_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace parquet_io {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Arrow error (" + what + "): " + status.ToString());
    }
}

// Column-at-a-time table assembly: each add_* appends one field and its array.
class TableBuilder {
public:
    void add_int64(const std::string& name, const std::vector<int64_t>& values) {
        arrow::Int64Builder b;
        check(b.AppendValues(values), name);
        finish(b, arrow::field(name, arrow::int64()));
    }

    void add_double(const std::string& name, const std::vector<double>& values) {
        arrow::DoubleBuilder b;
        check(b.AppendValues(values), name);
        finish(b, arrow::field(name, arrow::float64()));
    }

    void add_string(const std::string& name, const std::vector<std::string>& values) {
        arrow::StringBuilder b;
        check(b.AppendValues(values), name);
        finish(b, arrow::field(name, arrow::utf8()));
    }

    void add_bool(const std::string& name, const std::vector<bool>& values) {
        arrow::BooleanBuilder b;
        for (bool v : values) check(b.Append(v), name);
        finish(b, arrow::field(name, arrow::boolean()));
    }

    std::shared_ptr<arrow::Table> table() const {
        return arrow::Table::Make(arrow::schema(fields_), arrays_);
    }

private:
    arrow::FieldVector fields_;
    std::vector<std::shared_ptr<arrow::Array>> arrays_;

    void finish(arrow::ArrayBuilder& b, std::shared_ptr<arrow::Field> field) {
        std::shared_ptr<arrow::Array> arr;
        check(b.Finish(&arr), field->name());
        fields_.push_back(std::move(field));
        arrays_.push_back(std::move(arr));
    }
};

// Write with ZSTD compression, one row group.
inline void write_table(const arrow::Table& table, const std::string& path) {
    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(table.num_rows(), 1);
    check(parquet::arrow::WriteTable(table, arrow::default_memory_pool(), outfile,
                                     chunk, props),
          "write " + path);
    check(outfile->Close(), "close " + path);
}

}  // namespace parquet_io

// ---------------------------------------------------------------------------
// Labeled rows → Parquet (dataset-assembly input)
// ---------------------------------------------------------------------------
inline std::shared_ptr<arrow::Table> labels_table(const std::vector<LabeledRow>& rows) {
    std::vector<std::string> symbol, date, vol_class, trend_class, state, exit_type;
    std::vector<int64_t> ts, breakout, consolidation, horizon, label, decided_offset;
    std::vector<double> open, high, low, close, atr, adx, vol_ratio, fast_slope,
        slow_slope, bb_width_atr, tp_mult, sl_mult, long_tp, long_sl, short_tp, short_sl;

    for (const auto& r : rows) {
        symbol.push_back(r.symbol);
        date.push_back(time_utils::format_date(r.bar.timestamp));
        ts.push_back(static_cast<int64_t>(r.bar.timestamp));
        open.push_back(r.bar.open);
        high.push_back(r.bar.high);
        low.push_back(r.bar.low);
        close.push_back(r.bar.close);
        atr.push_back(r.bar.atr);
        adx.push_back(r.bar.adx);
        vol_ratio.push_back(r.regime.vol_ratio);
        vol_class.push_back(regime::to_string(r.regime.vol_class));
        trend_class.push_back(regime::to_string(r.regime.trend_class));
        fast_slope.push_back(r.regime.fast_slope);
        slow_slope.push_back(r.regime.slow_slope);
        bb_width_atr.push_back(r.regime.bb_width_atr);
        breakout.push_back(r.regime.breakout);
        state.push_back(regime::to_string(r.regime.market_state));
        consolidation.push_back(r.regime.consolidation_days);
        tp_mult.push_back(r.label.tp_mult);
        sl_mult.push_back(r.label.sl_mult);
        horizon.push_back(r.label.horizon);
        long_tp.push_back(r.label.long_tp);
        long_sl.push_back(r.label.long_sl);
        short_tp.push_back(r.label.short_tp);
        short_sl.push_back(r.label.short_sl);
        label.push_back(to_int(r.label.outcome));
        exit_type.push_back(r.label.exit_type);
        decided_offset.push_back(r.label.decided_idx - r.label.origin_idx);
    }

    parquet_io::TableBuilder t;
    t.add_string("symbol", symbol);
    t.add_string("date", date);
    t.add_int64("timestamp", ts);
    t.add_double("open", open);
    t.add_double("high", high);
    t.add_double("low", low);
    t.add_double("close", close);
    t.add_double("atr", atr);
    t.add_double("adx", adx);
    t.add_double("vol_ratio", vol_ratio);
    t.add_string("vol_class", vol_class);
    t.add_string("trend_class", trend_class);
    t.add_double("fast_slope", fast_slope);
    t.add_double("slow_slope", slow_slope);
    t.add_double("bb_width_atr", bb_width_atr);
    t.add_int64("breakout", breakout);
    t.add_string("market_state", state);
    t.add_int64("consolidation_days", consolidation);
    t.add_double("tp_mult", tp_mult);
    t.add_double("sl_mult", sl_mult);
    t.add_int64("horizon", horizon);
    t.add_double("long_tp", long_tp);
    t.add_double("long_sl", long_sl);
    t.add_double("short_tp", short_tp);
    t.add_double("short_sl", short_sl);
    t.add_int64("label", label);
    t.add_string("exit_type", exit_type);
    t.add_int64("decided_offset", decided_offset);
    return t.table();
}

// ---------------------------------------------------------------------------
// Trade log → Parquet
// ---------------------------------------------------------------------------
inline std::shared_ptr<arrow::Table> trades_table(const std::vector<TradeRecord>& trades) {
    std::vector<std::string> symbol;
    std::vector<int64_t> ts, direction, label;
    std::vector<bool> win;
    std::vector<double> confidence, entry, tp, sl, r, risk, size, pnl, eq_before, eq_after;

    for (const auto& tr : trades) {
        symbol.push_back(tr.symbol);
        ts.push_back(static_cast<int64_t>(tr.open_ts));
        direction.push_back(tr.direction);
        confidence.push_back(tr.confidence);
        entry.push_back(tr.entry_price);
        tp.push_back(tr.tp_price);
        sl.push_back(tr.sl_price);
        label.push_back(to_int(tr.label_outcome));
        win.push_back(tr.win);
        r.push_back(tr.r_multiple);
        risk.push_back(tr.risk_amount);
        size.push_back(tr.position_size);
        pnl.push_back(tr.pnl);
        eq_before.push_back(tr.equity_before);
        eq_after.push_back(tr.equity_after);
    }

    parquet_io::TableBuilder t;
    t.add_string("symbol", symbol);
    t.add_int64("timestamp", ts);
    t.add_int64("direction", direction);
    t.add_double("confidence", confidence);
    t.add_double("entry_price", entry);
    t.add_double("tp_price", tp);
    t.add_double("sl_price", sl);
    t.add_int64("label", label);
    t.add_bool("win", win);
    t.add_double("r_multiple", r);
    t.add_double("risk_amount", risk);
    t.add_double("position_size", size);
    t.add_double("pnl", pnl);
    t.add_double("equity_before", eq_before);
    t.add_double("equity_after", eq_after);
    return t.table();
}

inline void write_labels_parquet(const std::string& path, const std::vector<LabeledRow>& rows) {
    parquet_io::write_table(*labels_table(rows), path);
}

inline void write_trades_parquet(const std::string& path,
                                 const std::vector<TradeRecord>& trades) {
    parquet_io::write_table(*trades_table(trades), path);
}
