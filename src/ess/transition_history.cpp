// src/ess/transition_history.cpp
#include "ess/transition_history.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace ess {

TransitionHistory::TransitionHistory(size_t capacity)
    : buffer_(capacity == 0 ? 1 : capacity) {}

const std::vector<std::string>& TransitionHistory::column_names() {
    static const std::vector<std::string> names = {
        "time_hours", "current_a", "voltage_v", "soc",
        "soe", "power_kw", "internal_energy_change", "soh"
    };
    return names;
}

std::vector<double> TransitionHistory::to_row(const HistoryRecord& rec) {
    return {rec.time_hours, rec.current_a, rec.voltage_v, rec.soc,
            rec.soe, rec.power_kw, rec.internal_energy_change, rec.soh};
}

void TransitionHistory::append(const HistoryRecord& rec) {
    buffer_[head_] = rec;
    head_ = (head_ + 1) % buffer_.size();
    if (size_ < buffer_.size()) {
        ++size_;
    }
    ++total_;

    if (stream_ && stream_->is_open()) {
        stream_->write_row(to_row(rec));
    }
}

std::vector<HistoryRecord> TransitionHistory::records() const {
    std::vector<HistoryRecord> out;
    out.reserve(size_);
    const size_t start = (head_ + buffer_.size() - size_) % buffer_.size();
    for (size_t i = 0; i < size_; ++i) {
        out.push_back(buffer_[(start + i) % buffer_.size()]);
    }
    return out;
}

const HistoryRecord& TransitionHistory::back() const {
    if (size_ == 0) {
        throw std::out_of_range("TransitionHistory::back() on empty history");
    }
    return buffer_[(head_ + buffer_.size() - 1) % buffer_.size()];
}

void TransitionHistory::clear() {
    head_ = 0;
    size_ = 0;
    total_ = 0;
}

bool TransitionHistory::open_stream(const std::string& path) {
    auto writer = std::make_unique<utils::CsvWriter>();
    if (!writer->open(path, column_names())) {
        MGSIM_LOG_ERROR("[TransitionHistory] Cannot open stream file: %s", path.c_str());
        return false;
    }
    stream_ = std::move(writer);
    MGSIM_LOG_INFO("[TransitionHistory] Streaming records to %s", path.c_str());
    return true;
}

void TransitionHistory::close_stream() {
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
}

void TransitionHistory::write_csv(const std::string& path) const {
    utils::CsvWriter writer;
    if (!writer.open(path, column_names())) {
        throw std::runtime_error("[TransitionHistory] Cannot write CSV: " + path);
    }
    for (const auto& rec : records()) {
        writer.write_row(to_row(rec));
    }
    writer.close();
    MGSIM_LOG_INFO("[TransitionHistory] Wrote %zu records to %s", size_, path.c_str());
}

void TransitionHistory::write_json(const std::string& path) const {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("[TransitionHistory] Cannot write JSON: " + path);
    }

    const auto& names = column_names();
    out << std::setprecision(10);
    out << "[\n";
    const auto recs = records();
    for (size_t r = 0; r < recs.size(); ++r) {
        const auto row = to_row(recs[r]);
        out << "  {";
        for (size_t c = 0; c < names.size(); ++c) {
            if (c) out << ", ";
            out << '"' << names[c] << "\": ";
            // JSON has no NaN/Inf
            if (std::isfinite(row[c])) {
                out << row[c];
            } else {
                out << "null";
            }
        }
        out << (r + 1 < recs.size() ? "},\n" : "}\n");
    }
    out << "]\n";

    if (!out.good()) {
        throw std::runtime_error("[TransitionHistory] Write failed: " + path);
    }
    MGSIM_LOG_INFO("[TransitionHistory] Wrote %zu records to %s", recs.size(), path.c_str());
}

} // namespace ess
