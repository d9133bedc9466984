// src/ess/transition_history.hpp
#pragma once

#include "ess/battery_state.hpp"
#include "utils/csv.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace ess {

/**
 * TransitionHistory - Caller-owned, size-capped diagnostic history
 *
 * Keeps the most recent `capacity` records in a ring buffer. When a stream
 * file is attached every record is also appended to it as it arrives, so a
 * long run can be exported in full while memory stays bounded.
 *
 * Column/key names are stable:
 *   time_hours,current_a,voltage_v,soc,soe,power_kw,internal_energy_change,soh
 */
class TransitionHistory {
public:
    static constexpr size_t kDefaultCapacity = 100000;

    explicit TransitionHistory(size_t capacity = kDefaultCapacity);

    void append(const HistoryRecord& rec);

    // Oldest first.
    std::vector<HistoryRecord> records() const;

    size_t size() const { return size_; }
    size_t capacity() const { return buffer_.size(); }
    size_t total_appended() const { return total_; }
    bool empty() const { return size_ == 0; }
    const HistoryRecord& back() const;

    void clear();

    /**
     * Stream every subsequent record to a CSV file.
     * @return false if the file cannot be opened
     */
    bool open_stream(const std::string& path);
    void close_stream();

    /**
     * Export the retained records.
     * @throws std::runtime_error if the file cannot be written
     */
    void write_csv(const std::string& path) const;
    void write_json(const std::string& path) const;

    static const std::vector<std::string>& column_names();

private:
    static std::vector<double> to_row(const HistoryRecord& rec);

    std::vector<HistoryRecord> buffer_;
    size_t head_ = 0;    // next write position
    size_t size_ = 0;
    size_t total_ = 0;
    std::unique_ptr<utils::CsvWriter> stream_;
};

} // namespace ess
