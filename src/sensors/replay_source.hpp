// src/sensors/replay_source.hpp
#pragma once

#include "sensors/sensor_reading.hpp"
#include <string>
#include <utility>
#include <vector>

namespace sensors {

// One recorded reading
struct ReplayRow {
    double t_s = 0.0;
    std::string sensor_id;
    SensorReading reading;
};

/**
 * ReplaySource - Feeds recorded sensor logs back through the core
 *
 * CSV columns (header required, case-insensitive):
 *   t_s,sensor_id,value,unit[,fault]
 *
 * An empty value is an invalid reading; the optional fault column names why
 * (timeout, fault, out_of_range, not_ranging). Rows are replayed in time order.
 */
class ReplaySource {
public:
    /**
     * load() - Read the whole log
     * @return false if the file cannot be opened, lacks required columns,
     *         or names an unknown unit
     */
    bool load(const std::string& csv_path);

    /**
     * poll() - Every not-yet-replayed row with t_s <= t, in time order
     */
    std::vector<std::pair<std::string, SensorReading>> poll(double t);

    void rewind() { next_ = 0; }

    bool finished() const { return next_ >= rows_.size(); }
    double end_time() const { return rows_.empty() ? 0.0 : rows_.back().t_s; }
    size_t row_count() const { return rows_.size(); }
    size_t skipped_rows() const { return skipped_; }

    static ReadingFault parse_fault(const std::string& s);

private:
    std::vector<ReplayRow> rows_;
    size_t next_ = 0;
    size_t skipped_ = 0;
};

} // namespace sensors
