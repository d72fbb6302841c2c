// src/sensors/sensor_buffer.hpp
#pragma once

#include "sensors/sensor_reading.hpp"
#include <cstddef>
#include <deque>

namespace sensors {

/**
 * SensorBuffer - Rolling window of the most recent readings for one sensor
 *
 * The debounced estimate is the statistical mode of the valid values in the
 * window. When several values share the highest count, the one seen most
 * recently wins.
 *
 * Single writer, single reader. Not internally synchronized.
 */
class SensorBuffer {
public:
    static constexpr size_t kDefaultCapacity = 10;

    /**
     * @throws std::invalid_argument if capacity is zero
     */
    explicit SensorBuffer(size_t capacity = kDefaultCapacity);

    /**
     * push() - Append a reading, evicting the oldest entry when full
     */
    void push(const SensorReading& reading);

    /**
     * estimate() - Mode of the buffered valid values
     *
     * Returns an invalid reading when no valid value is buffered. A valid
     * result carries the timestamp of the newest occurrence of the mode value.
     */
    SensorReading estimate() const;

    /**
     * is_available() - At least one valid reading buffered
     */
    bool is_available() const;

    size_t valid_count() const;

    const SensorReading* latest() const {
        return readings_.empty() ? nullptr : &readings_.back();
    }

    // Oldest first
    const std::deque<SensorReading>& readings() const { return readings_; }

    size_t size() const { return readings_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return readings_.empty(); }
    void clear() { readings_.clear(); }

private:
    size_t capacity_;
    std::deque<SensorReading> readings_;
};

} // namespace sensors
