// src/sensors/sensor_bank.hpp
#pragma once

#include "sensors/sensor_buffer.hpp"
#include "sensors/sensor_reading.hpp"
#include "utils/logging.hpp"
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace sensors {

using ReadingMap = std::map<std::string, SensorReading>;
using AvailabilityMap = std::map<std::string, SensorAvailability>;

/**
 * SensorBank - One rolling buffer per configured sensor
 *
 * Responsibilities:
 * - Route each cycle's raw readings into the matching buffer
 * - Produce the debounced estimate of every sensor
 * - Report per-sensor availability for the bays' recheck
 *
 * Usage:
 *   SensorBank bank(10);
 *   bank.add_sensor("range");
 *   bank.add_sensor("lat_front");
 *
 *   // Each cycle:
 *   bank.push_all(readings);
 *   auto values = bank.estimates();
 */
class SensorBank {
public:
    explicit SensorBank(size_t buffer_capacity = SensorBuffer::kDefaultCapacity)
        : buffer_capacity_(buffer_capacity)
    {}

    /**
     * add_sensor() - Register a sensor id
     * @throws std::invalid_argument on duplicate id
     */
    void add_sensor(const std::string& id) {
        if (buffers_.count(id)) {
            throw std::invalid_argument("Duplicate sensor id: " + id);
        }
        buffers_.emplace(id, SensorBuffer(buffer_capacity_));
        order_.push_back(id);
    }

    bool has_sensor(const std::string& id) const {
        return buffers_.count(id) != 0;
    }

    /**
     * push() - Append one reading. Unknown ids are logged and dropped.
     */
    void push(const std::string& id, const SensorReading& reading) {
        auto it = buffers_.find(id);
        if (it == buffers_.end()) {
            LOG_WARN("[SensorBank] Dropping reading for unknown sensor '%s'", id.c_str());
            return;
        }
        if (!reading.is_valid()) {
            LOG_DEBUG("[SensorBank] %s: %s at t=%.3f", id.c_str(),
                      to_string(reading.fault), reading.timestamp_s);
        }
        it->second.push(reading);
    }

    void push_all(const ReadingMap& readings) {
        for (const auto& [id, reading] : readings) {
            push(id, reading);
        }
    }

    /**
     * estimates() - Debounced value of every registered sensor
     */
    ReadingMap estimates() const {
        ReadingMap out;
        for (const auto& [id, buf] : buffers_) {
            out.emplace(id, buf.estimate());
        }
        return out;
    }

    /**
     * availability() - Available once a valid reading is buffered,
     * unless the sensor has been marked unavailable
     */
    AvailabilityMap availability() const {
        AvailabilityMap out;
        for (const auto& [id, buf] : buffers_) {
            const bool ok = buf.is_available() && faulted_.count(id) == 0;
            out.emplace(id, ok ? SensorAvailability::Available : SensorAvailability::Unavailable);
        }
        return out;
    }

    void mark_unavailable(const std::string& id) {
        if (!has_sensor(id)) {
            throw std::out_of_range("Unknown sensor id: " + id);
        }
        if (faulted_.insert(id).second) {
            LOG_WARN("[SensorBank] Sensor '%s' marked unavailable", id.c_str());
        }
    }

    void mark_available(const std::string& id) {
        if (faulted_.erase(id)) {
            LOG_INFO("[SensorBank] Sensor '%s' marked available", id.c_str());
        }
    }

    /**
     * buffer() - Read-only access to one sensor's history
     * @throws std::out_of_range for unknown ids
     */
    const SensorBuffer& buffer(const std::string& id) const {
        auto it = buffers_.find(id);
        if (it == buffers_.end()) {
            throw std::out_of_range("Unknown sensor id: " + id);
        }
        return it->second;
    }

    /**
     * reset() - Forget all buffered readings
     */
    void reset() {
        for (auto& [id, buf] : buffers_) {
            (void)id;
            buf.clear();
        }
    }

    // Registration order
    const std::vector<std::string>& sensor_ids() const { return order_; }

    size_t sensor_count() const { return buffers_.size(); }

private:
    size_t buffer_capacity_;
    std::map<std::string, SensorBuffer> buffers_;
    std::vector<std::string> order_;
    std::set<std::string> faulted_;
};

} // namespace sensors
