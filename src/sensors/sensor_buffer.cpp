// src/sensors/sensor_buffer.cpp
#include "sensors/sensor_buffer.hpp"

#include <stdexcept>

namespace sensors {

SensorBuffer::SensorBuffer(size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw std::invalid_argument("SensorBuffer capacity must be >= 1");
    }
}

void SensorBuffer::push(const SensorReading& reading) {
    readings_.push_back(reading);
    while (readings_.size() > capacity_) {
        readings_.pop_front();
    }
}

SensorReading SensorBuffer::estimate() const {
    // Walk newest to oldest so the first candidate with a given count is
    // already the most recent occurrence of its value.
    size_t best_count = 0;
    const SensorReading* best = nullptr;

    for (auto it = readings_.rbegin(); it != readings_.rend(); ++it) {
        if (!it->is_valid()) continue;

        // Only score each distinct value at its newest occurrence
        bool seen_newer = false;
        for (auto newer = readings_.rbegin(); newer != it; ++newer) {
            if (newer->is_valid() && newer->value->base_value() == it->value->base_value()) {
                seen_newer = true;
                break;
            }
        }
        if (seen_newer) continue;

        size_t count = 0;
        for (const auto& r : readings_) {
            if (r.is_valid() && r.value->base_value() == it->value->base_value()) {
                ++count;
            }
        }

        // Strictly greater: on a tie the newer candidate (found first) is kept
        if (count > best_count) {
            best_count = count;
            best = &*it;
        }
    }

    if (best) {
        return SensorReading::valid(*best->value, best->timestamp_s);
    }

    if (readings_.empty()) {
        return SensorReading::invalid(0.0, ReadingFault::NotRanging);
    }
    return SensorReading::invalid(readings_.back().timestamp_s, readings_.back().fault);
}

bool SensorBuffer::is_available() const {
    for (const auto& r : readings_) {
        if (r.is_valid()) return true;
    }
    return false;
}

size_t SensorBuffer::valid_count() const {
    size_t n = 0;
    for (const auto& r : readings_) {
        if (r.is_valid()) ++n;
    }
    return n;
}

} // namespace sensors
