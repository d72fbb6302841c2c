// src/sensors/sensor_reading.hpp
#pragma once

#include "units/quantity.hpp"
#include <optional>
#include <string>

namespace sensors {

/**
 * ReadingFault - Why a reading carries no value
 *
 * None is only used by valid readings.
 */
enum class ReadingFault {
    None,
    Timeout,      // sensor not ready / no data this cycle
    Fault,        // hardware or bus error
    OutOfRange,   // beyond the sensor's physical detection distance
    NotRanging    // sensor idle, or no data buffered at all
};

enum class SensorAvailability {
    Available,
    Unavailable
};

inline const char* to_string(ReadingFault f) {
    switch (f) {
        case ReadingFault::None:       return "none";
        case ReadingFault::Timeout:    return "timeout";
        case ReadingFault::Fault:      return "fault";
        case ReadingFault::OutOfRange: return "out_of_range";
        case ReadingFault::NotRanging: return "not_ranging";
    }
    return "unknown";
}

inline const char* to_string(SensorAvailability a) {
    return a == SensorAvailability::Available ? "available" : "unavailable";
}

/**
 * SensorReading - One polling-cycle result for one sensor
 *
 * An invalid reading has no value. There is no sentinel distance.
 */
struct SensorReading {
    std::optional<units::Quantity> value;
    double timestamp_s = 0.0;
    ReadingFault fault = ReadingFault::NotRanging;

    static SensorReading valid(const units::Quantity& q, double t_s) {
        SensorReading r;
        r.value = q;
        r.timestamp_s = t_s;
        r.fault = ReadingFault::None;
        return r;
    }

    static SensorReading invalid(double t_s, ReadingFault why = ReadingFault::Timeout) {
        SensorReading r;
        r.timestamp_s = t_s;
        r.fault = (why == ReadingFault::None) ? ReadingFault::Fault : why;
        return r;
    }

    bool is_valid() const { return value.has_value(); }

    std::string describe() const {
        return value ? value->to_string() : std::string("invalid (") + to_string(fault) + ")";
    }
};

} // namespace sensors
