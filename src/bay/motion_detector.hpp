// src/bay/motion_detector.hpp
#pragma once

#include "bay/bay_status.hpp"
#include "sensors/sensor_buffer.hpp"
#include "units/quantity.hpp"
#include <optional>

namespace bay {

struct MotionEstimate {
    Motion motion = Motion::Unknown;
    std::optional<units::Quantity> net_displacement;   // newest - oldest, negative = closer
    std::optional<units::Quantity> speed;              // |net| per second
};

/**
 * MotionDetector - Vehicle movement from the range sensor's history
 *
 * Compares the oldest and newest valid readings in the buffer. Displacement
 * within the margin is treated as sensor wobble.
 */
class MotionDetector {
public:
    explicit MotionDetector(units::Quantity margin = units::cm(2.0))
        : margin_(margin.abs())
    {}

    MotionEstimate evaluate(const sensors::SensorBuffer& history) const {
        MotionEstimate out;

        const sensors::SensorReading* oldest = nullptr;
        const sensors::SensorReading* newest = nullptr;
        for (const auto& r : history.readings()) {
            if (!r.is_valid() || r.value->dimension() != units::Dimension::Distance) continue;
            if (!oldest) oldest = &r;
            newest = &r;
        }

        // Need two distinct valid points
        if (!oldest || oldest == newest) {
            return out;
        }

        const units::Quantity net = *newest->value - *oldest->value;
        out.net_displacement = net;

        const double dt = newest->timestamp_s - oldest->timestamp_s;
        if (dt > 0.0) {
            out.speed = net.abs() / dt;
        }

        if (net.abs() <= margin_) {
            out.motion = Motion::Still;
        } else if (net.base_value() < 0.0) {
            out.motion = Motion::Approaching;
        } else {
            out.motion = Motion::Receding;
        }
        return out;
    }

    const units::Quantity& margin() const { return margin_; }

private:
    units::Quantity margin_;
};

} // namespace bay
