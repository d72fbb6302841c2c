// src/sensors/sensor_base.hpp
#pragma once

#include "sensors/sensor_reading.hpp"
#include <map>
#include <optional>
#include <string>

namespace sensors {

/**
 * GroundTruth - True distances seen by each sensor at one instant
 *
 * Produced by a scenario (Lua script or built-in profile). A missing or
 * empty entry means nothing is in front of that sensor.
 */
struct GroundTruth {
    double t_s = 0.0;
    std::map<std::string, std::optional<double>> distance_cm;

    std::optional<double> distance_for(const std::string& sensor_id) const {
        auto it = distance_cm.find(sensor_id);
        if (it == distance_cm.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * SensorBase - Abstract interface for simulated range sensors
 *
 * All sensors follow this lifecycle:
 * 1. Construction with parameters
 * 2. step(t, truth) → samples the ground truth, applies noise
 * 3. get_output() → returns the latest reading (valid or invalid)
 */
class SensorBase {
public:
    virtual ~SensorBase() = default;

    /**
     * Sample the scenario's ground truth
     *
     * @param t Current time (seconds)
     * @param truth Ground truth distances
     * @param dt Timestep (seconds)
     */
    virtual void step(double t, const GroundTruth& truth, double dt) = 0;

    /**
     * Latest reading
     */
    virtual SensorReading get_output() const = 0;

    /**
     * Reset sensor to initial state
     */
    virtual void reset() = 0;

    /**
     * Sensor id (matches the configuration)
     */
    virtual std::string name() const = 0;

    /**
     * Check if the latest reading carries a value
     */
    virtual bool is_valid() const { return get_output().is_valid(); }
};

} // namespace sensors
