// src/sensors/synthetic_sensor.hpp
#pragma once

#include "sensors/sensor_base.hpp"
#include "sensors/sensor_reading.hpp"
#include "units/quantity.hpp"
#include "utils/noise.hpp"
#include <string>

namespace sensors {

struct SyntheticSensorParams {
    std::string id;
    units::Unit unit = units::Unit::Centimeter;    // unit readings are reported in
    double max_range_cm = 400.0;                   // beyond this → OutOfRange
    double noise_stddev_cm = 0.5;
    double quantization_cm = 1.0;                  // ranging resolution
    double dropout_rate = 0.0;                     // probability of a Timeout per sample
    double update_hz = 0.0;                        // 0 = sample every step
    uint64_t random_seed = 0;
};

/**
 * Simulated time-of-flight range sensor
 *
 * Samples a ground-truth distance, adds Gaussian noise, quantizes to the
 * ranging resolution and reports in its configured unit. Between samples
 * (finite update rate) the sensor reports Timeout, like a sensor whose data
 * ready interrupt has not fired yet.
 */
class SyntheticRangeSensor : public SensorBase {
public:
    explicit SyntheticRangeSensor(const SyntheticSensorParams& params)
        : params_(params)
        , range_noise_(params.random_seed)
        , dropout_noise_(params.random_seed ? params.random_seed + 1 : 0)
        , quantizer_(params.quantization_cm)
        , rate_limiter_(params.update_hz)
    {
        reset();
    }

    void step(double t, const GroundTruth& truth, double dt) override {
        (void)dt; // Unused parameter

        if (!rate_limiter_.due(t)) {
            out_ = SensorReading::invalid(t, ReadingFault::Timeout);
            return;
        }

        if (dropout_noise_.chance(params_.dropout_rate)) {
            out_ = SensorReading::invalid(t, ReadingFault::Timeout);
            return;
        }

        auto target = truth.distance_for(params_.id);
        if (!target) {
            // Nothing to reflect off within the sensor's field of view
            out_ = SensorReading::invalid(t, ReadingFault::OutOfRange);
            return;
        }

        double measured_cm = *target + range_noise_.gaussian(params_.noise_stddev_cm);
        measured_cm = quantizer_.quantize(measured_cm);

        if (measured_cm > params_.max_range_cm) {
            out_ = SensorReading::invalid(t, ReadingFault::OutOfRange);
            return;
        }
        if (measured_cm < 0.0) {
            measured_cm = 0.0;
        }

        out_ = SensorReading::valid(units::cm(measured_cm).convert(params_.unit), t);
    }

    SensorReading get_output() const override {
        return out_;
    }

    void reset() override {
        out_ = SensorReading::invalid(0.0, ReadingFault::NotRanging);
        rate_limiter_.reset();
    }

    std::string name() const override {
        return params_.id;
    }

    const SyntheticSensorParams& params() const { return params_; }

private:
    SyntheticSensorParams params_;
    SensorReading out_;

    utils::NoiseGenerator range_noise_;
    utils::NoiseGenerator dropout_noise_;
    utils::Quantizer quantizer_;
    utils::RateLimiter rate_limiter_;
};

} // namespace sensors
