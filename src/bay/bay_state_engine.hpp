// src/bay/bay_state_engine.hpp
#pragma once

#include "bay/bay_types.hpp"
#include "sensors/sensor_bank.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bay {

/**
 * BayStateEngine - Turns debounced readings into a bay position snapshot
 *
 * One longitudinal (range) sensor plus zero or more lateral zones. Range and
 * lateral evaluation are pure functions of the readings passed to update()
 * and the static configuration; the only mutable state is the lifecycle.
 *
 * Usage:
 *   BayStateEngine engine(cfg);              // throws ConfigurationError
 *   engine.recheck_availability(bank.availability());
 *
 *   // Each cycle:
 *   if (auto snap = engine.update(bank.estimates(), t)) { ... }
 */
class BayStateEngine {
public:
    /**
     * Sorts the lateral zones by intercept range (ascending, stable).
     * @throws config::ConfigurationError on structural problems
     */
    explicit BayStateEngine(BayConfig cfg);

    /**
     * recheck_availability() - Ready iff every dependent sensor is present
     * and Available; Unavailable otherwise.
     */
    LifecycleState recheck_availability(const sensors::AvailabilityMap& status);

    /**
     * update() - Evaluate one cycle of readings
     *
     * @return nullopt unless the lifecycle is Ready
     */
    std::optional<BayStateSnapshot> update(const sensors::ReadingMap& values,
                                           double timestamp_s) const;

    LifecycleState lifecycle_state() const { return lifecycle_; }

    const BayConfig& config() const { return cfg_; }
    const std::string& id() const { return cfg_.id; }

    // Range sensor first, then zone sensors in zone order, without duplicates
    const std::vector<std::string>& sensor_ids() const { return sensor_ids_; }

    // ========================================================================
    // Pure helpers
    // ========================================================================

    /**
     * classify_severity() - First match wins:
     *   <= ok → Ok, >= critical → Critical, >= warn → Warning, else Info
     */
    static Severity classify_severity(const units::Quantity& magnitude,
                                      const LateralZoneConfig& zone);

    /**
     * resolve_direction() - Direction relative to the bay centerline
     *
     * Positive deviation is away from the sensor: the vehicle sits toward the
     * opposite side. Negative deviation is toward the sensor's own side.
     */
    static Direction resolve_direction(const units::Quantity& deviation, Side side);

    RangeResult evaluate_range(const sensors::ReadingMap& values) const;

    LateralZoneResult evaluate_zone(const LateralZoneConfig& zone,
                                    const RangeResult& range,
                                    const sensors::ReadingMap& values) const;

private:
    void validate() const;

    BayConfig cfg_;
    std::vector<std::string> sensor_ids_;
    LifecycleState lifecycle_ = LifecycleState::Initializing;
};

} // namespace bay
