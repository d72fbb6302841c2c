// src/bay/bay_types.hpp
#pragma once

#include "units/quantity.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bay {

enum class Side { Left, Right };

enum class LifecycleState {
    Initializing,
    Ready,
    Unavailable
};

enum class RangeStatus {
    NoReading,      // range sensor missing or invalid this cycle
    BeyondRange,    // farther than max_detect_range
    InRange
};

enum class ZoneStatus {
    NotPresent,     // zone sensor had no valid reading
    BeyondRange,    // vehicle not yet within the zone's intercept range
    RangeUnknown,   // no usable range reading, zone relevance cannot be decided
    Evaluated
};

enum class Direction { None, Left, Right };

enum class Severity { Ok, Info, Warning, Critical };

// ============================================================================
// Configuration
// ============================================================================

struct RangeSensorConfig {
    std::string sensor_id;
    units::Quantity offset = units::cm(0.0);             // subtracted from every raw reading
    units::Quantity max_detect_range = units::cm(300.0);
    units::Quantity stop_distance = units::cm(10.0);
};

/**
 * LateralZoneConfig - One lateral alignment checkpoint
 *
 * The zone is active once the range sensor reads at or below intercept_range.
 */
struct LateralZoneConfig {
    std::string zone_id;
    std::string sensor_id;
    Side side = Side::Left;
    units::Quantity ideal_offset = units::cm(0.0);
    units::Quantity ok_spread = units::cm(1.0);
    units::Quantity warn_spread = units::cm(3.0);
    units::Quantity critical_spread = units::cm(5.0);
    units::Quantity intercept_range = units::cm(0.0);
};

struct BayConfig {
    std::string id;
    std::string name;
    units::UnitSystem unit_system = units::UnitSystem::Metric;

    RangeSensorConfig range;
    std::vector<LateralZoneConfig> lateral;

    // Activity tracking
    units::Quantity park_time = units::seconds(2.0);        // still this long → docked
    units::Quantity motion_margin = units::cm(2.0);         // displacement treated as noise
    units::Quantity dock_timeout = units::seconds(120.0);
    units::Quantity undock_timeout = units::seconds(180.0);

    // Range + evaluated zones needed to call the bay occupied (0 = all zones)
    int occupancy_score = 0;
};

// ============================================================================
// Engine output
// ============================================================================

struct RangeResult {
    RangeStatus status = RangeStatus::NoReading;
    std::optional<units::Quantity> raw;         // offset-corrected sensor distance
    std::optional<units::Quantity> adjusted;    // distance to stop point, negative = overshoot
    std::optional<double> fraction;             // adjusted / max_detect_range
};

struct LateralDeviation {
    units::Quantity magnitude = units::cm(0.0);
    Direction direction = Direction::None;
    Severity severity = Severity::Ok;
};

struct LateralZoneResult {
    std::string zone_id;
    ZoneStatus status = ZoneStatus::NotPresent;
    std::optional<LateralDeviation> deviation;  // only for Evaluated
};

/**
 * BayStateSnapshot - Engine output for one cycle (value type)
 */
struct BayStateSnapshot {
    std::string bay_id;
    double timestamp_s = 0.0;
    RangeResult range;
    std::vector<LateralZoneResult> lateral;     // configured (sorted) zone order
    size_t expected_zones = 0;

    const LateralZoneResult* zone(const std::string& zone_id) const {
        for (const auto& z : lateral) {
            if (z.zone_id == zone_id) return &z;
        }
        return nullptr;
    }
};

// ============================================================================
// String forms (logs, CSV, telemetry)
// ============================================================================

inline const char* to_string(Side s) { return s == Side::Left ? "L" : "R"; }

inline const char* to_string(LifecycleState s) {
    switch (s) {
        case LifecycleState::Initializing: return "initializing";
        case LifecycleState::Ready:        return "ready";
        case LifecycleState::Unavailable:  return "unavailable";
    }
    return "unknown";
}

inline const char* to_string(RangeStatus s) {
    switch (s) {
        case RangeStatus::NoReading:   return "no_reading";
        case RangeStatus::BeyondRange: return "beyond_range";
        case RangeStatus::InRange:     return "in_range";
    }
    return "unknown";
}

inline const char* to_string(ZoneStatus s) {
    switch (s) {
        case ZoneStatus::NotPresent:   return "not_present";
        case ZoneStatus::BeyondRange:  return "beyond_range";
        case ZoneStatus::RangeUnknown: return "range_unknown";
        case ZoneStatus::Evaluated:    return "evaluated";
    }
    return "unknown";
}

inline const char* to_string(Direction d) {
    switch (d) {
        case Direction::None:  return "none";
        case Direction::Left:  return "L";
        case Direction::Right: return "R";
    }
    return "unknown";
}

inline const char* to_string(Severity s) {
    switch (s) {
        case Severity::Ok:       return "ok";
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

} // namespace bay
