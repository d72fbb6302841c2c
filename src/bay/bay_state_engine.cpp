// src/bay/bay_state_engine.cpp
#include "bay/bay_state_engine.hpp"
#include "config/config_error.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace bay {

namespace {

void require_distance(const units::Quantity& q, const std::string& field) {
    if (q.dimension() != units::Dimension::Distance) {
        throw config::ConfigurationError(field + " must be a distance, got " + q.to_string());
    }
}

void require_time(const units::Quantity& q, const std::string& field) {
    if (q.dimension() != units::Dimension::Time) {
        throw config::ConfigurationError(field + " must be a time, got " + q.to_string());
    }
}

void require_non_negative(const units::Quantity& q, const std::string& field) {
    if (q.base_value() < 0.0) {
        throw config::ConfigurationError(field + " must be >= 0, got " + q.to_string());
    }
}

// A reading in a non-distance unit degrades its own range or zone only
bool usable_distance(sensors::ReadingMap::const_iterator it, const sensors::ReadingMap& values) {
    if (it == values.end() || !it->second.is_valid()) {
        return false;
    }
    if (it->second.value->dimension() != units::Dimension::Distance) {
        LOG_DEBUG("[Bay] Sensor '%s' reported %s, not a distance",
                  it->first.c_str(), it->second.value->to_string().c_str());
        return false;
    }
    return true;
}

} // namespace

BayStateEngine::BayStateEngine(BayConfig cfg)
    : cfg_(std::move(cfg))
{
    for (auto& zone : cfg_.lateral) {
        if (zone.zone_id.empty()) {
            zone.zone_id = zone.sensor_id;
        }
    }

    validate();

    std::stable_sort(cfg_.lateral.begin(), cfg_.lateral.end(),
                     [](const LateralZoneConfig& a, const LateralZoneConfig& b) {
                         return a.intercept_range < b.intercept_range;
                     });

    sensor_ids_.push_back(cfg_.range.sensor_id);
    for (const auto& zone : cfg_.lateral) {
        if (std::find(sensor_ids_.begin(), sensor_ids_.end(), zone.sensor_id) == sensor_ids_.end()) {
            sensor_ids_.push_back(zone.sensor_id);
        }
    }

    LOG_INFO("[Bay %s] Engine ready: range sensor '%s', %zu lateral zone(s)",
             cfg_.id.c_str(), cfg_.range.sensor_id.c_str(), cfg_.lateral.size());
}

void BayStateEngine::validate() const {
    const std::string tag = "Bay '" + cfg_.id + "': ";

    if (cfg_.id.empty()) {
        throw config::ConfigurationError("Bay id must not be empty");
    }

    // Range sensor
    if (cfg_.range.sensor_id.empty()) {
        throw config::ConfigurationError(tag + "range sensor id must not be empty");
    }
    require_distance(cfg_.range.offset, tag + "range.offset");
    require_distance(cfg_.range.max_detect_range, tag + "range.max_detect_range");
    require_distance(cfg_.range.stop_distance, tag + "range.stop_distance");
    if (cfg_.range.max_detect_range.base_value() <= 0.0) {
        throw config::ConfigurationError(tag + "range.max_detect_range must be > 0");
    }
    require_non_negative(cfg_.range.stop_distance, tag + "range.stop_distance");

    // Activity timing
    require_time(cfg_.park_time, tag + "park_time");
    require_time(cfg_.dock_timeout, tag + "dock_timeout");
    require_time(cfg_.undock_timeout, tag + "undock_timeout");
    require_distance(cfg_.motion_margin, tag + "motion_margin");
    require_non_negative(cfg_.motion_margin, tag + "motion_margin");

    if (cfg_.occupancy_score < 0 ||
        cfg_.occupancy_score > static_cast<int>(cfg_.lateral.size()) + 1) {
        throw config::ConfigurationError(tag + "occupancy_score must be between 0 and " +
                                         std::to_string(cfg_.lateral.size() + 1));
    }

    // Lateral zones
    std::set<std::string> zone_ids;
    for (const auto& zone : cfg_.lateral) {
        const std::string ztag = tag + "lateral zone '" + zone.zone_id + "' ";

        if (zone.sensor_id.empty()) {
            throw config::ConfigurationError(tag + "lateral zone without a sensor id");
        }
        if (!zone_ids.insert(zone.zone_id).second) {
            throw config::ConfigurationError(tag + "duplicate lateral zone '" + zone.zone_id + "'");
        }

        require_distance(zone.ideal_offset, ztag + "ideal_offset");
        require_distance(zone.ok_spread, ztag + "ok_spread");
        require_distance(zone.warn_spread, ztag + "warn_spread");
        require_distance(zone.critical_spread, ztag + "critical_spread");
        require_distance(zone.intercept_range, ztag + "intercept_range");

        require_non_negative(zone.ok_spread, ztag + "ok_spread");
        require_non_negative(zone.warn_spread, ztag + "warn_spread");
        require_non_negative(zone.critical_spread, ztag + "critical_spread");
        require_non_negative(zone.intercept_range, ztag + "intercept_range");
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

LifecycleState BayStateEngine::recheck_availability(const sensors::AvailabilityMap& status) {
    LifecycleState next = LifecycleState::Ready;

    for (const auto& id : sensor_ids_) {
        auto it = status.find(id);
        if (it == status.end()) {
            LOG_DEBUG("[Bay %s] Sensor '%s' not found", cfg_.id.c_str(), id.c_str());
            next = LifecycleState::Unavailable;
            break;
        }
        if (it->second == sensors::SensorAvailability::Unavailable) {
            LOG_DEBUG("[Bay %s] Sensor '%s' unavailable", cfg_.id.c_str(), id.c_str());
            next = LifecycleState::Unavailable;
            break;
        }
    }

    if (next != lifecycle_) {
        if (next == LifecycleState::Unavailable) {
            LOG_WARN("[Bay %s] Lifecycle %s -> %s", cfg_.id.c_str(),
                     to_string(lifecycle_), to_string(next));
        } else {
            LOG_INFO("[Bay %s] Lifecycle %s -> %s", cfg_.id.c_str(),
                     to_string(lifecycle_), to_string(next));
        }
    }
    lifecycle_ = next;
    return lifecycle_;
}

// ============================================================================
// Evaluation
// ============================================================================

Severity BayStateEngine::classify_severity(const units::Quantity& magnitude,
                                           const LateralZoneConfig& zone) {
    if (magnitude <= zone.ok_spread) return Severity::Ok;
    if (magnitude >= zone.critical_spread) return Severity::Critical;
    if (magnitude >= zone.warn_spread) return Severity::Warning;
    return Severity::Info;
}

Direction BayStateEngine::resolve_direction(const units::Quantity& deviation, Side side) {
    const double d = deviation.base_value();
    if (d == 0.0) {
        return Direction::None;
    }
    if (d > 0.0) {
        // Away from the sensor
        return side == Side::Left ? Direction::Right : Direction::Left;
    }
    // Toward the sensor
    return side == Side::Left ? Direction::Left : Direction::Right;
}

RangeResult BayStateEngine::evaluate_range(const sensors::ReadingMap& values) const {
    RangeResult out;

    auto it = values.find(cfg_.range.sensor_id);
    if (!usable_distance(it, values)) {
        out.status = RangeStatus::NoReading;
        return out;
    }

    const units::Quantity raw = *it->second.value - cfg_.range.offset;
    out.raw = raw;

    if (raw > cfg_.range.max_detect_range) {
        out.status = RangeStatus::BeyondRange;
        return out;
    }

    const units::Quantity adjusted = raw - cfg_.range.stop_distance;
    out.status = RangeStatus::InRange;
    out.adjusted = adjusted.to_system(cfg_.unit_system);
    out.fraction = units::ratio(adjusted, cfg_.range.max_detect_range);
    return out;
}

LateralZoneResult BayStateEngine::evaluate_zone(const LateralZoneConfig& zone,
                                                const RangeResult& range,
                                                const sensors::ReadingMap& values) const {
    LateralZoneResult out;
    out.zone_id = zone.zone_id;

    auto it = values.find(zone.sensor_id);
    if (!usable_distance(it, values)) {
        out.status = ZoneStatus::NotPresent;
        return out;
    }

    if (!range.raw) {
        out.status = ZoneStatus::RangeUnknown;
        return out;
    }

    if (*range.raw > zone.intercept_range) {
        out.status = ZoneStatus::BeyondRange;
        return out;
    }

    const units::Quantity deviation = *it->second.value - zone.ideal_offset;
    const units::Quantity magnitude = deviation.abs();

    LateralDeviation dev;
    dev.magnitude = magnitude.to_system(cfg_.unit_system);
    dev.direction = resolve_direction(deviation, zone.side);
    dev.severity = classify_severity(magnitude, zone);

    out.status = ZoneStatus::Evaluated;
    out.deviation = dev;
    return out;
}

std::optional<BayStateSnapshot> BayStateEngine::update(const sensors::ReadingMap& values,
                                                       double timestamp_s) const {
    if (lifecycle_ != LifecycleState::Ready) {
        LOG_DEBUG("[Bay %s] Update skipped, lifecycle is %s", cfg_.id.c_str(), to_string(lifecycle_));
        return std::nullopt;
    }

    BayStateSnapshot snap;
    snap.bay_id = cfg_.id;
    snap.timestamp_s = timestamp_s;
    snap.range = evaluate_range(values);
    snap.expected_zones = cfg_.lateral.size();

    snap.lateral.reserve(cfg_.lateral.size());
    for (const auto& zone : cfg_.lateral) {
        snap.lateral.push_back(evaluate_zone(zone, snap.range, values));
    }

    return snap;
}

} // namespace bay
