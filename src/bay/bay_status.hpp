// src/bay/bay_status.hpp
#pragma once

#include "bay/bay_types.hpp"
#include <map>
#include <optional>
#include <string>

namespace bay {

enum class Activity {
    Idle,
    Docking,
    Undocking,
    Verifying
};

enum class Occupancy {
    Unknown,
    Occupied,
    Unoccupied
};

enum class Motion {
    Unknown,
    Still,
    Approaching,
    Receding
};

/**
 * BayStatus - Consistent per-cycle view of one bay
 *
 * Built once per cycle by Bay::update() and handed to every trigger, so no
 * trigger can observe a state that changes mid-evaluation.
 */
struct BayStatus {
    std::string bay_id;
    double timestamp_s = 0.0;

    LifecycleState lifecycle = LifecycleState::Initializing;
    Activity activity = Activity::Idle;
    Occupancy occupancy = Occupancy::Unknown;
    Motion motion = Motion::Unknown;
    std::optional<units::Quantity> speed;   // distance per second, when known

    std::optional<BayStateSnapshot> snapshot;

    bool active() const {
        return activity == Activity::Docking || activity == Activity::Undocking;
    }

    bool in_motion() const {
        return motion == Motion::Approaching || motion == Motion::Receding;
    }
};

using BayStatusMap = std::map<std::string, BayStatus>;

inline const char* to_string(Activity a) {
    switch (a) {
        case Activity::Idle:      return "idle";
        case Activity::Docking:   return "docking";
        case Activity::Undocking: return "undocking";
        case Activity::Verifying: return "verifying";
    }
    return "unknown";
}

inline const char* to_string(Occupancy o) {
    switch (o) {
        case Occupancy::Unknown:    return "unknown";
        case Occupancy::Occupied:   return "occupied";
        case Occupancy::Unoccupied: return "unoccupied";
    }
    return "unknown";
}

inline const char* to_string(Motion m) {
    switch (m) {
        case Motion::Unknown:     return "unknown";
        case Motion::Still:       return "still";
        case Motion::Approaching: return "approaching";
        case Motion::Receding:    return "receding";
    }
    return "unknown";
}

} // namespace bay
