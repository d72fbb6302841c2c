// src/bay/occupancy.hpp
#pragma once

#include "bay/bay_status.hpp"
#include "bay/bay_types.hpp"

namespace bay {

/**
 * required_score() - Points needed to call the bay occupied
 *
 * The range sensor is worth one point and every evaluated lateral zone one
 * more. A configured score of 0 means "range plus every zone".
 */
inline int required_score(const BayConfig& cfg) {
    if (cfg.occupancy_score > 0) {
        return cfg.occupancy_score;
    }
    return 1 + static_cast<int>(cfg.lateral.size());
}

/**
 * evaluate_occupancy() - Is a vehicle parked in the bay?
 *
 * Zones count regardless of severity: a badly parked vehicle is still there.
 */
inline Occupancy evaluate_occupancy(const BayStateSnapshot& snap, const BayConfig& cfg) {
    switch (snap.range.status) {
        case RangeStatus::NoReading:
            return Occupancy::Unknown;
        case RangeStatus::BeyondRange:
            return Occupancy::Unoccupied;
        case RangeStatus::InRange:
            break;
    }

    int score = 1;
    for (const auto& zone : snap.lateral) {
        if (zone.status == ZoneStatus::Evaluated) {
            score++;
        }
    }
    return score >= required_score(cfg) ? Occupancy::Occupied : Occupancy::Unoccupied;
}

} // namespace bay
