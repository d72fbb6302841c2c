// src/bay/bay.cpp
#include "bay/bay.hpp"
#include "bay/occupancy.hpp"
#include "utils/logging.hpp"

#include <utility>

namespace bay {

Bay::Bay(BayConfig cfg)
    : engine_(std::move(cfg)),
      motion_(engine_.config().motion_margin)
{
    status_.bay_id = engine_.id();
}

LifecycleState Bay::recheck_availability(const sensors::AvailabilityMap& status, double t_s) {
    const LifecycleState state = engine_.recheck_availability(status);
    status_.lifecycle = state;

    if (state == LifecycleState::Unavailable && activity_ != Activity::Idle) {
        LOG_WARN("[Bay %s] Sensors unavailable, aborting %s", id().c_str(), to_string(activity_));
        set_activity(Activity::Idle, t_s);
    }
    return state;
}

// ============================================================================
// Commands
// ============================================================================

bool Bay::apply(triggers::Command cmd, double t_s) {
    using triggers::Command;

    if (triggers::is_system_command(cmd)) {
        LOG_WARN("[Bay %s] '%s' is not a bay command", id().c_str(), triggers::to_string(cmd));
        return false;
    }

    if (cmd == Command::Abort) {
        if (activity_ == Activity::Idle) {
            LOG_DEBUG("[Bay %s] Abort with nothing running", id().c_str());
        } else {
            LOG_INFO("[Bay %s] Aborting %s", id().c_str(), to_string(activity_));
        }
        set_activity(Activity::Idle, t_s);
        return true;
    }

    if (engine_.lifecycle_state() != LifecycleState::Ready) {
        LOG_WARN("[Bay %s] Refusing '%s', bay is %s", id().c_str(),
                 triggers::to_string(cmd), to_string(engine_.lifecycle_state()));
        return false;
    }

    if (status_.active()) {
        LOG_WARN("[Bay %s] Refusing '%s' while %s", id().c_str(),
                 triggers::to_string(cmd), to_string(activity_));
        return false;
    }

    switch (cmd) {
        case Command::Dock:
            if (status_.occupancy == Occupancy::Occupied) {
                LOG_WARN("[Bay %s] Refusing 'dock', bay is already occupied", id().c_str());
                return false;
            }
            set_activity(Activity::Docking, t_s);
            return true;

        case Command::Undock:
            set_activity(Activity::Undocking, t_s);
            return true;

        case Command::Verify:
            set_activity(Activity::Verifying, t_s);
            verify_pending_ = true;
            return true;

        default:
            break;
    }
    return false;
}

void Bay::set_activity(Activity next, double t_s) {
    if (next != activity_) {
        LOG_INFO("[Bay %s] Activity %s -> %s", id().c_str(), to_string(activity_), to_string(next));
    }
    activity_ = next;
    activity_since_s_ = t_s;
    still_since_s_ = -1.0;
    verify_pending_ = false;
    status_.activity = next;
}

// ============================================================================
// Cycle
// ============================================================================

const BayStatus& Bay::update(const sensors::SensorBank& bank, double t_s) {
    status_.timestamp_s = t_s;
    status_.lifecycle = engine_.lifecycle_state();
    status_.snapshot = engine_.update(bank.estimates(), t_s);

    if (status_.snapshot) {
        status_.occupancy = evaluate_occupancy(*status_.snapshot, engine_.config());
    } else {
        status_.occupancy = Occupancy::Unknown;
    }

    // Movement beyond the detection range is the door or the far wall, not a vehicle
    const std::string& range_id = engine_.config().range.sensor_id;
    const bool in_range = status_.snapshot &&
                          status_.snapshot->range.status == RangeStatus::InRange;
    if (in_range && bank.has_sensor(range_id)) {
        const MotionEstimate est = motion_.evaluate(bank.buffer(range_id));
        status_.motion = est.motion;
        status_.speed = est.speed;
    } else {
        status_.motion = Motion::Unknown;
        status_.speed.reset();
    }

    advance_activity(t_s);
    status_.activity = activity_;
    return status_;
}

void Bay::advance_activity(double t_s) {
    const BayConfig& cfg = engine_.config();
    const double elapsed = t_s - activity_since_s_;

    switch (activity_) {
        case Activity::Idle:
            break;

        case Activity::Verifying:
            if (verify_pending_ && status_.snapshot) {
                LOG_INFO("[Bay %s] Verify: occupancy %s, range %s", id().c_str(),
                         to_string(status_.occupancy), to_string(status_.snapshot->range.status));
                set_activity(Activity::Idle, t_s);
            }
            break;

        case Activity::Docking: {
            if (elapsed > cfg.dock_timeout.value_in(units::Unit::Second)) {
                LOG_WARN("[Bay %s] Docking timed out after %.1f s", id().c_str(), elapsed);
                set_activity(Activity::Idle, t_s);
                break;
            }

            const bool in_range = status_.snapshot &&
                                  status_.snapshot->range.status == RangeStatus::InRange;
            if (!in_range || status_.motion != Motion::Still) {
                still_since_s_ = -1.0;
                break;
            }
            if (still_since_s_ < 0.0) {
                still_since_s_ = t_s;
            }
            if (t_s - still_since_s_ >= cfg.park_time.value_in(units::Unit::Second)) {
                LOG_INFO("[Bay %s] Docking complete", id().c_str());
                set_activity(Activity::Idle, t_s);
                status_.occupancy = Occupancy::Occupied;
            }
            break;
        }

        case Activity::Undocking:
            if (elapsed > cfg.undock_timeout.value_in(units::Unit::Second)) {
                LOG_WARN("[Bay %s] Undocking timed out after %.1f s", id().c_str(), elapsed);
                set_activity(Activity::Idle, t_s);
                break;
            }
            if (status_.occupancy == Occupancy::Unoccupied) {
                LOG_INFO("[Bay %s] Undocking complete", id().c_str());
                set_activity(Activity::Idle, t_s);
            }
            break;
    }
}

} // namespace bay
