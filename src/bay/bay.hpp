// src/bay/bay.hpp
#pragma once

#include "bay/bay_state_engine.hpp"
#include "bay/bay_status.hpp"
#include "bay/motion_detector.hpp"
#include "sensors/sensor_bank.hpp"
#include "triggers/command.hpp"
#include <string>

namespace bay {

/**
 * Bay - One parking bay: state engine plus docking activity
 *
 * Activity transitions:
 *   Idle      --dock-->    Docking    (still for park_time in range → Idle)
 *   Idle      --undock-->  Undocking  (unoccupied → Idle)
 *   Idle      --verify-->  Verifying  (one update → Idle)
 *   any       --abort-->   Idle
 *   Docking/Undocking past their timeout → Idle with a warning
 *
 * Usage:
 *   Bay bay(cfg);
 *   bay.recheck_availability(bank.availability());
 *   bay.apply(triggers::Command::Dock, t);
 *   const BayStatus& st = bay.update(bank, t);
 */
class Bay {
public:
    explicit Bay(BayConfig cfg);

    /**
     * recheck_availability() - Forward to the engine; an unavailable bay
     * drops any running activity back to Idle.
     */
    LifecycleState recheck_availability(const sensors::AvailabilityMap& status, double t_s);

    /**
     * update() - Run engine, motion detection and occupancy for one cycle
     * and advance the activity. The returned reference stays valid until
     * the next update().
     */
    const BayStatus& update(const sensors::SensorBank& bank, double t_s);

    /**
     * apply() - Act on a bay command
     * @return false if the command was refused (logged)
     */
    bool apply(triggers::Command cmd, double t_s);

    const BayStatus& status() const { return status_; }
    Activity activity() const { return activity_; }
    LifecycleState lifecycle_state() const { return engine_.lifecycle_state(); }

    const BayStateEngine& engine() const { return engine_; }
    const BayConfig& config() const { return engine_.config(); }
    const std::string& id() const { return engine_.id(); }

private:
    void set_activity(Activity next, double t_s);
    void advance_activity(double t_s);

    BayStateEngine engine_;
    MotionDetector motion_;

    Activity activity_ = Activity::Idle;
    double activity_since_s_ = 0.0;
    double still_since_s_ = -1.0;      // < 0: not currently still
    bool verify_pending_ = false;

    BayStatus status_;
};

} // namespace bay
