// src/app/bay_app.cpp
#include "app/bay_app.hpp"
#include "app/timing_controller.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace app {

namespace {

// Built-in profile timeline (seconds)
constexpr double kArriveAt = 5.0;
constexpr double kParkedAt = 25.0;
constexpr double kLeaveAt = 45.0;
constexpr double kGoneAt = 60.0;

// A lateral sensor with no vehicle in front of it sees the far wall
constexpr double kWallBeyondZoneCm = 150.0;
constexpr double kLateralDriftCm = 1.5;

std::string format_lateral(const bay::BayStateSnapshot& snap) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    for (size_t i = 0; i < snap.lateral.size(); ++i) {
        const auto& z = snap.lateral[i];
        if (i) out << ";";
        out << z.zone_id << ":" << bay::to_string(z.status);
        if (z.deviation) {
            out << ":" << z.deviation->magnitude.value()
                << ":" << bay::to_string(z.deviation->direction)
                << ":" << bay::to_string(z.deviation->severity);
        }
    }
    return out.str();
}

} // namespace

BayApp::BayApp(BayAppConfig cfg, config::SystemConfig system)
    : cfg_(std::move(cfg)),
      system_(std::move(system)),
      bank_(system_.buffer_capacity)
{
    if (cfg_.enable_debug_log_file && !utils::open_log_file(cfg_.debug_log_path)) {
        LOG_WARN("[BayApp] Continuing without debug log file");
    }

    for (const auto& s : system_.sensors) {
        bank_.add_sensor(s.id);
        sensors_.push_back(std::make_unique<sensors::SyntheticRangeSensor>(s.to_params()));
    }
    LOG_INFO("[BayApp] Initialized %zu sensors", bank_.sensor_count());

    bays_.reserve(system_.bays.size());
    for (const auto& b : system_.bays) {
        bays_.emplace_back(b);
    }

    triggers_ = config::build_triggers(system_);
}

bay::Bay* BayApp::find_bay(const std::string& id) {
    for (auto& b : bays_) {
        if (b.id() == id) return &b;
    }
    return nullptr;
}

// ============================================================================
// Acquisition
// ============================================================================

sensors::GroundTruth BayApp::profile_truth(double t) const {
    sensors::GroundTruth truth;
    truth.t_s = t;

    for (const auto& b : system_.bays) {
        const double max_cm = b.range.max_detect_range.value_in(units::Unit::Centimeter);
        const double stop_cm = b.range.stop_distance.value_in(units::Unit::Centimeter);
        const double offset_cm = b.range.offset.value_in(units::Unit::Centimeter);

        const double door_cm = max_cm + 50.0;
        const double enter_cm = max_cm - 20.0;
        const double park_cm = stop_cm + 3.0;

        // Vehicle nose distance from the range sensor
        double pos_cm = door_cm;
        bool present = false;
        if (t >= kArriveAt && t < kParkedAt) {
            const double f = (t - kArriveAt) / (kParkedAt - kArriveAt);
            pos_cm = enter_cm + (park_cm - enter_cm) * f;
            present = true;
        } else if (t >= kParkedAt && t < kLeaveAt) {
            pos_cm = park_cm;
            present = true;
        } else if (t >= kLeaveAt && t < kGoneAt) {
            const double f = (t - kLeaveAt) / (kGoneAt - kLeaveAt);
            pos_cm = park_cm + (enter_cm - park_cm) * f;
            present = true;
        }

        truth.distance_cm[b.range.sensor_id] = pos_cm + offset_cm;

        for (const auto& z : b.lateral) {
            const double ideal_cm = z.ideal_offset.value_in(units::Unit::Centimeter);
            const double intercept_cm = z.intercept_range.value_in(units::Unit::Centimeter);
            if (present && pos_cm <= intercept_cm) {
                truth.distance_cm[z.sensor_id] = ideal_cm + kLateralDriftCm;
            } else {
                truth.distance_cm[z.sensor_id] = ideal_cm + kWallBeyondZoneCm;
            }
        }
    }
    return truth;
}

void BayApp::sample_sensors(const sensors::GroundTruth& truth, double t, double dt) {
    for (auto& s : sensors_) {
        s->step(t, truth, dt);
        bank_.push(s->name(), s->get_output());
    }
}

void BayApp::acquire(double t, double dt) {
    switch (source_) {
        case Source::Replay:
            for (const auto& [id, reading] : replay_.poll(t)) {
                bank_.push(id, reading);
            }
            break;

        case Source::Lua: {
            ScenarioStep step;
            if (lua_.step(t, step)) {
                for (auto& msg : step.messages) {
                    LOG_DEBUG("[BayApp] Message %s = '%s'", msg.topic.c_str(), msg.payload.c_str());
                    triggers_->post(std::move(msg));
                }
                sample_sensors(step.truth, t, dt);
                break;
            }
            LOG_WARN("[t=%.2f] Lua scenario_step failed, using built-in profile", t);
            source_ = Source::Profile;
            sample_sensors(profile_truth(t), t, dt);
            break;
        }

        case Source::Profile:
            sample_sensors(profile_truth(t), t, dt);
            break;
    }
}

// ============================================================================
// Commands
// ============================================================================

void BayApp::recheck_availability(double t) {
    const auto avail = bank_.availability();
    for (auto& b : bays_) {
        b.recheck_availability(avail, t);
    }
    next_recheck_ = t + cfg_.availability_recheck_s;
}

bool BayApp::handle_system_command(triggers::Command cmd, double t) {
    system_commands_.push_back(cmd);

    switch (cmd) {
        case triggers::Command::Rescan:
            LOG_INFO("[BayApp] Rescan: rechecking sensor availability");
            recheck_availability(t);
            return true;

        case triggers::Command::Rediscover:
            LOG_INFO("[BayApp] Rediscover: resetting sensors and buffers");
            bank_.reset();
            for (auto& s : sensors_) {
                s->reset();
            }
            next_recheck_ = t;
            return true;

        case triggers::Command::Reboot:
            LOG_WARN("[BayApp] Reboot requested, stopping loop");
            reboot_requested_ = true;
            return false;

        default:
            LOG_WARN("[BayApp] '%s' is not a system command", triggers::to_string(cmd));
            return true;
    }
}

void BayApp::apply_commands(const triggers::CommandBatch& batch, double t) {
    for (const auto& entry : batch.bay) {
        bay::Bay* target = find_bay(entry.bay_id);
        if (!target) {
            LOG_WARN("[BayApp] Trigger '%s' sent '%s' to unknown bay '%s'",
                     entry.trigger_id.c_str(), triggers::to_string(entry.command),
                     entry.bay_id.c_str());
            continue;
        }
        LOG_INFO("[BayApp] %s -> bay %s: %s", entry.trigger_id.c_str(),
                 entry.bay_id.c_str(), triggers::to_string(entry.command));
        target->apply(entry.command, t);
    }

    for (const auto& entry : batch.system) {
        LOG_INFO("[BayApp] %s -> system: %s", entry.trigger_id.c_str(),
                 triggers::to_string(entry.command));
        if (!handle_system_command(entry.command, t)) {
            break;
        }
    }
}

// ============================================================================
// Loop
// ============================================================================

int BayApp::run() {
    const double dt = cfg_.dt_s;

    TimingController timer(dt);

    // ---- Reading source ----
    double duration_s = cfg_.duration_s;
    if (!cfg_.replay_csv_path.empty()) {
        if (!replay_.load(cfg_.replay_csv_path)) {
            LOG_ERROR("Failed to load replay log: %s", cfg_.replay_csv_path.c_str());
            return 1;
        }
        source_ = Source::Replay;
        if (duration_s <= 0.0) {
            duration_s = replay_.end_time() + dt;
        }
        LOG_INFO("Replaying %zu readings from %s", replay_.row_count(), cfg_.replay_csv_path.c_str());
    } else if (cfg_.use_lua_scenario) {
        if (!lua_.init(cfg_.lua_script_path, system_.topic_prefix)) {
            LOG_WARN("Failed to init Lua runtime");
            LOG_INFO("Falling back to the built-in approach profile");
            source_ = Source::Profile;
        } else {
            source_ = Source::Lua;
            LOG_INFO("Lua scenario loaded: %s", cfg_.lua_script_path.c_str());
        }
    } else {
        source_ = Source::Profile;
        LOG_INFO("Using the built-in approach profile");
    }

    // ---- CSV logging ----
    std::ofstream csv(cfg_.csv_log_path);
    if (!csv) {
        LOG_ERROR("Failed to open CSV: %s", cfg_.csv_log_path.c_str());
        return 1;
    }
    csv << "t_s,bay,lifecycle,activity,occupancy,motion,"
        << "range_status,range,adjusted,fraction,lateral,"
        << "loop_time_us\n";
    csv << std::fixed << std::setprecision(3);

    // ---- Telemetry ----
    utils::InfluxClient influx(cfg_.influx);

    // ---- Loop control ----
    const int max_iters = (duration_s > 0.0) ? static_cast<int>(std::lround(duration_s / dt)) : 0;
    const double log_period_s = (cfg_.log_hz > 0.0) ? 1.0 / cfg_.log_hz : 0.5;
    double next_log = 0.0;
    next_recheck_ = 0.0;

    LOG_INFO("Starting bay loop (duration=%.1fs, dt=%.3fs, %zu bay(s), %zu trigger(s))",
             duration_s, dt, bays_.size(), triggers_->size());

    timer.reset();

    bool running = true;
    for (int iter = 0; running && ((max_iters == 0) || (iter < max_iters)); ++iter) {
        timer.mark_loop_start();
        const double t = cfg_.real_time_mode ? timer.get_loop_time() : (iter * dt);

        // ---- 1-2. Readings and availability ----
        acquire(t, dt);
        if (t >= next_recheck_) {
            recheck_availability(t);
        }

        // ---- 3. Bay state ----
        bay::BayStatusMap statuses;
        for (auto& b : bays_) {
            statuses[b.id()] = b.update(bank_, t);
        }

        // ---- 4-5. Triggers and commands ----
        const triggers::CommandBatch batch = triggers_->cycle(statuses);
        if (!batch.empty()) {
            apply_commands(batch, t);
            running = !reboot_requested_;
        }

        timer.update_loop_stats();

        // ---- 6. Output ----
        if (t >= next_log) {
            for (const auto& [bay_id, st] : statuses) {
                csv << t << "," << bay_id << ","
                    << bay::to_string(st.lifecycle) << ","
                    << bay::to_string(st.activity) << ","
                    << bay::to_string(st.occupancy) << ","
                    << bay::to_string(st.motion) << ",";
                if (st.snapshot) {
                    const auto& r = st.snapshot->range;
                    csv << bay::to_string(r.status) << ",";
                    if (r.raw) csv << r.raw->value();
                    csv << ",";
                    if (r.adjusted) csv << r.adjusted->value();
                    csv << ",";
                    if (r.fraction) csv << *r.fraction;
                    csv << "," << format_lateral(*st.snapshot) << ",";
                } else {
                    csv << ",,,,,";
                }
                csv << timer.get_last_loop_time_us() << "\n";
            }
            next_log += log_period_s;
        }

        influx.write_bay_statuses(statuses, t);

        // ---- Real-time pacing ----
        if (cfg_.real_time_mode && running) {
            const bool on_time = timer.wait_for_next_step();
            if (!on_time) {
                const auto& stats = timer.get_stats();
                LOG_WARN("[t=%.2f] Deadline miss! Total misses: %zu, Max lateness: %.1f us",
                         t, stats.deadline_misses, stats.max_lateness_us);
            }
        }
    }

    // ---- Final statistics ----
    const auto& stats = timer.get_stats();

    LOG_INFO("========================================");
    LOG_INFO("Loop Statistics");
    LOG_INFO("========================================");
    LOG_INFO("Total cycles: %zu", stats.total_steps);
    if (cfg_.real_time_mode && stats.total_steps > 0) {
        LOG_INFO("Deadline misses: %zu (%.2f%%)", stats.deadline_misses,
                 100.0 * stats.deadline_misses / stats.total_steps);
        LOG_INFO("Max lateness: %.1f us", stats.max_lateness_us);
    }
    LOG_INFO("Max loop time: %.1f us (%.1f%% of dt)", stats.max_loop_time_us,
             100.0 * stats.max_loop_time_us / (dt * 1e6));
    for (const auto& b : bays_) {
        LOG_INFO("Bay %s: %s, %s, %s", b.id().c_str(),
                 bay::to_string(b.lifecycle_state()),
                 bay::to_string(b.status().activity),
                 bay::to_string(b.status().occupancy));
    }
    LOG_INFO("========================================");

    LOG_INFO("Run complete. CSV written to: %s", cfg_.csv_log_path.c_str());
    csv.close();
    if (cfg_.enable_debug_log_file) {
        utils::close_log_file();
    }
    return 0;
}

} // namespace app
