// src/app/bay_app.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "app/lua_runtime.hpp"
#include "bay/bay.hpp"
#include "config/system_config.hpp"
#include "sensors/replay_source.hpp"
#include "sensors/sensor_bank.hpp"
#include "sensors/synthetic_sensor.hpp"
#include "triggers/trigger_engine.hpp"
#include "utils/influx.hpp"

namespace app {

struct BayAppConfig {
    // Loop timing
    double dt_s = 0.1;
    double duration_s = 75.0;       // <= 0 with a replay log: until the log ends
    double log_hz = 2.0;

    // Real-time mode
    bool real_time_mode = false;    // true = pace cycles against the wall clock

    // Reading sources (first match wins: replay, Lua, built-in profile)
    std::string replay_csv_path;
    bool use_lua_scenario = false;
    std::string lua_script_path = "config/lua/scenario.lua";

    // Availability recheck period
    double availability_recheck_s = 5.0;

    // Output files
    std::string csv_log_path = "bay_out.csv";
    std::string debug_log_path = "bay_debug.log";
    bool enable_debug_log_file = true;

    // Telemetry
    utils::InfluxClient::Config influx;
};

/**
 * BayApp - Single-threaded polling loop around the core
 *
 * One cycle:
 *   1. acquire readings (replay log, Lua scenario or built-in profile)
 *   2. push them into the sensor bank, recheck availability when due
 *   3. update every bay → status map
 *   4. run the triggers against that status map
 *   5. apply bay commands, handle system commands
 *   6. CSV / InfluxDB output
 */
class BayApp {
public:
    /**
     * @throws config::ConfigurationError if a bay cannot be built
     */
    BayApp(BayAppConfig cfg, config::SystemConfig system);

    int run();

    // Set once a reboot command has been handled
    bool reboot_requested() const { return reboot_requested_; }

    const std::vector<bay::Bay>& bays() const { return bays_; }

    // Every system command handled during the run, in order
    const std::vector<triggers::Command>& system_commands() const { return system_commands_; }

private:
    enum class Source { Replay, Lua, Profile };

    void acquire(double t, double dt);
    void sample_sensors(const sensors::GroundTruth& truth, double t, double dt);
    sensors::GroundTruth profile_truth(double t) const;

    void recheck_availability(double t);
    void apply_commands(const triggers::CommandBatch& batch, double t);
    bool handle_system_command(triggers::Command cmd, double t);

    bay::Bay* find_bay(const std::string& id);

    BayAppConfig cfg_;
    config::SystemConfig system_;

    sensors::SensorBank bank_;
    std::vector<std::unique_ptr<sensors::SyntheticRangeSensor>> sensors_;
    std::vector<bay::Bay> bays_;
    std::unique_ptr<triggers::TriggerEngine> triggers_;

    Source source_ = Source::Profile;
    LuaRuntime lua_;
    sensors::ReplaySource replay_;

    double next_recheck_ = 0.0;
    bool reboot_requested_ = false;
    std::vector<triggers::Command> system_commands_;
};

} // namespace app
