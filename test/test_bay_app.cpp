// test/test_bay_app.cpp
/**
 * Unit Test: BayApp (end-to-end polling loop)
 *
 * Test Coverage:
 *   1. Built-in profile: vehicle docks and leaves, range trigger drives the bay
 *   2. Replay of the recorded approach log
 *   3. Lua scenario: door trigger, bay commands, system commands
 */

#include "app/bay_app.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void check(bool ok, const std::string& msg) {
        if (ok) pass(msg); else fail(msg);
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

// Helper: Check if value is close to expected
bool is_close(double actual, double expected, double tolerance = 1e-6) {
    return std::abs(actual - expected) <= tolerance;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

app::BayAppConfig quiet_app_config(const std::string& csv_path) {
    app::BayAppConfig cfg;
    cfg.dt_s = 0.1;
    cfg.csv_log_path = csv_path;
    cfg.enable_debug_log_file = false;
    cfg.influx.enabled = false;
    return cfg;
}

// Test 1: Built-in profile
void test_profile(TestResult& result) {
    std::cout << "\n=== Test 1: Built-in Profile ===\n";

    const char* csv_path = "/tmp/test_bay_app_profile.csv";

    auto system = config::SystemConfig::get_default();
    for (size_t i = 0; i < system.sensors.size(); ++i) {
        system.sensors[i].random_seed = 100 + i;
    }

    auto cfg = quiet_app_config(csv_path);
    cfg.duration_s = 75.0;

    try {
        app::BayApp bay_app(cfg, system);
        result.check(bay_app.run() == 0, "Profile run completes");

        const auto& bay = bay_app.bays().at(0);
        result.check(bay.lifecycle_state() == bay::LifecycleState::Ready, "Bay ends Ready");
        result.check(bay.activity() == bay::Activity::Idle, "Bay ends Idle");
        result.check(bay.status().occupancy == bay::Occupancy::Unoccupied,
                     "Bay ends Unoccupied after the vehicle leaves");
        result.check(bay_app.system_commands().empty() && !bay_app.reboot_requested(),
                     "No system commands without a scenario");

        const std::string csv = read_file(csv_path);
        result.check(csv.rfind("t_s,bay,lifecycle,activity,occupancy,motion,", 0) == 0,
                     "CSV header written");
        result.check(csv.find(",docking,") != std::string::npos,
                     "Range trigger started docking");
        result.check(csv.find(",undocking,") != std::string::npos,
                     "Range trigger started undocking");
        result.check(csv.find(",idle,occupied,still,") != std::string::npos,
                     "Vehicle parked: idle, occupied, still");
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected exception: ") + e.what());
    }

    std::remove(csv_path);
}

// Test 2: Replay
void test_replay(TestResult& result) {
    std::cout << "\n=== Test 2: Replay ===\n";

    const char* csv_path = "/tmp/test_bay_app_replay.csv";

    auto cfg = quiet_app_config(csv_path);
    cfg.replay_csv_path = "data/replay/approach.csv";
    cfg.duration_s = 0.0;

    try {
        app::BayApp bay_app(cfg, config::SystemConfig::load("config/bays/example.yaml"));
        result.check(bay_app.run() == 0, "Replay run completes");

        const auto& bay = bay_app.bays().at(0);
        result.check(bay.status().snapshot.has_value() &&
                     bay.status().snapshot->range.status == bay::RangeStatus::InRange,
                     "Vehicle in range at the end of the log");

        const std::string csv = read_file(csv_path);
        result.check(csv.find(",approaching,") != std::string::npos, "Approach seen in the log");
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected exception: ") + e.what());
    }

    auto missing = quiet_app_config(csv_path);
    missing.replay_csv_path = "/tmp/nonexistent_replay_log.csv";
    app::BayApp bad_app(missing, config::SystemConfig::get_default());
    result.check(bad_app.run() == 1, "Missing replay log → exit code 1");

    std::remove(csv_path);
}

// Test 3: Lua scenario
void test_lua(TestResult& result) {
    std::cout << "\n=== Test 3: Lua Scenario ===\n";

    const char* csv_path = "/tmp/test_bay_app_lua.csv";

    auto system = config::SystemConfig::load("config/bays/example.yaml");
    auto cfg = quiet_app_config(csv_path);
    cfg.use_lua_scenario = true;
    cfg.lua_script_path = "config/lua/scenario.lua";
    cfg.duration_s = 75.0;

    try {
        app::BayApp bay_app(cfg, system);
        result.check(bay_app.run() == 0, "Lua run completes");

        const auto& cmds = bay_app.system_commands();
        result.check(cmds.size() == 1 && cmds[0] == triggers::Command::Rescan,
                     "Only 'rescan' reached the system (unknown payload discarded)");

        const auto& bay = bay_app.bays().at(0);
        result.check(bay.activity() == bay::Activity::Idle, "Bay ends Idle");

        const std::string csv = read_file(csv_path);
        result.check(csv.find(",docking,") != std::string::npos, "Door opening started docking");
        result.check(csv.find(",undocking,") != std::string::npos, "Second door opening started undocking");
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected exception: ") + e.what());
    }

    std::remove(csv_path);
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            BayApp End-to-End Tests                           ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    utils::set_level(utils::LogLevel::Error);

    TestResult result;

    test_profile(result);
    test_replay(result);
    test_lua(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
