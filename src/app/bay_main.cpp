// src/app/bay_main.cpp
#include "app/bay_app.hpp"
#include "config/system_config.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <getopt.h>

namespace {

// Exit code asking the service manager to restart us
constexpr int kExitReboot = 3;

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nReading sources (first match wins):\n");
    printf("  --replay PATH         Replay sensor readings from a CSV log\n");
    printf("  --scenario PATH       Lua scenario script (ground truth + messages)\n");
    printf("  (none)                Built-in approach/park/leave profile\n");
    printf("\nOptions:\n");
    printf("  --config PATH         System config YAML (default: config/bays/example.yaml)\n");
    printf("  --duration SEC        Run duration in seconds (default: 75)\n");
    printf("  --dt SEC              Cycle period in seconds (default: from config cycle_hz)\n");
    printf("  --real-time           Pace cycles against the wall clock\n");
    printf("  --fast                Run as fast as possible (default)\n");
    printf("  --csv PATH            CSV output (default: bay_out.csv)\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error (default: from config)\n");
    printf("  --influx              Write bay state to InfluxDB\n");
    printf("  --influx-url URL      InfluxDB URL (default: http://localhost:8086)\n");
    printf("  --influx-token TOKEN  InfluxDB API token\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  # Built-in profile, fast-forward:\n");
    printf("  %s --config config/bays/example.yaml\n\n", prog_name);
    printf("  # Lua scenario in real time with telemetry:\n");
    printf("  %s --scenario config/lua/scenario.lua --real-time --influx\n\n", prog_name);
    printf("  # Replay a recorded log:\n");
    printf("  %s --replay data/replay/approach.csv --duration 0\n\n", prog_name);
}

} // namespace

int main(int argc, char** argv) {
    // ========================================================================
    // Default configuration
    // ========================================================================
    app::BayAppConfig cfg{};
    std::string config_path = "config/bays/example.yaml";
    std::string log_level;
    bool dt_from_cli = false;

    static struct option long_options[] = {
        {"config",       required_argument, 0, 'c'},
        {"scenario",     required_argument, 0, 's'},
        {"replay",       required_argument, 0, 'p'},
        {"duration",     required_argument, 0, 'D'},
        {"dt",           required_argument, 0, 'd'},
        {"real-time",    no_argument,       0, 'R'},
        {"fast",         no_argument,       0, 'F'},
        {"csv",          required_argument, 0, 'o'},
        {"log-level",    required_argument, 0, 'l'},
        {"influx",       no_argument,       0, 'I'},
        {"influx-url",   required_argument, 0, 'u'},
        {"influx-token", required_argument, 0, 'k'},
        {"help",         no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 's':
                cfg.use_lua_scenario = true;
                cfg.lua_script_path = optarg;
                break;
            case 'p':
                cfg.replay_csv_path = optarg;
                break;
            case 'D':
                cfg.duration_s = std::atof(optarg);
                if (cfg.duration_s < 0) {
                    fprintf(stderr, "Error: Invalid duration: %s\n", optarg);
                    return 1;
                }
                break;
            case 'd':
                cfg.dt_s = std::atof(optarg);
                if (cfg.dt_s <= 0 || cfg.dt_s > 10.0) {
                    fprintf(stderr, "Error: Invalid cycle period: %s (must be 0 < dt <= 10)\n", optarg);
                    return 1;
                }
                dt_from_cli = true;
                break;
            case 'R':
                cfg.real_time_mode = true;
                break;
            case 'F':
                cfg.real_time_mode = false;
                break;
            case 'o':
                cfg.csv_log_path = optarg;
                break;
            case 'l':
                log_level = optarg;
                break;
            case 'I':
                cfg.influx.enabled = true;
                break;
            case 'u':
                cfg.influx.url = optarg;
                break;
            case 'k':
                cfg.influx.token = optarg;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (cfg.duration_s == 0.0 && cfg.replay_csv_path.empty()) {
        fprintf(stderr, "Error: --duration 0 is only valid with --replay\n");
        return 1;
    }

    if (!log_level.empty()) {
        utils::set_level(utils::parse_level(log_level, utils::LogLevel::Info));
    }

    try {
        // ====================================================================
        // Load system configuration
        // ====================================================================
        config::SystemConfig system = config::SystemConfig::load(config_path);

        if (log_level.empty()) {
            utils::set_level(utils::parse_level(system.log_level, utils::LogLevel::Info));
        }
        if (!dt_from_cli) {
            cfg.dt_s = 1.0 / system.cycle_hz;
        }

        const char* source = !cfg.replay_csv_path.empty() ? cfg.replay_csv_path.c_str()
                           : cfg.use_lua_scenario ? cfg.lua_script_path.c_str()
                           : "built-in profile";

        printf("\n");
        printf("╔════════════════════════════════════════════════════════════╗\n");
        printf("║              BAY ASSIST POLLING LOOP                       ║\n");
        printf("╠════════════════════════════════════════════════════════════╣\n");
        printf("║ System:     %-48s║\n", system.name.c_str());
        printf("║ Source:     %-48s║\n", source);
        char period_str[50], duration_str[50], bays_str[50];
        snprintf(period_str, sizeof(period_str), "%.3f seconds", cfg.dt_s);
        snprintf(duration_str, sizeof(duration_str), "%.1f seconds", cfg.duration_s);
        snprintf(bays_str, sizeof(bays_str), "%zu bay(s), %zu sensor(s)",
                 system.bays.size(), system.sensors.size());
        printf("║ Cycle:      %-48s║\n", period_str);
        printf("║ Duration:   %-48s║\n", duration_str);
        printf("║ Bays:       %-48s║\n", bays_str);
        printf("║ Real-time:  %-48s║\n", cfg.real_time_mode ? "yes (1:1 wall clock)" : "no (fast-forward)");
        printf("║ InfluxDB:   %-48s║\n", cfg.influx.enabled ? cfg.influx.url.c_str() : "disabled");
        printf("╚════════════════════════════════════════════════════════════╝\n");
        printf("\n");

        // ====================================================================
        // Run
        // ====================================================================
        app::BayApp bay_app(cfg, system);
        const int rc = bay_app.run();
        if (rc == 0 && bay_app.reboot_requested()) {
            return kExitReboot;
        }
        return rc;

    } catch (const config::ConfigurationError& e) {
        LOG_ERROR("Configuration error: %s", e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: %s", e.what());
        return 1;
    }
}
