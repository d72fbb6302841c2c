// src/config/system_config.hpp
#pragma once

#include "bay/bay_types.hpp"
#include "config/config_error.hpp"
#include "sensors/synthetic_sensor.hpp"
#include "triggers/trigger.hpp"
#include "triggers/trigger_engine.hpp"
#include "units/quantity.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace config {

/**
 * SensorConfig - One distance sensor known to the system
 *
 * The noise/quantization/dropout parameters describe the synthetic stand-in
 * used by the harness; the core only cares about the id.
 */
struct SensorConfig {
    std::string id;
    units::Unit unit = units::Unit::Centimeter;
    units::Quantity max_range = units::cm(400.0);
    units::Quantity noise_stddev = units::cm(0.3);
    units::Quantity quantization = units::cm(1.0);
    double dropout_rate = 0.0;
    double update_hz = 0.0;
    uint64_t random_seed = 0;

    sensors::SyntheticSensorParams to_params() const;
};

struct TriggerConfig {
    std::string id;
    triggers::TriggerKind kind = triggers::TriggerKind::SystemCommand;
    std::string topic;
    std::optional<triggers::TopicMode> topic_mode;  // default depends on kind
    std::string bay_id;

    // mqtt_sensor only
    std::optional<triggers::ChangeMode> change_mode;
    std::string trigger_value;

    // mqtt_sensor / range: "occupancy" or a bay command
    std::string action = "occupancy";

    triggers::TopicMode resolved_topic_mode() const;
};

/**
 * SystemConfig - Whole-system configuration loaded from YAML
 *
 * Usage:
 *   auto cfg = SystemConfig::load("config/bays/example.yaml");
 *   auto engine = build_triggers(cfg);
 *
 * Distances and times are written with their unit ("300 cm", "2 s").
 * Falls back to a single demo bay if the file is not found.
 */
class SystemConfig {
public:
    std::string name = "bayassist";
    units::UnitSystem unit_system = units::UnitSystem::Metric;
    std::string topic_prefix = "bayassist";
    std::string log_level = "info";
    double cycle_hz = 10.0;
    size_t buffer_capacity = 10;

    std::vector<SensorConfig> sensors;
    std::vector<bay::BayConfig> bays;
    std::vector<TriggerConfig> triggers;

    /**
     * Load configuration from a YAML file
     * @throws ConfigurationError if the file exists but is invalid
     *
     * If the file doesn't exist, returns the default configuration with a warning.
     */
    static SystemConfig load(const std::string& yaml_path);

    /**
     * Parse configuration from YAML text (same rules as load)
     * @throws ConfigurationError
     */
    static SystemConfig parse(const std::string& yaml_text);

    /**
     * Default configuration: one bay, a range sensor and two lateral zones
     */
    static SystemConfig get_default();

    /**
     * Cross-reference checks
     * @throws ConfigurationError on the first problem found
     */
    void validate() const;

    void print_summary() const;

    const SensorConfig* find_sensor(const std::string& id) const;
    const bay::BayConfig* find_bay(const std::string& id) const;
};

/**
 * build_triggers() - Trigger engine with every configured trigger registered
 * @throws ConfigurationError for an unusable trigger action
 */
std::unique_ptr<triggers::TriggerEngine> build_triggers(const SystemConfig& cfg);

} // namespace config
