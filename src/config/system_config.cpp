// src/config/system_config.cpp
#include "config/system_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <set>

namespace config {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

units::Quantity read_quantity(const YAML::Node& node, const char* key,
                              const units::Quantity& fallback, const std::string& where) {
    const YAML::Node value = node[key];
    if (!value) {
        return fallback;
    }
    try {
        return units::Quantity::parse(value.as<std::string>());
    } catch (const units::UnitError& e) {
        throw ConfigurationError(where + "." + key + ": " + e.what());
    }
}

std::string require_string(const YAML::Node& node, const char* key, const std::string& where) {
    const YAML::Node value = node[key];
    if (!value || value.as<std::string>().empty()) {
        throw ConfigurationError(where + ": missing '" + key + "'");
    }
    return value.as<std::string>();
}

bay::Side parse_side(const std::string& text, const std::string& where) {
    const std::string s = lower(text);
    if (s == "l" || s == "left") return bay::Side::Left;
    if (s == "r" || s == "right") return bay::Side::Right;
    throw ConfigurationError(where + ".side: expected L or R, got '" + text + "'");
}

triggers::TriggerKind parse_kind(const std::string& text, const std::string& where) {
    const std::string s = lower(text);
    if (s == "syscmd" || s == "system_command") return triggers::TriggerKind::SystemCommand;
    if (s == "baycmd" || s == "bay_command")    return triggers::TriggerKind::BayCommand;
    if (s == "mqtt_sensor")                     return triggers::TriggerKind::MqttSensor;
    if (s == "range")                           return triggers::TriggerKind::Range;
    throw ConfigurationError(where + ".type: unknown trigger type '" + text + "'");
}

triggers::TopicMode parse_topic_mode(const std::string& text, const std::string& where) {
    const std::string s = lower(text);
    if (s == "full") return triggers::TopicMode::Full;
    if (s == "suffix") return triggers::TopicMode::Suffix;
    throw ConfigurationError(where + ".topic_mode: expected full or suffix, got '" + text + "'");
}

units::Unit parse_unit_field(const std::string& text, const std::string& where) {
    try {
        return units::parse_unit(text);
    } catch (const units::UnitError& e) {
        throw ConfigurationError(where + ".unit: " + e.what());
    }
}

// ============================================================================
// Sections
// ============================================================================

SensorConfig parse_sensor(const YAML::Node& node, size_t index) {
    const std::string where = "sensors[" + std::to_string(index) + "]";

    SensorConfig s;
    s.id = require_string(node, "id", where);
    const std::string tag = "sensor '" + s.id + "'";

    if (node["unit"]) {
        s.unit = parse_unit_field(node["unit"].as<std::string>(), tag);
    }
    s.max_range = read_quantity(node, "max_range", s.max_range, tag);
    s.noise_stddev = read_quantity(node, "noise_stddev", s.noise_stddev, tag);
    s.quantization = read_quantity(node, "quantization", s.quantization, tag);
    s.dropout_rate = node["dropout_rate"].as<double>(s.dropout_rate);
    s.update_hz = node["update_hz"].as<double>(s.update_hz);
    s.random_seed = node["seed"].as<uint64_t>(s.random_seed);
    return s;
}

bay::LateralZoneConfig parse_zone(const YAML::Node& node, const bay::LateralZoneConfig& defaults,
                                  const std::string& where) {
    bay::LateralZoneConfig z = defaults;
    z.sensor_id = require_string(node, "sensor", where);
    z.zone_id = node["zone"].as<std::string>(z.sensor_id);

    if (node["side"]) {
        z.side = parse_side(node["side"].as<std::string>(), where);
    }
    z.ideal_offset = read_quantity(node, "ideal_offset", z.ideal_offset, where);
    z.ok_spread = read_quantity(node, "ok_spread", z.ok_spread, where);
    z.warn_spread = read_quantity(node, "warn_spread", z.warn_spread, where);
    z.critical_spread = read_quantity(node, "critical_spread", z.critical_spread, where);

    if (!node["intercept"]) {
        throw ConfigurationError(where + ": missing 'intercept'");
    }
    z.intercept_range = read_quantity(node, "intercept", z.intercept_range, where);
    return z;
}

bay::BayConfig parse_bay(const YAML::Node& node, size_t index, units::UnitSystem system) {
    bay::BayConfig b;
    b.id = require_string(node, "id", "bays[" + std::to_string(index) + "]");
    b.name = node["name"].as<std::string>(b.id);
    b.unit_system = system;

    const std::string tag = "bay '" + b.id + "'";

    b.park_time = read_quantity(node, "park_time", b.park_time, tag);
    b.motion_margin = read_quantity(node, "motion_margin", b.motion_margin, tag);
    b.dock_timeout = read_quantity(node, "dock_timeout", b.dock_timeout, tag);
    b.undock_timeout = read_quantity(node, "undock_timeout", b.undock_timeout, tag);
    b.occupancy_score = node["occupancy_score"].as<int>(b.occupancy_score);

    const YAML::Node range = node["range"];
    if (!range) {
        throw ConfigurationError(tag + ": missing 'range' section");
    }
    const std::string rtag = tag + ".range";
    b.range.sensor_id = require_string(range, "sensor", rtag);
    b.range.offset = read_quantity(range, "offset", b.range.offset, rtag);
    b.range.max_detect_range = read_quantity(range, "max_detect_range", b.range.max_detect_range, rtag);
    b.range.stop_distance = read_quantity(range, "stop_distance", b.range.stop_distance, rtag);

    const YAML::Node lateral = node["lateral"];
    if (lateral) {
        // Section-wide defaults, overridden per zone
        bay::LateralZoneConfig defaults;
        const std::string dtag = tag + ".lateral.defaults";
        if (const YAML::Node d = lateral["defaults"]) {
            if (d["side"]) {
                defaults.side = parse_side(d["side"].as<std::string>(), dtag);
            }
            defaults.ideal_offset = read_quantity(d, "ideal_offset", defaults.ideal_offset, dtag);
            defaults.ok_spread = read_quantity(d, "ok_spread", defaults.ok_spread, dtag);
            defaults.warn_spread = read_quantity(d, "warn_spread", defaults.warn_spread, dtag);
            defaults.critical_spread = read_quantity(d, "critical_spread", defaults.critical_spread, dtag);
        }

        const YAML::Node zones = lateral["zones"];
        if (zones) {
            if (!zones.IsSequence()) {
                throw ConfigurationError(tag + ".lateral.zones must be a list");
            }
            for (size_t i = 0; i < zones.size(); ++i) {
                const std::string ztag = tag + ".lateral.zones[" + std::to_string(i) + "]";
                b.lateral.push_back(parse_zone(zones[i], defaults, ztag));
            }
        }
    }
    return b;
}

TriggerConfig parse_trigger(const YAML::Node& node, size_t index) {
    const std::string where = "triggers[" + std::to_string(index) + "]";

    TriggerConfig t;
    t.id = triggers::Trigger::normalize_id(require_string(node, "id", where));
    const std::string tag = "trigger '" + t.id + "'";

    t.kind = parse_kind(require_string(node, "type", tag), tag);
    t.topic = node["topic"].as<std::string>("");
    if (node["topic_mode"]) {
        t.topic_mode = parse_topic_mode(node["topic_mode"].as<std::string>(), tag);
    }
    t.bay_id = node["bay"].as<std::string>("");
    t.action = node["when_triggered"].as<std::string>(t.action);

    const bool has_to = static_cast<bool>(node["to"]);
    const bool has_from = static_cast<bool>(node["from"]);
    if (t.kind == triggers::TriggerKind::MqttSensor) {
        if (has_to == has_from) {
            throw ConfigurationError(tag + ": mqtt_sensor needs exactly one of 'to' or 'from'");
        }
        t.change_mode = has_to ? triggers::ChangeMode::To : triggers::ChangeMode::From;
        t.trigger_value = has_to ? node["to"].as<std::string>() : node["from"].as<std::string>();
    } else if (has_to || has_from) {
        LOG_WARN("[Config] %s: 'to'/'from' only apply to mqtt_sensor, ignored", tag.c_str());
    }
    return t;
}

SystemConfig from_node(const YAML::Node& root) {
    SystemConfig cfg;

    // ====================================================================
    // System
    // ====================================================================
    if (const YAML::Node sys = root["system"]) {
        cfg.name = sys["name"].as<std::string>(cfg.name);
        if (sys["unit_system"]) {
            try {
                cfg.unit_system = units::parse_unit_system(sys["unit_system"].as<std::string>());
            } catch (const units::UnitError& e) {
                throw ConfigurationError(std::string("system.unit_system: ") + e.what());
            }
        }
        cfg.topic_prefix = sys["topic_prefix"].as<std::string>(cfg.topic_prefix);
        cfg.log_level = sys["log_level"].as<std::string>(cfg.log_level);
        cfg.cycle_hz = sys["cycle_hz"].as<double>(cfg.cycle_hz);

        const int capacity = sys["buffer_capacity"].as<int>(static_cast<int>(cfg.buffer_capacity));
        if (capacity <= 0) {
            throw ConfigurationError("system.buffer_capacity must be > 0");
        }
        cfg.buffer_capacity = static_cast<size_t>(capacity);
    }

    // ====================================================================
    // Sensors
    // ====================================================================
    if (const YAML::Node sensors = root["sensors"]) {
        if (!sensors.IsSequence()) {
            throw ConfigurationError("'sensors' must be a list");
        }
        for (size_t i = 0; i < sensors.size(); ++i) {
            cfg.sensors.push_back(parse_sensor(sensors[i], i));
        }
    }

    // ====================================================================
    // Bays
    // ====================================================================
    if (const YAML::Node bays = root["bays"]) {
        if (!bays.IsSequence()) {
            throw ConfigurationError("'bays' must be a list");
        }
        for (size_t i = 0; i < bays.size(); ++i) {
            cfg.bays.push_back(parse_bay(bays[i], i, cfg.unit_system));
        }
    }

    // ====================================================================
    // Triggers
    // ====================================================================
    if (const YAML::Node trigs = root["triggers"]) {
        if (!trigs.IsSequence()) {
            throw ConfigurationError("'triggers' must be a list");
        }
        for (size_t i = 0; i < trigs.size(); ++i) {
            cfg.triggers.push_back(parse_trigger(trigs[i], i));
        }
    }

    cfg.validate();
    return cfg;
}

SystemConfig parse_document(const std::function<YAML::Node()>& loader) {
    try {
        return from_node(loader());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("[Config] YAML error: ") + e.what());
    }
}

} // namespace

// ============================================================================
// SensorConfig / TriggerConfig
// ============================================================================

sensors::SyntheticSensorParams SensorConfig::to_params() const {
    sensors::SyntheticSensorParams p;
    p.id = id;
    p.unit = unit;
    p.max_range_cm = max_range.value_in(units::Unit::Centimeter);
    p.noise_stddev_cm = noise_stddev.value_in(units::Unit::Centimeter);
    p.quantization_cm = quantization.value_in(units::Unit::Centimeter);
    p.dropout_rate = dropout_rate;
    p.update_hz = update_hz;
    p.random_seed = random_seed;
    return p;
}

triggers::TopicMode TriggerConfig::resolved_topic_mode() const {
    if (topic_mode) {
        return *topic_mode;
    }
    // Command topics live under the system prefix, sensor topics belong to other systems
    return kind == triggers::TriggerKind::MqttSensor ? triggers::TopicMode::Full
                                                     : triggers::TopicMode::Suffix;
}

// ============================================================================
// SystemConfig
// ============================================================================

SystemConfig SystemConfig::load(const std::string& yaml_path) {
    // Check if file exists
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[Config] File not found: %s", yaml_path.c_str());
        LOG_WARN("[Config] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[Config] Loading configuration from: %s", yaml_path.c_str());

    SystemConfig cfg = parse_document([&]() { return YAML::LoadFile(yaml_path); });

    LOG_INFO("[Config] Successfully loaded: %s", cfg.name.c_str());
    cfg.print_summary();
    return cfg;
}

SystemConfig SystemConfig::parse(const std::string& yaml_text) {
    return parse_document([&]() { return YAML::Load(yaml_text); });
}

SystemConfig SystemConfig::get_default() {
    SystemConfig cfg;
    cfg.name = "bayassist (default)";

    for (const char* id : {"range", "front", "rear"}) {
        SensorConfig s;
        s.id = id;
        cfg.sensors.push_back(s);
    }
    cfg.sensors[0].max_range = units::cm(600.0);

    bay::BayConfig b;
    b.id = "bay1";
    b.name = "Bay 1";
    b.range.sensor_id = "range";
    b.range.max_detect_range = units::cm(500.0);
    b.range.stop_distance = units::cm(30.0);

    bay::LateralZoneConfig front;
    front.zone_id = "front";
    front.sensor_id = "front";
    front.side = bay::Side::Right;
    front.ideal_offset = units::cm(60.0);
    front.intercept_range = units::cm(150.0);

    bay::LateralZoneConfig rear = front;
    rear.zone_id = "rear";
    rear.sensor_id = "rear";
    rear.intercept_range = units::cm(400.0);

    b.lateral = {front, rear};
    cfg.bays.push_back(b);

    TriggerConfig sys;
    sys.id = "system";
    sys.kind = triggers::TriggerKind::SystemCommand;
    sys.topic = "command";
    cfg.triggers.push_back(sys);

    TriggerConfig baycmd;
    baycmd.id = "bay1_command";
    baycmd.kind = triggers::TriggerKind::BayCommand;
    baycmd.topic = "command";
    baycmd.bay_id = "bay1";
    cfg.triggers.push_back(baycmd);

    TriggerConfig range;
    range.id = "bay1_range";
    range.kind = triggers::TriggerKind::Range;
    range.bay_id = "bay1";
    cfg.triggers.push_back(range);

    return cfg;
}

void SystemConfig::validate() const {
    if (cycle_hz <= 0.0) {
        throw ConfigurationError("system.cycle_hz must be > 0");
    }
    if (buffer_capacity == 0) {
        throw ConfigurationError("system.buffer_capacity must be > 0");
    }

    std::set<std::string> sensor_ids;
    for (const auto& s : sensors) {
        if (!sensor_ids.insert(s.id).second) {
            throw ConfigurationError("Duplicate sensor id '" + s.id + "'");
        }
        if (s.dropout_rate < 0.0 || s.dropout_rate > 1.0) {
            throw ConfigurationError("sensor '" + s.id + "'.dropout_rate must be in [0, 1]");
        }
        if (s.max_range.dimension() != units::Dimension::Distance ||
            s.noise_stddev.dimension() != units::Dimension::Distance ||
            s.quantization.dimension() != units::Dimension::Distance) {
            throw ConfigurationError("sensor '" + s.id + "': range parameters must be distances");
        }
        if (units::dimension_of(s.unit) != units::Dimension::Distance) {
            throw ConfigurationError("sensor '" + s.id + "'.unit must be a distance unit, got '" +
                                     units::to_string(s.unit) + "'");
        }
    }

    std::set<std::string> bay_ids;
    for (const auto& b : bays) {
        if (!bay_ids.insert(b.id).second) {
            throw ConfigurationError("Duplicate bay id '" + b.id + "'");
        }
        if (!sensor_ids.count(b.range.sensor_id)) {
            throw ConfigurationError("bay '" + b.id + "'.range: unknown sensor '" +
                                     b.range.sensor_id + "'");
        }
        for (const auto& z : b.lateral) {
            if (!sensor_ids.count(z.sensor_id)) {
                throw ConfigurationError("bay '" + b.id + "' zone '" + z.zone_id +
                                         "': unknown sensor '" + z.sensor_id + "'");
            }
        }
    }

    std::set<std::string> trigger_ids;
    for (const auto& t : triggers) {
        const std::string tag = "trigger '" + t.id + "'";
        if (!trigger_ids.insert(t.id).second) {
            throw ConfigurationError("Duplicate trigger id '" + t.id + "'");
        }

        const bool needs_bay = t.kind != triggers::TriggerKind::SystemCommand;
        if (needs_bay && !bay_ids.count(t.bay_id)) {
            throw ConfigurationError(tag + ": unknown bay '" + t.bay_id + "'");
        }

        const bool needs_topic = t.kind != triggers::TriggerKind::Range;
        if (needs_topic && t.topic.empty()) {
            throw ConfigurationError(tag + ": missing 'topic'");
        }

        if (t.kind == triggers::TriggerKind::MqttSensor && !t.change_mode) {
            throw ConfigurationError(tag + ": mqtt_sensor needs exactly one of 'to' or 'from'");
        }

        if ((t.kind == triggers::TriggerKind::MqttSensor || t.kind == triggers::TriggerKind::Range) &&
            !triggers::TriggerAction::parse(t.action)) {
            throw ConfigurationError(tag + ": invalid when_triggered '" + t.action + "'");
        }
    }

    LOG_DEBUG("[Config] Validation passed");
}

void SystemConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("System Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    LOG_INFO("Units: %s, topic prefix: %s", units::to_string(unit_system), topic_prefix.c_str());
    LOG_INFO("Cycle: %.1f Hz, buffer capacity: %zu", cycle_hz, buffer_capacity);
    LOG_INFO("----------------------------------------");
    for (const auto& s : sensors) {
        LOG_INFO("Sensor %-10s %s, max %s", s.id.c_str(), units::to_string(s.unit),
                 s.max_range.to_string().c_str());
    }
    for (const auto& b : bays) {
        LOG_INFO("Bay %s (%s): range '%s' max %s stop %s, %zu lateral zone(s)",
                 b.id.c_str(), b.name.c_str(), b.range.sensor_id.c_str(),
                 b.range.max_detect_range.to_string().c_str(),
                 b.range.stop_distance.to_string().c_str(), b.lateral.size());
    }
    for (const auto& t : triggers) {
        LOG_INFO("Trigger %s: %s%s%s", t.id.c_str(), triggers::to_string(t.kind),
                 t.bay_id.empty() ? "" : " bay=", t.bay_id.c_str());
    }
    LOG_INFO("========================================");
}

const SensorConfig* SystemConfig::find_sensor(const std::string& id) const {
    for (const auto& s : sensors) {
        if (s.id == id) return &s;
    }
    return nullptr;
}

const bay::BayConfig* SystemConfig::find_bay(const std::string& id) const {
    for (const auto& b : bays) {
        if (b.id == id) return &b;
    }
    return nullptr;
}

// ============================================================================
// Trigger factory
// ============================================================================

std::unique_ptr<triggers::TriggerEngine> build_triggers(const SystemConfig& cfg) {
    auto engine = std::make_unique<triggers::TriggerEngine>();
    engine->set_topic_prefix(cfg.topic_prefix);

    for (const auto& t : cfg.triggers) {
        const triggers::TopicMode mode = t.resolved_topic_mode();

        switch (t.kind) {
            case triggers::TriggerKind::SystemCommand:
                engine->add(triggers::Trigger::system_command(t.id, t.topic, mode));
                break;

            case triggers::TriggerKind::BayCommand:
                engine->add(triggers::Trigger::bay_command(t.id, t.topic, t.bay_id, mode));
                break;

            case triggers::TriggerKind::MqttSensor:
            case triggers::TriggerKind::Range: {
                auto action = triggers::TriggerAction::parse(t.action);
                if (!action) {
                    throw ConfigurationError("trigger '" + t.id + "': invalid when_triggered '" +
                                             t.action + "'");
                }
                if (t.kind == triggers::TriggerKind::Range) {
                    engine->add(triggers::Trigger::range(t.id, t.bay_id, *action));
                } else {
                    engine->add(triggers::Trigger::mqtt_sensor(
                        t.id, t.topic, t.bay_id,
                        t.change_mode.value_or(triggers::ChangeMode::To),
                        t.trigger_value, *action, mode));
                }
                break;
            }
        }
    }
    return engine;
}

} // namespace config
