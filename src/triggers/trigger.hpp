// src/triggers/trigger.hpp
#pragma once

#include "bay/bay_status.hpp"
#include "triggers/command.hpp"
#include "triggers/command_queue.hpp"
#include "triggers/event.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace triggers {

enum class TriggerKind {
    SystemCommand,
    BayCommand,
    MqttSensor,
    Range
};

enum class TopicMode {
    Full,       // configured topic used as-is
    Suffix      // joined to the topic prefix (and bay id for bay commands)
};

enum class ChangeMode {
    To,         // fire whenever the payload equals the value
    From        // fire when the payload leaves the value
};

// What happened to one event at one trigger
enum class Disposition {
    Ignored,        // not for this trigger
    Observed,       // state updated, nothing fired
    Fired,          // commands produced
    Filtered,       // valid command suppressed by bay state
    UnknownCommand  // payload is not a command this trigger accepts
};

/**
 * TriggerAction - What a sensor-style trigger does when it fires
 *
 * "occupancy" picks dock or undock from the bay's occupancy; anything else
 * must name a bay command.
 */
struct TriggerAction {
    bool from_occupancy = true;
    Command command = Command::Dock;

    static TriggerAction occupancy() { return TriggerAction{}; }
    static TriggerAction literal(Command c) { return TriggerAction{false, c}; }

    // nullopt for unknown text or a system command
    static std::optional<TriggerAction> parse(const std::string& text);

    std::string to_string() const;
};

// ============================================================================
// Watch states
// ============================================================================

struct SystemCommandWatch {};

struct BayCommandWatch {
    std::string bay_id;
};

struct MqttSensorWatch {
    std::string bay_id;
    ChangeMode mode = ChangeMode::To;
    std::string value;                      // lower-cased
    TriggerAction action;
    std::optional<std::string> previous;    // last observed payload, lower-cased
};

struct RangeWatch {
    std::string bay_id;
    TriggerAction action;
};

using WatchState = std::variant<SystemCommandWatch, BayCommandWatch, MqttSensorWatch, RangeWatch>;

struct Transition {
    WatchState next;
    std::vector<Command> commands;
    Disposition disposition = Disposition::Ignored;
};

/**
 * Pure transitions: (prior state, event, bay status) → (new state, commands,
 * disposition). Topic matching is done by the Trigger before these run.
 * The bay status pointer may be null when the bay is unknown.
 */
Transition transition(const SystemCommandWatch& prior, const Event& ev, const bay::BayStatus* status);
Transition transition(const BayCommandWatch& prior, const Event& ev, const bay::BayStatus* status);
Transition transition(const MqttSensorWatch& prior, const Event& ev, const bay::BayStatus* status);
Transition transition(const RangeWatch& prior, const Event& ev, const bay::BayStatus* status);

/**
 * resolve_action() - Commands for a fired sensor-style trigger
 *
 * Occupied → undock, Unoccupied → dock, Unknown or no bay → nothing.
 */
std::vector<Command> resolve_action(const TriggerAction& action, const bay::BayStatus* status);

/**
 * Trigger - Watches events and queues commands
 *
 * observe() is the only mutating entry point and never blocks. Queued
 * commands are handed over by drain().
 *
 * Usage:
 *   auto t = Trigger::bay_command("Bay 1 Command", "command", "bay1");
 *   t.set_topic_prefix("bayassist");          // topic: bayassist/bay1/command
 *   t.observe(MessageEvent{t.topic(), "dock"}, statuses);
 *   for (Command c : t.drain()) { ... }
 */
class Trigger {
public:
    // ========================================================================
    // Factories
    // ========================================================================

    static Trigger system_command(const std::string& id, const std::string& topic,
                                  TopicMode mode = TopicMode::Suffix);

    static Trigger bay_command(const std::string& id, const std::string& topic,
                               const std::string& bay_id,
                               TopicMode mode = TopicMode::Suffix);

    static Trigger mqtt_sensor(const std::string& id, const std::string& topic,
                               const std::string& bay_id, ChangeMode change,
                               const std::string& value, TriggerAction action,
                               TopicMode mode = TopicMode::Full);

    static Trigger range(const std::string& id, const std::string& bay_id,
                         TriggerAction action = TriggerAction::occupancy());

    // Lower-cased, spaces replaced with '_'
    static std::string normalize_id(const std::string& name);

    // ========================================================================
    // Operation
    // ========================================================================

    Disposition observe(const Event& ev, const bay::BayStatusMap& statuses);

    std::vector<Command> drain() { return queue_.drain_all(); }
    bool triggered() const { return !queue_.empty(); }

    void set_topic_prefix(const std::string& prefix);

    // ========================================================================
    // Accessors
    // ========================================================================

    const std::string& id() const { return id_; }
    TriggerKind kind() const { return kind_; }
    const std::string& topic() const { return topic_; }     // empty for Range
    bool has_topic() const { return kind_ != TriggerKind::Range; }
    const std::string& bay_id() const { return bay_id_; }
    const WatchState& state() const { return state_; }

private:
    Trigger(std::string id, TriggerKind kind, std::string bay_id, std::string topic,
            TopicMode mode, WatchState state);

    void resolve_topic();

    std::string id_;
    TriggerKind kind_;
    std::string bay_id_;

    std::string configured_topic_;
    TopicMode topic_mode_;
    std::string prefix_;
    std::string topic_;

    WatchState state_;
    CommandQueue queue_;
};

const char* to_string(TriggerKind k);
const char* to_string(Disposition d);
const char* to_string(ChangeMode m);
const char* to_string(TopicMode m);

} // namespace triggers
