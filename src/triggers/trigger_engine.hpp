// src/triggers/trigger_engine.hpp
#pragma once

#include "bay/bay_status.hpp"
#include "triggers/trigger.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace triggers {

struct SystemCommandEntry {
    Command command;
    std::string trigger_id;
};

struct BayCommandEntry {
    std::string bay_id;
    Command command;
    std::string trigger_id;
};

// Everything the triggers asked for in one cycle, in registration order
struct CommandBatch {
    std::vector<SystemCommandEntry> system;
    std::vector<BayCommandEntry> bay;

    bool empty() const { return system.empty() && bay.empty(); }
};

/**
 * TriggerEngine - Owns the triggers and runs them once per cycle
 *
 * Messages may arrive from another thread through post(); they are buffered
 * and only evaluated inside cycle(), so every trigger sees the same bay
 * status snapshot.
 *
 * Usage:
 *   TriggerEngine engine;
 *   engine.set_topic_prefix("bayassist");
 *   engine.add(Trigger::system_command("System", "command"));
 *
 *   engine.post({"bayassist/command", "rescan"});   // any thread
 *   CommandBatch batch = engine.cycle(statuses);    // loop thread
 */
class TriggerEngine {
public:
    /**
     * add() - Register a trigger
     * @throws std::invalid_argument if the id is already registered
     */
    void add(Trigger trigger);

    void set_topic_prefix(const std::string& prefix);
    const std::string& topic_prefix() const { return prefix_; }

    // Resolved topics of all message-driven triggers, without duplicates
    std::vector<std::string> topics() const;

    // Thread-safe
    void post(MessageEvent msg);
    size_t pending() const;

    /**
     * cycle() - Evaluate pending messages and bay changes, collect commands
     *
     * Every bay in statuses yields one BayEvent per cycle, after the messages.
     */
    CommandBatch cycle(const bay::BayStatusMap& statuses);

    const Trigger* find(const std::string& id) const;
    size_t size() const { return triggers_.size(); }

private:
    std::vector<Trigger> triggers_;
    std::string prefix_;

    mutable std::mutex pending_mutex_;
    std::vector<MessageEvent> pending_;
};

} // namespace triggers
