// src/triggers/trigger_engine.cpp
#include "triggers/trigger_engine.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace triggers {

void TriggerEngine::add(Trigger trigger) {
    if (find(trigger.id())) {
        throw std::invalid_argument("Duplicate trigger id: " + trigger.id());
    }
    trigger.set_topic_prefix(prefix_);

    LOG_INFO("[Triggers] Added %s trigger '%s'%s%s", to_string(trigger.kind()),
             trigger.id().c_str(),
             trigger.has_topic() ? " on " : "",
             trigger.has_topic() ? trigger.topic().c_str() : "");
    triggers_.push_back(std::move(trigger));
}

void TriggerEngine::set_topic_prefix(const std::string& prefix) {
    prefix_ = prefix;
    for (auto& t : triggers_) {
        t.set_topic_prefix(prefix_);
    }
}

std::vector<std::string> TriggerEngine::topics() const {
    std::vector<std::string> out;
    for (const auto& t : triggers_) {
        if (!t.has_topic()) continue;
        if (std::find(out.begin(), out.end(), t.topic()) == out.end()) {
            out.push_back(t.topic());
        }
    }
    return out;
}

void TriggerEngine::post(MessageEvent msg) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.push_back(std::move(msg));
}

size_t TriggerEngine::pending() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

CommandBatch TriggerEngine::cycle(const bay::BayStatusMap& statuses) {
    std::vector<MessageEvent> messages;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        messages.swap(pending_);
    }

    std::vector<Event> events;
    events.reserve(messages.size() + statuses.size());
    for (auto& m : messages) {
        events.emplace_back(std::move(m));
    }

    for (const auto& [bay_id, status] : statuses) {
        events.emplace_back(BayEvent{bay_id, status.motion});
    }

    for (const auto& ev : events) {
        size_t handled = 0;
        for (auto& t : triggers_) {
            if (t.observe(ev, statuses) != Disposition::Ignored) {
                handled++;
            }
        }
        if (handled == 0) {
            if (const auto* msg = std::get_if<MessageEvent>(&ev)) {
                LOG_DEBUG("[Triggers] No trigger for topic '%s'", msg->topic.c_str());
            }
        }
    }

    CommandBatch batch;
    for (auto& t : triggers_) {
        if (!t.triggered()) continue;
        for (Command c : t.drain()) {
            if (is_system_command(c)) {
                batch.system.push_back({c, t.id()});
            } else {
                batch.bay.push_back({t.bay_id(), c, t.id()});
            }
        }
    }
    return batch;
}

const Trigger* TriggerEngine::find(const std::string& id) const {
    const std::string key = Trigger::normalize_id(id);
    for (const auto& t : triggers_) {
        if (t.id() == key) return &t;
    }
    return nullptr;
}

} // namespace triggers
