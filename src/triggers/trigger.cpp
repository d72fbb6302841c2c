// src/triggers/trigger.cpp
#include "triggers/trigger.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace triggers {

namespace {

std::string normalize_payload(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    std::string s = text.substr(first, last - first + 1);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void append_segment(std::string& out, const std::string& seg) {
    if (seg.empty()) return;
    if (!out.empty() && out.back() != '/') out += '/';
    out += seg;
}

} // namespace

// ============================================================================
// TriggerAction
// ============================================================================

std::optional<TriggerAction> TriggerAction::parse(const std::string& text) {
    const std::string s = normalize_payload(text);
    if (s == "occupancy") {
        return TriggerAction::occupancy();
    }
    auto cmd = parse_command(s);
    if (!cmd || !is_bay_command(*cmd)) {
        return std::nullopt;
    }
    return TriggerAction::literal(*cmd);
}

std::string TriggerAction::to_string() const {
    return from_occupancy ? "occupancy" : triggers::to_string(command);
}

std::vector<Command> resolve_action(const TriggerAction& action, const bay::BayStatus* status) {
    if (!action.from_occupancy) {
        return {action.command};
    }
    if (!status) {
        return {};
    }
    switch (status->occupancy) {
        case bay::Occupancy::Occupied:   return {Command::Undock};
        case bay::Occupancy::Unoccupied: return {Command::Dock};
        case bay::Occupancy::Unknown:    break;
    }
    return {};
}

// ============================================================================
// Transitions
// ============================================================================

Transition transition(const SystemCommandWatch& prior, const Event& ev, const bay::BayStatus*) {
    Transition out{prior, {}, Disposition::Ignored};

    const auto* msg = std::get_if<MessageEvent>(&ev);
    if (!msg) {
        return out;
    }

    auto cmd = parse_command(msg->payload);
    if (!cmd || !is_system_command(*cmd)) {
        out.disposition = Disposition::UnknownCommand;
        return out;
    }

    out.commands.push_back(*cmd);
    out.disposition = Disposition::Fired;
    return out;
}

Transition transition(const BayCommandWatch& prior, const Event& ev, const bay::BayStatus* status) {
    Transition out{prior, {}, Disposition::Ignored};

    const auto* msg = std::get_if<MessageEvent>(&ev);
    if (!msg) {
        return out;
    }

    auto cmd = parse_command(msg->payload);
    if (!cmd || !is_bay_command(*cmd)) {
        out.disposition = Disposition::UnknownCommand;
        return out;
    }

    if (*cmd != Command::Abort) {
        // dock/undock/verify need a Ready bay with nothing in progress
        if (!status || status->active() || status->lifecycle != bay::LifecycleState::Ready) {
            out.disposition = Disposition::Filtered;
            return out;
        }
    }

    out.commands.push_back(*cmd);
    out.disposition = Disposition::Fired;
    return out;
}

Transition transition(const MqttSensorWatch& prior, const Event& ev, const bay::BayStatus* status) {
    Transition out{prior, {}, Disposition::Ignored};

    const auto* msg = std::get_if<MessageEvent>(&ev);
    if (!msg) {
        return out;
    }

    const std::string payload = normalize_payload(msg->payload);
    auto& next = std::get<MqttSensorWatch>(out.next);

    bool fire = false;
    if (prior.mode == ChangeMode::To) {
        fire = (payload == prior.value);
    } else {
        fire = prior.previous && *prior.previous == prior.value && payload != prior.value;
    }
    next.previous = payload;

    if (!fire) {
        out.disposition = Disposition::Observed;
        return out;
    }

    out.commands = resolve_action(prior.action, status);
    out.disposition = out.commands.empty() ? Disposition::Filtered : Disposition::Fired;
    return out;
}

Transition transition(const RangeWatch& prior, const Event& ev, const bay::BayStatus* status) {
    Transition out{prior, {}, Disposition::Ignored};

    const auto* be = std::get_if<BayEvent>(&ev);
    if (!be || be->bay_id != prior.bay_id) {
        return out;
    }

    if (be->motion != bay::Motion::Approaching && be->motion != bay::Motion::Receding) {
        out.disposition = Disposition::Observed;
        return out;
    }

    // Motion is reported every cycle; a bay already docking or undocking needs no repeat
    if (!status || status->active() || status->lifecycle != bay::LifecycleState::Ready) {
        out.disposition = Disposition::Filtered;
        return out;
    }

    // A vehicle moving away from an empty bay has nothing to dock
    if (prior.action.from_occupancy && be->motion == bay::Motion::Receding &&
        status->occupancy == bay::Occupancy::Unoccupied) {
        out.disposition = Disposition::Filtered;
        return out;
    }

    out.commands = resolve_action(prior.action, status);
    out.disposition = out.commands.empty() ? Disposition::Filtered : Disposition::Fired;
    return out;
}

// ============================================================================
// Trigger
// ============================================================================

Trigger::Trigger(std::string id, TriggerKind kind, std::string bay_id, std::string topic,
                 TopicMode mode, WatchState state)
    : id_(normalize_id(id)),
      kind_(kind),
      bay_id_(std::move(bay_id)),
      configured_topic_(std::move(topic)),
      topic_mode_(mode),
      state_(std::move(state))
{
    resolve_topic();
}

Trigger Trigger::system_command(const std::string& id, const std::string& topic, TopicMode mode) {
    return Trigger(id, TriggerKind::SystemCommand, "", topic, mode, SystemCommandWatch{});
}

Trigger Trigger::bay_command(const std::string& id, const std::string& topic,
                             const std::string& bay_id, TopicMode mode) {
    return Trigger(id, TriggerKind::BayCommand, bay_id, topic, mode, BayCommandWatch{bay_id});
}

Trigger Trigger::mqtt_sensor(const std::string& id, const std::string& topic,
                             const std::string& bay_id, ChangeMode change,
                             const std::string& value, TriggerAction action, TopicMode mode) {
    MqttSensorWatch watch;
    watch.bay_id = bay_id;
    watch.mode = change;
    watch.value = normalize_payload(value);
    watch.action = action;
    return Trigger(id, TriggerKind::MqttSensor, bay_id, topic, mode, std::move(watch));
}

Trigger Trigger::range(const std::string& id, const std::string& bay_id, TriggerAction action) {
    return Trigger(id, TriggerKind::Range, bay_id, "", TopicMode::Full, RangeWatch{bay_id, action});
}

std::string Trigger::normalize_id(const std::string& name) {
    std::string s = normalize_payload(name);
    std::replace(s.begin(), s.end(), ' ', '_');
    return s;
}

void Trigger::set_topic_prefix(const std::string& prefix) {
    prefix_ = prefix;
    resolve_topic();
}

void Trigger::resolve_topic() {
    if (kind_ == TriggerKind::Range) {
        topic_.clear();
        return;
    }
    if (topic_mode_ == TopicMode::Full) {
        topic_ = configured_topic_;
        return;
    }

    std::string t;
    append_segment(t, prefix_);
    if (kind_ == TriggerKind::BayCommand) {
        append_segment(t, bay_id_);
    }
    append_segment(t, configured_topic_);
    topic_ = t;
}

Disposition Trigger::observe(const Event& ev, const bay::BayStatusMap& statuses) {
    if (const auto* msg = std::get_if<MessageEvent>(&ev)) {
        if (!has_topic() || msg->topic != topic_) {
            return Disposition::Ignored;
        }
    }

    const bay::BayStatus* status = nullptr;
    if (!bay_id_.empty()) {
        auto it = statuses.find(bay_id_);
        if (it != statuses.end()) {
            status = &it->second;
        }
    }

    Transition tr = std::visit([&](const auto& s) { return transition(s, ev, status); }, state_);
    state_ = std::move(tr.next);
    for (Command c : tr.commands) {
        queue_.enqueue(c);
    }

    const auto* msg = std::get_if<MessageEvent>(&ev);
    switch (tr.disposition) {
        case Disposition::Fired:
            for (Command c : tr.commands) {
                LOG_DEBUG("[Trigger %s] Queued '%s'", id_.c_str(), to_string(c));
            }
            break;
        case Disposition::UnknownCommand:
            LOG_WARN("[Trigger %s] Discarding unknown command '%s'", id_.c_str(),
                     msg ? msg->payload.c_str() : "");
            break;
        case Disposition::Filtered:
            if (!status) {
                LOG_WARN("[Trigger %s] Bay '%s' has no status, nothing queued",
                         id_.c_str(), bay_id_.c_str());
            } else if (kind_ == TriggerKind::BayCommand) {
                LOG_INFO("[Trigger %s] Ignoring '%s', bay %s is %s/%s", id_.c_str(),
                         msg ? msg->payload.c_str() : "", bay_id_.c_str(),
                         bay::to_string(status->lifecycle), bay::to_string(status->activity));
            } else {
                LOG_WARN("[Trigger %s] Occupancy of bay %s is %s, no command issued",
                         id_.c_str(), bay_id_.c_str(), bay::to_string(status->occupancy));
            }
            break;
        case Disposition::Ignored:
        case Disposition::Observed:
            break;
    }
    return tr.disposition;
}

// ============================================================================
// String forms
// ============================================================================

const char* to_string(TriggerKind k) {
    switch (k) {
        case TriggerKind::SystemCommand: return "syscmd";
        case TriggerKind::BayCommand:    return "baycmd";
        case TriggerKind::MqttSensor:    return "mqtt_sensor";
        case TriggerKind::Range:         return "range";
    }
    return "unknown";
}

const char* to_string(Disposition d) {
    switch (d) {
        case Disposition::Ignored:        return "ignored";
        case Disposition::Observed:       return "observed";
        case Disposition::Fired:          return "fired";
        case Disposition::Filtered:       return "filtered";
        case Disposition::UnknownCommand: return "unknown_command";
    }
    return "unknown";
}

const char* to_string(ChangeMode m) {
    return m == ChangeMode::To ? "to" : "from";
}

const char* to_string(TopicMode m) {
    return m == TopicMode::Full ? "full" : "suffix";
}

} // namespace triggers
