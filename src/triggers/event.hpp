// src/triggers/event.hpp
#pragma once

#include "bay/bay_status.hpp"
#include <string>
#include <variant>

namespace triggers {

// External message (e.g. delivered by an MQTT bridge)
struct MessageEvent {
    std::string topic;
    std::string payload;
};

// Bay-internal change, derived from the cycle's BayStatus
struct BayEvent {
    std::string bay_id;
    bay::Motion motion = bay::Motion::Unknown;
};

using Event = std::variant<MessageEvent, BayEvent>;

} // namespace triggers
