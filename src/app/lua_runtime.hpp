// src/app/lua_runtime.hpp
#pragma once

#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "sensors/sensor_base.hpp"
#include "triggers/event.hpp"

namespace app {

// One scenario tick: what the sensors should see and which messages arrive
struct ScenarioStep {
    sensors::GroundTruth truth;
    std::vector<triggers::MessageEvent> messages;
};

/**
 * LuaRuntime - Scripted scenarios
 *
 * The script defines
 *   scenario_init(topic_prefix)      optional, may return false to warn
 *   scenario_step(t)                 returns {
 *       truth    = { <sensor_id> = <distance_cm> | false, ... },
 *       messages = { { topic = "...", payload = "..." }, ... } }
 *
 * A sensor mapped to false (or absent) sees nothing.
 */
class LuaRuntime {
public:
    LuaRuntime() = default;
    ~LuaRuntime();

    LuaRuntime(const LuaRuntime&) = delete;
    LuaRuntime& operator=(const LuaRuntime&) = delete;

    bool init(const std::string& lua_script_path, const std::string& topic_prefix);

    bool step(double t_s, ScenarioStep& out);

    bool ready() const { return L_ != nullptr; }

private:
    lua_State* L_{nullptr};

    bool read_truth_table_(int idx, sensors::GroundTruth& out);
    bool read_messages_table_(int idx, std::vector<triggers::MessageEvent>& out);
};

} // namespace app
