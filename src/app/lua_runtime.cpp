// src/app/lua_runtime.cpp
#include "app/lua_runtime.hpp"
#include "utils/logging.hpp"

namespace app {

LuaRuntime::~LuaRuntime() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaRuntime::init(const std::string& lua_script_path, const std::string& topic_prefix) {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    // Call optional scenario_init(topic_prefix) if present
    lua_getglobal(L_, "scenario_init");
    if (lua_isfunction(L_, -1)) {
        lua_pushstring(L_, topic_prefix.c_str());
        if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
            LOG_ERROR("[Lua] scenario_init failed: %s", lua_tostring(L_, -1));
            lua_close(L_);
            L_ = nullptr;
            return false;
        }
        if (lua_isboolean(L_, -1) && !lua_toboolean(L_, -1)) {
            LOG_WARN("[Lua] scenario_init returned false");
        }
        lua_pop(L_, 1);
    } else {
        lua_pop(L_, 1);
    }

    lua_getglobal(L_, "scenario_step");
    const bool has_step = lua_isfunction(L_, -1);
    lua_pop(L_, 1);
    if (!has_step) {
        LOG_ERROR("[Lua] %s does not define scenario_step()", lua_script_path.c_str());
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    return true;
}

bool LuaRuntime::read_truth_table_(int idx, sensors::GroundTruth& out) {
    if (!lua_istable(L_, idx)) return false;

    const int table = lua_absindex(L_, idx);
    lua_pushnil(L_);
    while (lua_next(L_, table) != 0) {
        if (lua_type(L_, -2) == LUA_TSTRING) {
            const std::string id = lua_tostring(L_, -2);
            if (lua_type(L_, -1) == LUA_TNUMBER) {
                out.distance_cm[id] = lua_tonumber(L_, -1);
            } else {
                out.distance_cm[id] = std::nullopt;
            }
        }
        lua_pop(L_, 1);
    }
    return true;
}

bool LuaRuntime::read_messages_table_(int idx, std::vector<triggers::MessageEvent>& out) {
    if (!lua_istable(L_, idx)) return false;

    const int table = lua_absindex(L_, idx);
    const auto n = static_cast<int>(lua_rawlen(L_, table));
    for (int i = 1; i <= n; ++i) {
        lua_rawgeti(L_, table, i);
        if (lua_istable(L_, -1)) {
            lua_getfield(L_, -1, "topic");
            lua_getfield(L_, -2, "payload");
            if (lua_type(L_, -2) == LUA_TSTRING && lua_isstring(L_, -1)) {
                out.push_back(triggers::MessageEvent{lua_tostring(L_, -2), lua_tostring(L_, -1)});
            } else {
                LOG_WARN("[Lua] Message %d needs a topic and a payload, skipped", i);
            }
            lua_pop(L_, 2);
        }
        lua_pop(L_, 1);
    }
    return true;
}

bool LuaRuntime::step(double t_s, ScenarioStep& out) {
    if (!L_) return false;

    out.truth = sensors::GroundTruth{};
    out.truth.t_s = t_s;
    out.messages.clear();

    lua_getglobal(L_, "scenario_step");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] scenario_step() missing");
        return false;
    }

    lua_pushnumber(L_, t_s);

    // returns 1 value: step table
    if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_step failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    if (!lua_istable(L_, -1)) {
        LOG_ERROR("[Lua] scenario_step must return a table");
        lua_pop(L_, 1);
        return false;
    }

    lua_getfield(L_, -1, "truth");
    if (!lua_isnil(L_, -1)) {
        read_truth_table_(-1, out.truth);
    }
    lua_pop(L_, 1);

    lua_getfield(L_, -1, "messages");
    if (!lua_isnil(L_, -1)) {
        read_messages_table_(-1, out.messages);
    }
    lua_pop(L_, 1);

    lua_pop(L_, 1);
    return true;
}

} // namespace app
