// src/sim/lua_scenario.cpp
#include "sim/lua_scenario.hpp"
#include "utils/logging.hpp"

namespace sim {

LuaScenario::~LuaScenario() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaScenario::open_state_() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);
    return true;
}

bool LuaScenario::init(const std::string& lua_script_path) {
    if (!open_state_()) return false;

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        MGSIM_LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    MGSIM_LOG_INFO("[Lua] Loaded scenario %s", lua_script_path.c_str());
    return call_init_();
}

bool LuaScenario::init_from_string(const std::string& source) {
    if (!open_state_()) return false;

    if (luaL_dostring(L_, source.c_str()) != LUA_OK) {
        MGSIM_LOG_ERROR("[Lua] Failed to load chunk: %s", lua_tostring(L_, -1));
        lua_close(L_);
        L_ = nullptr;
        return false;
    }
    return call_init_();
}

bool LuaScenario::call_init_() {
    // Call optional scenario_init() if present
    lua_getglobal(L_, "scenario_init");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        return true;
    }

    if (lua_pcall(L_, 0, 0, 0) != LUA_OK) {
        MGSIM_LOG_ERROR("[Lua] scenario_init failed: %s", lua_tostring(L_, -1));
        lua_close(L_);
        L_ = nullptr;
        return false;
    }
    return true;
}

void LuaScenario::push_state_table_(const ScenarioState& s) {
    lua_newtable(L_);

    auto set_num = [&](const char* k, double v) {
        lua_pushstring(L_, k);
        lua_pushnumber(L_, v);
        lua_settable(L_, -3);
    };

    set_num("soe", s.soe);
    set_num("soc", s.soc);
    set_num("soh", s.soh);
}

bool LuaScenario::read_input_table_(int idx, ScenarioInput& out) {
    if (!lua_istable(L_, idx)) return false;

    auto get_num = [&](const char* k, double def) -> double {
        lua_getfield(L_, idx, k);
        double v = def;
        if (lua_isnumber(L_, -1)) v = lua_tonumber(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    out.p_g_kw = get_num("p_g", out.p_g_kw);
    out.p_l_kw = get_num("p_l", out.p_l_kw);
    out.alpha = get_num("alpha", out.alpha);

    return true;
}

bool LuaScenario::step(int step, double t_h, const ScenarioState& s, ScenarioInput& out) {
    if (!L_) return false;

    lua_getglobal(L_, "scenario_step");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        MGSIM_LOG_ERROR("[Lua] scenario_step() missing");
        return false;
    }

    lua_pushinteger(L_, step);
    lua_pushnumber(L_, t_h);
    push_state_table_(s);

    // returns 1 value: input table
    if (lua_pcall(L_, 3, 1, 0) != LUA_OK) {
        MGSIM_LOG_ERROR("[Lua] scenario_step failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    const bool ok = read_input_table_(-1, out);
    lua_pop(L_, 1);
    if (!ok) {
        MGSIM_LOG_ERROR("[Lua] scenario_step must return a table");
    }
    return ok;
}

} // namespace sim
