// src/sim/lua_scenario.hpp
#pragma once

#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace sim {

// Battery state handed to scenario_step().
struct ScenarioState {
    double soe = 0.0;
    double soc = 0.0;
    double soh = 1.0;
};

// Inputs returned by scenario_step(). Missing keys keep the caller's values.
struct ScenarioInput {
    double p_g_kw = 0.0;
    double p_l_kw = 0.0;
    double alpha = 1.0;
};

/**
 * LuaScenario - Synthetic generation/load profiles from a Lua script
 *
 * Script contract:
 *   function scenario_init() ... end                      -- optional
 *   function scenario_step(step, t_h, state)             -- required
 *       return { p_g = ..., p_l = ..., alpha = ... }
 *   end
 *
 * state exposes soe, soc and soh.
 */
class LuaScenario {
public:
    LuaScenario() = default;
    ~LuaScenario();

    LuaScenario(const LuaScenario&) = delete;
    LuaScenario& operator=(const LuaScenario&) = delete;

    bool init(const std::string& lua_script_path);

    // Loads a script from a string (used by tests).
    bool init_from_string(const std::string& source);

    bool ready() const { return L_ != nullptr; }

    bool step(int step, double t_h, const ScenarioState& s, ScenarioInput& out);

private:
    lua_State* L_{nullptr};

    bool open_state_();
    bool call_init_();
    void push_state_table_(const ScenarioState& s);
    bool read_input_table_(int idx, ScenarioInput& out);
};

} // namespace sim
