// src/sim/sim_app.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "config/microgrid_config.hpp"
#include "ess/transition_history.hpp"
#include "sim/lua_scenario.hpp"
#include "sim/microgrid_state.hpp"
#include "sim/profile_source.hpp"

namespace utils {
class CsvWriter;
class InfluxClient;
}

namespace sim {

/**
 * SimApp - Runs a microgrid simulation from a MicrogridConfig
 *
 * Modes:
 *   - dispatch:   profile/Lua inputs -> Dispatcher -> StorageUnit -> Economics
 *   - transition: profile inputs -> greedy controller -> battery model directly
 *
 * Every step produces a MicrogridState that is written to the run CSV and,
 * when enabled, to InfluxDB. run() never throws: failures are logged and
 * turned into a non-zero exit code.
 */
class SimApp {
public:
    explicit SimApp(config::MicrogridConfig cfg);
    ~SimApp();

    SimApp(const SimApp&) = delete;
    SimApp& operator=(const SimApp&) = delete;

    // Profile supplied in memory instead of simulation.profile_csv.
    void set_profile(ProfileSource profile);

    int run();

    const RunTotals& totals() const { return totals_; }
    const MicrogridState& last_state() const { return last_state_; }
    const ess::TransitionHistory& history() const { return history_; }
    const config::MicrogridConfig& config() const { return cfg_; }

private:
    void prepare_inputs_();
    int total_steps_() const;
    ScenarioInput next_input_(int step, double t_h, const ScenarioState& s);

    void run_dispatch_();
    void run_transition_();

    void open_outputs_();
    void record_step_(const MicrogridState& s);
    void close_outputs_();
    void print_totals_() const;

    config::MicrogridConfig cfg_;
    ess::TransitionHistory history_;
    std::optional<ProfileSource> profile_;

    LuaScenario lua_;
    bool lua_ready_ = false;

    std::unique_ptr<utils::CsvWriter> run_csv_;
    std::unique_ptr<utils::InfluxClient> influx_;

    RunTotals totals_;
    MicrogridState last_state_;
};

} // namespace sim
