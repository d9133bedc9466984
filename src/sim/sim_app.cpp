// src/sim/sim_app.cpp
#include "sim/sim_app.hpp"
#include "ess/model_factory.hpp"
#include "ess/storage_unit.hpp"
#include "grid/dispatcher.hpp"
#include "grid/economics.hpp"
#include "grid/greedy_controller.hpp"
#include "sim/state_visitor.hpp"
#include "utils/csv.hpp"
#include "utils/influx.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace sim {

SimApp::SimApp(config::MicrogridConfig cfg)
    : cfg_(std::move(cfg)),
      history_(cfg_.simulation.history_capacity > 0 ? cfg_.simulation.history_capacity
                                                    : ess::TransitionHistory::kDefaultCapacity) {
    if (!cfg_.logging.file.empty()) {
        utils::open_log_file(cfg_.logging.file);
    }
}

SimApp::~SimApp() {
    close_outputs_();
}

void SimApp::set_profile(ProfileSource profile) {
    profile_ = std::move(profile);
}

// ============================================================================
// Inputs
// ============================================================================

void SimApp::prepare_inputs_() {
    if (!profile_ && !cfg_.simulation.profile_csv.empty()) {
        profile_ = ProfileSource::load(cfg_.simulation.profile_csv);
    }
    if (profile_ && cfg_.simulation.profile_noise_std > 0.0) {
        profile_->add_noise(cfg_.simulation.profile_noise_std, cfg_.simulation.seed);
    }

    if (!cfg_.lua_script.empty()) {
        lua_ready_ = lua_.init(cfg_.lua_script);
        if (!lua_ready_) {
            if (!profile_) {
                throw std::runtime_error("Lua scenario failed to load and no profile is configured: " +
                                         cfg_.lua_script);
            }
            MGSIM_LOG_WARN("[SimApp] Lua scenario not available, using profile only");
        }
    }

    if (!profile_ && !lua_ready_) {
        throw config::ConfigError("No inputs: set simulation.profile_csv or scenario.lua_script");
    }
}

int SimApp::total_steps_() const {
    if (cfg_.simulation.steps > 0) return cfg_.simulation.steps;
    if (profile_) return static_cast<int>(profile_->size());
    throw config::ConfigError("simulation.steps must be > 0 when running from a Lua scenario only");
}

ScenarioInput SimApp::next_input_(int step, double t_h, const ScenarioState& s) {
    ScenarioInput in;
    in.alpha = cfg_.simulation.alpha;
    if (profile_) {
        const ProfileSample& sample = profile_->at(static_cast<size_t>(step));
        in.p_g_kw = sample.solar_kw;
        in.p_l_kw = sample.load_kw;
    }

    if (lua_ready_) {
        ScenarioInput from_lua = in;
        if (lua_.step(step, t_h, s, from_lua)) {
            in = from_lua;
        } else {
            MGSIM_LOG_WARN("[SimApp] step %d: scenario_step failed, keeping profile inputs", step);
        }
    }
    return in;
}

// ============================================================================
// Outputs
// ============================================================================

void SimApp::open_outputs_() {
    if (!cfg_.simulation.output_csv.empty()) {
        run_csv_ = std::make_unique<utils::CsvWriter>();
        if (!run_csv_->open(cfg_.simulation.output_csv, field_names(MicrogridState{}))) {
            throw std::runtime_error("Failed to open output CSV: " + cfg_.simulation.output_csv);
        }
    }

    utils::InfluxClient::Config icfg;
    icfg.enabled = cfg_.telemetry.enabled;
    icfg.url = cfg_.telemetry.url;
    icfg.org = cfg_.telemetry.org;
    icfg.bucket = cfg_.telemetry.bucket;
    icfg.token = cfg_.telemetry.token;
    icfg.write_every_n_steps = cfg_.telemetry.write_every_n_steps;
    if (icfg.enabled) {
        influx_ = std::make_unique<utils::InfluxClient>(icfg);
    }
}

void SimApp::record_step_(const MicrogridState& s) {
    last_state_ = s;
    if (run_csv_) {
        run_csv_->write_row(field_values(s));
    }
    if (influx_) {
        influx_->write_step(s);
    }
}

void SimApp::close_outputs_() {
    if (run_csv_) {
        run_csv_->close();
        run_csv_.reset();
    }
    if (influx_) {
        influx_->flush();
        influx_.reset();
    }
}

// ============================================================================
// Dispatch mode
// ============================================================================

void SimApp::run_dispatch_() {
    const double dt = cfg_.simulation.delta_t_h();
    const int steps = total_steps_();

    ess::StorageUnit storage(cfg_.battery, ess::make_battery_model(cfg_.battery, &history_));
    grid::Dispatcher dispatcher(storage, dt);
    grid::Economics economics(cfg_.tariffs, dt);

    MGSIM_LOG_INFO("[SimApp] Dispatch run: %d steps, dt=%.3f h, %s model, %.1f kWh / %.1f kW",
                   steps, dt, ess::to_string(cfg_.battery.chemistry),
                   storage.nominal_energy_kwh(), storage.rated_power_kw());

    for (int k = 0; k < steps; ++k) {
        const double t_h = k * dt;

        ScenarioState ss;
        ss.soe = storage.soe();
        ss.soc = storage.soc();
        ss.soh = storage.soh();
        const ScenarioInput in = next_input_(k, t_h, ss);

        const grid::DispatchStep d = dispatcher.dispatch(in.p_g_kw, in.p_l_kw, in.alpha);

        std::optional<grid::PriceQuote> quote;
        if (!cfg_.price_bands.empty()) {
            quote = cfg_.price_bands.at_time(t_h);
        }
        const double wear = storage.wear_cost(d.soe_before, std::fabs(d.p_gl_s), dt);
        const grid::StepCost c = economics.step_cost(d, wear, quote ? &*quote : nullptr);

        MicrogridState s;
        s.step = k;
        s.t_h = t_h;
        s.apply(d);
        s.apply(c);
        s.soc = storage.soc();
        s.soh = storage.soh();
        s.efficiency = storage.round_trip_efficiency();
        if (!history_.empty() && d.dispatch_case != grid::DispatchCase::Equilibrium) {
            const ess::HistoryRecord& h = history_.back();
            s.voltage_v = h.voltage_v;
            s.current_a = h.current_a;
            s.internal_energy_kwh = h.internal_energy_change;
        }
        if (quote) {
            s.buy_price = quote->buy;
            s.sell_price = quote->sell;
            s.band = quote->band;
        } else {
            s.buy_price = cfg_.tariffs.P_pur;
            s.sell_price = cfg_.tariffs.PR_3 * grid::Economics::kMWhToKWh;
        }

        totals_.add(d, c, dt);
        record_step_(s);

        MGSIM_LOG_DEBUG("[SimApp] k=%d t=%.2fh case=%s p_gl_s=%.2f p_gl_n=%.2f soe=%.4f cost=%.4f",
                        k, t_h, grid::to_string(d.dispatch_case), d.p_gl_s, d.p_gl_n,
                        d.soe_after, c.cost);
    }
}

// ============================================================================
// Transition mode
// ============================================================================

void SimApp::run_transition_() {
    const double dt = cfg_.simulation.delta_t_h();
    const int steps = total_steps_();
    const ess::BatteryConfig& bat = cfg_.battery;

    std::unique_ptr<ess::BatteryModel> model = ess::make_battery_model(bat, &history_);
    grid::Economics economics(cfg_.tariffs, dt);

    const double e_n = bat.nominal_energy_kwh();
    double soe = bat.soe_0;
    double soc = bat.soe_0;

    MGSIM_LOG_INFO("[SimApp] Transition run: %d steps, dt=%.3f h, %s model",
                   steps, dt, ess::to_string(bat.chemistry));

    for (int k = 0; k < steps; ++k) {
        const double t_h = k * dt;

        ScenarioState ss;
        ss.soe = soe;
        ss.soc = soc;
        ss.soh = model->soh();
        const ScenarioInput in = next_input_(k, t_h, ss);

        std::string band;
        std::optional<grid::PriceQuote> quote;
        if (!cfg_.price_bands.empty()) {
            quote = cfg_.price_bands.at_time(t_h);
            band = quote->band;
        }

        grid::GreedyLimits limits;
        limits.max_charge_kwh = bat.max_charge_kwh();
        limits.max_discharge_kwh = bat.max_discharge_kwh();
        limits.headroom_kwh = std::max(0.0, bat.max_capacity_kwh() - soe * e_n);

        const grid::GreedyDecision g = grid::greedy_battery_request(
            in.p_l_kw * dt, in.p_g_kw * dt, limits, band, cfg_.simulation.allow_night_grid_charge);

        ess::TransitionRequest req;
        req.external_energy_change_kwh = -g.e_batt_kwh;
        req.min_capacity_kwh = bat.min_capacity_kwh();
        req.max_capacity_kwh = bat.max_capacity_kwh();
        req.max_charge_kwh = bat.max_charge_kwh();
        req.max_discharge_kwh = bat.max_discharge_kwh();
        req.efficiency = bat.efficiency;
        req.current_step = k;

        const double soc_prev = soc;
        // the model is handed the energy fraction; it tracks SoC itself
        const double internal = model->transition(
            req, ess::StateInput::make(std::clamp(soe, 0.0, 1.0), std::max(soe * e_n, 0.0),
                                       bat.temperature_c));
        soe = model->soe();
        soc = model->soc();

        // Grid absorbs whatever the model did not take
        const double e_batt_done = -internal;
        const double e_grid = (in.p_l_kw - in.p_g_kw) * dt - e_batt_done;

        const double p_gl_s = internal / dt;
        const double p_gl_n = -e_grid / dt;
        const double wear = model->wear_cost(soc_prev, std::fabs(p_gl_s), dt);
        const grid::StepCost c = economics.step_cost(in.p_g_kw, p_gl_s, in.p_l_kw, p_gl_n,
                                                     wear, quote ? &*quote : nullptr);

        grid::DispatchStep d;
        d.p_g = in.p_g_kw;
        d.p_l = in.p_l_kw;
        d.p_gl = in.p_g_kw - in.p_l_kw;
        d.p_gl_s = p_gl_s;
        d.p_gl_n = p_gl_n;
        d.alpha = in.alpha;

        MicrogridState s;
        s.step = k;
        s.t_h = t_h;
        s.apply(d);
        s.apply(c);
        s.soe = soe;
        s.soc = soc;
        s.soh = model->soh();
        s.efficiency = model->last_dynamic_efficiency().value_or(bat.efficiency);
        s.internal_energy_kwh = internal;
        if (!history_.empty()) {
            s.voltage_v = history_.back().voltage_v;
            s.current_a = history_.back().current_a;
        }
        if (quote) {
            s.buy_price = quote->buy;
            s.sell_price = quote->sell;
            s.band = quote->band;
        }

        totals_.add(d, c, dt);
        record_step_(s);
    }
}

// ============================================================================
// Entry point
// ============================================================================

int SimApp::run() {
    try {
        cfg_.validate();
        prepare_inputs_();
        open_outputs_();

        if (cfg_.simulation.mode == "transition") {
            run_transition_();
        } else if (cfg_.simulation.mode == "dispatch") {
            run_dispatch_();
        } else {
            throw config::ConfigError("Unknown simulation mode: " + cfg_.simulation.mode);
        }

        close_outputs_();

        if (!cfg_.simulation.history_csv.empty()) {
            history_.write_csv(cfg_.simulation.history_csv);
            MGSIM_LOG_INFO("[SimApp] History CSV written to: %s", cfg_.simulation.history_csv.c_str());
        }
        if (!cfg_.simulation.history_json.empty()) {
            history_.write_json(cfg_.simulation.history_json);
            MGSIM_LOG_INFO("[SimApp] History JSON written to: %s", cfg_.simulation.history_json.c_str());
        }
        if (history_.total_appended() > history_.capacity()) {
            MGSIM_LOG_WARN("[SimApp] History kept the last %zu of %zu transitions",
                           history_.size(), history_.total_appended());
        }
    } catch (const grid::InvariantViolation& e) {
        MGSIM_LOG_ERROR("[SimApp] Invariant violated: %s (value=%.6f, bounds=[%.6f, %.6f])",
                        e.what(), e.value(), e.lower(), e.upper());
        close_outputs_();
        return 2;
    } catch (const std::exception& e) {
        MGSIM_LOG_ERROR("[SimApp] %s", e.what());
        close_outputs_();
        return 1;
    }

    print_totals_();
    if (!cfg_.simulation.output_csv.empty()) {
        MGSIM_LOG_INFO("Simulation complete. CSV written to: %s", cfg_.simulation.output_csv.c_str());
    }
    return 0;
}

void SimApp::print_totals_() const {
    MGSIM_LOG_INFO("========================================");
    MGSIM_LOG_INFO("Run Summary");
    MGSIM_LOG_INFO("========================================");
    MGSIM_LOG_INFO("Steps:              %d", totals_.steps);
    MGSIM_LOG_INFO("Energy produced:    %.2f kWh", totals_.energy_produced_kwh);
    MGSIM_LOG_INFO("Energy shared:      %.2f kWh", totals_.energy_shared_kwh);
    MGSIM_LOG_INFO("Battery charged:    %.2f kWh", totals_.energy_charged_kwh);
    MGSIM_LOG_INFO("Battery discharged: %.2f kWh", totals_.energy_discharged_kwh);
    MGSIM_LOG_INFO("Grid export:        %.2f kWh", totals_.energy_exported_kwh);
    MGSIM_LOG_INFO("Grid import:        %.2f kWh", totals_.energy_imported_kwh);
    MGSIM_LOG_INFO("Revenue:            %.2f EUR", totals_.revenue);
    MGSIM_LOG_INFO("Purchase cost:      %.2f EUR", totals_.purch_cost);
    MGSIM_LOG_INFO("Wear cost:          %.4f EUR", totals_.wear_cost);
    MGSIM_LOG_INFO("Net cost:           %.2f EUR", totals_.cost);
    MGSIM_LOG_INFO("Cost without PV:    %.2f EUR", totals_.no_pv_cost);
    MGSIM_LOG_INFO("Savings:            %.2f EUR", totals_.savings());
    MGSIM_LOG_INFO("========================================");
}

} // namespace sim
