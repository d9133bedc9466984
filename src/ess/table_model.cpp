// src/ess/table_model.cpp
#include "ess/table_model.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace ess {

TableModel::TableModel(const BatteryConfig& cfg, VocR0Table table, TransitionHistory* history)
    : cfg_(cfg),
      table_(std::move(table)),
      history_(history),
      wear_(cfg.wear, cfg.nominal_energy_kwh()) {
    state_.soc = cfg.soe_0;
    state_.soe = cfg.soe_0;
    soh_.set_initial_soh(cfg.soh_0);
    if (cfg.soh_0 < table_.soh_min()) {
        MGSIM_LOG_WARN("[TableModel] Initial SOH %.3f below the table's oldest layer %.3f; lookups clamp to it",
                       cfg.soh_0, table_.soh_min());
    }
}

double TableModel::dynamic_efficiency(double current_a, double voc, double v_batt) const {
    if (std::abs(current_a) < 1e-8) {
        return cfg_.eta_inverter;
    }

    double eta = 0.0;
    if (current_a > 0.0) {
        // discharging
        eta = cfg_.eta_inverter * (1.0 - (r0_ * current_a * current_a) / (current_a * std::max(voc, kDivEps)));
    } else {
        // charging
        eta = cfg_.eta_inverter * (1.0 - (r0_ * current_a * current_a) / (-current_a * std::max(v_batt, kDivEps)));
    }
    return std::clamp(eta, 0.0, 1.0);
}

double TableModel::current_eta() const {
    return state_.dynamic_efficiency ? *state_.dynamic_efficiency : cfg_.eta_inverter;
}

double TableModel::transition(const TransitionRequest& req, const StateInput& state) {
    const double temperature = state.temperature_c().value_or(cfg_.temperature_c);
    const double dt = std::max(cfg_.delta_t_h, kDivEps);
    const double energy_kwh = std::max(cfg_.nominal_energy_kwh(), kDivEps);
    const double pack_ah = cfg_.pack_capacity_ah();

    // the host owns the energy fraction; the charge fraction is ours
    state_.soe = state.soc();

    if (req.current_step == 0 || !state_.initialized) {
        state_.soc = state.soc();
        const auto init = table_.lookup(state_.soc, temperature, soh_.soh());
        state_.v_prev = std::max(init.voc, kVoltageEps);
        state_.initialized = true;
        MGSIM_LOG_DEBUG("[TableModel] Initialized at soc=%.4f Voc=%.3f V", state_.soc, init.voc);
    }

    // aged cells: Voc and R0 follow the tracked SOH
    const auto lut = table_.lookup(state_.soc, temperature, soh_.soh());
    r0_ = lut.r0;

    const double power_kw = -req.external_energy_change_kwh / dt;
    const double current_a = 1000.0 * power_kw / std::max(state_.v_prev, kVoltageEps);
    const double v_batt = std::max(lut.voc - r0_ * current_a, kVoltageEps);

    // capacity window on an Ah basis
    const double ah_to_kwh = pack_ah * cfg_.pack_voltage_v() / 1000.0;
    const double min_soc = std::clamp(req.min_capacity_kwh / std::max(ah_to_kwh, kDivEps), 0.0, 1.0);
    const double max_soc = std::clamp(req.max_capacity_kwh / std::max(ah_to_kwh, kDivEps), min_soc, 1.0);

    const double soc_before = state_.soc;
    const double soc_unbounded = state_.soc - current_a * dt / pack_ah;
    const double soc_new = std::clamp(soc_unbounded, min_soc, max_soc);

    const double eta_dyn = std::max(kDivEps, dynamic_efficiency(current_a, lut.voc, v_batt));

    const double min_soe = std::clamp(req.min_capacity_kwh / energy_kwh, 0.0, 1.0);
    const double max_soe = std::clamp(req.max_capacity_kwh / energy_kwh, min_soe, 1.0);
    const double soe_before = state_.soe;
    double soe_new = state_.soe - (current_a * lut.voc * dt / 1000.0) / energy_kwh;
    soe_new = std::clamp(soe_new, min_soe, max_soe);

    double internal = (soe_new - soe_before) * energy_kwh;
    internal = std::clamp(internal, -req.max_discharge_kwh, req.max_charge_kwh);
    soe_new = soe_before + internal / energy_kwh;

    state_.soc = soc_new;
    state_.soe = soe_new;
    state_.v_prev = v_batt;
    state_.current_a = current_a;
    state_.dynamic_efficiency = eta_dyn;
    state_.wear_cost = wear_.cost(soc_before, soc_new, power_kw, dt, eta_dyn);

    // per-cell throughput drives the degradation curve
    const double delta_ah = std::abs(current_a) * dt / cfg_.np;
    const double soh = soh_.update(delta_ah);

    MGSIM_LOG_TRACE("[TableModel::transition] step=%d p=%.3f kW i=%.2f A v=%.3f V soc=%.4f soe=%.4f eta=%.4f",
                    req.current_step, power_kw, current_a, v_batt, soc_new, soe_new, eta_dyn);

    if (history_) {
        HistoryRecord rec;
        rec.time_hours = req.current_step * cfg_.delta_t_h;
        rec.current_a = current_a;
        rec.voltage_v = v_batt;
        rec.soc = soc_new;
        rec.soe = soe_new;
        rec.power_kw = -power_kw;
        rec.internal_energy_change = internal;
        rec.soh = soh;
        history_->append(rec);
    }
    return internal;
}

double TableModel::wear_cost(double soc_prev, double power_kw, double dt_h) const {
    return wear_.cost(soc_prev, state_.soc, power_kw, dt_h, current_eta());
}

void TableModel::reset() {
    state_ = ElectricalState{};
    state_.soc = cfg_.soe_0;
    state_.soe = cfg_.soe_0;
    r0_ = 0.0;
    soh_.reset();
}

} // namespace ess
