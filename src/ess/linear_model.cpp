// src/ess/linear_model.cpp
#include "ess/linear_model.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace ess {

LinearModel::LinearModel(const BatteryConfig& cfg, TransitionHistory* history)
    : cfg_(cfg),
      history_(history),
      wear_(cfg.wear, cfg.nominal_energy_kwh()) {
    state_.soc = cfg.soe_0;
    state_.soe = cfg.soe_0;
    soh_.set_initial_soh(cfg.soh_0);
}

double LinearModel::transition(const TransitionRequest& req, const StateInput& state) {
    const double energy_kwh = cfg_.nominal_energy_kwh();
    const double eff = std::max(req.efficiency, kDivEps);
    const double dt = std::max(cfg_.delta_t_h, kDivEps);

    const double soc_before = state.soc();
    const double charge_before = state.current_charge_kwh();

    double internal = (req.external_energy_change_kwh < 0.0)
                          ? req.external_energy_change_kwh / eff
                          : req.external_energy_change_kwh * eff;
    internal = std::clamp(internal, -req.max_discharge_kwh, req.max_charge_kwh);

    // keep the stored energy inside [min_capacity, max_capacity]
    const double charge_after = std::clamp(charge_before + internal,
                                           std::min(req.min_capacity_kwh, charge_before),
                                           std::max(req.max_capacity_kwh, charge_before));
    internal = charge_after - charge_before;

    state_.soe = std::clamp(charge_after / std::max(energy_kwh, kDivEps), 0.0, 1.0);
    state_.soc = state_.soe;
    state_.initialized = true;

    const double power_kw = req.external_energy_change_kwh / dt;
    state_.current_a = -1000.0 * power_kw / std::max(cfg_.pack_voltage_v(), kVoltageEps);
    state_.v_prev = cfg_.pack_voltage_v();
    state_.wear_cost = wear_.cost(soc_before, state_.soc, power_kw, dt, cfg_.efficiency);

    const double delta_ah = std::abs(state_.current_a) * dt / std::max(cfg_.np, 1);
    const double soh = soh_.update(delta_ah);

    MGSIM_LOG_TRACE("[LinearModel::transition] step=%d ext=%.4f kWh int=%.4f kWh soe=%.4f",
                    req.current_step, req.external_energy_change_kwh, internal, state_.soe);

    if (history_) {
        HistoryRecord rec;
        rec.time_hours = req.current_step * cfg_.delta_t_h;
        rec.current_a = state_.current_a;
        rec.voltage_v = state_.v_prev;
        rec.soc = state_.soc;
        rec.soe = state_.soe;
        rec.power_kw = power_kw;
        rec.internal_energy_change = internal;
        rec.soh = soh;
        history_->append(rec);
    }
    return internal;
}

double LinearModel::wear_cost(double soc_prev, double power_kw, double dt_h) const {
    return wear_.cost(soc_prev, state_.soc, power_kw, dt_h, cfg_.efficiency);
}

void LinearModel::reset() {
    state_ = ElectricalState{};
    state_.soc = cfg_.soe_0;
    state_.soe = cfg_.soe_0;
    soh_.reset();
}

} // namespace ess
