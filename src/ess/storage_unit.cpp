// src/ess/storage_unit.cpp
#include "ess/storage_unit.hpp"
#include "ess/battery_state.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ess {

StorageUnit::StorageUnit(const BatteryConfig& cfg, std::unique_ptr<BatteryModel> model)
    : cfg_(cfg),
      model_(std::move(model)),
      wear_(cfg.wear, cfg.nominal_energy_kwh()),
      soe_(cfg.soe_0) {
    if (!model_) {
        throw std::invalid_argument("StorageUnit: battery model is null");
    }
    cfg_.validate();
}

double StorageUnit::apply(double energy_kwh, double dt_h) {
    const double q = cfg_.nominal_energy_kwh();
    const double before = soe_;

    TransitionRequest req;
    req.external_energy_change_kwh = energy_kwh;
    req.min_capacity_kwh = cfg_.min_capacity_kwh();
    req.max_capacity_kwh = cfg_.max_capacity_kwh();
    req.max_charge_kwh = cfg_.p_s_max_kw * dt_h;
    req.max_discharge_kwh = cfg_.p_s_max_kw * dt_h;
    req.efficiency = 1.0;
    req.current_step = step_;

    const auto input = StateInput::make(std::clamp(soe_, 0.0, 1.0), std::max(soe_ * q, 0.0),
                                        cfg_.temperature_c);
    const double internal = model_->transition(req, input);
    ++step_;

    // booked energy lies between 0 and the request
    const double booked = (energy_kwh >= 0.0) ? std::clamp(internal, 0.0, energy_kwh)
                                              : std::clamp(internal, energy_kwh, 0.0);
    if (std::abs(booked - internal) > 1e-9) {
        MGSIM_LOG_TRACE("[StorageUnit] Model reported %.6f kWh for a %.6f kWh request; booking %.6f kWh",
                        internal, energy_kwh, booked);
    }

    soe_ = std::clamp(soe_ + booked / q, cfg_.soe_min, cfg_.soe_max);
    return (soe_ - before) * q;
}

double StorageUnit::charge(double p_kw, double dt_h) {
    if (!std::isfinite(p_kw) || p_kw < 0.0) {
        throw std::invalid_argument("StorageUnit::charge: power must be finite and >= 0");
    }
    const double requested = p_kw * dt_h;
    const double absorbed = apply(requested, dt_h);
    const double excess = std::max(0.0, requested - absorbed);

    MGSIM_LOG_DEBUG("[StorageUnit::charge] p=%.3f kW req=%.4f kWh absorbed=%.4f kWh excess=%.4f kWh soe=%.4f",
                    p_kw, requested, absorbed, excess, soe_);
    return excess;
}

double StorageUnit::discharge(double p_kw, double dt_h) {
    if (!std::isfinite(p_kw) || p_kw < 0.0) {
        throw std::invalid_argument("StorageUnit::discharge: power must be finite and >= 0");
    }
    const double requested = p_kw * dt_h;
    const double delivered = -apply(-requested, dt_h);
    const double lack = std::max(0.0, requested - delivered);

    MGSIM_LOG_DEBUG("[StorageUnit::discharge] p=%.3f kW req=%.4f kWh delivered=%.4f kWh lack=%.4f kWh soe=%.4f",
                    p_kw, requested, delivered, lack, soe_);
    return lack;
}

double StorageUnit::round_trip_efficiency() const {
    return model_->last_dynamic_efficiency().value_or(cfg_.efficiency);
}

double StorageUnit::wear_cost(double soe_prev, double p_kw, double dt_h) const {
    return wear_.cost(soe_prev, soe_, p_kw, dt_h, round_trip_efficiency());
}

void StorageUnit::reset() {
    model_->reset();
    soe_ = cfg_.soe_0;
    step_ = 0;
}

} // namespace ess
