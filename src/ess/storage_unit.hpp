// src/ess/storage_unit.hpp
#pragma once

#include "ess/battery_config.hpp"
#include "ess/battery_model.hpp"
#include "ess/wear_cost.hpp"

#include <memory>

namespace ess {

/**
 * StorageUnit - The battery as seen by the dispatcher
 *
 * Owns one BatteryModel, the SoE window, the rated power and the step
 * counter. charge()/discharge() route the request through the model with
 * unit efficiency (losses are booked by the caller), clip the SoE to
 * [soe_min, soe_max] and report the part of the request that could not be
 * absorbed/delivered.
 *
 * The SoE moves by what the model actually took, capped at the request, and
 * the returned excess/lack is the request minus that. So after the caller
 * corrects its flow by the excess/lack, flow * dt equals the SoE change
 * times E_n.
 */
class StorageUnit {
public:
    StorageUnit(const BatteryConfig& cfg, std::unique_ptr<BatteryModel> model);

    /**
     * Charge at p_kw (>= 0) for dt_h hours.
     * @return energy not absorbed (kWh, >= 0)
     */
    double charge(double p_kw, double dt_h);

    /**
     * Discharge at p_kw (>= 0, magnitude) for dt_h hours.
     * @return energy not delivered (kWh, >= 0)
     */
    double discharge(double p_kw, double dt_h);

    double soe() const { return soe_; }
    double soe_min() const { return cfg_.soe_min; }
    double soe_max() const { return cfg_.soe_max; }
    double soh() const { return model_->soh(); }
    double soc() const { return model_->soc(); }
    double nominal_energy_kwh() const { return cfg_.nominal_energy_kwh(); }
    double rated_power_kw() const { return cfg_.p_s_max_kw; }

    // Last dynamic efficiency of the model, static efficiency when undefined.
    double round_trip_efficiency() const;

    // Wear cost of moving p_kw for dt_h, from soe_prev to the present SoE.
    double wear_cost(double soe_prev, double p_kw, double dt_h) const;

    void reset();

    int step() const { return step_; }
    const BatteryModel& model() const { return *model_; }
    const BatteryConfig& config() const { return cfg_; }

private:
    // Signed request, charge positive. Returns the absorbed (+) / delivered (-) energy.
    double apply(double energy_kwh, double dt_h);

    BatteryConfig cfg_;
    std::unique_ptr<BatteryModel> model_;
    WearModel wear_;
    double soe_;
    int step_ = 0;
};

} // namespace ess
