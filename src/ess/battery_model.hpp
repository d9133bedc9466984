// src/ess/battery_model.hpp
#pragma once

#include "ess/battery_config.hpp"
#include "ess/battery_state.hpp"

#include <optional>

namespace ess {

/**
 * BatteryModel - Converts an external energy request into an internal
 * energy change and an updated electrochemical state.
 *
 * Conventions:
 *   - external_energy_change > 0 charges the battery (kWh)
 *   - the returned internal energy change uses the same sign
 *   - the model owns its electrical and SOH state across calls
 *
 * Variants: LinearModel, TableModel, EmpiricalModel (see make_battery_model).
 */
class BatteryModel {
public:
    virtual ~BatteryModel() = default;

    virtual double transition(const TransitionRequest& req, const StateInput& state) = 0;

    virtual double soc() const = 0;
    virtual double soe() const = 0;
    virtual double soh() const = 0;
    virtual double last_wear_cost() const = 0;

    // Empty when the model has no notion of dynamic efficiency yet.
    virtual std::optional<double> last_dynamic_efficiency() const = 0;

    // Wear cost of moving power_kw for dt_h starting from soc_prev.
    virtual double wear_cost(double soc_prev, double power_kw, double dt_h) const = 0;

    virtual void reset() = 0;

    virtual Chemistry kind() const = 0;
};

} // namespace ess
