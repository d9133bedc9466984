// src/ess/linear_model.hpp
#pragma once

#include "ess/battery_model.hpp"
#include "ess/soh_model.hpp"
#include "ess/transition_history.hpp"
#include "ess/wear_cost.hpp"

namespace ess {

/**
 * LinearModel - Static-efficiency baseline
 *
 *   charge:    internal = external * efficiency
 *   discharge: internal = external / efficiency
 *
 * clipped to the per-step limits and to the capacity window. SoC == SoE.
 */
class LinearModel : public BatteryModel {
public:
    explicit LinearModel(const BatteryConfig& cfg, TransitionHistory* history = nullptr);

    double transition(const TransitionRequest& req, const StateInput& state) override;

    double soc() const override { return state_.soc; }
    double soe() const override { return state_.soe; }
    double soh() const override { return soh_.soh(); }
    double last_wear_cost() const override { return state_.wear_cost; }
    std::optional<double> last_dynamic_efficiency() const override { return std::nullopt; }
    double wear_cost(double soc_prev, double power_kw, double dt_h) const override;
    void reset() override;
    Chemistry kind() const override { return Chemistry::Linear; }

    void set_soh_model(SohModel soh) { soh_ = std::move(soh); }

private:
    BatteryConfig cfg_;
    TransitionHistory* history_;
    WearModel wear_;
    SohModel soh_;
    ElectricalState state_;
};

} // namespace ess
