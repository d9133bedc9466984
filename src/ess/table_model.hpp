// src/ess/table_model.hpp
#pragma once

#include "ess/battery_model.hpp"
#include "ess/lookup_table.hpp"
#include "ess/soh_model.hpp"
#include "ess/transition_history.hpp"
#include "ess/wear_cost.hpp"

namespace ess {

/**
 * TableModel - Chemistry model driven by Voc/R0 lookup tables (NMC, NCA, LFP)
 *
 * Per call:
 *   p      = -external / dt                   (discharge positive)
 *   i      = 1000 * p / v_prev                (v_prev: previous terminal voltage)
 *   v_batt = max(Voc - R0 * i, eps)
 *   soc   -= i * dt / (c_n * Np)              clipped to the capacity window
 *   soe   -= (i * Voc * dt / 1000) / E_n      clipped to the capacity window
 *
 * v_prev lags one step behind the lookup at the current soc. On the first
 * step it is initialized to Voc. Voc and R0 are looked up at the tracked
 * SOH, which starts at BatteryConfig::soh_0.
 */
class TableModel : public BatteryModel {
public:
    TableModel(const BatteryConfig& cfg, VocR0Table table,
               TransitionHistory* history = nullptr);

    double transition(const TransitionRequest& req, const StateInput& state) override;

    double soc() const override { return state_.soc; }
    double soe() const override { return state_.soe; }
    double soh() const override { return soh_.soh(); }
    double last_wear_cost() const override { return state_.wear_cost; }
    std::optional<double> last_dynamic_efficiency() const override { return state_.dynamic_efficiency; }
    double wear_cost(double soc_prev, double power_kw, double dt_h) const override;
    void reset() override;
    Chemistry kind() const override { return cfg_.chemistry; }

    void set_soh_model(SohModel soh) { soh_ = std::move(soh); }
    const SohModel& soh_model() const { return soh_; }

    const ElectricalState& electrical_state() const { return state_; }
    double last_r0() const { return r0_; }

private:
    double dynamic_efficiency(double current_a, double voc, double v_batt) const;
    double current_eta() const;

    BatteryConfig cfg_;
    VocR0Table table_;
    TransitionHistory* history_;
    WearModel wear_;
    SohModel soh_;
    ElectricalState state_;
    double r0_ = 0.0;
};

} // namespace ess
