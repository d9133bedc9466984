// src/ess/empirical_model.hpp
#pragma once

#include "ess/battery_model.hpp"
#include "ess/soh_model.hpp"
#include "ess/transition_history.hpp"
#include "ess/wear_cost.hpp"

#include <array>
#include <cstddef>

namespace ess {

/**
 * EmpiricalModel - First-order RC equivalent circuit with fitted parameters
 *
 * x = C-rate |i / Qr|, y = coulomb-counted SoC. Separate coefficient sets for
 * charge and discharge:
 *
 *   R0   = (p0 + p1 x + p2 x^2) e^(-p3 y)   + (p4 + p5 x + p6 x^2)
 *   Rp   = (p7 + p8 x + p9 x^2) e^(-p10 y)  + (p11 + p12 x + p13 x^2)
 *   Cp   = -(p14 + p15 x + p16 x^2) e^(-p17 y) + (p18 + p19 x + p20 x^2)
 *   Vocv = (p21 + p22 x + p23 x^2) e^(-p24 y)
 *          + (p25 + p26 y + p27 y^2 + p28 y^3) - p29 x + p30 x^2
 *
 *   Vterm = (Qr / Cp + i Rp) e^(-dt / (Rp Cp)) + Vocv - i (R0 + Rp)
 *   SoC   = 0.03 Vterm^2 + 1.08 Vterm - 4.15   (rounded to 2 decimals)
 *
 * Negative regression results are squared, results above one become (x-1)^2.
 * A result that is still non-finite or outside [0,1] falls back to the
 * coulomb-counted SoC clamped to [0,1].
 */
class EmpiricalModel : public BatteryModel {
public:
    using Params = std::array<double, 31>;

    static const Params& charge_params();
    static const Params& discharge_params();

    struct EcmResult {
        double r0;
        double rp;
        double cp;
        double vocv;
        double vterm;
        double soc;      // after regression and folding, before fallback
    };

    explicit EmpiricalModel(const BatteryConfig& cfg, TransitionHistory* history = nullptr);

    double transition(const TransitionRequest& req, const StateInput& state) override;

    double soc() const override { return state_.soc; }
    double soe() const override { return state_.soe; }
    double soh() const override { return soh_.soh(); }
    double last_wear_cost() const override { return state_.wear_cost; }
    std::optional<double> last_dynamic_efficiency() const override { return std::nullopt; }
    double wear_cost(double soc_prev, double power_kw, double dt_h) const override;
    void reset() override;
    Chemistry kind() const override { return Chemistry::Empirical; }

    void set_soh_model(SohModel soh) { soh_ = std::move(soh); }

    // Cell current in A (charge positive), C-rate, SoC estimate, residual Ah.
    static EcmResult evaluate(double current_a, double c_rate, double soc_est,
                              double qr_ah, double dt_h);

    // Number of steps where the regression had to be replaced.
    size_t fallback_count() const { return fallback_count_; }

    // Number of discharge steps whose new SoC fell below SoE_min before clipping.
    size_t shortfall_count() const { return shortfall_count_; }

private:
    BatteryConfig cfg_;
    TransitionHistory* history_;
    WearModel wear_;
    SohModel soh_;
    ElectricalState state_;
    size_t fallback_count_ = 0;
    size_t shortfall_count_ = 0;
};

} // namespace ess
