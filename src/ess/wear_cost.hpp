// src/ess/wear_cost.hpp
#pragma once

#include "ess/battery_config.hpp"

namespace ess {

/**
 * WearModel - Empirical cycling cost of the storage
 *
 *   W(x) = (B / (2 * Q_n * eta)) * b * (1 - x)^(b - 1) / a
 *   C    = (dt / 2) * (W(soc_prev) + W(soc_now)) * |p|
 *
 * Q_n is the nominal pack energy (kWh). Cost is zero when any coefficient
 * is unset.
 */
class WearModel {
public:
    WearModel() = default;
    WearModel(const WearCoefficients& coeffs, double nominal_energy_kwh);

    bool enabled() const { return coeffs_.complete() && q_n_ > 0.0; }

    double marginal(double soc, double eta) const;

    double cost(double soc_prev, double soc_now, double power_kw,
                double dt_h, double eta) const;

    /**
     * @throws std::invalid_argument if any of a, b, B is unset
     */
    void require_coefficients() const;

    const WearCoefficients& coefficients() const { return coeffs_; }

private:
    WearCoefficients coeffs_;
    double q_n_ = 0.0;
};

} // namespace ess
