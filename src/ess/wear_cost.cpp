// src/ess/wear_cost.cpp
#include "ess/wear_cost.hpp"
#include "ess/battery_state.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ess {

WearModel::WearModel(const WearCoefficients& coeffs, double nominal_energy_kwh)
    : coeffs_(coeffs), q_n_(nominal_energy_kwh) {}

// Marginal wear rises towards SoC = 1 for b < 1, falls towards it for b > 1
// and is flat for b = 1.
double WearModel::marginal(double soc, double eta) const {
    if (!enabled()) {
        return 0.0;
    }
    const double a = *coeffs_.a;
    const double b = *coeffs_.b;
    const double B = *coeffs_.B;

    // (1 - x)^(b - 1) is undefined for x > 1 and unbounded at x == 1 when b < 1
    const double x = std::clamp(soc, 0.0, 1.0 - kVoltageEps);
    const double e = std::max(eta, kDivEps);
    return (B / (2.0 * q_n_ * e)) * (b * std::pow(1.0 - x, b - 1.0)) / a;
}

double WearModel::cost(double soc_prev, double soc_now, double power_kw,
                       double dt_h, double eta) const {
    if (!enabled()) {
        return 0.0;
    }
    return (dt_h / 2.0) * (marginal(soc_prev, eta) + marginal(soc_now, eta)) * std::abs(power_kw);
}

void WearModel::require_coefficients() const {
    if (!coeffs_.a || !coeffs_.b || !coeffs_.B) {
        throw std::invalid_argument("Wear cost requested but coefficients a, b, B are not all set");
    }
}

} // namespace ess
