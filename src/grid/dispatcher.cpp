// src/grid/dispatcher.cpp
#include "grid/dispatcher.hpp"
#include "utils/logging.hpp"

#include <cmath>

namespace grid {

const char* to_string(DispatchCase c) {
    switch (c) {
        case DispatchCase::Equilibrium:        return "equilibrium";
        case DispatchCase::OverAmple:          return "over_ample";
        case DispatchCase::OverLimitedEnergy:  return "over_limited_energy";
        case DispatchCase::OverPowerLimit:     return "over_power_limit";
        case DispatchCase::UnderAmple:         return "under_ample";
        case DispatchCase::UnderLimitedEnergy: return "under_limited_energy";
        case DispatchCase::UnderPowerLimit:    return "under_power_limit";
    }
    return "unknown";
}

Dispatcher::Dispatcher(ess::StorageUnit& storage, double dt_h)
    : storage_(storage), dt_h_(dt_h) {
    if (!(dt_h_ > 0.0)) {
        throw std::invalid_argument("Dispatcher: dt_h must be > 0");
    }
}

DispatchStep Dispatcher::dispatch(double p_g, double p_l, double alpha) {
    if (!std::isfinite(p_g) || !std::isfinite(p_l) || !std::isfinite(alpha)) {
        throw DispatchError("[Dispatcher] Case not covered: non-finite input (p_G=" + std::to_string(p_g) +
                            ", p_L=" + std::to_string(p_l) + ", alpha=" + std::to_string(alpha) + ")");
    }
    if (alpha < 0.0 || alpha > 1.0) {
        throw DispatchError("[Dispatcher] Case not covered: alpha=" + std::to_string(alpha) +
                            " outside [0,1]");
    }

    const double q = storage_.nominal_energy_kwh();

    DispatchStep s;
    s.p_g = p_g;
    s.p_l = p_l;
    s.alpha = alpha;
    s.p_gl = round2(p_g - p_l);
    s.soe_before = storage_.soe();
    s.q_res = round2(q * (storage_.soe_max() - storage_.soe()));
    s.e_s_res = round2(q * (storage_.soe() - storage_.soe_min()));
    s.eta = storage_.round_trip_efficiency();

    MGSIM_LOG_DEBUG("[Dispatcher] SoE_before=%.4f p_G=%.3f p_L=%.3f p_GL=%.2f Q_res=%.2f e_S_res=%.2f eta=%.4f",
                    s.soe_before, p_g, p_l, s.p_gl, s.q_res, s.e_s_res, s.eta);

    if (s.p_gl == 0.0) {
        s.dispatch_case = DispatchCase::Equilibrium;
        MGSIM_LOG_DEBUG("[Dispatcher] Equilibrium between generation and load");
    } else if (s.p_gl > 0.0) {
        dispatch_surplus(s);
    } else if (s.p_gl < 0.0) {
        dispatch_deficit(s);
    } else {
        throw DispatchError("[Dispatcher] Case not covered: p_GL=" + std::to_string(s.p_gl));
    }

    s.soe_after = storage_.soe();

    MGSIM_LOG_DEBUG("[Dispatcher] case=%s p_GL_S=%.2f p_GL_N=%.2f losses=%.2f SoE_after=%.4f",
                    to_string(s.dispatch_case), s.p_gl_s, s.p_gl_n, s.ess_losses, s.soe_after);

    check_invariants(s, storage_.soe_min(), storage_.soe_max());
    return s;
}

// ============================================================================
// Overproduction: p_GL > 0
// ============================================================================

void Dispatcher::dispatch_surplus(DispatchStep& s) {
    const double p_max = storage_.rated_power_kw();
    const double eta = s.eta;
    const double dt = dt_h_;

    if (s.p_gl * dt <= s.q_res && s.p_gl <= p_max) {
        s.dispatch_case = DispatchCase::OverAmple;
        const double r = round2(s.alpha * s.p_gl);
        s.p_gl_s = r * eta;
        s.ess_losses = r * (1.0 - eta);
    } else if (s.p_gl * dt > s.q_res && s.p_gl <= p_max) {
        s.dispatch_case = DispatchCase::OverLimitedEnergy;
        s.p_gl_s = round2(s.alpha * s.q_res / dt) * eta;
    } else if (s.p_gl > p_max) {
        s.dispatch_case = DispatchCase::OverPowerLimit;
        // at rated power, does the headroom still suffice?
        s.p_gl_s = (s.alpha * p_max * dt * eta <= s.q_res) ? s.alpha * p_max : 0.0;
    } else {
        throw DispatchError("[Dispatcher] Case not covered in overproduction: p_GL=" + std::to_string(s.p_gl));
    }
    s.p_gl_n = s.p_gl - s.p_gl_s - s.ess_losses;

    s.excess_kwh = storage_.charge(s.p_gl_s, dt);
    if (s.excess_kwh > 0.0) {
        // the storage takes what it can, the rest goes to the grid
        s.p_gl_s -= s.excess_kwh / dt;
        s.p_gl_n = s.p_gl - s.p_gl_s - s.ess_losses;
    }
}

// ============================================================================
// Underproduction: p_GL < 0
// ============================================================================

void Dispatcher::dispatch_deficit(DispatchStep& s) {
    const double p_max = storage_.rated_power_kw();
    const double eta = s.eta;
    const double dt = dt_h_;
    const double need = std::abs(s.p_gl);

    if (s.alpha * need * dt / eta <= s.e_s_res && need <= p_max) {
        s.dispatch_case = DispatchCase::UnderAmple;
        s.p_gl_s = -round2(s.alpha * need) / eta;
        s.ess_losses = round2(s.alpha * s.p_gl) * (1.0 - eta);
    } else if (s.alpha * need * dt / eta > s.e_s_res && need <= p_max) {
        s.dispatch_case = DispatchCase::UnderLimitedEnergy;
        s.p_gl_s = -round2(s.alpha * s.e_s_res / dt) / eta;
    } else if (need > p_max) {
        s.dispatch_case = DispatchCase::UnderPowerLimit;
        // at rated power, is there still enough stored energy?
        s.p_gl_s = (s.alpha * p_max * dt / eta <= s.e_s_res) ? -s.alpha * p_max / eta : 0.0;
    } else {
        throw DispatchError("[Dispatcher] Case not covered in underproduction: p_GL=" + std::to_string(s.p_gl));
    }
    s.p_gl_n = s.p_gl - s.p_gl_s - s.ess_losses;

    s.lack_kwh = storage_.discharge(-s.p_gl_s, dt);
    if (s.lack_kwh > 0.0) {
        // the storage gives what it can, the rest comes from the grid
        s.p_gl_s += s.lack_kwh / dt;
        s.p_gl_n = s.p_gl - s.p_gl_s - s.ess_losses;
    }
}

// ============================================================================
// Invariants
// ============================================================================

void Dispatcher::check_invariants(const DispatchStep& step, double soe_min, double soe_max) {
    const utils::Quantizer q(0.01);

    const double soe = q.quantize(step.soe_after);
    if (soe > soe_max || soe < soe_min) {
        MGSIM_LOG_ERROR("[Dispatcher] SoE out of bounds: %.4f not in [%.4f, %.4f]",
                        step.soe_after, soe_min, soe_max);
        throw InvariantViolation("SoE out of bounds: " + std::to_string(step.soe_after) +
                                 " not in [" + std::to_string(soe_min) + ", " + std::to_string(soe_max) + "]",
                                 step.soe_after, soe_min, soe_max);
    }

    const double bal = step.balance();
    if (q.quantize(bal) != 0.0) {
        MGSIM_LOG_ERROR("[Dispatcher] Non-zero energy balance: %.6f (p_GL=%.4f p_GL_N=%.4f p_GL_S=%.4f losses=%.4f)",
                        bal, step.p_gl, step.p_gl_n, step.p_gl_s, step.ess_losses);
        throw InvariantViolation("Non-zero energy balance: " + std::to_string(bal) +
                                 " (p_GL=" + std::to_string(step.p_gl) +
                                 ", p_GL_N=" + std::to_string(step.p_gl_n) +
                                 ", p_GL_S=" + std::to_string(step.p_gl_s) +
                                 ", losses=" + std::to_string(step.ess_losses) + ")",
                                 bal, 0.0, 0.0);
    }
}

} // namespace grid
