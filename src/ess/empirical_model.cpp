// src/ess/empirical_model.cpp
#include "ess/empirical_model.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ess {

// ============================================================================
// Fitted coefficients
// ============================================================================

const EmpiricalModel::Params& EmpiricalModel::charge_params() {
    static const Params p = {
        0, 0, 0, 1.83, 0, 0, 0, 1.59, 0, 1.02, 1.33, 0, 0, 0, 0.66, 0,
        0, 7.29, 5.23, 0, 0, 4.42, 0, 0, 5.91, 0, 0, 6.34, 0, 0, 0
    };
    return p;
}

const EmpiricalModel::Params& EmpiricalModel::discharge_params() {
    static const Params p = {
        0, 0, 0, 0, 0, 0, 0, 0, 4.15, 4.13, 0, 0, 2.90, 0.86, 0, 0,
        0, 0, 0.12, 0, 0, 0, 0, 0, 2.31, 0, 0, 3.13, -0.36, 0, 0
    };
    return p;
}

namespace {

constexpr double kRegC2 = 0.03;
constexpr double kRegC3 = 1.08;
constexpr double kRegQ = -4.15;

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace

// ============================================================================
// Equivalent circuit
// ============================================================================

EmpiricalModel::EcmResult EmpiricalModel::evaluate(double current_a, double c_rate,
                                                   double soc_est, double qr_ah, double dt_h) {
    const Params& p = (current_a >= 0.0) ? charge_params() : discharge_params();
    const double x = c_rate;
    const double y = soc_est;
    const double x2 = x * x;

    EcmResult r{};
    r.r0 = (p[0] + p[1] * x + p[2] * x2) * std::exp(-p[3] * y) + (p[4] + p[5] * x + p[6] * x2);
    r.rp = (p[7] + p[8] * x + p[9] * x2) * std::exp(-p[10] * y) + (p[11] + p[12] * x + p[13] * x2);
    r.cp = -(p[14] + p[15] * x + p[16] * x2) * std::exp(-p[17] * y) + (p[18] + p[19] * x + p[20] * x2);
    r.vocv = (p[21] + p[22] * x + p[23] * x2) * std::exp(-p[24] * y)
           + (p[25] + p[26] * y + p[27] * y * y + p[28] * y * y * y)
           - p[29] * x + p[30] * x2;

    const double tau = r.rp * r.cp;
    if (std::abs(r.cp) < kDivEps || std::abs(tau) < kDivEps) {
        r.vterm = std::numeric_limits<double>::quiet_NaN();
    } else {
        r.vterm = (qr_ah / r.cp + current_a * r.rp) * std::exp(-dt_h / tau)
                + r.vocv - current_a * (r.r0 + r.rp);
    }

    double soc = round2(kRegC2 * r.vterm * r.vterm + kRegC3 * r.vterm + kRegQ);
    if (soc < 0.0) {
        soc = soc * soc;
    }
    if (soc > 1.0) {
        soc = (soc - 1.0) * (soc - 1.0);
    }
    r.soc = soc;
    return r;
}

EmpiricalModel::EmpiricalModel(const BatteryConfig& cfg, TransitionHistory* history)
    : cfg_(cfg),
      history_(history),
      wear_(cfg.wear, cfg.nominal_energy_kwh()) {
    state_.soc = cfg.soe_0;
    state_.soe = cfg.soe_0;
    soh_.set_initial_soh(cfg.soh_0);
}

double EmpiricalModel::transition(const TransitionRequest& req, const StateInput& state) {
    const double dt = std::max(cfg_.delta_t_h, kDivEps);
    const double energy_kwh = std::max(cfg_.nominal_energy_kwh(), kDivEps);
    const double c_n = cfg_.c_n_ah;

    const double soe_before = state.soc();
    state_.soe = soe_before;
    if (req.current_step == 0 || !state_.initialized) {
        state_.soc = soe_before;
        state_.initialized = true;
    }
    const double soc_before = state_.soc;

    // ECM convention: charge current positive, per cell
    const double power_kw = req.external_energy_change_kwh / dt;
    const double current_a = 1000.0 * power_kw /
                             (std::max(cfg_.pack_voltage_v(), kVoltageEps) * cfg_.np);

    const double qr = soc_before * c_n;
    const double c_rate = (qr == 0.0) ? 1000.0 : std::abs(current_a / qr);

    // coulomb counting, symmetric for charge and discharge
    const double soc_coulomb = soc_before + current_a * dt / c_n;

    const EcmResult ecm = evaluate(current_a, c_rate, soc_coulomb, qr, dt);

    double soc_new = ecm.soc;
    if (!std::isfinite(soc_new) || soc_new < 0.0 || soc_new > 1.0) {
        ++fallback_count_;
        soc_new = std::isfinite(soc_coulomb) ? std::clamp(soc_coulomb, 0.0, 1.0) : soc_before;
        MGSIM_LOG_WARN("[EmpiricalModel] Regression inversion out of range at step %d "
                       "(Vterm=%.4f V, SoC=%.4f); using coulomb estimate %.4f",
                       req.current_step, ecm.vterm, ecm.soc, soc_new);
    }

    const double min_soe = std::clamp(req.min_capacity_kwh / energy_kwh, 0.0, 1.0);
    const double max_soe = std::clamp(req.max_capacity_kwh / energy_kwh, min_soe, 1.0);

    // discharge shortfall is judged against the lower bound
    if (current_a < 0.0 && soc_new < min_soe) {
        ++shortfall_count_;
        MGSIM_LOG_WARN("[EmpiricalModel] Discharge at step %d undershoots SoE_min (%.4f < %.4f); "
                       "clipping to SoE_min", req.current_step, soc_new, min_soe);
    }
    double soe_new = std::clamp(soc_new, min_soe, max_soe);

    double internal = (soe_new - soe_before) * energy_kwh;
    internal = std::clamp(internal, -req.max_discharge_kwh, req.max_charge_kwh);
    soe_new = soe_before + internal / energy_kwh;

    state_.soc = soe_new;
    state_.soe = soe_new;
    state_.current_a = current_a;
    state_.v_prev = std::isfinite(ecm.vterm) ? ecm.vterm * cfg_.ns : 0.0;
    state_.wear_cost = wear_.cost(soc_before, soe_new, power_kw, dt, cfg_.efficiency);

    const double soh = soh_.update(std::abs(current_a) * dt);

    if (history_) {
        HistoryRecord rec;
        rec.time_hours = req.current_step * cfg_.delta_t_h;
        rec.current_a = current_a;
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

double EmpiricalModel::wear_cost(double soc_prev, double power_kw, double dt_h) const {
    return wear_.cost(soc_prev, state_.soc, power_kw, dt_h, cfg_.efficiency);
}

void EmpiricalModel::reset() {
    state_ = ElectricalState{};
    state_.soc = cfg_.soe_0;
    state_.soe = cfg_.soe_0;
    fallback_count_ = 0;
    shortfall_count_ = 0;
    soh_.reset();
}

} // namespace ess
