// src/grid/dispatcher.hpp
#pragma once

#include "ess/storage_unit.hpp"
#include "utils/sampler.hpp"

#include <stdexcept>
#include <string>

namespace grid {

enum class DispatchCase {
    Equilibrium,
    OverAmple,           // surplus fits in headroom and power rating
    OverLimitedEnergy,   // surplus exceeds headroom, within power rating
    OverPowerLimit,      // surplus exceeds power rating
    UnderAmple,
    UnderLimitedEnergy,
    UnderPowerLimit
};

const char* to_string(DispatchCase c);

// Uncovered input combination (NaN, alpha outside [0,1]).
class DispatchError : public std::runtime_error {
public:
    explicit DispatchError(const std::string& msg) : std::runtime_error(msg) {}
};

// Post-dispatch check failed. Carries the offending quantities.
class InvariantViolation : public std::runtime_error {
public:
    InvariantViolation(const std::string& msg, double value, double lower, double upper)
        : std::runtime_error(msg), value_(value), lower_(lower), upper_(upper) {}

    double value() const { return value_; }
    double lower() const { return lower_; }
    double upper() const { return upper_; }

private:
    double value_;
    double lower_;
    double upper_;
};

/**
 * DispatchStep - Realized power flows of one timestep (kW)
 *
 *   p_gl = p_g - p_l = p_gl_s + p_gl_n + ess_losses
 *
 * p_gl_s > 0 charges the storage, p_gl_n > 0 exports to the main grid.
 */
struct DispatchStep {
    double p_g = 0.0;
    double p_l = 0.0;
    double p_gl = 0.0;
    double p_gl_s = 0.0;
    double p_gl_n = 0.0;
    double ess_losses = 0.0;
    double q_res = 0.0;        // kWh of headroom before the step
    double e_s_res = 0.0;      // kWh available before the step
    double alpha = 0.0;
    double eta = 1.0;
    double excess_kwh = 0.0;
    double lack_kwh = 0.0;
    double soe_before = 0.0;
    double soe_after = 0.0;
    DispatchCase dispatch_case = DispatchCase::Equilibrium;

    double balance() const { return p_gl - p_gl_n - p_gl_s - ess_losses; }
};

/**
 * Dispatcher - Splits the generation/load imbalance between storage and grid
 *
 * alpha in [0,1] is the share of the imbalance offered to the storage.
 * Every call re-invokes the storage unit and verifies the SoE window and the
 * energy balance (two decimals).
 */
class Dispatcher {
public:
    Dispatcher(ess::StorageUnit& storage, double dt_h);

    /**
     * @throws DispatchError on NaN inputs or alpha outside [0,1]
     * @throws InvariantViolation if the SoE window or balance is broken
     */
    DispatchStep dispatch(double p_g, double p_l, double alpha);

    /**
     * @throws InvariantViolation
     */
    static void check_invariants(const DispatchStep& step, double soe_min, double soe_max);

    double dt_h() const { return dt_h_; }

private:
    void dispatch_surplus(DispatchStep& s);
    void dispatch_deficit(DispatchStep& s);

    double round2(double v) const { return quant_.quantize(v); }

    ess::StorageUnit& storage_;
    double dt_h_;
    utils::Quantizer quant_{0.01};
};

} // namespace grid
