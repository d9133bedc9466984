// src/grid/economics.hpp
#pragma once

#include "grid/dispatcher.hpp"
#include "grid/price_bands.hpp"

namespace grid {

/**
 * Tariffs - Energy community tariff set
 *
 * PR_3, TRAS_e, max_BTAU_m, TP_CE are EUR/MWh; u_pv is EUR/kWh produced;
 * P_pur is EUR/kWh purchased; bill_fixed_costs EUR per purchasing step;
 * VAT is a fraction.
 */
struct Tariffs {
    double PR_3 = 0.0;
    double TRAS_e = 0.0;
    double max_BTAU_m = 0.0;
    double TP_CE = 0.0;
    double u_pv = 0.0;
    double P_pur = 0.0;
    double bill_fixed_costs = 0.0;
    double VAT = 0.0;
};

// Per-step figures in EUR (energies in kWh).
struct StepCost {
    double e_prod = 0.0;
    double e_draw = 0.0;
    double e_sha = 0.0;
    double p_sold = 0.0;
    double p_purch = 0.0;
    double i_ret = 0.0;
    double i_rest = 0.0;
    double i_sha = 0.0;
    double revenue = 0.0;
    double inv_cost = 0.0;
    double c_b_k = 0.0;
    double purch_cost = 0.0;
    double cost = 0.0;
    double oper_cost = 0.0;
    double no_pv_cost = 0.0;
};

class Economics {
public:
    static constexpr double kMWhToKWh = 0.001;

    Economics(const Tariffs& tariffs, double dt_h);

    /**
     * Cost of one step. With a price quote, quote.buy replaces P_pur and
     * quote.sell (EUR/kWh) replaces the PR_3 export price.
     */
    StepCost step_cost(double p_g, double p_gl_s, double p_l, double p_gl_n,
                       double wear_cost, const PriceQuote* quote = nullptr) const;

    StepCost step_cost(const DispatchStep& step, double wear_cost,
                       const PriceQuote* quote = nullptr) const {
        return step_cost(step.p_g, step.p_gl_s, step.p_l, step.p_gl_n, wear_cost, quote);
    }

    const Tariffs& tariffs() const { return tariffs_; }

private:
    Tariffs tariffs_;
    double dt_h_;
};

} // namespace grid
