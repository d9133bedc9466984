// src/grid/economics.cpp
#include "grid/economics.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace grid {

Economics::Economics(const Tariffs& tariffs, double dt_h)
    : tariffs_(tariffs), dt_h_(dt_h) {}

StepCost Economics::step_cost(double p_g, double p_gl_s, double p_l, double p_gl_n,
                              double wear_cost, const PriceQuote* quote) const {
    const Tariffs& t = tariffs_;
    const double dt = dt_h_;

    const double export_price = quote ? quote->sell : t.PR_3 * kMWhToKWh;
    const double purchase_price = quote ? quote->buy : t.P_pur;

    StepCost c;
    c.e_prod = dt * p_g;
    c.e_draw = (p_gl_s > 0.0) ? dt * (p_l + p_gl_s) : dt * p_l;
    c.e_sha = std::min(c.e_prod, c.e_draw);

    c.p_sold = std::max(p_gl_n, 0.0);
    c.p_purch = std::max(-p_gl_n, 0.0);

    c.i_ret = export_price * dt * c.p_sold;
    c.i_rest = (t.TRAS_e + t.max_BTAU_m) * kMWhToKWh * c.e_sha;
    c.i_sha = t.TP_CE * kMWhToKWh * c.e_sha;
    c.revenue = c.i_sha + c.i_rest + c.i_ret;

    c.inv_cost = t.u_pv * p_g * dt;
    c.c_b_k = wear_cost;

    c.purch_cost = (c.p_purch != 0.0)
                       ? (c.p_purch * dt * purchase_price + t.bill_fixed_costs) * (1.0 + t.VAT)
                       : 0.0;

    c.cost = -c.revenue + c.inv_cost + c.c_b_k + c.purch_cost;
    c.oper_cost = c.inv_cost + c.c_b_k;
    c.no_pv_cost = (p_l * dt * purchase_price + t.bill_fixed_costs) * (1.0 + t.VAT);

    MGSIM_LOG_TRACE("[Economics] E_prod=%.3f E_draw=%.3f E_sha=%.3f sold=%.3f kW purch=%.3f kW cost=%.4f",
                    c.e_prod, c.e_draw, c.e_sha, c.p_sold, c.p_purch, c.cost);
    return c;
}

} // namespace grid
