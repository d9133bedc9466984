// src/sim/microgrid_state.hpp
#pragma once

#include "grid/dispatcher.hpp"
#include "grid/economics.hpp"

#include <string>

namespace sim {

// Per-step snapshot of the microgrid. Units are embedded in field names.
struct MicrogridState {
    int step = 0;
    double t_h = 0.0;

    // --- Power flows (kW)
    double p_g_kw = 0.0;
    double p_l_kw = 0.0;
    double p_gl_kw = 0.0;
    double p_gl_s_kw = 0.0;
    double p_gl_n_kw = 0.0;
    double ess_losses_kw = 0.0;
    double alpha = 0.0;
    int dispatch_case = 0;
    double excess_kwh = 0.0;
    double lack_kwh = 0.0;

    // --- Battery
    double soe = 0.0;
    double soc = 0.0;
    double soh = 1.0;
    double voltage_v = 0.0;
    double current_a = 0.0;
    double efficiency = 1.0;
    double internal_energy_kwh = 0.0;

    // --- Economics (EUR)
    double wear_cost_eur = 0.0;
    double cost_eur = 0.0;
    double revenue_eur = 0.0;
    double inv_cost_eur = 0.0;
    double purch_cost_eur = 0.0;
    double oper_cost_eur = 0.0;
    double no_pv_cost_eur = 0.0;
    double buy_price = 0.0;
    double sell_price = 0.0;

    std::string band;

    /**
     * Enumerate every numeric field with its column name.
     * Drives the run CSV header/rows and the telemetry lines.
     */
    template<typename Visitor>
    void accept_fields(Visitor& visitor) const {
        visitor.visit("step", step);
        visitor.visit("time_hours", t_h);

        visitor.visit("p_g_kw", p_g_kw);
        visitor.visit("p_l_kw", p_l_kw);
        visitor.visit("p_gl_kw", p_gl_kw);
        visitor.visit("p_gl_s_kw", p_gl_s_kw);
        visitor.visit("p_gl_n_kw", p_gl_n_kw);
        visitor.visit("ess_losses_kw", ess_losses_kw);
        visitor.visit("alpha", alpha);
        visitor.visit("dispatch_case", dispatch_case);
        visitor.visit("excess_kwh", excess_kwh);
        visitor.visit("lack_kwh", lack_kwh);

        visitor.visit("soe", soe);
        visitor.visit("soc", soc);
        visitor.visit("soh", soh);
        visitor.visit("voltage_v", voltage_v);
        visitor.visit("current_a", current_a);
        visitor.visit("efficiency", efficiency);
        visitor.visit("internal_energy_kwh", internal_energy_kwh);

        visitor.visit("wear_cost_eur", wear_cost_eur);
        visitor.visit("cost_eur", cost_eur);
        visitor.visit("revenue_eur", revenue_eur);
        visitor.visit("inv_cost_eur", inv_cost_eur);
        visitor.visit("purch_cost_eur", purch_cost_eur);
        visitor.visit("oper_cost_eur", oper_cost_eur);
        visitor.visit("no_pv_cost_eur", no_pv_cost_eur);
        visitor.visit("buy_price", buy_price);
        visitor.visit("sell_price", sell_price);
    }

    void apply(const grid::DispatchStep& d) {
        p_g_kw = d.p_g;
        p_l_kw = d.p_l;
        p_gl_kw = d.p_gl;
        p_gl_s_kw = d.p_gl_s;
        p_gl_n_kw = d.p_gl_n;
        ess_losses_kw = d.ess_losses;
        alpha = d.alpha;
        dispatch_case = static_cast<int>(d.dispatch_case);
        excess_kwh = d.excess_kwh;
        lack_kwh = d.lack_kwh;
        soe = d.soe_after;
    }

    void apply(const grid::StepCost& c) {
        wear_cost_eur = c.c_b_k;
        cost_eur = c.cost;
        revenue_eur = c.revenue;
        inv_cost_eur = c.inv_cost;
        purch_cost_eur = c.purch_cost;
        oper_cost_eur = c.oper_cost;
        no_pv_cost_eur = c.no_pv_cost;
    }
};

// Running totals folded from every validated step.
struct RunTotals {
    int steps = 0;
    double cost = 0.0;
    double revenue = 0.0;
    double inv_cost = 0.0;
    double wear_cost = 0.0;
    double purch_cost = 0.0;
    double oper_cost = 0.0;
    double no_pv_cost = 0.0;
    double energy_produced_kwh = 0.0;
    double energy_shared_kwh = 0.0;
    double energy_imported_kwh = 0.0;
    double energy_exported_kwh = 0.0;
    double energy_charged_kwh = 0.0;
    double energy_discharged_kwh = 0.0;

    void add(const grid::DispatchStep& d, const grid::StepCost& c, double dt_h) {
        ++steps;
        cost += c.cost;
        revenue += c.revenue;
        inv_cost += c.inv_cost;
        wear_cost += c.c_b_k;
        purch_cost += c.purch_cost;
        oper_cost += c.oper_cost;
        no_pv_cost += c.no_pv_cost;
        energy_produced_kwh += c.e_prod;
        energy_shared_kwh += c.e_sha;
        energy_imported_kwh += c.p_purch * dt_h;
        energy_exported_kwh += c.p_sold * dt_h;
        if (d.p_gl_s > 0.0) {
            energy_charged_kwh += d.p_gl_s * dt_h;
        } else {
            energy_discharged_kwh += -d.p_gl_s * dt_h;
        }
    }

    // Saving against buying the whole load from the grid.
    double savings() const { return no_pv_cost - cost; }
};

} // namespace sim
