// src/grid/greedy_controller.hpp
#pragma once

#include <string>

namespace grid {

// Battery limits for one step, all in kWh.
struct GreedyLimits {
    double max_charge_kwh = 0.0;
    double max_discharge_kwh = 0.0;
    double headroom_kwh = 0.0;     // max_capacity - current_charge
};

// e_batt > 0 discharges the battery, e_grid > 0 imports from the grid.
struct GreedyDecision {
    double e_batt_kwh = 0.0;
    double e_grid_kwh = 0.0;
};

/**
 * Self-consumption rule: a deficit is covered by the battery up to its
 * discharge limit and the rest imported; a surplus charges the battery up to
 * its charge limit and the rest is exported.
 *
 * With allow_night_grid_charge and band == "OFFPEAK" the battery is not
 * discharged and is topped up from the grid within the remaining headroom.
 */
GreedyDecision greedy_battery_request(double load_kwh, double pv_kwh,
                                      const GreedyLimits& limits,
                                      const std::string& band = "",
                                      bool allow_night_grid_charge = false);

} // namespace grid
