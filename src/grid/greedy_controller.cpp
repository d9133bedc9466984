// src/grid/greedy_controller.cpp
#include "grid/greedy_controller.hpp"

#include <algorithm>
#include <cctype>

namespace grid {

GreedyDecision greedy_battery_request(double load_kwh, double pv_kwh,
                                      const GreedyLimits& limits,
                                      const std::string& band,
                                      bool allow_night_grid_charge) {
    constexpr double kTolerance = 1e-6;

    const double max_discharge = std::max(0.0, limits.max_discharge_kwh);
    const double max_charge = std::max(0.0, limits.max_charge_kwh);

    std::string band_upper;
    for (char c : band) {
        band_upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    const bool night_grid_mode = allow_night_grid_charge && band_upper == "OFFPEAK";

    GreedyDecision d;
    if (load_kwh > pv_kwh + kTolerance) {
        const double deficit = load_kwh - pv_kwh;
        if (night_grid_mode) {
            // cheap grid energy, keep the battery
            d.e_grid_kwh = deficit;
        } else {
            const double discharge = std::min(deficit, max_discharge);
            d.e_batt_kwh = discharge;
            d.e_grid_kwh = std::max(deficit - discharge, 0.0);
        }
    } else if (pv_kwh > load_kwh + kTolerance) {
        const double surplus = pv_kwh - load_kwh;
        const double charge = std::min(surplus, max_charge);
        d.e_batt_kwh = -charge;
        d.e_grid_kwh = -std::max(surplus - charge, 0.0);
    }

    if (night_grid_mode) {
        const double planned = std::max(0.0, -d.e_batt_kwh);
        const double headroom = std::max(0.0, limits.headroom_kwh - planned);
        const double extra = std::min(std::max(0.0, max_charge - planned), headroom);
        if (extra > kTolerance) {
            d.e_batt_kwh -= extra;
            d.e_grid_kwh += extra;
        }
    }
    return d;
}

} // namespace grid
