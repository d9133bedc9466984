// src/ess/battery_state.hpp
#pragma once

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

namespace ess {

// Numerical floors. Degenerate voltages/divisors are clamped, never thrown.
constexpr double kVoltageEps = 1e-6;
constexpr double kDivEps = 1e-9;

/**
 * StateInput - Host-side state handed to BatteryModel::transition()
 *
 * soc is the host's energy fraction (i.e. the SoE). The model keeps its own
 * charge-based SoC internally.
 */
class StateInput {
public:
    /**
     * @throws std::invalid_argument if soc is outside [0,1], current_charge
     *         is negative or any value is non-finite
     */
    static StateInput make(double soc, double current_charge_kwh,
                           std::optional<double> temperature_c = std::nullopt) {
        if (!std::isfinite(soc) || soc < 0.0 || soc > 1.0) {
            throw std::invalid_argument("StateInput: soc out of [0,1]: " + std::to_string(soc));
        }
        if (!std::isfinite(current_charge_kwh) || current_charge_kwh < 0.0) {
            throw std::invalid_argument("StateInput: current_charge must be >= 0 kWh: " +
                                        std::to_string(current_charge_kwh));
        }
        if (temperature_c && !std::isfinite(*temperature_c)) {
            throw std::invalid_argument("StateInput: temperature_c must be finite");
        }
        return StateInput(soc, current_charge_kwh, temperature_c);
    }

    double soc() const { return soc_; }
    double current_charge_kwh() const { return current_charge_kwh_; }
    const std::optional<double>& temperature_c() const { return temperature_c_; }

private:
    StateInput(double soc, double charge, std::optional<double> temp)
        : soc_(soc), current_charge_kwh_(charge), temperature_c_(temp) {}

    double soc_;
    double current_charge_kwh_;
    std::optional<double> temperature_c_;
};

// Per-step request. Energies in kWh, external convention: charge positive.
struct TransitionRequest {
    double external_energy_change_kwh = 0.0;
    double min_capacity_kwh = 0.0;
    double max_capacity_kwh = 0.0;
    double max_charge_kwh = 0.0;
    double max_discharge_kwh = 0.0;
    double efficiency = 1.0;
    int current_step = 0;       // 0 = first call, re-initializes the model
};

// Electrical state carried between steps. Discharge current positive.
struct ElectricalState {
    double soc = 0.0;
    double soe = 0.0;
    double v_prev = 0.0;        // terminal voltage of the previous step
    double current_a = 0.0;
    std::optional<double> dynamic_efficiency;
    double wear_cost = 0.0;
    bool initialized = false;
};

// One row of the diagnostic history.
struct HistoryRecord {
    double time_hours = 0.0;
    double current_a = 0.0;
    double voltage_v = 0.0;
    double soc = 0.0;
    double soe = 0.0;
    double power_kw = 0.0;              // external convention: charge positive
    double internal_energy_change = 0.0;
    double soh = 1.0;
};

} // namespace ess
