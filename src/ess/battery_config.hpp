// src/ess/battery_config.hpp
#pragma once

#include <optional>
#include <string>

namespace ess {

enum class Chemistry {
    Linear,     // static-efficiency baseline
    Empirical,  // 31-parameter ECM, no lookup tables
    NMC,
    NCA,
    LFP
};

const char* to_string(Chemistry chem);

// Case-insensitive. Returns nullopt for unknown names.
std::optional<Chemistry> parse_chemistry(const std::string& name);

// Reference cell the Voc/R0 tables were measured on.
struct ReferenceCell {
    double capacity_ah;
    double nominal_voltage_v;
    const char* table_file;   // relative to the data directory
    double min_table_soh;     // oldest SOH layer of the bundled table
};

// Only the table chemistries (NMC, NCA, LFP) carry a reference cell.
std::optional<ReferenceCell> reference_cell(Chemistry chem);

// Empirical wear coefficients. Wear cost is zero unless all three are set.
struct WearCoefficients {
    std::optional<double> a;
    std::optional<double> b;
    std::optional<double> B;

    bool complete() const { return a && b && B; }
};

/**
 * BatteryConfig - Pack description shared by every battery model
 *
 * Energies in kWh, powers in kW, time in hours, capacities in Ah.
 * Immutable once the simulation starts.
 */
struct BatteryConfig {
    Chemistry chemistry = Chemistry::NMC;

    // --- Cell / pack layout
    double reference_capacity_ah = 3.2;   // reference cell capacity
    double cell_voltage_v = 3.7;          // nominal cell voltage
    int ns = 16;                          // cells in series
    int np = 528;                         // strings in parallel
    double c_n_ah = 3.2;                  // target cell capacity

    // --- Efficiencies
    double eta_inverter = 0.96;
    double efficiency = 0.95;             // static round-trip fallback

    // --- Operating window (fractions of nominal energy)
    double soe_0 = 0.5;
    double soe_min = 0.1;
    double soe_max = 0.9;

    double p_s_max_kw = 50.0;             // rated charge/discharge power
    double delta_t_h = 0.25;
    double temperature_c = 25.0;
    double soh_0 = 1.0;                   // initial state of health

    WearCoefficients wear;

    std::string table_path = "data/cells/nmc_voc_r0.csv";
    std::string soh_curve_path;           // empty = no SOH tracking

    double nominal_energy_kwh() const {
        return c_n_ah * cell_voltage_v * ns * np / 1000.0;
    }
    double pack_capacity_ah() const { return c_n_ah * np; }
    double pack_voltage_v() const { return cell_voltage_v * ns; }

    double min_capacity_kwh() const { return soe_min * nominal_energy_kwh(); }
    double max_capacity_kwh() const { return soe_max * nominal_energy_kwh(); }

    // Per-step energy limits at rated power.
    double max_charge_kwh() const { return p_s_max_kw * delta_t_h; }
    double max_discharge_kwh() const { return p_s_max_kw * delta_t_h; }

    /**
     * Apply the chemistry's reference cell (capacity, voltage, bundled table).
     * c_n follows the reference capacity unless overridden afterwards.
     */
    void apply_chemistry_preset(Chemistry chem, const std::string& data_dir);

    /**
     * @throws std::invalid_argument on out-of-range parameters, or an aged
     *         soh_0 for a chemistry whose tables only cover SOH 1.0
     */
    void validate() const;
};

} // namespace ess
