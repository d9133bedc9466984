// src/config/microgrid_config.hpp
#pragma once

#include "ess/battery_config.hpp"
#include "grid/economics.hpp"
#include "grid/price_bands.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace config {

// Present but invalid configuration.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct SimulationSettings {
    std::string name = "Default Microgrid";
    std::string description;
    std::string mode = "dispatch";          // dispatch | transition
    double delta_t_min = 15.0;
    int steps = 96;                         // 0 = length of the profile
    double alpha = 1.0;
    std::string data_dir = "data";
    std::string profile_csv;
    double profile_noise_std = 0.0;         // relative, 0 = off
    uint64_t seed = 0;
    std::string history_csv;
    std::string history_json;
    size_t history_capacity = 100000;
    std::string output_csv = "mgsim_output.csv";
    bool allow_night_grid_charge = false;

    double delta_t_h() const { return delta_t_min / 60.0; }
};

struct TelemetrySettings {
    bool enabled = false;
    std::string url = "http://localhost:8086";
    std::string org = "microgrid";
    std::string bucket = "mgsim";
    std::string token;
    int write_every_n_steps = 1;
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;
};

/**
 * MicrogridConfig - Loads the simulation setup from a YAML file
 *
 * Usage:
 *   auto cfg = MicrogridConfig::load("config/microgrid.yaml");
 *   auto model = ess::make_battery_model(cfg.battery, &history);
 *
 * Falls back to built-in defaults if the file is not found.
 */
class MicrogridConfig {
public:
    SimulationSettings simulation;
    ess::BatteryConfig battery;
    grid::Tariffs tariffs;
    grid::PriceBands price_bands;
    std::string lua_script;
    TelemetrySettings telemetry;
    LoggingSettings logging;

    /**
     * Load config from a YAML file
     * @throws ConfigError if the file exists but is invalid
     *
     * If the file doesn't exist, returns the default configuration with a warning.
     */
    static MicrogridConfig load(const std::string& yaml_path);

    /**
     * Parse YAML text (same schema as load()).
     * @throws ConfigError
     */
    static MicrogridConfig parse(const std::string& yaml_text);

    /**
     * Default setup: ~100 kWh NMC pack, 50 kW, 15 min steps, one day.
     */
    static MicrogridConfig get_default();

    /**
     * Change chemistry after loading (CLI override). Re-applies the reference
     * cell preset from simulation.data_dir.
     * @throws ConfigError on an unknown name
     */
    void set_chemistry(const std::string& name);

    /**
     * @throws ConfigError if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;

    MicrogridConfig() = default;
};

} // namespace config
