// src/config/microgrid_config.cpp
#include "config/microgrid_config.hpp"
#include "ess/wear_cost.hpp"
#include "utils/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>

namespace config {

namespace {

void parse_root(const YAML::Node& root, MicrogridConfig& cfg) {
    // ========================================================================
    // Simulation
    // ========================================================================
    if (root["simulation"]) {
        auto s = root["simulation"];
        cfg.simulation.name = s["name"].as<std::string>(cfg.simulation.name);
        cfg.simulation.description = s["description"].as<std::string>("");
        cfg.simulation.mode = s["mode"].as<std::string>(cfg.simulation.mode);
        cfg.simulation.delta_t_min = s["delta_t_min"].as<double>(cfg.simulation.delta_t_min);
        cfg.simulation.steps = s["steps"].as<int>(cfg.simulation.steps);
        cfg.simulation.alpha = s["alpha"].as<double>(cfg.simulation.alpha);
        cfg.simulation.data_dir = s["data_dir"].as<std::string>(cfg.simulation.data_dir);
        cfg.simulation.profile_csv = s["profile_csv"].as<std::string>("");
        cfg.simulation.profile_noise_std = s["profile_noise_std"].as<double>(0.0);
        cfg.simulation.seed = s["seed"].as<uint64_t>(0);
        cfg.simulation.history_csv = s["history_csv"].as<std::string>("");
        cfg.simulation.history_json = s["history_json"].as<std::string>("");
        cfg.simulation.history_capacity = s["history_capacity"].as<size_t>(cfg.simulation.history_capacity);
        cfg.simulation.output_csv = s["output_csv"].as<std::string>(cfg.simulation.output_csv);
        cfg.simulation.allow_night_grid_charge = s["allow_night_grid_charge"].as<bool>(false);
    }

    // ========================================================================
    // Battery
    // ========================================================================
    ess::BatteryConfig& bat = cfg.battery;
    std::string chem_name = ess::to_string(bat.chemistry);
    if (root["battery"] && root["battery"]["chemistry"]) {
        chem_name = root["battery"]["chemistry"].as<std::string>();
    }
    cfg.set_chemistry(chem_name);

    if (root["battery"]) {
        auto b = root["battery"];
        bat.ns = b["ns"].as<int>(bat.ns);
        bat.np = b["np"].as<int>(bat.np);
        bat.reference_capacity_ah = b["reference_capacity_ah"].as<double>(bat.reference_capacity_ah);
        bat.cell_voltage_v = b["cell_voltage_v"].as<double>(bat.cell_voltage_v);
        bat.c_n_ah = b["c_n"].as<double>(bat.c_n_ah);
        bat.eta_inverter = b["eta_inverter"].as<double>(bat.eta_inverter);
        bat.efficiency = b["efficiency"].as<double>(bat.efficiency);
        bat.soe_0 = b["soe_0"].as<double>(bat.soe_0);
        bat.soe_min = b["soe_min"].as<double>(bat.soe_min);
        bat.soe_max = b["soe_max"].as<double>(bat.soe_max);
        bat.p_s_max_kw = b["p_s_max_kw"].as<double>(bat.p_s_max_kw);
        bat.temperature_c = b["temperature_c"].as<double>(bat.temperature_c);
        bat.soh_0 = b["soh"].as<double>(bat.soh_0);
        bat.table_path = b["table_path"].as<std::string>(bat.table_path);
        bat.soh_curve_path = b["soh_curve_path"].as<std::string>(bat.soh_curve_path);

        if (b["wear"]) {
            auto w = b["wear"];
            if (w["a"]) bat.wear.a = w["a"].as<double>();
            if (w["b"]) bat.wear.b = w["b"].as<double>();
            if (w["B"]) bat.wear.B = w["B"].as<double>();
            // a wear section asks for wear cost, so it must be complete
            try {
                ess::WearModel(bat.wear, bat.nominal_energy_kwh()).require_coefficients();
            } catch (const std::invalid_argument& e) {
                throw ConfigError(std::string("battery.wear: ") + e.what());
            }
        }
    }
    bat.delta_t_h = cfg.simulation.delta_t_h();

    // ========================================================================
    // Tariffs
    // ========================================================================
    if (root["tariffs"]) {
        auto t = root["tariffs"];
        cfg.tariffs.PR_3 = t["PR_3"].as<double>(cfg.tariffs.PR_3);
        cfg.tariffs.TRAS_e = t["TRAS_e"].as<double>(cfg.tariffs.TRAS_e);
        cfg.tariffs.max_BTAU_m = t["max_BTAU_m"].as<double>(cfg.tariffs.max_BTAU_m);
        cfg.tariffs.TP_CE = t["TP_CE"].as<double>(cfg.tariffs.TP_CE);
        cfg.tariffs.u_pv = t["u_pv"].as<double>(cfg.tariffs.u_pv);
        cfg.tariffs.P_pur = t["P_pur"].as<double>(cfg.tariffs.P_pur);
        cfg.tariffs.bill_fixed_costs = t["bill_fixed_costs"].as<double>(cfg.tariffs.bill_fixed_costs);
        cfg.tariffs.VAT = t["VAT"].as<double>(cfg.tariffs.VAT);
    }

    // ========================================================================
    // Time-of-use price bands
    // ========================================================================
    if (root["price_bands"]) {
        auto bands = root["price_bands"];
        if (!bands.IsMap()) {
            throw ConfigError("price_bands must be a map of band name -> {buy, sell, ranges}");
        }
        for (auto it = bands.begin(); it != bands.end(); ++it) {
            grid::PriceBand band;
            band.name = it->first.as<std::string>();
            band.buy = it->second["buy"].as<double>(0.0);
            band.sell = it->second["sell"].as<double>(0.0);
            if (it->second["ranges"]) {
                for (const auto& r : it->second["ranges"]) {
                    if (!r.IsSequence() || r.size() != 2) {
                        throw ConfigError("price_bands." + band.name + ": each range must be [start, end]");
                    }
                    band.ranges.emplace_back(r[0].as<int>(), r[1].as<int>());
                }
            }
            cfg.price_bands.add(std::move(band));
        }
    }

    // ========================================================================
    // Scenario / telemetry / logging
    // ========================================================================
    if (root["scenario"]) {
        cfg.lua_script = root["scenario"]["lua_script"].as<std::string>("");
    }

    if (root["telemetry"]) {
        auto t = root["telemetry"];
        cfg.telemetry.enabled = t["enabled"].as<bool>(false);
        cfg.telemetry.url = t["url"].as<std::string>(cfg.telemetry.url);
        cfg.telemetry.org = t["org"].as<std::string>(cfg.telemetry.org);
        cfg.telemetry.bucket = t["bucket"].as<std::string>(cfg.telemetry.bucket);
        cfg.telemetry.token = t["token"].as<std::string>("");
        cfg.telemetry.write_every_n_steps = t["write_every_n_steps"].as<int>(1);
    }

    if (root["logging"]) {
        cfg.logging.level = root["logging"]["level"].as<std::string>(cfg.logging.level);
        cfg.logging.file = root["logging"]["file"].as<std::string>("");
    }
}

MicrogridConfig from_node(const YAML::Node& root) {
    MicrogridConfig cfg = MicrogridConfig::get_default();
    try {
        parse_root(root, cfg);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("[MicrogridConfig] YAML error: ") + e.what());
    }
    cfg.validate();
    return cfg;
}

} // namespace

MicrogridConfig MicrogridConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        MGSIM_LOG_WARN("[MicrogridConfig] File not found: %s", yaml_path.c_str());
        MGSIM_LOG_WARN("[MicrogridConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    MGSIM_LOG_INFO("[MicrogridConfig] Loading config from: %s", yaml_path.c_str());

    YAML::Node root;
    try {
        root = YAML::LoadFile(yaml_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("[MicrogridConfig] YAML parse error: ") + e.what());
    }

    MicrogridConfig cfg = from_node(root);
    MGSIM_LOG_INFO("[MicrogridConfig] Successfully loaded: %s", cfg.simulation.name.c_str());
    return cfg;
}

MicrogridConfig MicrogridConfig::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("[MicrogridConfig] YAML parse error: ") + e.what());
    }
    return from_node(root);
}

MicrogridConfig MicrogridConfig::get_default() {
    MicrogridConfig cfg;

    cfg.simulation.name = "Default Microgrid";
    cfg.simulation.description = "NMC storage, PV and load on a grid connection";

    cfg.battery.apply_chemistry_preset(ess::Chemistry::NMC, cfg.simulation.data_dir);
    cfg.battery.ns = 16;
    cfg.battery.np = 528;
    cfg.battery.eta_inverter = 0.96;
    cfg.battery.efficiency = 0.95;
    cfg.battery.soe_0 = 0.5;
    cfg.battery.soe_min = 0.1;
    cfg.battery.soe_max = 0.9;
    cfg.battery.p_s_max_kw = 50.0;
    cfg.battery.temperature_c = 25.0;
    cfg.battery.delta_t_h = cfg.simulation.delta_t_h();

    // EUR/MWh except u_pv, P_pur (EUR/kWh) and bill_fixed_costs (EUR)
    cfg.tariffs.PR_3 = 110.0;
    cfg.tariffs.TRAS_e = 8.48;
    cfg.tariffs.max_BTAU_m = 0.61;
    cfg.tariffs.TP_CE = 110.0;
    cfg.tariffs.u_pv = 0.0;
    cfg.tariffs.P_pur = 0.25;
    cfg.tariffs.bill_fixed_costs = 0.0;
    cfg.tariffs.VAT = 0.10;

    return cfg;
}

void MicrogridConfig::set_chemistry(const std::string& name) {
    auto chem = ess::parse_chemistry(name);
    if (!chem) {
        throw ConfigError("Unknown battery chemistry: " + name);
    }
    battery.apply_chemistry_preset(*chem, simulation.data_dir);
}

void MicrogridConfig::validate() const {
    if (!(simulation.delta_t_min > 0.0)) {
        throw ConfigError("Invalid delta_t_min: must be > 0");
    }
    if (simulation.steps < 0) {
        throw ConfigError("Invalid steps: must be >= 0");
    }
    if (!(simulation.alpha >= 0.0 && simulation.alpha <= 1.0)) {
        throw ConfigError("Invalid alpha: must be 0 <= alpha <= 1");
    }
    if (simulation.mode != "dispatch" && simulation.mode != "transition") {
        throw ConfigError("Invalid mode: " + simulation.mode + " (dispatch | transition)");
    }
    if (simulation.history_capacity == 0) {
        throw ConfigError("Invalid history_capacity: must be > 0");
    }
    if (simulation.profile_noise_std < 0.0) {
        throw ConfigError("Invalid profile_noise_std: must be >= 0");
    }

    try {
        battery.validate();
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("Invalid battery: ") + e.what());
    }

    if (tariffs.VAT < 0.0) {
        throw ConfigError("Invalid VAT: must be >= 0");
    }
    if (tariffs.P_pur < 0.0 || tariffs.bill_fixed_costs < 0.0) {
        throw ConfigError("Invalid purchase tariffs: must be >= 0");
    }

    if (telemetry.enabled && telemetry.write_every_n_steps <= 0) {
        throw ConfigError("Invalid telemetry.write_every_n_steps: must be > 0");
    }

    MGSIM_LOG_DEBUG("[MicrogridConfig] Validation passed");
}

void MicrogridConfig::print_summary() const {
    MGSIM_LOG_INFO("========================================");
    MGSIM_LOG_INFO("Microgrid Configuration Summary");
    MGSIM_LOG_INFO("========================================");
    MGSIM_LOG_INFO("Name: %s", simulation.name.c_str());
    if (!simulation.description.empty()) {
        MGSIM_LOG_INFO("Description: %s", simulation.description.c_str());
    }
    MGSIM_LOG_INFO("----------------------------------------");
    MGSIM_LOG_INFO("Mode: %s, dt=%.1f min, steps=%d, alpha=%.2f",
                   simulation.mode.c_str(), simulation.delta_t_min, simulation.steps, simulation.alpha);
    MGSIM_LOG_INFO("Battery: %s, %dS%dP, %.1f kWh, %.1f kW",
                   ess::to_string(battery.chemistry), battery.ns, battery.np,
                   battery.nominal_energy_kwh(), battery.p_s_max_kw);
    MGSIM_LOG_INFO("SoE window: [%.2f, %.2f], SoE_0=%.2f, SOH_0=%.3f",
                   battery.soe_min, battery.soe_max, battery.soe_0, battery.soh_0);
    MGSIM_LOG_INFO("Wear model: %s", battery.wear.complete() ? "enabled" : "disabled");
    MGSIM_LOG_INFO("Price bands: %zu", price_bands.size());
    if (!lua_script.empty()) {
        MGSIM_LOG_INFO("Scenario: %s", lua_script.c_str());
    }
    MGSIM_LOG_INFO("========================================");
}

} // namespace config
