// src/sim/sim_main.cpp
#include "sim/sim_app.hpp"
#include "config/microgrid_config.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <getopt.h>

void print_usage(const char* prog_name) {
    printf("Usage: %s [options] [config.yaml]\n", prog_name);
    printf("\nSimulation Modes:\n");
    printf("  dispatch (default)    Power-flow dispatcher + storage unit + economics\n");
    printf("  transition            Greedy controller drives the battery model directly\n");
    printf("\nOptions:\n");
    printf("  --mode MODE           dispatch | transition (default: from YAML)\n");
    printf("  --steps N             Number of timesteps (default: from YAML)\n");
    printf("  --profile PATH        Generation/load CSV (datetime,solar,load)\n");
    printf("  --alpha A             Share of surplus/deficit routed to storage, 0..1\n");
    printf("  --chemistry NAME      linear | empirical | nmc | nca | lfp\n");
    printf("  --output PATH         Per-step run CSV\n");
    printf("  --history PATH        Battery transition history CSV\n");
    printf("  --lua PATH            Lua scenario script\n");
    printf("  --influx              Enable InfluxDB telemetry\n");
    printf("  --log-level LEVEL     trace | debug | info | warn | error | off\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  # One day with the sample profile:\n");
    printf("  %s config/microgrid.yaml\n\n", prog_name);
    printf("  # Same day with the linear model and half of the surplus stored:\n");
    printf("  %s --chemistry linear --alpha 0.5 config/microgrid.yaml\n\n", prog_name);
    printf("  # Greedy controller, battery history exported:\n");
    printf("  %s --mode transition --history history.csv config/microgrid.yaml\n\n", prog_name);
}

int main(int argc, char** argv) {
    std::string config_path = "config/microgrid.yaml";

    // CLI overrides, applied after the YAML is loaded
    std::string mode, profile, chemistry, output, history, lua, log_level;
    int steps = -1;
    double alpha = -1.0;
    bool influx = false;

    static struct option long_options[] = {
        {"mode",      required_argument, 0, 'm'},
        {"steps",     required_argument, 0, 'n'},
        {"profile",   required_argument, 0, 'p'},
        {"alpha",     required_argument, 0, 'a'},
        {"chemistry", required_argument, 0, 'c'},
        {"output",    required_argument, 0, 'o'},
        {"history",   required_argument, 0, 'H'},
        {"lua",       required_argument, 0, 'l'},
        {"influx",    no_argument,       0, 'I'},
        {"log-level", required_argument, 0, 'L'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'm':
                mode = optarg;
                if (mode != "dispatch" && mode != "transition") {
                    fprintf(stderr, "Error: Invalid mode: %s (dispatch|transition)\n", optarg);
                    return 1;
                }
                break;
            case 'n':
                steps = std::atoi(optarg);
                if (steps <= 0) {
                    fprintf(stderr, "Error: Invalid step count: %s\n", optarg);
                    return 1;
                }
                break;
            case 'p':
                profile = optarg;
                break;
            case 'a':
                alpha = std::atof(optarg);
                if (alpha < 0.0 || alpha > 1.0) {
                    fprintf(stderr, "Error: Invalid alpha: %s (must be 0 <= alpha <= 1)\n", optarg);
                    return 1;
                }
                break;
            case 'c':
                chemistry = optarg;
                break;
            case 'o':
                output = optarg;
                break;
            case 'H':
                history = optarg;
                break;
            case 'l':
                lua = optarg;
                break;
            case 'I':
                influx = true;
                break;
            case 'L':
                log_level = optarg;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    // Positional argument: configuration YAML
    if (optind < argc) {
        config_path = argv[optind];
    }

    if (!log_level.empty()) {
        utils::set_level(utils::parse_level(log_level));
    }

    // ========================================================================
    // Load configuration, then apply command-line overrides
    // ========================================================================
    config::MicrogridConfig cfg;
    try {
        cfg = config::MicrogridConfig::load(config_path);

        if (log_level.empty()) {
            utils::set_level(utils::parse_level(cfg.logging.level));
        }
        if (!chemistry.empty()) cfg.set_chemistry(chemistry);
        if (!mode.empty()) cfg.simulation.mode = mode;
        if (steps > 0) cfg.simulation.steps = steps;
        if (!profile.empty()) cfg.simulation.profile_csv = profile;
        if (alpha >= 0.0) cfg.simulation.alpha = alpha;
        if (!output.empty()) cfg.simulation.output_csv = output;
        if (!history.empty()) cfg.simulation.history_csv = history;
        if (!lua.empty()) cfg.lua_script = lua;
        if (influx) cfg.telemetry.enabled = true;

        cfg.validate();
    } catch (const std::exception& e) {
        MGSIM_LOG_ERROR("[main] %s", e.what());
        return 1;
    }

    cfg.print_summary();

    // ========================================================================
    // Print configuration summary
    // ========================================================================
    char dt_str[50], energy_str[50], power_str[50], steps_str[50];
    snprintf(dt_str, sizeof(dt_str), "%.1f min", cfg.simulation.delta_t_min);
    snprintf(energy_str, sizeof(energy_str), "%.1f kWh", cfg.battery.nominal_energy_kwh());
    snprintf(power_str, sizeof(power_str), "%.1f kW", cfg.battery.p_s_max_kw);
    snprintf(steps_str, sizeof(steps_str), "%d", cfg.simulation.steps);

    printf("\n");
    printf("╔════════════════════════════════════════════════════════════╗\n");
    printf("║            MICROGRID ESS SIMULATION CONFIGURATION          ║\n");
    printf("╠════════════════════════════════════════════════════════════╣\n");
    printf("║ Name:       %-48s║\n", cfg.simulation.name.c_str());
    printf("║ Mode:       %-48s║\n", cfg.simulation.mode.c_str());
    printf("║ Model:      %-48s║\n", ess::to_string(cfg.battery.chemistry));
    printf("║ Energy:     %-48s║\n", energy_str);
    printf("║ Power:      %-48s║\n", power_str);
    printf("║ Timestep:   %-48s║\n", dt_str);
    printf("║ Steps:      %-48s║\n", cfg.simulation.steps > 0 ? steps_str : "profile length");
    printf("║ Profile:    %-48s║\n", cfg.simulation.profile_csv.empty() ? "(none)" : cfg.simulation.profile_csv.c_str());
    printf("║ Scenario:   %-48s║\n", cfg.lua_script.empty() ? "(none)" : cfg.lua_script.c_str());
    printf("║ Telemetry:  %-48s║\n", cfg.telemetry.enabled ? "InfluxDB" : "disabled");
    printf("╚════════════════════════════════════════════════════════════╝\n");
    printf("\n");

    sim::SimApp app(cfg);
    return app.run();
}
