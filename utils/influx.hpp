// utils/influx.hpp
#pragma once

#include "sim/microgrid_state.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace utils {

/**
 * InfluxDB Client for time-series logging of the microgrid simulation
 *
 * Logs the same per-step data as the run CSV to an InfluxDB v2 bucket for
 * live dashboards. Disabled unless telemetry.enabled is set (or --influx).
 *
 * Write rate: every write_every_n_steps simulation steps.
 *
 * Measurement schema:
 *   - microgrid_flows: generation, load, battery and grid power, dispatch case
 *   - battery_state: SoE, SoC, SOH, voltage, current, efficiency
 *   - economics: step cost breakdown and prices (tag band=PEAK|STANDARD|OFFPEAK)
 */
class InfluxClient {
public:
    struct Config {
        std::string url = "http://localhost:8086";  // InfluxDB server URL
        std::string token = "";                      // Authentication token (optional for local)
        std::string org = "microgrid";               // Organization name
        std::string bucket = "mgsim";                // Bucket name
        int write_every_n_steps = 1;
        bool enabled = false;
    };

    /**
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit InfluxClient(const Config& config);

    ~InfluxClient();

    /**
     * Write one simulation step.
     *
     * @return true if data was written, false if skipped (disabled, rate
     *         limiting) or the HTTP write failed
     */
    bool write_step(const sim::MicrogridState& state);

    // Number of steps that passed the rate limiter (attempted writes).
    int attempted_writes() const { return attempted_; }
    int successful_writes() const { return succeeded_; }

    void flush();

    bool is_enabled() const { return config_.enabled; }

    const Config& get_config() const { return config_; }

    // ------------------------------------------------------------------------
    // Line protocol builders: "measurement[,tags] field=v,... timestamp"
    // ------------------------------------------------------------------------
    static std::string build_flows_line(const sim::MicrogridState& state, int64_t timestamp_ns);
    static std::string build_battery_line(const sim::MicrogridState& state, int64_t timestamp_ns);
    static std::string build_economics_line(const sim::MicrogridState& state, int64_t timestamp_ns);

    static int64_t wall_clock_time_ns();

    /**
     * Simulation time (hours) to nanoseconds since the epoch.
     */
    static int64_t sim_time_to_ns(double sim_time_h);

private:
    Config config_;
    int last_write_step_;
    int attempted_ = 0;
    int succeeded_ = 0;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;

    bool send_to_influx(const std::string& line_protocol);
};

} // namespace utils
