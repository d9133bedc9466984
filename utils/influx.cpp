// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct InfluxClient::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string write_url;
    std::string auth_header;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

// Response body is ignored, only the HTTP status matters.
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    (void)contents;
    (void)userp;
    return size * nmemb;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

InfluxClient::InfluxClient(const Config& config)
    : config_(config)
    , last_write_step_(-1)
    , impl_(std::make_unique<Impl>())
{
    if (config_.write_every_n_steps < 1) {
        config_.write_every_n_steps = 1;
    }

    if (!config_.enabled) {
        MGSIM_LOG_INFO("[InfluxDB] Client created but disabled (use --influx to enable)");
        return;
    }

    // http://localhost:8086/api/v2/write?org=microgrid&bucket=mgsim&precision=ns
    std::ostringstream url_builder;
    url_builder << config_.url << "/api/v2/write"
                << "?org=" << config_.org
                << "&bucket=" << config_.bucket
                << "&precision=ns";
    impl_->write_url = url_builder.str();

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: text/plain; charset=utf-8");

    if (!config_.token.empty()) {
        impl_->auth_header = "Authorization: Token " + config_.token;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
        MGSIM_LOG_INFO("[InfluxDB] Authentication enabled (token configured)");
    } else {
        MGSIM_LOG_WARN("[InfluxDB] No authentication token provided - writes may fail!");
    }

    curl_easy_setopt(impl_->curl, CURLOPT_URL, impl_->write_url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT, 5L);

    MGSIM_LOG_INFO("[InfluxDB] Client initialized: url=%s org=%s bucket=%s every=%d steps",
                   config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str(),
                   config_.write_every_n_steps);
}

InfluxClient::~InfluxClient() {
    if (config_.enabled) {
        flush();
        MGSIM_LOG_INFO("[InfluxDB] Client shutdown (%d/%d writes ok)", succeeded_, attempted_);
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool InfluxClient::write_step(const sim::MicrogridState& state) {
    if (!config_.enabled) {
        return false;
    }

    if (last_write_step_ >= 0 &&
        (state.step - last_write_step_) < config_.write_every_n_steps) {
        return false;
    }

    last_write_step_ = state.step;
    ++attempted_;

    // Wall clock so points show up as "now" in the InfluxDB UI
    const int64_t timestamp_ns = wall_clock_time_ns();

    std::ostringstream line_protocol;
    line_protocol << build_flows_line(state, timestamp_ns) << "\n";
    line_protocol << build_battery_line(state, timestamp_ns) << "\n";
    line_protocol << build_economics_line(state, timestamp_ns) << "\n";

    const bool ok = send_to_influx(line_protocol.str());
    if (ok) ++succeeded_;
    return ok;
}

void InfluxClient::flush() {
    // No buffering: every write_step() posts immediately
}

// ============================================================================
// Line Protocol Builders (field names match the run CSV)
// ============================================================================

std::string InfluxClient::build_flows_line(const sim::MicrogridState& state, int64_t timestamp_ns) {
    std::ostringstream line;

    line << "microgrid_flows";

    line << " "
         << "p_g_kw=" << state.p_g_kw << ","
         << "p_l_kw=" << state.p_l_kw << ","
         << "p_gl_kw=" << state.p_gl_kw << ","
         << "p_gl_s_kw=" << state.p_gl_s_kw << ","
         << "p_gl_n_kw=" << state.p_gl_n_kw << ","
         << "ess_losses_kw=" << state.ess_losses_kw << ","
         << "alpha=" << state.alpha << ","
         << "excess_kwh=" << state.excess_kwh << ","
         << "lack_kwh=" << state.lack_kwh << ","
         << "dispatch_case=" << state.dispatch_case << "i,"
         << "step=" << state.step << "i";

    line << " " << timestamp_ns;

    return line.str();
}

std::string InfluxClient::build_battery_line(const sim::MicrogridState& state, int64_t timestamp_ns) {
    std::ostringstream line;

    line << "battery_state";

    line << " "
         << "soe=" << state.soe << ","
         << "soc=" << state.soc << ","
         << "soh=" << state.soh << ","
         << "voltage_v=" << state.voltage_v << ","
         << "current_a=" << state.current_a << ","
         << "efficiency=" << state.efficiency << ","
         << "internal_energy_kwh=" << state.internal_energy_kwh;

    line << " " << timestamp_ns;

    return line.str();
}

std::string InfluxClient::build_economics_line(const sim::MicrogridState& state, int64_t timestamp_ns) {
    std::ostringstream line;

    line << "economics";
    if (!state.band.empty()) {
        line << ",band=" << state.band;
    }

    line << " "
         << "cost_eur=" << state.cost_eur << ","
         << "revenue_eur=" << state.revenue_eur << ","
         << "inv_cost_eur=" << state.inv_cost_eur << ","
         << "wear_cost_eur=" << state.wear_cost_eur << ","
         << "purch_cost_eur=" << state.purch_cost_eur << ","
         << "oper_cost_eur=" << state.oper_cost_eur << ","
         << "no_pv_cost_eur=" << state.no_pv_cost_eur << ","
         << "buy_price=" << state.buy_price << ","
         << "sell_price=" << state.sell_price;

    line << " " << timestamp_ns;

    return line.str();
}

// ============================================================================
// HTTP Communication
// ============================================================================

bool InfluxClient::send_to_influx(const std::string& line_protocol) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, line_protocol.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(line_protocol.size()));

    CURLcode res = curl_easy_perform(impl_->curl);

    if (res != CURLE_OK) {
        MGSIM_LOG_ERROR("[InfluxDB] Write failed: CURL error: %s", curl_easy_strerror(res));
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code != 204) {  // InfluxDB returns 204 No Content on success
        MGSIM_LOG_ERROR("[InfluxDB] Write failed: HTTP %ld (expected 204)", http_code);
        return false;
    }

    if (succeeded_ == 0) {
        MGSIM_LOG_INFO("[InfluxDB] First write successful");
    } else if ((succeeded_ + 1) % 100 == 0) {
        MGSIM_LOG_INFO("[InfluxDB] Successfully wrote %d data points", succeeded_ + 1);
    }

    return true;
}

// ============================================================================
// Time Conversion
// ============================================================================

int64_t InfluxClient::wall_clock_time_ns() {
    auto now = std::chrono::system_clock::now();
    auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch());
    return nanoseconds.count();
}

int64_t InfluxClient::sim_time_to_ns(double sim_time_h) {
    // Epoch-based: these points land in 1970 in the InfluxDB UI
    return static_cast<int64_t>(sim_time_h * 3600.0 * 1e9);
}

} // namespace utils
