// test/test_influx_client.cpp
// Unit tests for InfluxDB client integration

#include "utils/influx.hpp"
#include "sim/microgrid_state.hpp"
#include <iostream>
#include <cmath>
#include <string>

// Test helper macros
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

// Nothing listens on port 1, so enabled clients fail fast
static const char* kUnreachableUrl = "http://127.0.0.1:1";

// Helper to create a representative microgrid step
sim::MicrogridState create_test_state(int step) {
    sim::MicrogridState state;
    state.step = step;
    state.t_h = 0.25 * step;
    state.p_g_kw = 30.0;
    state.p_l_kw = 12.0;
    state.p_gl_kw = 18.0;
    state.p_gl_s_kw = 17.1;
    state.p_gl_n_kw = 0.0;
    state.ess_losses_kw = 0.9;
    state.alpha = 1.0;
    state.dispatch_case = 1;

    state.soe = 0.62;
    state.soc = 0.61;
    state.soh = 0.998;
    state.voltage_v = 61.5;
    state.current_a = 278.0;
    state.efficiency = 0.95;
    state.internal_energy_kwh = 4.275;

    state.cost_eur = -0.12;
    state.revenue_eur = 0.14;
    state.wear_cost_eur = 0.02;
    state.buy_price = 0.32;
    state.sell_price = 0.14;
    state.band = "PEAK";
    return state;
}

utils::InfluxClient::Config enabled_config(int every_n) {
    utils::InfluxClient::Config config;
    config.enabled = true;
    config.url = kUnreachableUrl;
    config.org = "test-org";
    config.bucket = "test-bucket";
    config.token = "fake-token";
    config.write_every_n_steps = every_n;
    return config;
}

// ============================================================================
// Test Cases
// ============================================================================

// Test 1: Client creation with disabled config
bool test_client_creation_disabled() {
    utils::InfluxClient::Config config;
    config.enabled = false;

    utils::InfluxClient client(config);

    TEST_ASSERT(!client.is_enabled(), "Client should be disabled");

    return true;
}

// Test 2: Client creation with enabled config (no actual connection)
bool test_client_creation_enabled() {
    utils::InfluxClient client(enabled_config(4));

    TEST_ASSERT(client.is_enabled(), "Client should be enabled");
    TEST_ASSERT(client.get_config().write_every_n_steps == 4, "Write rate not kept");

    return true;
}

// Test 3: Write with disabled client (should not write)
bool test_write_disabled_client() {
    utils::InfluxClient::Config config;
    config.enabled = false;

    utils::InfluxClient client(config);

    bool result = client.write_step(create_test_state(0));

    TEST_ASSERT(!result, "Write should return false for disabled client");
    TEST_ASSERT(client.attempted_writes() == 0, "Disabled client should not attempt writes");

    return true;
}

// Test 4: Rate limiting (every 4th step is attempted)
bool test_rate_limiting() {
    utils::InfluxClient client(enabled_config(4));

    for (int step = 0; step < 10; ++step) {
        client.write_step(create_test_state(step));
    }

    // steps 0, 4, 8
    TEST_ASSERT(client.attempted_writes() == 3, "Expected 3 attempted writes, got " << client.attempted_writes());
    TEST_ASSERT(client.successful_writes() == 0, "No server, no successful writes");

    return true;
}

// Test 5: Config validation (default values)
bool test_config_defaults() {
    utils::InfluxClient::Config config;

    TEST_ASSERT(!config.enabled, "Default enabled should be false");
    TEST_ASSERT(config.url == "http://localhost:8086", "Default URL incorrect");
    TEST_ASSERT(config.token == "", "Default token should be empty");
    TEST_ASSERT(config.org == "microgrid", "Default org incorrect");
    TEST_ASSERT(config.bucket == "mgsim", "Default bucket incorrect");
    TEST_ASSERT(config.write_every_n_steps == 1, "Default write rate incorrect");

    return true;
}

// Test 6: Non-positive write rate is raised to every step
bool test_config_clamped_rate() {
    utils::InfluxClient::Config config;
    config.write_every_n_steps = 0;

    utils::InfluxClient client(config);

    TEST_ASSERT(client.get_config().write_every_n_steps == 1, "Write rate should be clamped to 1");

    return true;
}

// Test 7: Flows line protocol
bool test_flows_line() {
    const auto line = utils::InfluxClient::build_flows_line(create_test_state(12), 1000);

    TEST_ASSERT(line.rfind("microgrid_flows p_g_kw=30,", 0) == 0, "Unexpected prefix: " << line);
    TEST_ASSERT(line.find("p_gl_s_kw=17.1") != std::string::npos, "Missing p_gl_s_kw");
    TEST_ASSERT(line.find("dispatch_case=1i") != std::string::npos, "dispatch_case should be an integer field");
    TEST_ASSERT(line.find("step=12i 1000") != std::string::npos, "Missing step or timestamp: " << line);

    return true;
}

// Test 8: Battery line protocol
bool test_battery_line() {
    const auto line = utils::InfluxClient::build_battery_line(create_test_state(0), 42);

    TEST_ASSERT(line.rfind("battery_state soe=0.62,", 0) == 0, "Unexpected prefix: " << line);
    TEST_ASSERT(line.find("soh=0.998") != std::string::npos, "Missing soh");
    TEST_ASSERT(line.find(" 42") == line.size() - 3, "Timestamp should terminate the line");

    return true;
}

// Test 9: Economics line carries the band tag
bool test_economics_line() {
    auto state = create_test_state(0);
    const auto tagged = utils::InfluxClient::build_economics_line(state, 7);
    TEST_ASSERT(tagged.rfind("economics,band=PEAK cost_eur=-0.12,", 0) == 0, "Unexpected prefix: " << tagged);
    TEST_ASSERT(tagged.find("buy_price=0.32") != std::string::npos, "Missing buy_price");

    state.band.clear();
    const auto untagged = utils::InfluxClient::build_economics_line(state, 7);
    TEST_ASSERT(untagged.rfind("economics cost_eur=", 0) == 0, "Empty band should drop the tag: " << untagged);

    return true;
}

// Test 10: Time conversion
bool test_time_conversion() {
    TEST_ASSERT(utils::InfluxClient::sim_time_to_ns(0.0) == 0, "t=0 should map to the epoch");
    TEST_ASSERT(utils::InfluxClient::sim_time_to_ns(1.0) == 3600000000000LL, "1 h should be 3.6e12 ns");
    TEST_ASSERT(utils::InfluxClient::wall_clock_time_ns() > 1600000000000000000LL, "Wall clock before 2020");

    return true;
}

// Test 11: Flush operation (should not crash)
bool test_flush() {
    utils::InfluxClient client(enabled_config(1));

    // Should not crash even with no writes
    client.flush();

    client.write_step(create_test_state(0));
    client.flush();

    TEST_ASSERT(client.attempted_writes() == 1, "One write expected");

    return true;
}

// ============================================================================
// Main test runner
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "InfluxDB Client Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Run all tests
    RUN_TEST(test_client_creation_disabled);
    RUN_TEST(test_client_creation_enabled);
    RUN_TEST(test_write_disabled_client);
    RUN_TEST(test_rate_limiting);
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_clamped_rate);
    RUN_TEST(test_flows_line);
    RUN_TEST(test_battery_line);
    RUN_TEST(test_economics_line);
    RUN_TEST(test_time_conversion);
    RUN_TEST(test_flush);

    // Print summary
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Test Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    if (failed == 0) {
        std::cout << "✓ All tests passed!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ Some tests failed!" << std::endl;
        return 1;
    }
}
