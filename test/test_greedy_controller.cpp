// test/test_greedy_controller.cpp
/**
 * Unit Test: greedy_battery_request
 *
 * Test Coverage:
 *   1. Deficit covered by the battery, rest imported
 *   2. Surplus charges the battery, rest exported
 *   3. Balanced step
 *   4. Night grid charging in the offpeak band
 *   5. Energy balance over random inputs
 */

#include "grid/greedy_controller.hpp"
#include "utils/sampler.hpp"
#include <cmath>
#include <iostream>

#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

// Helper: Check if value is close to expected
bool is_close(double actual, double expected, double tolerance = 0.0001) {
    if (std::abs(expected) < 1e-9) {
        return std::abs(actual) < tolerance;
    }
    return std::abs(actual - expected) / std::abs(expected) < tolerance;
}

grid::GreedyLimits make_limits(double headroom) {
    grid::GreedyLimits l;
    l.max_charge_kwh = 12.5;
    l.max_discharge_kwh = 12.5;
    l.headroom_kwh = headroom;
    return l;
}

bool decision_is(const grid::GreedyDecision& d, double batt, double grid_kwh) {
    return std::abs(d.e_batt_kwh - batt) < 1e-9 && std::abs(d.e_grid_kwh - grid_kwh) < 1e-9;
}

// Test 1: Deficit
void test_deficit(TestResult& result) {
    std::cout << "\n=== Test 1: Deficit ===\n";

    const auto small = grid::greedy_battery_request(5.0, 1.0, make_limits(20.0));
    if (decision_is(small, 4.0, 0.0)) {
        result.pass("4 kWh deficit discharged from the battery");
    } else {
        result.fail("Small deficit wrong: batt=" + std::to_string(small.e_batt_kwh));
    }

    const auto large = grid::greedy_battery_request(20.0, 0.0, make_limits(20.0));
    if (decision_is(large, 12.5, 7.5)) {
        result.pass("Discharge capped at 12.5 kWh, 7.5 kWh imported");
    } else {
        result.fail("Large deficit wrong: batt=" + std::to_string(large.e_batt_kwh) +
                    " grid=" + std::to_string(large.e_grid_kwh));
    }
}

// Test 2: Surplus
void test_surplus(TestResult& result) {
    std::cout << "\n=== Test 2: Surplus ===\n";

    const auto small = grid::greedy_battery_request(2.0, 10.0, make_limits(20.0));
    if (decision_is(small, -8.0, 0.0)) {
        result.pass("8 kWh surplus charged into the battery");
    } else {
        result.fail("Small surplus wrong: batt=" + std::to_string(small.e_batt_kwh));
    }

    const auto large = grid::greedy_battery_request(0.0, 20.0, make_limits(20.0));
    if (decision_is(large, -12.5, -7.5)) {
        result.pass("Charge capped at 12.5 kWh, 7.5 kWh exported");
    } else {
        result.fail("Large surplus wrong: batt=" + std::to_string(large.e_batt_kwh) +
                    " grid=" + std::to_string(large.e_grid_kwh));
    }
}

// Test 3: Balanced
void test_balanced(TestResult& result) {
    std::cout << "\n=== Test 3: Balanced ===\n";

    const auto d = grid::greedy_battery_request(3.0, 3.0, make_limits(20.0), "PEAK", true);
    if (decision_is(d, 0.0, 0.0)) {
        result.pass("No flows when load equals production outside offpeak");
    } else {
        result.fail("Balanced step produced flows");
    }
}

// Test 4: Night grid charging
void test_night_charge(TestResult& result) {
    std::cout << "\n=== Test 4: Night Grid Charging ===\n";

    const auto night = grid::greedy_battery_request(3.0, 0.0, make_limits(20.0), "offpeak", true);
    if (decision_is(night, -12.5, 15.5)) {
        result.pass("Offpeak: load imported and battery topped up at the charge limit");
    } else {
        result.fail("Night charge wrong: batt=" + std::to_string(night.e_batt_kwh) +
                    " grid=" + std::to_string(night.e_grid_kwh));
    }

    const auto nearly_full = grid::greedy_battery_request(3.0, 0.0, make_limits(5.0), "OFFPEAK", true);
    if (decision_is(nearly_full, -5.0, 8.0)) {
        result.pass("Top-up limited by the remaining headroom");
    } else {
        result.fail("Headroom limit wrong: batt=" + std::to_string(nearly_full.e_batt_kwh));
    }

    const auto sunny = grid::greedy_battery_request(0.0, 6.0, make_limits(20.0), "OFFPEAK", true);
    if (decision_is(sunny, -12.5, 6.5)) {
        result.pass("Top-up counts the surplus already planned");
    } else {
        result.fail("Planned charge ignored: batt=" + std::to_string(sunny.e_batt_kwh) +
                    " grid=" + std::to_string(sunny.e_grid_kwh));
    }

    const auto disabled = grid::greedy_battery_request(3.0, 0.0, make_limits(20.0), "OFFPEAK", false);
    if (decision_is(disabled, 3.0, 0.0)) {
        result.pass("Without the flag offpeak behaves like any other band");
    } else {
        result.fail("Flag ignored");
    }
}

// Test 5: Balance
void test_balance(TestResult& result) {
    std::cout << "\n=== Test 5: Energy Balance ===\n";

    utils::RandomSampler rng(11);
    const char* bands[] = {"PEAK", "STANDARD", "OFFPEAK"};
    int violations = 0;
    for (int k = 0; k < 1000; ++k) {
        const double load = rng.uniform(0.0, 25.0);
        const double pv = rng.uniform(0.0, 25.0);
        const auto d = grid::greedy_battery_request(load, pv, make_limits(rng.uniform(0.0, 30.0)),
                                                    bands[k % 3], true);
        if (std::abs(d.e_batt_kwh + d.e_grid_kwh - (load - pv)) > 1e-6) ++violations;
        if (d.e_batt_kwh > 12.5 + 1e-9 || d.e_batt_kwh < -12.5 - 1e-9) ++violations;
    }

    if (violations == 0) {
        result.pass("e_batt + e_grid == load - pv and limits held on 1000 random steps");
    } else {
        result.fail(std::to_string(violations) + " balance or limit violations");
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            GREEDY CONTROLLER UNIT TESTS                    ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    try {
        test_deficit(result);
        test_surplus(result);
        test_balanced(result);
        test_night_charge(result);
        test_balance(result);
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected exception: ") + e.what());
    }

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
