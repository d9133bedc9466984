// test/test_dispatcher.cpp
/**
 * Unit Test: Dispatcher (linear storage, efficiency 0.95, dt = 15 min;
 * table and empirical storage for the random walk)
 *
 * Test Coverage:
 *   1. Equilibrium
 *   2. Overproduction cases
 *   3. Underproduction cases
 *   4. alpha = 0 sends everything to the grid
 *   5. Rejected inputs
 *   6. Random walk keeps the invariants (linear, NMC, empirical)
 *   7. Invariant checker
 *   8. NMC table: booked flows equal the stored energy
 */

#include "ess/linear_model.hpp"
#include "ess/model_factory.hpp"
#include "ess/storage_unit.hpp"
#include "grid/dispatcher.hpp"
#include "utils/sampler.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>

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

bool near(double actual, double expected, double tol) {
    return std::abs(actual - expected) <= tol;
}

ess::StorageUnit make_storage(double soe_0) {
    ess::BatteryConfig cfg;
    cfg.chemistry = ess::Chemistry::Linear;
    cfg.delta_t_h = 0.25;
    cfg.soe_0 = soe_0;
    return ess::StorageUnit(cfg, std::make_unique<ess::LinearModel>(cfg));
}

// Test 1: Equilibrium
void test_equilibrium(TestResult& result) {
    std::cout << "\n=== Test 1: Equilibrium ===\n";

    auto storage = make_storage(0.5);
    grid::Dispatcher dispatcher(storage, 0.25);
    const auto s = dispatcher.dispatch(5.0, 5.0, 1.0);

    if (s.dispatch_case == grid::DispatchCase::Equilibrium && s.p_gl_s == 0.0 && s.p_gl_n == 0.0 &&
        is_close(s.soe_after, 0.5)) {
        result.pass("Balanced step leaves storage and grid idle");
    } else {
        result.fail(std::string("Equilibrium wrong: case=") + grid::to_string(s.dispatch_case));
    }
}

// Test 2: Overproduction
void test_overproduction(TestResult& result) {
    std::cout << "\n=== Test 2: Overproduction ===\n";

    {
        auto storage = make_storage(0.5);
        grid::Dispatcher dispatcher(storage, 0.25);
        const double q = storage.nominal_energy_kwh();
        const auto s = dispatcher.dispatch(10.0, 2.0, 1.0);

        if (s.dispatch_case == grid::DispatchCase::OverAmple && near(s.p_gl_s, 7.6, 1e-9) &&
            near(s.ess_losses, 0.4, 1e-9) && near(s.p_gl_n, 0.0, 1e-9) &&
            near(s.soe_after, 0.5 + 7.6 * 0.25 / q, 1e-9)) {
            result.pass("Ample: p_GL_S=7.6 kW, losses 0.4 kW, nothing exported");
        } else {
            result.fail("Ample wrong: p_GL_S=" + std::to_string(s.p_gl_s) + " p_GL_N=" + std::to_string(s.p_gl_n));
        }
    }

    {
        auto storage = make_storage(0.5);
        grid::Dispatcher dispatcher(storage, 0.25);
        const auto s = dispatcher.dispatch(70.0, 0.0, 1.0);

        if (s.dispatch_case == grid::DispatchCase::OverPowerLimit && near(s.p_gl_s, 50.0, 1e-9) &&
            near(s.p_gl_n, 20.0, 1e-9) && s.excess_kwh == 0.0) {
            result.pass("Power limit: 50 kW stored, 20 kW exported");
        } else {
            result.fail("Power limit wrong: p_GL_S=" + std::to_string(s.p_gl_s) + " p_GL_N=" + std::to_string(s.p_gl_n));
        }
    }

    {
        auto storage = make_storage(0.88);
        grid::Dispatcher dispatcher(storage, 0.25);
        const auto s = dispatcher.dispatch(10.0, 0.0, 1.0);

        if (s.dispatch_case == grid::DispatchCase::OverLimitedEnergy && near(s.p_gl_s, 7.6, 1e-9) &&
            near(s.p_gl_n, 2.4, 1e-9) && s.soe_after <= 0.9) {
            result.pass("Limited energy: headroom of 2 kWh fills, 2.4 kW exported");
        } else {
            result.fail("Limited energy wrong: p_GL_S=" + std::to_string(s.p_gl_s) + " p_GL_N=" + std::to_string(s.p_gl_n));
        }
    }
}

// Test 3: Underproduction
void test_underproduction(TestResult& result) {
    std::cout << "\n=== Test 3: Underproduction ===\n";

    {
        auto storage = make_storage(0.5);
        grid::Dispatcher dispatcher(storage, 0.25);
        const auto s = dispatcher.dispatch(2.0, 6.0, 1.0);

        if (s.dispatch_case == grid::DispatchCase::UnderAmple && near(s.p_gl_s, -4.0 / 0.95, 1e-9) &&
            near(s.balance(), 0.0, 1e-9) && s.soe_after < 0.5) {
            result.pass("Ample: storage delivers 4 kW grossed up by efficiency");
        } else {
            result.fail("Ample wrong: p_GL_S=" + std::to_string(s.p_gl_s));
        }
    }

    {
        auto storage = make_storage(0.11);
        grid::Dispatcher dispatcher(storage, 0.25);
        const auto s = dispatcher.dispatch(1.0, 6.0, 1.0);

        if (s.dispatch_case == grid::DispatchCase::UnderLimitedEnergy && s.lack_kwh > 0.0 &&
            near(s.p_gl_s, -4.0, 0.01) && near(s.p_gl_n, -1.0, 0.01) && near(s.soe_after, 0.1, 1e-9)) {
            result.pass("Limited energy: storage empties to soe_min, lack " + std::to_string(s.lack_kwh) +
                        " kWh imported");
        } else {
            result.fail("Limited energy wrong: p_GL_S=" + std::to_string(s.p_gl_s) + " p_GL_N=" +
                        std::to_string(s.p_gl_n) + " soe=" + std::to_string(s.soe_after));
        }
    }

    {
        auto storage = make_storage(0.5);
        grid::Dispatcher dispatcher(storage, 0.25);
        const auto s = dispatcher.dispatch(0.0, 60.0, 1.0);

        if (s.dispatch_case == grid::DispatchCase::UnderPowerLimit && near(s.p_gl_s, -50.0, 1e-9) &&
            near(s.p_gl_n, -10.0, 1e-9)) {
            result.pass("Power limit: storage delivers 50 kW, 10 kW imported");
        } else {
            result.fail("Power limit wrong: p_GL_S=" + std::to_string(s.p_gl_s) + " p_GL_N=" + std::to_string(s.p_gl_n));
        }
    }
}

// Test 4: alpha = 0
void test_alpha_zero(TestResult& result) {
    std::cout << "\n=== Test 4: alpha = 0 ===\n";

    auto storage = make_storage(0.5);
    grid::Dispatcher dispatcher(storage, 0.25);
    const auto up = dispatcher.dispatch(10.0, 2.0, 0.0);
    const auto down = dispatcher.dispatch(2.0, 10.0, 0.0);

    if (up.p_gl_s == 0.0 && near(up.p_gl_n, 8.0, 1e-9) && down.p_gl_s == 0.0 && near(down.p_gl_n, -8.0, 1e-9) &&
        is_close(storage.soe(), 0.5)) {
        result.pass("alpha = 0 routes the whole imbalance through the grid");
    } else {
        result.fail("alpha = 0 wrong: up.p_GL_N=" + std::to_string(up.p_gl_n) + " down.p_GL_N=" +
                    std::to_string(down.p_gl_n));
    }
}

// Test 5: Rejected inputs
void test_rejected(TestResult& result) {
    std::cout << "\n=== Test 5: Rejected Inputs ===\n";

    auto storage = make_storage(0.5);
    grid::Dispatcher dispatcher(storage, 0.25);

    try {
        dispatcher.dispatch(std::numeric_limits<double>::quiet_NaN(), 1.0, 1.0);
        result.fail("NaN generation accepted");
    } catch (const grid::DispatchError&) {
        result.pass("NaN generation throws DispatchError");
    }

    try {
        dispatcher.dispatch(5.0, 1.0, 1.5);
        result.fail("alpha = 1.5 accepted");
    } catch (const grid::DispatchError&) {
        result.pass("alpha outside [0,1] throws DispatchError");
    }

    try {
        grid::Dispatcher bad(storage, 0.0);
        result.fail("dt = 0 accepted");
    } catch (const std::invalid_argument&) {
        result.pass("dt = 0 rejected");
    }
}

// Drive 2000 random steps; flows, SoE window and stored energy must agree.
void random_walk(ess::StorageUnit& storage, const std::string& label, TestResult& result) {
    grid::Dispatcher dispatcher(storage, 0.25);
    utils::RandomSampler rng(42);
    const double e_n = storage.nominal_energy_kwh();

    int cases_seen[7] = {0};
    double worst_balance = 0.0;
    double worst_stored = 0.0;
    for (int k = 0; k < 2000; ++k) {
        const auto s = dispatcher.dispatch(rng.uniform(0.0, 80.0), rng.uniform(0.0, 80.0), rng.uniform(0.0, 1.0));
        ++cases_seen[static_cast<int>(s.dispatch_case)];
        worst_balance = std::max(worst_balance, std::abs(s.balance()));
        // energy the battery gained against the flow booked for it
        const double stored = (s.soe_after - s.soe_before) * e_n;
        worst_stored = std::max(worst_stored, std::abs(stored - s.p_gl_s * 0.25));
    }

    if (worst_balance < 0.005) {
        result.pass(label + ": energy balance held on every step (worst " + std::to_string(worst_balance) + ")");
    } else {
        result.fail(label + ": energy balance drifted: " + std::to_string(worst_balance));
    }

    if (worst_stored < 1e-2) {
        result.pass(label + ": SoE change matches p_GL_S * dt (worst " + std::to_string(worst_stored) + " kWh)");
    } else {
        result.fail(label + ": SoE change differs from booked flow by " + std::to_string(worst_stored) + " kWh");
    }

    if (storage.soe() >= 0.1 && storage.soe() <= 0.9) {
        result.pass(label + ": SoE inside the window after the walk");
    } else {
        result.fail(label + ": SoE outside the window: " + std::to_string(storage.soe()));
    }

    if (cases_seen[static_cast<int>(grid::DispatchCase::OverPowerLimit)] > 0 &&
        cases_seen[static_cast<int>(grid::DispatchCase::UnderPowerLimit)] > 0) {
        result.pass(label + ": both power-limit cases exercised");
    } else {
        result.fail(label + ": power-limit cases not reached");
    }
}

ess::StorageUnit make_model_storage(ess::Chemistry chem) {
    ess::BatteryConfig cfg;
    cfg.apply_chemistry_preset(chem, MGSIM_DATA_DIR);
    cfg.delta_t_h = 0.25;
    cfg.soe_0 = 0.5;
    return ess::StorageUnit(cfg, ess::make_battery_model(cfg));
}

// Test 6: Random walk
void test_random_walk(TestResult& result) {
    std::cout << "\n=== Test 6: Random Walk (2000 steps per model) ===\n";

    auto linear = make_storage(0.5);
    random_walk(linear, "linear", result);

    auto nmc = make_model_storage(ess::Chemistry::NMC);
    random_walk(nmc, "nmc", result);

    auto empirical = make_model_storage(ess::Chemistry::Empirical);
    random_walk(empirical, "empirical", result);
}

// Test 8: Table model charge and discharge
void test_table_bookkeeping(TestResult& result) {
    std::cout << "\n=== Test 8: NMC Table Bookkeeping ===\n";

    // sustained surplus, then sustained deficit
    auto storage = make_model_storage(ess::Chemistry::NMC);
    grid::Dispatcher dispatcher(storage, 0.25);
    const double e_n = storage.nominal_energy_kwh();
    const double soe_0 = storage.soe();

    double booked = 0.0;
    for (int k = 0; k < 8; ++k) {
        const auto s = dispatcher.dispatch(40.0, 0.0, 1.0);
        booked += s.p_gl_s * 0.25;
        if (s.excess_kwh < 0.0) {
            result.fail("Charging: negative excess");
        }
    }
    const double stored = (storage.soe() - soe_0) * e_n;
    if (near(booked, stored, 1e-6)) {
        result.pass("Charging: booked " + std::to_string(booked) + " kWh equals stored energy");
    } else {
        result.fail("Charging: booked " + std::to_string(booked) + " kWh, stored " + std::to_string(stored) + " kWh");
    }
    if (storage.soe() > soe_0) {
        result.pass("Charging: SoE rose to " + std::to_string(storage.soe()));
    } else {
        result.fail("Charging: SoE did not rise");
    }

    const double soe_mid = storage.soe();
    booked = 0.0;
    for (int k = 0; k < 8; ++k) {
        const auto s = dispatcher.dispatch(0.0, 30.0, 1.0);
        booked += s.p_gl_s * 0.25;
        if (s.lack_kwh < 0.0) {
            result.fail("Discharging: negative lack");
        }
    }
    const double drawn = (storage.soe() - soe_mid) * e_n;
    if (near(booked, drawn, 1e-6) && booked < 0.0) {
        result.pass("Discharging: booked " + std::to_string(booked) + " kWh equals drawn energy");
    } else {
        result.fail("Discharging: booked " + std::to_string(booked) + " kWh, drawn " + std::to_string(drawn) + " kWh");
    }
}

// Test 7: Invariant checker
void test_invariants(TestResult& result) {
    std::cout << "\n=== Test 7: Invariant Checker ===\n";

    grid::DispatchStep s;
    s.p_gl = 10.0;
    s.p_gl_s = 5.0;
    s.p_gl_n = 4.0;
    s.soe_after = 0.5;
    try {
        grid::Dispatcher::check_invariants(s, 0.1, 0.9);
        result.fail("Unbalanced step accepted");
    } catch (const grid::InvariantViolation& e) {
        if (is_close(e.value(), 1.0)) {
            result.pass("Unbalanced step reports the residual of 1 kW");
        } else {
            result.fail("Residual wrong: " + std::to_string(e.value()));
        }
    }

    s.p_gl_n = 5.0;
    s.soe_after = 0.95;
    try {
        grid::Dispatcher::check_invariants(s, 0.1, 0.9);
        result.fail("SoE above soe_max accepted");
    } catch (const grid::InvariantViolation& e) {
        if (is_close(e.value(), 0.95) && is_close(e.upper(), 0.9)) {
            result.pass("SoE violation carries value and bounds");
        } else {
            result.fail("SoE violation payload wrong");
        }
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            DISPATCHER UNIT TESTS                           ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    try {
        test_equilibrium(result);
        test_overproduction(result);
        test_underproduction(result);
        test_alpha_zero(result);
        test_rejected(result);
        test_random_walk(result);
        test_invariants(result);
        test_table_bookkeeping(result);
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected exception: ") + e.what());
    }

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
