// src/grid/price_bands.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace grid {

// One time-of-use band. Prices in EUR/kWh, hour ranges inclusive.
struct PriceBand {
    std::string name;
    double buy = 0.0;
    double sell = 0.0;
    std::vector<std::pair<int, int>> ranges;

    bool contains(int hour) const;
};

struct PriceQuote {
    double buy = 0.0;
    double sell = 0.0;
    std::string band;   // upper case: PEAK, STANDARD, OFFPEAK
};

/**
 * PriceBands - Time-of-use tariff lookup
 *
 * Peak is checked first, then standard. Hours matching neither fall back to
 * offpeak (or the first configured band when offpeak is absent).
 */
class PriceBands {
public:
    void add(PriceBand band);

    bool empty() const { return bands_.empty(); }
    size_t size() const { return bands_.size(); }

    /**
     * @throws std::logic_error if no band is configured
     */
    PriceQuote at_hour(int hour) const;

    // Simulation time in hours since midnight of day 0.
    PriceQuote at_time(double t_h) const;

    const PriceBand* find(const std::string& name) const;

private:
    std::vector<PriceBand> bands_;
};

} // namespace grid
