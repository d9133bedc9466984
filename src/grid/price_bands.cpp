// src/grid/price_bands.cpp
#include "grid/price_bands.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace grid {

namespace {

std::string upper(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

PriceQuote quote(const PriceBand& band) {
    return {band.buy, band.sell, upper(band.name)};
}

} // namespace

bool PriceBand::contains(int hour) const {
    for (const auto& [start, end] : ranges) {
        if (start <= hour && hour <= end) {
            return true;
        }
    }
    return false;
}

void PriceBands::add(PriceBand band) {
    band.name = lower(band.name);
    for (auto& existing : bands_) {
        if (existing.name == band.name) {
            existing = std::move(band);
            return;
        }
    }
    bands_.push_back(std::move(band));
}

const PriceBand* PriceBands::find(const std::string& name) const {
    const std::string key = lower(name);
    for (const auto& b : bands_) {
        if (b.name == key) {
            return &b;
        }
    }
    return nullptr;
}

PriceQuote PriceBands::at_hour(int hour) const {
    if (bands_.empty()) {
        throw std::logic_error("PriceBands: no band configured");
    }
    for (const char* key : {"peak", "standard"}) {
        const PriceBand* band = find(key);
        if (band && band->contains(hour)) {
            return quote(*band);
        }
    }
    const PriceBand* fallback = find("offpeak");
    return quote(fallback ? *fallback : bands_.front());
}

PriceQuote PriceBands::at_time(double t_h) const {
    const int hour = static_cast<int>(std::floor(std::fmod(t_h, 24.0)));
    return at_hour(hour < 0 ? hour + 24 : hour);
}

} // namespace grid
