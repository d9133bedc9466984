// src/ess/soh_model.cpp
#include "ess/soh_model.hpp"
#include "ess/lookup_table.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ess {

SohModel::SohModel(std::vector<SohPoint> points)
    : points_(std::move(points)) {
    validate_curve(points_);
}

void SohModel::validate_curve(const std::vector<SohPoint>& points) {
    for (size_t i = 0; i < points.size(); ++i) {
        const auto& p = points[i];
        if (!std::isfinite(p.ah) || !(p.ah > 0.0)) {
            throw std::invalid_argument("SOH curve: Ah threshold must be > 0 (point " + std::to_string(i) + ")");
        }
        if (!(p.soh > 0.0) || p.soh > 1.0) {
            throw std::invalid_argument("SOH curve: value must lie in (0, 1] (point " + std::to_string(i) + ")");
        }
        if (i > 0) {
            if (!(p.ah > points[i - 1].ah)) {
                throw std::invalid_argument("SOH curve: Ah thresholds must be strictly ascending");
            }
            if (p.soh > points[i - 1].soh) {
                throw std::invalid_argument("SOH curve: values must be non-increasing");
            }
        }
    }
}

std::vector<SohPoint> SohModel::load_curve(const std::string& path) {
    utils::CsvReader reader;
    if (!reader.open(path)) {
        throw TableLoadError("SOH curve: cannot open " + path);
    }
    const int ah_col = reader.col("ah");
    const int soh_col = reader.col("soh");
    if (ah_col < 0 || soh_col < 0) {
        throw TableLoadError("SOH curve: " + path + " needs columns ah,soh");
    }

    std::vector<SohPoint> points;
    std::vector<std::string> row;
    while (reader.read_row(row)) {
        SohPoint p{};
        if (!utils::CsvReader::try_parse_double(row[static_cast<size_t>(ah_col)], p.ah) ||
            !utils::CsvReader::try_parse_double(row[static_cast<size_t>(soh_col)], p.soh)) {
            throw TableLoadError("SOH curve: " + path + " line " + std::to_string(reader.line_no()) +
                                 ": non-numeric value");
        }
        points.push_back(p);
    }
    if (points.empty()) {
        throw TableLoadError("SOH curve: " + path + " has no points");
    }

    try {
        validate_curve(points);
    } catch (const std::invalid_argument& e) {
        throw TableLoadError(std::string(e.what()) + " in " + path);
    }

    MGSIM_LOG_INFO("[SohModel] Loaded %zu curve points from %s (last: %.1f Ah -> %.3f)",
                   points.size(), path.c_str(), points.back().ah, points.back().soh);
    return points;
}

double SohModel::evaluate(double ah) const {
    if (points_.empty() || ah <= 0.0) {
        return 1.0;
    }

    const auto& first = points_.front();
    if (ah <= first.ah) {
        return 1.0 + (first.soh - 1.0) * (ah / first.ah);
    }
    if (ah >= points_.back().ah) {
        return points_.back().soh;
    }

    auto it = std::upper_bound(points_.begin(), points_.end(), ah,
                               [](double v, const SohPoint& p) { return v < p.ah; });
    const SohPoint& hi = *it;
    const SohPoint& lo = *(it - 1);
    const double t = (ah - lo.ah) / (hi.ah - lo.ah);
    return lo.soh + (hi.soh - lo.soh) * t;
}

double SohModel::update(double delta_ah) {
    if (!std::isfinite(delta_ah)) {
        MGSIM_LOG_WARN("[SohModel::update] Ignoring non-finite Ah delta");
        return state_.last_soh;
    }
    state_.cumulative_ah += std::abs(delta_ah);
    state_.last_soh = std::min(evaluate(state_.cumulative_ah), state_.last_soh);
    return state_.last_soh;
}

void SohModel::reset() {
    state_ = SohState{};
    state_.last_soh = initial_soh_;
}

void SohModel::set_initial_soh(double soh) {
    if (!std::isfinite(soh) || !(soh > 0.0) || soh > 1.0) {
        throw std::invalid_argument("SOH: initial value must lie in (0, 1], got " + std::to_string(soh));
    }
    initial_soh_ = soh;
    reset();
}

} // namespace ess
