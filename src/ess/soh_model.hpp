// src/ess/soh_model.hpp
#pragma once

#include <string>
#include <vector>

namespace ess {

struct SohPoint {
    double ah;     // cumulative per-cell Ah throughput
    double soh;    // health fraction at that throughput
};

struct SohState {
    double cumulative_ah = 0.0;
    double last_soh = 1.0;
};

/**
 * SohModel - Cumulative Ah throughput -> state of health
 *
 * Curve: linear from (0, 1.0) to the first point, piecewise-linear between
 * points, held flat past the last one. The tracked value never increases:
 * update() returns min(curve(ah), last_soh).
 *
 * The tracked value starts at the initial SOH (1.0 unless set) and reset()
 * returns to it. Without a curve the model reports the initial SOH forever.
 */
class SohModel {
public:
    SohModel() = default;

    /**
     * @throws std::invalid_argument unless points are strictly ascending in Ah,
     *         non-increasing in SOH and SOH lies in (0, 1]
     */
    explicit SohModel(std::vector<SohPoint> points);

    /**
     * Load an `ah,soh` CSV.
     * @throws TableLoadError if the file is missing or malformed
     */
    static std::vector<SohPoint> load_curve(const std::string& path);

    static void validate_curve(const std::vector<SohPoint>& points);

    // Pure curve value, no state.
    double evaluate(double ah) const;

    /**
     * Accumulate |delta_ah| and return the new (non-increasing) SOH.
     */
    double update(double delta_ah);

    void reset();

    /**
     * Start from an already aged pack. Resets the accumulated throughput.
     * @throws std::invalid_argument unless soh lies in (0, 1]
     */
    void set_initial_soh(double soh);
    double initial_soh() const { return initial_soh_; }

    bool has_curve() const { return !points_.empty(); }
    const SohState& state() const { return state_; }
    double soh() const { return state_.last_soh; }
    const std::vector<SohPoint>& points() const { return points_; }

private:
    std::vector<SohPoint> points_;
    SohState state_;
    double initial_soh_ = 1.0;
};

} // namespace ess
