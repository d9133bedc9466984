// src/sim/profile_source.hpp
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sim {

class ProfileError : public std::runtime_error {
public:
    explicit ProfileError(const std::string& msg) : std::runtime_error(msg) {}
};

// One timestep of generation and load, mean power over the step (kW).
struct ProfileSample {
    std::string datetime;
    double solar_kw = 0.0;
    double load_kw = 0.0;
};

/**
 * ProfileSource - Generation/load time series read from CSV
 *
 * Expected columns (any order, case-insensitive): datetime, solar, load.
 * Negative values are clamped to 0, unparseable rows are skipped with a
 * warning. Missing columns or an unreadable file throw ProfileError.
 */
class ProfileSource {
public:
    ProfileSource() = default;

    static ProfileSource load(const std::string& csv_path);

    // Multiplicative gaussian noise on both series (rel_stddev = 0 is a no-op).
    void add_noise(double rel_stddev, uint64_t seed);

    void push_back(const ProfileSample& s);

    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    size_t skipped_rows() const { return skipped_; }

    // Index wraps around so a one-day profile can drive a longer run.
    const ProfileSample& at(size_t step) const;

    const std::vector<ProfileSample>& samples() const { return samples_; }

private:
    std::vector<ProfileSample> samples_;
    size_t skipped_ = 0;
};

} // namespace sim
