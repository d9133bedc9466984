// src/sim/profile_source.cpp
#include "sim/profile_source.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"
#include "utils/sampler.hpp"

#include <algorithm>
#include <cmath>

namespace sim {

ProfileSource ProfileSource::load(const std::string& csv_path) {
    utils::CsvReader reader;
    if (!reader.open(csv_path)) {
        throw ProfileError("Cannot open profile CSV: " + csv_path);
    }

    for (const char* name : {"datetime", "solar", "load"}) {
        if (!reader.has_col(name)) {
            throw ProfileError("Profile CSV " + csv_path + " has no '" + name + "' column");
        }
    }

    ProfileSource src;
    std::vector<std::string> row;
    while (reader.read_row(row)) {
        ProfileSample s;
        s.datetime = reader.get(row, "datetime");

        double solar = 0.0;
        double load = 0.0;
        if (!utils::CsvReader::try_parse_double(reader.get(row, "solar"), solar) ||
            !utils::CsvReader::try_parse_double(reader.get(row, "load"), load) ||
            !std::isfinite(solar) || !std::isfinite(load)) {
            MGSIM_LOG_WARN("[ProfileSource] %s:%zu: invalid row skipped",
                           csv_path.c_str(), reader.line_no());
            ++src.skipped_;
            continue;
        }

        if (solar < 0.0 || load < 0.0) {
            MGSIM_LOG_DEBUG("[ProfileSource] %s:%zu: negative value clamped to 0",
                            csv_path.c_str(), reader.line_no());
        }
        s.solar_kw = std::max(0.0, solar);
        s.load_kw = std::max(0.0, load);
        src.samples_.push_back(s);
    }

    if (src.samples_.empty()) {
        throw ProfileError("Profile CSV " + csv_path + " has no valid rows");
    }

    MGSIM_LOG_INFO("[ProfileSource] Loaded %zu samples from %s (%zu skipped)",
                   src.samples_.size(), csv_path.c_str(), src.skipped_);
    return src;
}

void ProfileSource::add_noise(double rel_stddev, uint64_t seed) {
    if (rel_stddev <= 0.0) return;

    utils::RandomSampler rng(seed);
    for (auto& s : samples_) {
        s.solar_kw = rng.perturb_nonnegative(s.solar_kw, rel_stddev);
        s.load_kw = rng.perturb_nonnegative(s.load_kw, rel_stddev);
    }
    MGSIM_LOG_INFO("[ProfileSource] Applied %.1f%% noise (seed=%llu)",
                   rel_stddev * 100.0, static_cast<unsigned long long>(seed));
}

void ProfileSource::push_back(const ProfileSample& s) {
    ProfileSample clamped = s;
    clamped.solar_kw = std::max(0.0, s.solar_kw);
    clamped.load_kw = std::max(0.0, s.load_kw);
    samples_.push_back(clamped);
}

const ProfileSample& ProfileSource::at(size_t step) const {
    if (samples_.empty()) {
        throw ProfileError("ProfileSource::at on an empty profile");
    }
    return samples_[step % samples_.size()];
}

} // namespace sim
