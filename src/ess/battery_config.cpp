// src/ess/battery_config.cpp
#include "ess/battery_config.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace ess {

const char* to_string(Chemistry chem) {
    switch (chem) {
        case Chemistry::Linear:    return "linear";
        case Chemistry::Empirical: return "empirical";
        case Chemistry::NMC:       return "nmc";
        case Chemistry::NCA:       return "nca";
        case Chemistry::LFP:       return "lfp";
    }
    return "unknown";
}

std::optional<Chemistry> parse_chemistry(const std::string& name) {
    std::string v;
    v.reserve(name.size());
    for (char c : name) {
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (v == "linear")    return Chemistry::Linear;
    if (v == "empirical") return Chemistry::Empirical;
    if (v == "nmc")       return Chemistry::NMC;
    if (v == "nca")       return Chemistry::NCA;
    if (v == "lfp")       return Chemistry::LFP;
    return std::nullopt;
}

std::optional<ReferenceCell> reference_cell(Chemistry chem) {
    switch (chem) {
        case Chemistry::NMC: return ReferenceCell{3.2, 3.7, "cells/nmc_voc_r0.csv", 0.799};
        case Chemistry::NCA: return ReferenceCell{87.671, 3.65, "cells/nca_voc_r0.csv", 1.0};
        case Chemistry::LFP: return ReferenceCell{3.704, 3.2, "cells/lfp_voc_r0.csv", 1.0};
        default:             return std::nullopt;
    }
}

void BatteryConfig::apply_chemistry_preset(Chemistry chem, const std::string& data_dir) {
    chemistry = chem;
    auto cell = reference_cell(chem);
    if (!cell) {
        return;
    }
    reference_capacity_ah = cell->capacity_ah;
    cell_voltage_v = cell->nominal_voltage_v;
    c_n_ah = cell->capacity_ah;

    std::string dir = data_dir.empty() ? std::string("data") : data_dir;
    if (dir.back() != '/') {
        dir.push_back('/');
    }
    table_path = dir + cell->table_file;
}

void BatteryConfig::validate() const {
    if (ns <= 0 || np <= 0) {
        throw std::invalid_argument("Invalid pack layout: ns and np must be > 0");
    }
    if (!(reference_capacity_ah > 0.0) || !(c_n_ah > 0.0)) {
        throw std::invalid_argument("Invalid cell capacity: must be > 0 Ah");
    }
    if (!(cell_voltage_v > 0.0)) {
        throw std::invalid_argument("Invalid cell_voltage_v: must be > 0");
    }
    if (!(eta_inverter > 0.0) || eta_inverter > 1.0) {
        throw std::invalid_argument("Invalid eta_inverter: must be 0 < eta <= 1");
    }
    if (!(efficiency > 0.0) || efficiency > 1.0) {
        throw std::invalid_argument("Invalid efficiency: must be 0 < eta <= 1");
    }
    if (!(soe_min >= 0.0) || !(soe_min < soe_max) || soe_max > 1.0) {
        throw std::invalid_argument("Invalid SoE window: 0 <= soe_min < soe_max <= 1");
    }
    if (soe_0 < soe_min || soe_0 > soe_max) {
        throw std::invalid_argument("Invalid soe_0: must lie in [soe_min, soe_max]");
    }
    if (!(p_s_max_kw > 0.0)) {
        throw std::invalid_argument("Invalid p_s_max_kw: must be > 0");
    }
    if (!(delta_t_h > 0.0)) {
        throw std::invalid_argument("Invalid delta_t_h: must be > 0");
    }
    if (!std::isfinite(temperature_c)) {
        throw std::invalid_argument("Invalid temperature_c: must be finite");
    }
    if (!std::isfinite(soh_0) || !(soh_0 > 0.0) || soh_0 > 1.0) {
        throw std::invalid_argument("Invalid soh_0: must lie in (0, 1]");
    }
    // below the oldest layer an NMC pack is clamped at lookup; NCA and LFP have no aged layer
    auto cell = reference_cell(chemistry);
    if (cell && cell->min_table_soh >= 1.0 && soh_0 < 1.0) {
        throw std::invalid_argument(std::string("Invalid soh_0 for ") + to_string(chemistry) +
                                    ": tables only cover SOH 1.0");
    }
    if (wear.a && *wear.a == 0.0) {
        throw std::invalid_argument("Invalid wear coefficient a: must be non-zero");
    }
}

} // namespace ess
