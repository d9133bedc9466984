// src/ess/lookup_table.cpp
#include "ess/lookup_table.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"

#include <algorithm>

namespace ess {

// ============================================================================
// Grid2D
// ============================================================================

static void check_axis(const std::vector<double>& axis, const char* name) {
    if (axis.size() < 2) {
        throw std::invalid_argument(std::string("Grid2D: axis ") + name + " needs >= 2 points");
    }
    for (size_t i = 1; i < axis.size(); ++i) {
        if (!(axis[i] > axis[i - 1])) {
            throw std::invalid_argument(std::string("Grid2D: axis ") + name + " must be strictly ascending");
        }
    }
}

Grid2D::Grid2D(std::vector<double> x, std::vector<double> y,
               std::vector<std::vector<double>> values)
    : x_(std::move(x)), y_(std::move(y)), values_(std::move(values)) {
    check_axis(x_, "x");
    check_axis(y_, "y");
    if (values_.size() != x_.size()) {
        throw std::invalid_argument("Grid2D: row count does not match x axis");
    }
    for (const auto& row : values_) {
        if (row.size() != y_.size()) {
            throw std::invalid_argument("Grid2D: column count does not match y axis");
        }
    }
}

std::pair<size_t, double> Grid2D::locate(const std::vector<double>& axis, double v) {
    v = std::clamp(v, axis.front(), axis.back());
    auto it = std::upper_bound(axis.begin(), axis.end(), v);
    size_t hi = static_cast<size_t>(it - axis.begin());
    if (hi >= axis.size()) {
        hi = axis.size() - 1;
    }
    if (hi == 0) {
        hi = 1;
    }
    const size_t lo = hi - 1;
    const double t = (v - axis[lo]) / (axis[hi] - axis[lo]);
    return {lo, t};
}

double Grid2D::operator()(double x, double y) const {
    if (values_.empty()) {
        throw std::logic_error("Grid2D: lookup on empty table");
    }
    const auto [i, tx] = locate(x_, x);
    const auto [j, ty] = locate(y_, y);

    const double v00 = values_[i][j];
    const double v01 = values_[i][j + 1];
    const double v10 = values_[i + 1][j];
    const double v11 = values_[i + 1][j + 1];

    const double v0 = v00 + (v01 - v00) * ty;
    const double v1 = v10 + (v11 - v10) * ty;
    return v0 + (v1 - v0) * tx;
}

// ============================================================================
// VocR0Table
// ============================================================================

namespace {

// One pack-scaled (soc, T) grid pair from the cell rows of a single layer.
std::pair<Grid2D, Grid2D> scale_layer(const std::vector<std::vector<double>>& rows,
                                      double voc_scale, double r0_scale) {
    if (rows.size() < 2) {
        throw TableLoadError("VocR0Table: need at least 2 soc rows, got " + std::to_string(rows.size()));
    }

    std::vector<double> soc_axis(rows.size());
    std::vector<std::vector<double>> voc(rows.size()), r0(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() < 4) {
            throw TableLoadError("VocR0Table: row " + std::to_string(i) + " has fewer than 4 values");
        }
        soc_axis[i] = static_cast<double>(i) / static_cast<double>(rows.size() - 1);
        r0[i] = {rows[i][0] * r0_scale, rows[i][1] * r0_scale};
        voc[i] = {rows[i][2] * voc_scale, rows[i][3] * voc_scale};
    }

    const std::vector<double> temp_axis = {VocR0Table::kTempLowC, VocR0Table::kTempHighC};
    return {Grid2D(soc_axis, temp_axis, std::move(voc)), Grid2D(soc_axis, temp_axis, std::move(r0))};
}

} // namespace

VocR0Table VocR0Table::from_layers(std::vector<Layer> layers, int ns, int np,
                                   double reference_capacity_ah, double c_n_ah) {
    if (layers.empty()) {
        throw TableLoadError("VocR0Table: no soh layers");
    }
    if (ns <= 0 || np <= 0 || !(c_n_ah > 0.0) || !(reference_capacity_ah > 0.0)) {
        throw TableLoadError("VocR0Table: invalid pack scaling parameters");
    }

    std::sort(layers.begin(), layers.end(),
              [](const Layer& a, const Layer& b) { return a.soh < b.soh; });
    for (size_t k = 0; k < layers.size(); ++k) {
        if (!(layers[k].soh > 0.0) || layers[k].soh > 1.0) {
            throw TableLoadError("VocR0Table: soh layer " + std::to_string(layers[k].soh) +
                                 " outside (0, 1]");
        }
        if (k > 0 && layers[k].soh == layers[k - 1].soh) {
            throw TableLoadError("VocR0Table: duplicate soh layer " + std::to_string(layers[k].soh));
        }
    }

    const double r0_scale = (static_cast<double>(ns) / np) * (reference_capacity_ah / c_n_ah);
    const double voc_scale = static_cast<double>(ns);

    VocR0Table table;
    for (const auto& layer : layers) {
        auto grids = scale_layer(layer.rows, voc_scale, r0_scale);
        table.soh_.push_back(layer.soh);
        table.voc_.push_back(std::move(grids.first));
        table.r0_.push_back(std::move(grids.second));
    }
    return table;
}

VocR0Table VocR0Table::from_cell_rows(const std::vector<std::vector<double>>& rows,
                                      int ns, int np,
                                      double reference_capacity_ah, double c_n_ah) {
    return from_layers({Layer{1.0, rows}}, ns, np, reference_capacity_ah, c_n_ah);
}

VocR0Table VocR0Table::load(const std::string& path, int ns, int np,
                            double reference_capacity_ah, double c_n_ah) {
    utils::CsvReader reader;
    if (!reader.open(path)) {
        throw TableLoadError("VocR0Table: cannot open " + path);
    }

    static const char* kColumns[] = {"r0_20c", "r0_40c", "voc_20c", "voc_40c"};
    int idx[4];
    for (int k = 0; k < 4; ++k) {
        idx[k] = reader.col(kColumns[k]);
        if (idx[k] < 0) {
            throw TableLoadError("VocR0Table: " + path + " missing column " + kColumns[k]);
        }
    }
    const int soh_col = reader.col("soh");

    // rows of one layer are contiguous in the file
    std::vector<Layer> layers;
    std::vector<std::string> row;
    while (reader.read_row(row)) {
        double soh = 1.0;
        if (soh_col >= 0) {
            const std::string& cell = row[static_cast<size_t>(soh_col)];
            if (!utils::CsvReader::try_parse_double(cell, soh)) {
                throw TableLoadError("VocR0Table: " + path + " line " + std::to_string(reader.line_no()) +
                                     ": bad soh '" + cell + "'");
            }
        }

        std::vector<double> values(4);
        for (int k = 0; k < 4; ++k) {
            const std::string& cell = row[static_cast<size_t>(idx[k])];
            if (!utils::CsvReader::try_parse_double(cell, values[static_cast<size_t>(k)])) {
                throw TableLoadError("VocR0Table: " + path + " line " + std::to_string(reader.line_no()) +
                                     ": bad value '" + cell + "' in " + kColumns[k]);
            }
        }

        if (layers.empty() || layers.back().soh != soh) {
            for (const auto& l : layers) {
                if (l.soh == soh) {
                    throw TableLoadError("VocR0Table: " + path + " soh layer " + std::to_string(soh) +
                                         " is not contiguous");
                }
            }
            layers.push_back(Layer{soh, {}});
        }
        layers.back().rows.push_back(std::move(values));
    }

    VocR0Table table = from_layers(std::move(layers), ns, np, reference_capacity_ah, c_n_ah);
    MGSIM_LOG_INFO("[VocR0Table] Loaded %zu soc points x %zu soh layers from %s (Ns=%d, Np=%d, SOH %.3f..%.3f)",
                   table.rows(), table.soh_.size(), path.c_str(), ns, np, table.soh_min(), table.soh_max());
    return table;
}

VocR0Table::Lookup VocR0Table::lookup(double soc, double temperature_c, double soh) const {
    if (soh_.empty()) {
        throw std::logic_error("VocR0Table: lookup on empty table");
    }
    if (soh_.size() == 1) {
        return {voc_[0](soc, temperature_c), r0_[0](soc, temperature_c)};
    }

    soh = std::clamp(soh, soh_.front(), soh_.back());
    auto it = std::upper_bound(soh_.begin(), soh_.end(), soh);
    size_t hi = std::min(static_cast<size_t>(it - soh_.begin()), soh_.size() - 1);
    if (hi == 0) {
        hi = 1;
    }
    const size_t lo = hi - 1;
    const double t = (soh - soh_[lo]) / (soh_[hi] - soh_[lo]);

    const double voc_lo = voc_[lo](soc, temperature_c);
    const double r0_lo = r0_[lo](soc, temperature_c);
    return {voc_lo + (voc_[hi](soc, temperature_c) - voc_lo) * t,
            r0_lo + (r0_[hi](soc, temperature_c) - r0_lo) * t};
}

} // namespace ess
