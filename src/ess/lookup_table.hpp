// src/ess/lookup_table.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ess {

// Raised when a lookup or degradation table cannot be loaded. Never retried.
class TableLoadError : public std::runtime_error {
public:
    explicit TableLoadError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Grid2D - Rectilinear 2-D table with bilinear interpolation
 *
 * values[i][j] is the sample at (x[i], y[j]). Queries outside the grid are
 * clamped to its edges, no extrapolation.
 */
class Grid2D {
public:
    Grid2D() = default;

    /**
     * @throws std::invalid_argument if an axis has fewer than 2 points, is not
     *         strictly ascending, or values do not match the axes
     */
    Grid2D(std::vector<double> x, std::vector<double> y,
           std::vector<std::vector<double>> values);

    double operator()(double x, double y) const;

    const std::vector<double>& x_axis() const { return x_; }
    const std::vector<double>& y_axis() const { return y_; }

private:
    // Index of the lower cell corner and the fractional position inside it.
    static std::pair<size_t, double> locate(const std::vector<double>& axis, double v);

    std::vector<double> x_;
    std::vector<double> y_;
    std::vector<std::vector<double>> values_;
};

/**
 * VocR0Table - Open-circuit voltage and internal resistance vs (soc, T, SOH)
 *
 * Built once from the reference-cell CSV
 *   [soh,]soc,r0_20c,r0_40c,voc_20c,voc_40c
 * and scaled to the pack:
 *   Voc *= Ns
 *   R0  *= (Ns / Np) * (reference_capacity_ah / c_n_ah)
 *
 * Each SOH layer is a (soc, T) grid: soc axis linspace(0, 1, rows),
 * temperature axis {20, 40} degC. Without a soh column the file is a single
 * layer at SOH 1.0. Between layers the lookup is linear in SOH; outside the
 * measured SOH range it is clamped to the nearest layer.
 */
class VocR0Table {
public:
    struct Lookup {
        double voc;
        double r0;
    };

    // Cell rows of {r0_20, r0_40, voc_20, voc_40} measured at one SOH.
    struct Layer {
        double soh;
        std::vector<std::vector<double>> rows;
    };

    /**
     * @throws TableLoadError if the file is missing or malformed
     */
    static VocR0Table load(const std::string& path, int ns, int np,
                           double reference_capacity_ah, double c_n_ah);

    /**
     * Build a single SOH 1.0 layer from in-memory cell data.
     */
    static VocR0Table from_cell_rows(const std::vector<std::vector<double>>& rows,
                                     int ns, int np,
                                     double reference_capacity_ah, double c_n_ah);

    /**
     * @throws TableLoadError on an empty layer list, duplicate SOH values or
     *         a layer with SOH outside (0, 1]
     */
    static VocR0Table from_layers(std::vector<Layer> layers, int ns, int np,
                                  double reference_capacity_ah, double c_n_ah);

    Lookup lookup(double soc, double temperature_c, double soh = 1.0) const;

    size_t rows() const { return voc_.empty() ? 0 : voc_.front().x_axis().size(); }

    const std::vector<double>& soh_axis() const { return soh_; }
    double soh_min() const { return soh_.front(); }
    double soh_max() const { return soh_.back(); }

    static constexpr double kTempLowC = 20.0;
    static constexpr double kTempHighC = 40.0;

private:
    std::vector<double> soh_;       // ascending
    std::vector<Grid2D> voc_;       // one grid per soh_ entry
    std::vector<Grid2D> r0_;
};

} // namespace ess
