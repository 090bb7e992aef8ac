#include "point_process/Diagnostics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "error.hpp"
#include "point_process/Errors.hpp"

namespace spatial::diagnostics {

UniformityReport ks_uniform(std::vector<double> samples, double low, double high) {
    if (!(low < high)) {
        SPATIAL_THROW(std::invalid_argument("ks_uniform requires low < high"));
    }
    UniformityReport report;
    report.samples = samples.size();
    if (samples.empty()) {
        return report;
    }

    std::sort(samples.begin(), samples.end());
    const double n = static_cast<double>(samples.size());
    const double width = high - low;
    double d = 0.0;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const double cdf = std::clamp((samples[i] - low) / width, 0.0, 1.0);
        const double above = static_cast<double>(i + 1) / n - cdf;
        const double below = cdf - static_cast<double>(i) / n;
        d = std::max({d, above, below});
    }
    report.statistic = d;
    report.p_value = kolmogorov_p_value(d, samples.size());
    return report;
}

double kolmogorov_p_value(double statistic, std::size_t samples) {
    if (samples == 0 || !(statistic > 0.0)) {
        return 1.0;
    }
    const double root_n = std::sqrt(static_cast<double>(samples));
    const double lambda = (root_n + 0.12 + 0.11 / root_n) * statistic;
    if (lambda < 0.2) {
        return 1.0;
    }
    constexpr int kTerms = 100;
    double sum = 0.0;
    double sign = 1.0;
    for (int k = 1; k <= kTerms; ++k) {
        const double term = sign * std::exp(-2.0 * k * k * lambda * lambda);
        sum += term;
        if (std::abs(term) < 1e-12) {
            break;
        }
        sign = -sign;
    }
    return std::clamp(2.0 * sum, 0.0, 1.0);
}

CellFrequencyReport chi_square_cells(const LatticePoints& points, const WeightGrid& grid) {
    if (points.cols() != grid.rank()) {
        SPATIAL_THROW(ShapeMismatch(grid.rank(), points.cols(), "lattice points for chi-square"));
    }
    CellFrequencyReport report;
    report.counts.assign(grid.size(), 0);

    std::vector<std::size_t> index(grid.rank());
    for (std::size_t i = 0; i < points.rows(); ++i) {
        for (std::size_t dim = 0; dim < grid.rank(); ++dim) {
            const std::int64_t coord = points(i, dim);
            if (coord < 0 || static_cast<std::size_t>(coord) >= grid.shape()[dim]) {
                SPATIAL_THROW(std::out_of_range("lattice point lies outside the weight grid"));
            }
            index[dim] = static_cast<std::size_t>(coord);
        }
        ++report.counts[grid.flat_index(index)];
    }

    const double total_weight = grid.total();
    const double n = static_cast<double>(points.rows());
    std::size_t positive_cells = 0;
    for (std::size_t cell = 0; cell < grid.size(); ++cell) {
        const double weight = grid.values()[cell];
        if (weight <= 0.0) {
            report.zero_weight_hits += report.counts[cell];
            continue;
        }
        ++positive_cells;
        const double expected = n * weight / total_weight;
        const double diff = static_cast<double>(report.counts[cell]) - expected;
        report.statistic += diff * diff / expected;
    }
    report.degrees_of_freedom = positive_cells > 0 ? positive_cells - 1 : 0;
    report.p_value = chi_square_p_value(report.statistic, report.degrees_of_freedom);
    return report;
}

double chi_square_p_value(double statistic, std::size_t degrees_of_freedom) {
    if (degrees_of_freedom == 0 || !(statistic > 0.0)) {
        return 1.0;
    }
    const double k = static_cast<double>(degrees_of_freedom);
    const double mean = 1.0 - 2.0 / (9.0 * k);
    const double sd = std::sqrt(2.0 / (9.0 * k));
    const double z = (std::cbrt(statistic / k) - mean) / sd;
    return 0.5 * std::erfc(z / std::sqrt(2.0));
}

bool all_within(const ContinuousPoints& points, const Bounds& bounds) {
    if (points.cols() != bounds.dimension()) {
        return false;
    }
    for (std::size_t i = 0; i < points.rows(); ++i) {
        for (std::size_t dim = 0; dim < points.cols(); ++dim) {
            if (!bounds[dim].contains(points(i, dim))) {
                return false;
            }
        }
    }
    return true;
}

bool all_within(const LatticePoints& points, const WeightGrid& grid) {
    if (points.cols() != grid.rank()) {
        return false;
    }
    for (std::size_t i = 0; i < points.rows(); ++i) {
        for (std::size_t dim = 0; dim < points.cols(); ++dim) {
            const std::int64_t coord = points(i, dim);
            if (coord < 0 || static_cast<std::size_t>(coord) >= grid.shape()[dim]) {
                return false;
            }
        }
    }
    return true;
}

} // namespace spatial::diagnostics
