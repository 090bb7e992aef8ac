#pragma once

#include "point_process/Bounds.hpp"
#include "point_process/Density.hpp"
#include "point_process/Points.hpp"

#include <cstddef>
#include <vector>

namespace spatial::diagnostics {

struct UniformityReport {
    double statistic{0.0}; // Kolmogorov-Smirnov D
    double p_value{1.0};
    std::size_t samples{0};
};

struct CellFrequencyReport {
    std::vector<std::size_t> counts; // row-major, same layout as the grid
    double statistic{0.0};           // Pearson chi-square over positive-weight cells
    std::size_t degrees_of_freedom{0};
    double p_value{1.0};
    std::size_t zero_weight_hits{0};
};

// One-sample KS test of `samples` against U(low, high).
[[nodiscard]] UniformityReport ks_uniform(std::vector<double> samples, double low, double high);

// Asymptotic Kolmogorov tail probability with Stephens' small-sample correction.
[[nodiscard]] double kolmogorov_p_value(double statistic, std::size_t samples);

[[nodiscard]] CellFrequencyReport chi_square_cells(const LatticePoints& points, const WeightGrid& grid);

// Upper tail of the chi-square distribution, Wilson-Hilferty approximation.
[[nodiscard]] double chi_square_p_value(double statistic, std::size_t degrees_of_freedom);

[[nodiscard]] bool all_within(const ContinuousPoints& points, const Bounds& bounds);
[[nodiscard]] bool all_within(const LatticePoints& points, const WeightGrid& grid);

} // namespace spatial::diagnostics
