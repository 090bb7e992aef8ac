#pragma once

#include "point_process/Bounds.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

namespace spatial::envelope {

struct EnvelopeSearchConfig {
    double gradient_tolerance{1e-8};
    double parameter_tolerance{1e-10};
    std::size_t max_iterations{200};
    double armijo_c1{1e-4};
    double backtracking_shrink{0.5};
    std::size_t max_line_search_steps{30};
    // Central-difference step as a fraction of each interval width.
    double finite_difference_step{1e-6};
    // Extra uniformly drawn starting points on top of the midpoint. Zero keeps
    // the single-start local search, which can miss the global mode of a
    // multimodal density.
    std::size_t restarts{0};
    std::uint64_t restart_seed{2024};
};

struct EnvelopeEstimate {
    double value{-std::numeric_limits<double>::infinity()};
    std::vector<double> location;
    std::size_t iterations{0};
    std::size_t evaluations{0};
    std::size_t starts{0};
    bool converged{false};
};

using Objective = std::function<double(const std::vector<double>&)>;

// Bounded local maximization by projected BFGS with finite-difference
// gradients, seeded at the midpoint of the bounds.
[[nodiscard]] EnvelopeEstimate maximize_over_bounds(
    const Objective& objective,
    const Bounds& bounds,
    const EnvelopeSearchConfig& config = {});

} // namespace spatial::envelope
