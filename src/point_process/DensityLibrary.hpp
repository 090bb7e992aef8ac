#pragma once

#include "point_process/Density.hpp"

#include <cstddef>
#include <memory>
#include <string_view>

namespace spatial::library {

// Constant density over any box; vectorized.
[[nodiscard]] std::shared_ptr<const DensityModel> uniform_density(std::size_t dimension);

// amplitude * exp(-|x - center|^2 / (2 sigma^2)) with an isotropic center.
// kwargs: sigma (required), amplitude (default 1), center (default 0).
[[nodiscard]] std::shared_ptr<const DensityModel> gaussian_density(std::size_t dimension);

// Annulus exp(-(|x| - radius)^2 / (2 width^2)) in the plane. It has a cusp at the
// origin where central differences cancel; the envelope search steps off it along
// the one-sided slope.
// kwargs: radius, width (both required).
[[nodiscard]] std::shared_ptr<const DensityModel> ring_density();

// Lookup by name ("uniform", "gaussian", "ring") for command-line tools.
[[nodiscard]] std::shared_ptr<const DensityModel> by_name(std::string_view name, std::size_t dimension);

} // namespace spatial::library
