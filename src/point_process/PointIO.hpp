#pragma once

#include "point_process/Density.hpp"
#include "point_process/Points.hpp"

#include <filesystem>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace spatial::io {

// Header x0,...,x{d-1}, one accepted point per line in acceptance order.
void write_points_csv(const std::filesystem::path& path, const PointSet& points);
void write_points_csv(std::ostream& out, const PointSet& points);

// A single row yields a rank-1 grid, several rows a rank-2 grid.
[[nodiscard]] WeightGrid read_weight_grid_csv(const std::filesystem::path& path);
[[nodiscard]] WeightGrid read_weight_grid_csv(std::istream& in);

// Command-line values. `key` names the argument in error messages.
[[nodiscard]] std::size_t parse_count(const std::string& key, const std::string& value);

// "sigma=0.2,center=0.5"; empty text gives no kwargs.
[[nodiscard]] DensityKwargs parse_kwargs(const std::string& text);

} // namespace spatial::io
