#include "point_process/DensityLibrary.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "error.hpp"
#include "point_process/Errors.hpp"

namespace spatial::library {

namespace {

double kwarg_or(const DensityKwargs& kwargs, const char* key, double fallback) {
    const auto it = kwargs.find(key);
    return it == kwargs.end() ? fallback : it->second;
}

} // namespace

std::shared_ptr<const DensityModel> uniform_density(std::size_t dimension) {
    ContinuousDensity::PointFn point = [](const std::vector<double>&, const DensityKwargs&) { return 1.0; };
    ContinuousDensity::BlockFn block = [](const CandidateBlock& candidates, const DensityKwargs&,
                                          std::vector<double>& out) { out.assign(candidates.size(), 1.0); };
    return std::make_shared<ContinuousDensity>(std::move(point), std::move(block), dimension);
}

std::shared_ptr<const DensityModel> gaussian_density(std::size_t dimension) {
    ContinuousDensity::PointFn point = [](const std::vector<double>& x, const DensityKwargs& kwargs) {
        const double sigma = kwargs.at("sigma");
        const double amplitude = kwarg_or(kwargs, "amplitude", 1.0);
        const double center = kwarg_or(kwargs, "center", 0.0);
        double r2 = 0.0;
        for (double xi : x) {
            r2 += (xi - center) * (xi - center);
        }
        return amplitude * std::exp(-r2 / (2.0 * sigma * sigma));
    };
    return make_continuous_density(std::move(point), dimension, {"sigma"});
}

std::shared_ptr<const DensityModel> ring_density() {
    ContinuousDensity::PointFn point = [](const std::vector<double>& x, const DensityKwargs& kwargs) {
        const double radius = kwargs.at("radius");
        const double width = kwargs.at("width");
        const double r = std::hypot(x[0], x[1]);
        const double offset = r - radius;
        return std::exp(-offset * offset / (2.0 * width * width));
    };
    return make_continuous_density(std::move(point), 2, {"radius", "width"});
}

std::shared_ptr<const DensityModel> by_name(std::string_view name, std::size_t dimension) {
    if (name == "uniform") {
        return uniform_density(dimension);
    }
    if (name == "gaussian") {
        return gaussian_density(dimension);
    }
    if (name == "ring") {
        if (dimension != 2) {
            SPATIAL_THROW(ShapeMismatch(2, dimension, "ring density"));
        }
        return ring_density();
    }
    SPATIAL_THROW(InvalidDensity("unknown built-in density '" + std::string(name) + "'"));
}

} // namespace spatial::library
