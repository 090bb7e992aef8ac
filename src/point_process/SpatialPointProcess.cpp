#include "point_process/SpatialPointProcess.hpp"

#include <ostream>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "error.hpp"
#include "point_process/Errors.hpp"

namespace spatial {

Algorithm parse_algorithm(std::string_view name) {
    if (name == "thinning") {
        return Algorithm::Thinning;
    }
    SPATIAL_THROW(UnsupportedAlgorithm(std::string(name)));
}

SpatialPointProcess::SpatialPointProcess(std::shared_ptr<const DensityModel> density, DensityKwargs density_kwargs)
    : density_(std::move(density)), density_kwargs_(std::move(density_kwargs)) {
    if (!density_) {
        SPATIAL_THROW(InvalidDensity("density must be a callable or an n-dimensional weight array"));
    }
    density_->validate_kwargs(density_kwargs_);
}

SpatialPointProcess::SpatialPointProcess(ContinuousDensity::PointFn density, std::size_t arity,
                                         DensityKwargs density_kwargs)
    : SpatialPointProcess(make_continuous_density(std::move(density), arity), std::move(density_kwargs)) {}

SpatialPointProcess::SpatialPointProcess(WeightGrid weights)
    : SpatialPointProcess(make_discrete_density(std::move(weights))) {}

void SpatialPointProcess::set_density(std::shared_ptr<const DensityModel> density) {
    if (!density) {
        SPATIAL_THROW(InvalidDensity("density must be a callable or an n-dimensional weight array"));
    }
    // Existing kwargs must still satisfy the replacement density.
    density->validate_kwargs(density_kwargs_);
    density_ = std::move(density);
}

void SpatialPointProcess::set_density_kwargs(DensityKwargs density_kwargs) {
    density_->validate_kwargs(density_kwargs);
    density_kwargs_ = std::move(density_kwargs);
}

const DensityModel& SpatialPointProcess::density() const noexcept {
    return *density_;
}

std::shared_ptr<const DensityModel> SpatialPointProcess::density_ptr() const noexcept {
    return density_;
}

const DensityKwargs& SpatialPointProcess::density_kwargs() const noexcept {
    return density_kwargs_;
}

std::size_t SpatialPointProcess::dimension() const noexcept {
    return density_->dimension();
}

PointSet SpatialPointProcess::sample(std::optional<std::size_t> n,
                                     const Bounds& bounds,
                                     std::string_view algo,
                                     std::size_t blocksize,
                                     std::uint64_t seed) const {
    SampleRequest request;
    request.n = n;
    request.bounds = bounds;
    request.algo = std::string(algo);
    request.blocksize = blocksize;
    request.seed = seed;
    return sample(request).points;
}

SampleResult SpatialPointProcess::sample(const SampleRequest& request) const {
    std::mt19937_64 rng(request.seed);
    return sample(request, rng);
}

SampleResult SpatialPointProcess::sample(const SampleRequest& request, std::mt19937_64& rng) const {
    const ThinningSampler sampler = prepare(request);
    return sampler.sample(*density_, density_kwargs_, request.bounds, *request.n, rng, request.stop);
}

ThinningSampler SpatialPointProcess::prepare(const SampleRequest& request) const {
    const bool n_missing = !request.n.has_value();
    const bool bounds_missing = request.bounds.empty();
    if (n_missing || bounds_missing) {
        SPATIAL_THROW(MissingArguments(n_missing, bounds_missing));
    }
    if (*request.n == 0) {
        SPATIAL_THROW(std::invalid_argument("sample requires n >= 1"));
    }

    switch (parse_algorithm(request.algo)) {
        case Algorithm::Thinning:
            break;
    }

    check_arity(request.bounds);

    ThinningConfig config;
    config.blocksize = request.blocksize;
    config.max_blocks = request.max_blocks;
    config.envelope = request.envelope;
    return ThinningSampler(config);
}

void SpatialPointProcess::check_arity(const Bounds& bounds) const {
    if (bounds.dimension() != density_->dimension()) {
        spdlog::debug("rejecting {}-dimensional bounds for {}", bounds.dimension(), density_->describe());
        SPATIAL_THROW(ShapeMismatch(density_->dimension(), bounds.dimension(),
                                    "number of bound pairs for " + density_->describe()));
    }
}

std::string SpatialPointProcess::to_string() const {
    std::ostringstream oss;
    oss << "SpatialPointProcess(density=" << density_->describe() << ", density_kwargs={";
    bool first = true;
    for (const auto& [key, value] : density_kwargs_) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << value;
        first = false;
    }
    oss << "})";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const SpatialPointProcess& process) {
    return os << process.to_string();
}

} // namespace spatial
