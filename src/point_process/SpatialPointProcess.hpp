#pragma once

#include "point_process/Bounds.hpp"
#include "point_process/Density.hpp"
#include "point_process/Envelope.hpp"
#include "point_process/Points.hpp"
#include "point_process/ThinningSampler.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <random>
#include <stop_token>
#include <string>
#include <string_view>

namespace spatial {

enum class Algorithm {
    Thinning,
};

// Throws UnsupportedAlgorithm for anything but "thinning".
[[nodiscard]] Algorithm parse_algorithm(std::string_view name);

struct SampleRequest {
    std::optional<std::size_t> n{};
    Bounds bounds{};
    std::string algo{"thinning"};
    std::size_t blocksize{1000};
    std::size_t max_blocks{100000};
    std::uint64_t seed{42};
    envelope::EnvelopeSearchConfig envelope{};
    std::stop_token stop{};
};

// Spatial point process whose intensity follows a continuous density function
// or a discrete weight grid.
class SpatialPointProcess {
public:
    explicit SpatialPointProcess(std::shared_ptr<const DensityModel> density, DensityKwargs density_kwargs = {});
    SpatialPointProcess(ContinuousDensity::PointFn density, std::size_t arity, DensityKwargs density_kwargs = {});
    explicit SpatialPointProcess(WeightGrid weights);

    void set_density(std::shared_ptr<const DensityModel> density);
    void set_density_kwargs(DensityKwargs density_kwargs);

    [[nodiscard]] const DensityModel& density() const noexcept;
    [[nodiscard]] std::shared_ptr<const DensityModel> density_ptr() const noexcept;
    [[nodiscard]] const DensityKwargs& density_kwargs() const noexcept;
    [[nodiscard]] std::size_t dimension() const noexcept;

    // Exactly n points in acceptance order, seeded per call.
    [[nodiscard]] PointSet sample(std::optional<std::size_t> n,
                                  const Bounds& bounds,
                                  std::string_view algo = "thinning",
                                  std::size_t blocksize = 1000,
                                  std::uint64_t seed = 42) const;

    [[nodiscard]] SampleResult sample(const SampleRequest& request) const;
    [[nodiscard]] SampleResult sample(const SampleRequest& request, std::mt19937_64& rng) const;

    [[nodiscard]] std::string to_string() const;

private:
    [[nodiscard]] ThinningSampler prepare(const SampleRequest& request) const;
    void check_arity(const Bounds& bounds) const;

    std::shared_ptr<const DensityModel> density_;
    DensityKwargs density_kwargs_;
};

std::ostream& operator<<(std::ostream& os, const SpatialPointProcess& process);

} // namespace spatial
