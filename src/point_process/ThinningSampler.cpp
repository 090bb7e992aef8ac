#include "point_process/ThinningSampler.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "error.hpp"
#include "perf/ScopedTimer.hpp"
#include "point_process/Errors.hpp"

namespace spatial {

namespace {

PointSet make_point_set(bool continuous, std::size_t n, std::size_t d, std::vector<double> coords) {
    if (continuous) {
        return ContinuousPoints(n, d, std::move(coords));
    }
    std::vector<std::int64_t> indices;
    indices.reserve(coords.size());
    for (double c : coords) {
        indices.push_back(static_cast<std::int64_t>(c));
    }
    return LatticePoints(n, d, std::move(indices));
}

} // namespace

ThinningSampler::ThinningSampler(ThinningConfig config) : config_(std::move(config)) {
    if (config_.blocksize == 0) {
        SPATIAL_THROW(std::invalid_argument("ThinningSampler requires blocksize >= 1"));
    }
    if (config_.max_blocks == 0) {
        SPATIAL_THROW(std::invalid_argument("ThinningSampler requires max_blocks >= 1"));
    }
}

const ThinningConfig& ThinningSampler::config() const noexcept {
    return config_;
}

void ThinningSampler::validate(const DensityModel& density, const DensityKwargs& kwargs,
                               const Bounds& bounds, std::size_t n) const {
    if (n == 0) {
        SPATIAL_THROW(std::invalid_argument("ThinningSampler::sample requires n >= 1"));
    }
    if (density.dimension() == 0) {
        SPATIAL_THROW(InvalidDensity("density reports zero dimensions"));
    }
    if (bounds.dimension() != density.dimension()) {
        SPATIAL_THROW(ShapeMismatch(
            density.dimension(),
            bounds.dimension(),
            density.is_continuous() ? "bounds for continuous density" : "bounds for discrete density rank"));
    }
    density.validate_kwargs(kwargs);

    if (!density.is_continuous()) {
        const Bounds region = density.sampling_region(bounds);
        for (std::size_t i = 0; i < region.dimension(); ++i) {
            if (bounds[i].low != region[i].low || bounds[i].high != region[i].high) {
                spdlog::warn("bounds {} differ from the weight grid index range {}; candidates follow the grid",
                             bounds.to_string(), region.to_string());
                break;
            }
        }
    }
}

void ThinningSampler::draw_candidates(const Bounds& region, bool continuous, CandidateBlock& block,
                                      std::mt19937_64& rng) {
    for (std::size_t dim = 0; dim < block.dimension(); ++dim) {
        double* axis = block.axis(dim);
        if (continuous) {
            std::uniform_real_distribution<double> unif(region[dim].low, region[dim].high);
            for (std::size_t j = 0; j < block.size(); ++j) {
                axis[j] = unif(rng);
            }
        } else {
            const auto extent = static_cast<std::int64_t>(region[dim].high);
            std::uniform_int_distribution<std::int64_t> index(0, extent - 1);
            for (std::size_t j = 0; j < block.size(); ++j) {
                axis[j] = static_cast<double>(index(rng));
            }
        }
    }
}

SampleResult ThinningSampler::sample(const DensityModel& density,
                                     const DensityKwargs& kwargs,
                                     const Bounds& bounds,
                                     std::size_t n,
                                     std::uint64_t seed,
                                     std::stop_token stop) const {
    std::mt19937_64 rng(seed);
    return sample(density, kwargs, bounds, n, rng, std::move(stop));
}

SampleResult ThinningSampler::sample(const DensityModel& density,
                                     const DensityKwargs& kwargs,
                                     const Bounds& bounds,
                                     std::size_t n,
                                     std::mt19937_64& rng,
                                     std::stop_token stop) const {
    validate(density, kwargs, bounds, n);

    perf::ScopedTimer timer([](double us) { spdlog::debug("thinning call finished in {:.1f} us", us); });

    const std::size_t d = density.dimension();
    const bool continuous = density.is_continuous();
    const Bounds region = density.sampling_region(bounds);

    SampleReport report;
    report.blocksize = config_.blocksize;
    report.envelope = density.envelope(bounds, kwargs, config_.envelope);
    report.lmax = report.envelope.value;
    if (!std::isfinite(report.lmax) || !(report.lmax > 0.0)) {
        SPATIAL_THROW(DegenerateDensity(report.lmax));
    }
    spdlog::debug("envelope lmax={} from {} start(s), {} iteration(s), {} evaluation(s), converged={}",
                  report.lmax, report.envelope.starts, report.envelope.iterations,
                  report.envelope.evaluations, report.envelope.converged);

    const std::size_t blocksize = config_.blocksize;
    CandidateBlock block(d, blocksize);
    std::vector<double> thresholds(blocksize);
    std::vector<double> values;
    values.reserve(blocksize);
    std::uniform_real_distribution<double> unif(0.0, 1.0);

    // One block can overshoot the target by at most blocksize - 1 points.
    std::vector<double> accepted;
    accepted.reserve((n - 1 + blocksize) * d);

    std::size_t count = 0;
    while (count < n) {
        if (stop.stop_requested()) {
            SPATIAL_THROW(SamplingCancelled(count, n, report.blocks));
        }
        if (report.blocks >= config_.max_blocks) {
            SPATIAL_THROW(SamplingBudgetExceeded(count, n, report.blocks, report.lmax));
        }

        draw_candidates(region, continuous, block, rng);
        for (double& u : thresholds) {
            u = unif(rng);
        }
        density.evaluate(block, kwargs, values);

        for (std::size_t j = 0; j < blocksize; ++j) {
            const double ratio = values[j] / report.lmax;
            if (ratio > 1.0) {
                ++report.envelope_violations;
            }
            if (thresholds[j] < ratio) {
                for (std::size_t dim = 0; dim < d; ++dim) {
                    accepted.push_back(block.coordinate(dim, j));
                }
                ++count;
            }
        }
        ++report.blocks;
        report.candidates += blocksize;
    }
    report.accepted = count;

    if (report.envelope_violations > 0) {
        spdlog::warn("density exceeded the estimated maximum lmax={} at {} of {} candidate(s); "
                     "the sample is biased toward the located mode",
                     report.lmax, report.envelope_violations, report.candidates);
    }
    spdlog::debug("accepted {} of {} candidate(s) over {} block(s), acceptance rate {:.4f}",
                  report.accepted, report.candidates, report.blocks, report.acceptance_rate());

    accepted.resize(n * d);
    report.elapsed_microseconds = timer.elapsed_microseconds();
    return SampleResult{make_point_set(continuous, n, d, std::move(accepted)), std::move(report)};
}

} // namespace spatial
