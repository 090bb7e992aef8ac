#pragma once

#include "point_process/Bounds.hpp"
#include "point_process/Density.hpp"
#include "point_process/Envelope.hpp"
#include "point_process/Points.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <stop_token>

namespace spatial {

struct ThinningConfig {
    std::size_t blocksize{1000};
    // Hard cap on candidate blocks per call; SamplingBudgetExceeded past it.
    std::size_t max_blocks{100000};
    envelope::EnvelopeSearchConfig envelope{};
};

struct SampleReport {
    double lmax{0.0};
    envelope::EnvelopeEstimate envelope;
    std::size_t blocksize{0};
    std::size_t blocks{0};
    std::size_t candidates{0};
    std::size_t accepted{0};      // before truncation to n
    std::size_t envelope_violations{0};
    double elapsed_microseconds{0.0};

    [[nodiscard]] double acceptance_rate() const noexcept {
        return candidates > 0 ? static_cast<double>(accepted) / static_cast<double>(candidates) : 0.0;
    }
};

struct SampleResult {
    PointSet points;
    SampleReport report;
};

class ThinningSampler {
public:
    explicit ThinningSampler(ThinningConfig config = {});

    SampleResult sample(const DensityModel& density,
                        const DensityKwargs& kwargs,
                        const Bounds& bounds,
                        std::size_t n,
                        std::mt19937_64& rng,
                        std::stop_token stop = {}) const;

    SampleResult sample(const DensityModel& density,
                        const DensityKwargs& kwargs,
                        const Bounds& bounds,
                        std::size_t n,
                        std::uint64_t seed,
                        std::stop_token stop = {}) const;

    [[nodiscard]] const ThinningConfig& config() const noexcept;

private:
    void validate(const DensityModel& density, const DensityKwargs& kwargs, const Bounds& bounds, std::size_t n) const;
    static void draw_candidates(const Bounds& region, bool continuous, CandidateBlock& block, std::mt19937_64& rng);

    ThinningConfig config_;
};

} // namespace spatial
