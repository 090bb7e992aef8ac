#include <catch2/catch.hpp>

#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <stop_token>
#include <variant>
#include <vector>

#include "point_process/DensityLibrary.hpp"
#include "point_process/Diagnostics.hpp"
#include "point_process/Errors.hpp"
#include "point_process/ThinningSampler.hpp"

namespace {

using spatial::Bounds;
using spatial::ContinuousDensity;
using spatial::ContinuousPoints;
using spatial::DensityKwargs;
using spatial::DiscreteDensity;
using spatial::LatticePoints;
using spatial::ThinningConfig;
using spatial::ThinningSampler;
using spatial::WeightGrid;

ThinningSampler make_sampler(std::size_t blocksize, std::size_t max_blocks = 100000) {
    ThinningConfig config;
    config.blocksize = blocksize;
    config.max_blocks = max_blocks;
    return ThinningSampler(config);
}

} // namespace

TEST_CASE("sampler rejects zero blocksize and zero budget") {
    CHECK_THROWS_AS(make_sampler(0), std::invalid_argument);
    CHECK_THROWS_AS(make_sampler(10, 0), std::invalid_argument);
}

TEST_CASE("sampler returns exactly n points inside the bounds") {
    const auto gaussian = spatial::library::gaussian_density(2);
    const DensityKwargs kwargs{{"sigma", 0.4}};
    const Bounds bounds{{-1.0, 1.0}, {0.0, 3.0}};

    const auto result = make_sampler(256).sample(*gaussian, kwargs, bounds, 777, std::uint64_t{9});
    const auto& points = std::get<ContinuousPoints>(result.points);

    REQUIRE(points.rows() == 777);
    REQUIRE(points.cols() == 2);
    CHECK(spatial::diagnostics::all_within(points, bounds));

    const auto& report = result.report;
    CHECK(report.lmax == Catch::Detail::Approx(1.0).margin(1e-4));
    CHECK(report.blocksize == 256);
    CHECK(report.candidates == report.blocks * 256);
    CHECK(report.accepted >= 777);
    CHECK(report.accepted < 777 + 256);
    CHECK(report.acceptance_rate() > 0.0);
    CHECK(report.acceptance_rate() <= 1.0);
}

TEST_CASE("uniform density accepts every candidate in draw order") {
    const auto uniform = spatial::library::uniform_density(1);

    const auto result = make_sampler(8).sample(*uniform, {}, Bounds{{0.0, 1.0}}, 5, std::uint64_t{7});
    const auto& points = std::get<ContinuousPoints>(result.points);

    // First block: eight candidate coordinates, then eight thresholds.
    std::mt19937_64 rng(7);
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    REQUIRE(points.rows() == 5);
    for (std::size_t i = 0; i < 5; ++i) {
        CHECK(points(i, 0) == unif(rng));
    }
    CHECK(result.report.blocks == 1);
    CHECK(result.report.accepted == 8);
}

TEST_CASE("uniform density passes Kolmogorov-Smirnov at the one percent level") {
    const auto uniform = spatial::library::uniform_density(1);

    const auto result = make_sampler(1000).sample(*uniform, {}, Bounds{{0.0, 1.0}}, 10000, std::uint64_t{42});
    const auto& points = std::get<ContinuousPoints>(result.points);
    const auto ks = spatial::diagnostics::ks_uniform(points.column(0), 0.0, 1.0);

    CHECK(ks.samples == 10000);
    CHECK(ks.p_value > 0.01);
}

TEST_CASE("unit blocksize draws from the same distribution") {
    const auto uniform = spatial::library::uniform_density(1);

    const auto result = make_sampler(1).sample(*uniform, {}, Bounds{{2.0, 4.0}}, 2000, std::uint64_t{5});
    const auto& points = std::get<ContinuousPoints>(result.points);
    const auto ks = spatial::diagnostics::ks_uniform(points.column(0), 2.0, 4.0);

    CHECK(ks.p_value > 0.01);
    CHECK(result.report.blocks == 2000);
    CHECK(result.report.accepted == 2000);
}

TEST_CASE("single point request yields a one row matrix") {
    const auto gaussian = spatial::library::gaussian_density(3);
    const Bounds bounds{{0.0, 1.0}, {0.0, 1.0}, {0.0, 1.0}};

    const auto result = make_sampler(1000).sample(*gaussian, {{"sigma", 1.0}, {"center", 0.5}}, bounds, 1,
                                                  std::uint64_t{3});
    const auto& points = std::get<ContinuousPoints>(result.points);
    CHECK(points.rows() == 1);
    CHECK(points.cols() == 3);
}

TEST_CASE("same seed reproduces the sample and the external generator advances") {
    const auto gaussian = spatial::library::gaussian_density(2);
    const DensityKwargs kwargs{{"sigma", 0.3}};
    const Bounds bounds{{-1.0, 1.0}, {-1.0, 1.0}};
    const ThinningSampler sampler = make_sampler(100);

    const auto first = sampler.sample(*gaussian, kwargs, bounds, 200, std::uint64_t{11});
    const auto second = sampler.sample(*gaussian, kwargs, bounds, 200, std::uint64_t{11});
    const auto other = sampler.sample(*gaussian, kwargs, bounds, 200, std::uint64_t{12});
    CHECK(first.points == second.points);
    CHECK_FALSE(first.points == other.points);

    std::mt19937_64 rng(11);
    const auto a = sampler.sample(*gaussian, kwargs, bounds, 200, rng);
    const auto b = sampler.sample(*gaussian, kwargs, bounds, 200, rng);
    CHECK(a.points == first.points);
    CHECK_FALSE(a.points == b.points);
}

TEST_CASE("grid with a single positive cell always yields that cell") {
    const DiscreteDensity density(WeightGrid{1.0, 0.0, 0.0, 0.0});

    const auto result = make_sampler(64).sample(density, {}, Bounds{{0.0, 4.0}}, 500, std::uint64_t{1});
    const auto& points = std::get<LatticePoints>(result.points);
    REQUIRE(points.rows() == 500);
    REQUIRE(points.cols() == 1);
    for (std::size_t i = 0; i < points.rows(); ++i) {
        CHECK(points(i, 0) == 0);
    }
    CHECK(result.report.lmax == Catch::Detail::Approx(1.0));
}

TEST_CASE("grid samples follow the weights") {
    const WeightGrid grid(std::vector<std::vector<double>>{{1.0, 2.0, 0.0}, {4.0, 1.0, 8.0}});
    const DiscreteDensity density(grid);

    const auto result = make_sampler(1000).sample(density, {}, Bounds{{0.0, 2.0}, {0.0, 3.0}}, 20000,
                                                  std::uint64_t{17});
    const auto& points = std::get<LatticePoints>(result.points);
    CHECK(result.report.lmax == Catch::Detail::Approx(8.0));
    CHECK(spatial::diagnostics::all_within(points, grid));

    const auto cells = spatial::diagnostics::chi_square_cells(points, grid);
    CHECK(cells.zero_weight_hits == 0);
    CHECK(cells.degrees_of_freedom == 4);
    CHECK(cells.p_value > 0.001);
}

TEST_CASE("grid candidates ignore the interval values of the bounds") {
    const DiscreteDensity density(WeightGrid{1.0, 1.0, 1.0});

    const auto result = make_sampler(16).sample(density, {}, Bounds{{-10.0, 10.0}}, 300, std::uint64_t{2});
    const auto& points = std::get<LatticePoints>(result.points);
    CHECK(spatial::diagnostics::all_within(points, density.weights()));
}

TEST_CASE("zero density raises DegenerateDensity") {
    const ContinuousDensity zero([](const std::vector<double>&, const DensityKwargs&) { return 0.0; }, 2);
    try {
        (void)make_sampler(10).sample(zero, {}, Bounds{{0.0, 1.0}, {0.0, 1.0}}, 10, std::uint64_t{1});
        FAIL("expected DegenerateDensity");
    } catch (const spatial::DegenerateDensity& ex) {
        CHECK(ex.lmax() == 0.0);
    }

    const DiscreteDensity empty_grid(WeightGrid{0.0, 0.0, 0.0});
    CHECK_THROWS_AS(make_sampler(10).sample(empty_grid, {}, Bounds{{0.0, 3.0}}, 10, std::uint64_t{1}),
                    spatial::DegenerateDensity);
}

TEST_CASE("arguments are validated before sampling") {
    const auto gaussian = spatial::library::gaussian_density(2);
    const ThinningSampler sampler = make_sampler(10);

    CHECK_THROWS_AS(sampler.sample(*gaussian, {{"sigma", 1.0}}, Bounds{{0.0, 1.0}}, 10, std::uint64_t{1}),
                    spatial::ShapeMismatch);
    CHECK_THROWS_AS(sampler.sample(*gaussian, {}, Bounds{{0.0, 1.0}, {0.0, 1.0}}, 10, std::uint64_t{1}),
                    spatial::InvalidDensityKwargs);
    CHECK_THROWS_AS(sampler.sample(*gaussian, {{"sigma", 1.0}}, Bounds{{0.0, 1.0}, {0.0, 1.0}}, 0, std::uint64_t{1}),
                    std::invalid_argument);

    const DiscreteDensity grid(WeightGrid{1.0, 2.0});
    CHECK_THROWS_AS(sampler.sample(grid, {}, Bounds{{0.0, 2.0}, {0.0, 1.0}}, 10, std::uint64_t{1}),
                    spatial::ShapeMismatch);
}

TEST_CASE("exhausted block budget raises SamplingBudgetExceeded") {
    const auto uniform = spatial::library::uniform_density(1);
    try {
        (void)make_sampler(1, 3).sample(*uniform, {}, Bounds{{0.0, 1.0}}, 1000, std::uint64_t{1});
        FAIL("expected SamplingBudgetExceeded");
    } catch (const spatial::SamplingBudgetExceeded& ex) {
        CHECK(ex.accepted() == 3);
        CHECK(ex.target() == 1000);
        CHECK(ex.blocks() == 3);
        CHECK(ex.lmax() == Catch::Detail::Approx(1.0));
    }
}

TEST_CASE("requested stop raises SamplingCancelled") {
    const auto uniform = spatial::library::uniform_density(2);
    std::stop_source source;
    source.request_stop();
    try {
        (void)make_sampler(10).sample(*uniform, {}, Bounds{{0.0, 1.0}, {0.0, 1.0}}, 50, std::uint64_t{1},
                                      source.get_token());
        FAIL("expected SamplingCancelled");
    } catch (const spatial::SamplingCancelled& ex) {
        CHECK(ex.accepted() == 0);
        CHECK(ex.target() == 50);
        CHECK(ex.blocks() == 0);
    }
}

TEST_CASE("underestimated envelope is counted as violations") {
    // The midpoint start settles on the minor peak and misses the major one.
    const ContinuousDensity bimodal(
        [](const std::vector<double>& x, const DensityKwargs&) {
            const double a = (x[0] - 0.5) / 0.05;
            const double b = (x[0] - 0.85) / 0.1;
            return 0.5 * std::exp(-0.5 * a * a) + std::exp(-0.5 * b * b);
        },
        1);

    const auto result = make_sampler(500).sample(bimodal, {}, Bounds{{0.0, 1.0}}, 200, std::uint64_t{4});
    CHECK(result.report.lmax < 0.6);
    CHECK(result.report.envelope_violations > 0);
    CHECK(std::get<ContinuousPoints>(result.points).rows() == 200);
}
