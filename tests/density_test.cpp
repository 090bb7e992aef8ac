#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "point_process/Density.hpp"
#include "point_process/DensityLibrary.hpp"
#include "point_process/Errors.hpp"

namespace {

using spatial::Bounds;
using spatial::CandidateBlock;
using spatial::ContinuousDensity;
using spatial::DensityKwargs;
using spatial::DiscreteDensity;
using spatial::WeightGrid;

CandidateBlock block_of(const std::vector<std::vector<double>>& points) {
    CandidateBlock block(points.front().size(), points.size());
    for (std::size_t j = 0; j < points.size(); ++j) {
        for (std::size_t dim = 0; dim < points[j].size(); ++dim) {
            block.axis(dim)[j] = points[j][dim];
        }
    }
    return block;
}

} // namespace

TEST_CASE("weight grid validates shape and values") {
    CHECK_THROWS_AS(WeightGrid({2, 2}, {1.0, 2.0, 3.0}), spatial::InvalidDensity);
    CHECK_THROWS_AS(WeightGrid({2, 0}, {}), spatial::InvalidDensity);
    CHECK_THROWS_AS((WeightGrid{1.0, -0.5}), spatial::InvalidDensity);
    CHECK_THROWS_AS((WeightGrid{1.0, std::numeric_limits<double>::quiet_NaN()}), spatial::InvalidDensity);
    CHECK_THROWS_AS(WeightGrid(std::vector<std::vector<double>>{{1.0, 2.0}, {3.0}}), spatial::InvalidDensity);
}

TEST_CASE("weight grid indexes row-major") {
    const WeightGrid grid(std::vector<std::vector<double>>{{1.0, 2.0, 3.0}, {4.0, 9.0, 0.0}});

    REQUIRE(grid.rank() == 2);
    CHECK(grid.shape() == std::vector<std::size_t>{2, 3});
    CHECK(grid.flat_index({1, 1}) == 4);
    CHECK(grid.unravel(5) == std::vector<std::size_t>{1, 2});
    CHECK(grid.at({0, 2}) == Catch::Detail::Approx(3.0));
    CHECK(grid.max_value() == Catch::Detail::Approx(9.0));
    CHECK(grid.argmax() == 4);
    CHECK(grid.total() == Catch::Detail::Approx(19.0));

    CHECK_THROWS_AS(grid.flat_index({2, 0}), std::out_of_range);
    CHECK_THROWS_AS(grid.flat_index({0}), spatial::ShapeMismatch);
}

TEST_CASE("discrete density looks up weights by index tuple") {
    const DiscreteDensity density(WeightGrid(std::vector<std::vector<double>>{{1.0, 2.0}, {3.0, 4.0}}));

    CHECK(density.dimension() == 2);
    CHECK_FALSE(density.is_continuous());
    CHECK(density.evaluate_single({1.0, 0.0}, {}) == Catch::Detail::Approx(3.0));
    // Off-lattice and out-of-range indices carry no weight.
    CHECK(density.evaluate_single({0.5, 0.0}, {}) == Catch::Detail::Approx(0.0));
    CHECK(density.evaluate_single({2.0, 0.0}, {}) == Catch::Detail::Approx(0.0));
    CHECK(density.evaluate_single({-1.0, 0.0}, {}) == Catch::Detail::Approx(0.0));

    std::vector<double> out;
    density.evaluate(block_of({{0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}}), {}, out);
    REQUIRE(out.size() == 3);
    CHECK(out[0] == Catch::Detail::Approx(1.0));
    CHECK(out[1] == Catch::Detail::Approx(2.0));
    CHECK(out[2] == Catch::Detail::Approx(4.0));
}

TEST_CASE("discrete envelope is the exact grid maximum") {
    const DiscreteDensity density(WeightGrid{0.5, 7.0, 2.0});

    const auto estimate = density.envelope(Bounds{{0.0, 3.0}}, {}, {});
    CHECK(estimate.value == Catch::Detail::Approx(7.0));
    REQUIRE(estimate.location.size() == 1);
    CHECK(estimate.location[0] == Catch::Detail::Approx(1.0));
    CHECK(estimate.converged);

    const Bounds region = density.sampling_region(Bounds{{5.0, 9.0}});
    REQUIRE(region.dimension() == 1);
    CHECK(region[0].low == Catch::Detail::Approx(0.0));
    CHECK(region[0].high == Catch::Detail::Approx(3.0));
}

TEST_CASE("continuous density rejects missing callables and zero arity") {
    CHECK_THROWS_AS(ContinuousDensity(ContinuousDensity::PointFn{}, 1), spatial::InvalidDensity);
    CHECK_THROWS_AS(ContinuousDensity([](const std::vector<double>&, const DensityKwargs&) { return 1.0; }, 0),
                    spatial::InvalidDensity);
}

TEST_CASE("continuous density evaluates blocks point by point") {
    const ContinuousDensity density(
        [](const std::vector<double>& x, const DensityKwargs& kwargs) { return kwargs.at("scale") * (x[0] + x[1]); },
        2,
        {"scale"});

    const DensityKwargs kwargs{{"scale", 2.0}};
    std::vector<double> out;
    density.evaluate(block_of({{1.0, 2.0}, {0.5, 0.5}}), kwargs, out);
    REQUIRE(out.size() == 2);
    CHECK(out[0] == Catch::Detail::Approx(6.0));
    CHECK(out[1] == Catch::Detail::Approx(2.0));

    CHECK_THROWS_AS(density.evaluate_single({1.0}, kwargs), spatial::ShapeMismatch);
    CHECK_THROWS_AS(density.evaluate(block_of({{1.0, 2.0, 3.0}}), kwargs, out), spatial::ShapeMismatch);
}

TEST_CASE("continuous density checks required kwargs") {
    const ContinuousDensity density(
        [](const std::vector<double>& x, const DensityKwargs& kwargs) { return kwargs.at("rate") * x[0]; }, 1, {"rate"});

    CHECK_NOTHROW(density.validate_kwargs({{"rate", 1.0}}));
    try {
        density.validate_kwargs({{"other", 1.0}});
        FAIL("expected InvalidDensityKwargs");
    } catch (const spatial::InvalidDensityKwargs& ex) {
        CHECK(ex.key() == "rate");
    }
    CHECK_THROWS_AS(density.validate_kwargs({{"rate", std::numeric_limits<double>::infinity()}}),
                    spatial::InvalidDensityKwargs);
    CHECK_THROWS_AS(spatial::validate_density_kwargs({{"", 1.0}}), spatial::InvalidDensityKwargs);
}

TEST_CASE("vectorized density output must match the block length") {
    const ContinuousDensity density(
        [](const std::vector<double>&, const DensityKwargs&) { return 1.0; },
        [](const CandidateBlock&, const DensityKwargs&, std::vector<double>& out) { out.assign(1, 1.0); },
        1);

    std::vector<double> out;
    CHECK_THROWS_AS(density.evaluate(block_of({{0.1}, {0.2}}), {}, out), spatial::ShapeMismatch);
}

TEST_CASE("density library builds the named densities") {
    const auto uniform = spatial::library::by_name("uniform", 3);
    CHECK(uniform->dimension() == 3);
    std::vector<double> out;
    uniform->evaluate(block_of({{0.1, 0.2, 0.3}, {0.4, 0.5, 0.6}}), {}, out);
    CHECK(out == std::vector<double>{1.0, 1.0});

    const auto gaussian = spatial::library::gaussian_density(2);
    CHECK_THROWS_AS(gaussian->validate_kwargs({}), spatial::InvalidDensityKwargs);
    const DensityKwargs kwargs{{"sigma", 0.5}, {"amplitude", 3.0}};
    CHECK(gaussian->evaluate_single({0.0, 0.0}, kwargs) == Catch::Detail::Approx(3.0));
    CHECK(gaussian->evaluate_single({0.5, 0.0}, kwargs) == Catch::Detail::Approx(3.0 * std::exp(-0.5)));

    const auto ring = spatial::library::ring_density();
    CHECK(ring->evaluate_single({0.6, 0.8}, {{"radius", 1.0}, {"width", 0.1}}) == Catch::Detail::Approx(1.0));

    CHECK_THROWS_AS(spatial::library::by_name("ring", 3), spatial::ShapeMismatch);
    CHECK_THROWS_AS(spatial::library::by_name("cauchy", 1), spatial::InvalidDensity);
}
