#include <catch2/catch.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "point_process/DensityLibrary.hpp"
#include "point_process/Envelope.hpp"

using spatial::Bounds;
using spatial::envelope::EnvelopeSearchConfig;
using spatial::envelope::maximize_over_bounds;

TEST_CASE("envelope_search_locates_interior_peak") {
    const auto bump = [](const std::vector<double>& x) {
        const double dx = x[0] - 0.3;
        return std::exp(-dx * dx / (2.0 * 0.1 * 0.1));
    };

    const auto estimate = maximize_over_bounds(bump, Bounds{{0.0, 1.0}});
    CHECK(estimate.value == Catch::Detail::Approx(1.0).margin(1e-5));
    REQUIRE(estimate.location.size() == 1);
    CHECK(estimate.location[0] == Catch::Detail::Approx(0.3).margin(1e-2));
    CHECK(estimate.starts == 1);
    CHECK(estimate.evaluations > estimate.iterations);
}

TEST_CASE("envelope_search_stops_on_active_bound") {
    const auto ramp = [](const std::vector<double>& x) { return x[0] + 0.5 * x[1]; };

    const auto estimate = maximize_over_bounds(ramp, Bounds{{0.0, 2.0}, {0.0, 1.0}});
    CHECK(estimate.value == Catch::Detail::Approx(2.5).margin(1e-8));
    CHECK(estimate.location[0] == Catch::Detail::Approx(2.0));
    CHECK(estimate.location[1] == Catch::Detail::Approx(1.0));
    CHECK(estimate.converged);
}

TEST_CASE("envelope_search_leaves_cusp_at_the_midpoint") {
    // Cusp at the origin: central differences cancel there.
    const auto ring = spatial::library::ring_density();
    const spatial::DensityKwargs kwargs{{"radius", 0.5}, {"width", 0.2}};

    const auto estimate = ring->envelope(Bounds{{-1.0, 1.0}, {-1.0, 1.0}}, kwargs, {});
    CHECK(estimate.value == Catch::Detail::Approx(1.0).margin(1e-4));
    CHECK(estimate.starts == 1);
    CHECK(std::hypot(estimate.location[0], estimate.location[1]) == Catch::Detail::Approx(0.5).margin(1e-2));
}

TEST_CASE("envelope_search_leaves_v_shaped_kink") {
    const auto v = [](const std::vector<double>& x) { return std::abs(x[0] - 0.5); };

    const auto estimate = maximize_over_bounds(v, Bounds{{0.0, 1.0}});
    CHECK(estimate.value == Catch::Detail::Approx(0.5));
    REQUIRE(estimate.location.size() == 1);
    CHECK(estimate.location[0] == Catch::Detail::Approx(1.0));
    CHECK(estimate.converged);
}

TEST_CASE("envelope_search_keeps_smooth_local_maximum") {
    // Minor peak at the midpoint, major peak at 0.85.
    const auto bimodal = [](const std::vector<double>& x) {
        const double a = (x[0] - 0.5) / 0.05;
        const double b = (x[0] - 0.85) / 0.1;
        return 0.5 * std::exp(-0.5 * a * a) + std::exp(-0.5 * b * b);
    };
    const Bounds bounds{{0.0, 1.0}};

    const auto single = maximize_over_bounds(bimodal, bounds);
    CHECK(single.value == Catch::Detail::Approx(0.5).margin(1e-2));
    CHECK(single.location[0] == Catch::Detail::Approx(0.5).margin(1e-2));

    EnvelopeSearchConfig config;
    config.restarts = 16;
    const auto multi = maximize_over_bounds(bimodal, bounds, config);
    CHECK(multi.value == Catch::Detail::Approx(1.0).margin(1e-4));
    CHECK(multi.starts == 17);
    CHECK(multi.location[0] == Catch::Detail::Approx(0.85).margin(1e-2));
}

TEST_CASE("envelope_search_rejects_invalid_setup") {
    const auto flat = [](const std::vector<double>&) { return 1.0; };
    CHECK_THROWS_AS(maximize_over_bounds(spatial::envelope::Objective{}, Bounds{{0.0, 1.0}}), std::invalid_argument);
    CHECK_THROWS_AS(maximize_over_bounds(flat, Bounds{}), std::invalid_argument);

    EnvelopeSearchConfig config;
    config.backtracking_shrink = 1.0;
    CHECK_THROWS_AS(maximize_over_bounds(flat, Bounds{{0.0, 1.0}}, config), std::invalid_argument);
}
