#include "spatial_c_api.h"

#include "point_process/Density.hpp"
#include "point_process/ThinningSampler.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include "error.hpp"

namespace {

thread_local std::string g_last_error;

template <typename T>
std::size_t copy_matrix(const spatial::PointMatrix<T>& points, T** out) {
    const std::size_t count = points.rows() * points.cols();
    T* buffer = nullptr;
    if (count > 0) {
        buffer = static_cast<T*>(std::malloc(count * sizeof(T)));
        if (!buffer) {
            SPATIAL_THROW(std::bad_alloc());
        }
        std::memcpy(buffer, points.data().data(), count * sizeof(T));
    }
    *out = buffer;
    return points.rows();
}

template <typename T>
std::size_t handle_failure(T** out, const std::string& message) {
    g_last_error = message;
    if (out) {
        *out = nullptr;
    }
    return static_cast<std::size_t>(-1);
}

spatial::ThinningConfig make_config(std::size_t blocksize, std::size_t max_blocks) {
    spatial::ThinningConfig config;
    if (blocksize > 0) {
        config.blocksize = blocksize;
    }
    if (max_blocks > 0) {
        config.max_blocks = max_blocks;
    }
    return config;
}

}  // namespace

extern "C" {

// Samples n points from a callback density over the box [lows[i], highs[i]].
// On success *points_out holds n * dimension doubles, row-major, and n is returned.
std::size_t spatial_sample_function(SpatialDensityCallback density, void* density_ctx,
                                    std::size_t dimension, const double* lows, const double* highs,
                                    std::size_t n, std::size_t blocksize, std::size_t max_blocks,
                                    std::uint64_t seed, double** points_out) {
    if (!points_out) {
        return handle_failure(points_out, "null output pointer");
    }
    if (!density) {
        return handle_failure(points_out, "null density callback");
    }
    if (dimension == 0 || !lows || !highs) {
        return handle_failure(points_out, "bounds require dimension >= 1 and non-null arrays");
    }

    g_last_error.clear();
    try {
        spatial::Bounds bounds;
        for (std::size_t i = 0; i < dimension; ++i) {
            bounds.add(lows[i], highs[i]);
        }
        spatial::ContinuousDensity model(
            [density, density_ctx](const std::vector<double>& x, const spatial::DensityKwargs&) {
                return density(x.data(), x.size(), density_ctx);
            },
            dimension);
        const spatial::ThinningSampler sampler(make_config(blocksize, max_blocks));
        const auto result = sampler.sample(model, {}, bounds, n, seed);
        return copy_matrix(std::get<spatial::ContinuousPoints>(result.points), points_out);
    } catch (const std::exception& ex) {
        return handle_failure(points_out, ex.what());
    }
}

// Samples n index tuples from a row-major weight grid of the given shape.
// On success *indices_out holds n * rank int64 values, row-major.
std::size_t spatial_sample_grid(const double* weights, const std::size_t* shape, std::size_t rank,
                                std::size_t n, std::size_t blocksize, std::size_t max_blocks,
                                std::uint64_t seed, std::int64_t** indices_out) {
    if (!indices_out) {
        return handle_failure(indices_out, "null output pointer");
    }
    if (!weights || !shape || rank == 0) {
        return handle_failure(indices_out, "weight grid requires data, a shape and rank >= 1");
    }

    g_last_error.clear();
    try {
        std::vector<std::size_t> dims(shape, shape + rank);
        std::size_t cells = 1;
        for (std::size_t extent : dims) {
            cells *= extent;
        }
        std::vector<double> values(weights, weights + cells);
        spatial::DiscreteDensity model(spatial::WeightGrid(dims, std::move(values)));

        const spatial::ThinningSampler sampler(make_config(blocksize, max_blocks));
        const auto result = sampler.sample(model, {}, model.sampling_region({}), n, seed);
        return copy_matrix(std::get<spatial::LatticePoints>(result.points), indices_out);
    } catch (const std::exception& ex) {
        return handle_failure(indices_out, ex.what());
    }
}

void spatial_free(void* ptr) {
    std::free(ptr);
}

const char* spatial_last_error() {
    return g_last_error.empty() ? nullptr : g_last_error.c_str();
}

}  // extern "C"
