#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef double (*SpatialDensityCallback)(const double* point, size_t dimension, void* ctx);

/* Both samplers return the number of points written, or (size_t)-1 on failure
   with the reason available from spatial_last_error(). Zero blocksize or
   max_blocks selects the library default. Release buffers with spatial_free. */
size_t spatial_sample_function(SpatialDensityCallback density, void* density_ctx,
                               size_t dimension, const double* lows, const double* highs,
                               size_t n, size_t blocksize, size_t max_blocks,
                               uint64_t seed, double** points_out);

size_t spatial_sample_grid(const double* weights, const size_t* shape, size_t rank,
                           size_t n, size_t blocksize, size_t max_blocks,
                           uint64_t seed, int64_t** indices_out);

void spatial_free(void* ptr);

const char* spatial_last_error(void);

#ifdef __cplusplus
}
#endif
