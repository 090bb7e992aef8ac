#include <iostream>

#include "point_process/DensityLibrary.hpp"
#include "point_process/SpatialPointProcess.hpp"

int main() {
    using namespace spatial;

    const SpatialPointProcess process(library::gaussian_density(2), DensityKwargs{{"sigma", 0.25}});

    SampleRequest request;
    request.n = 5000;
    request.bounds = Bounds{{-1.0, 1.0}, {-1.0, 1.0}};
    const SampleResult result = process.sample(request);

    const auto& points = std::get<ContinuousPoints>(result.points);
    double mean_x = 0.0;
    double mean_y = 0.0;
    for (std::size_t i = 0; i < points.rows(); ++i) {
        mean_x += points(i, 0);
        mean_y += points(i, 1);
    }
    mean_x /= static_cast<double>(points.rows());
    mean_y /= static_cast<double>(points.rows());

    std::cout << "Thinning sample complete\n";
    std::cout << "Process          : " << process << '\n';
    std::cout << "Bounds           : " << request.bounds.to_string() << '\n';
    std::cout << "Points accepted  : " << points.rows() << '\n';
    std::cout << "Envelope lmax    : " << result.report.lmax << '\n';
    std::cout << "Blocks drawn     : " << result.report.blocks << '\n';
    std::cout << "Candidates       : " << result.report.candidates << '\n';
    std::cout << "Acceptance rate  : " << result.report.acceptance_rate() << '\n';
    std::cout << "Sample mean      : (" << mean_x << ", " << mean_y << ")\n";
    std::cout << "Elapsed          : " << result.report.elapsed_microseconds << " us\n";
    return 0;
}
