#include "point_process/Density.hpp"
#include "point_process/DensityLibrary.hpp"
#include "point_process/PointIO.hpp"
#include "point_process/SpatialPointProcess.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "error.hpp"

namespace {

using spatial::Bounds;
using spatial::DensityKwargs;
using spatial::SampleRequest;
using spatial::SampleResult;
using spatial::SpatialPointProcess;

struct Options {
    std::string density{"gaussian"};
    std::size_t dimension{2};
    std::string grid_path{};
    std::size_t n{1000};
    std::string bounds{};
    std::string kwargs{};
    std::string algo{"thinning"};
    std::size_t blocksize{1000};
    std::size_t max_blocks{100000};
    std::size_t restarts{0};
    std::uint64_t seed{42};
    std::string output{"results/points.csv"};
    std::string log_path{"logs/spatial_sample.log"};
    std::string log_level{"info"};
};

Options parse_arguments(int argc, char** argv) {
    Options opts;
    std::unordered_map<std::string, std::string> args;
    for (int i = 1; i + 1 < argc; i += 2) {
        args[argv[i]] = argv[i + 1];
    }
    if (argc > 1 && argc % 2 == 0) {
        SPATIAL_THROW(std::invalid_argument(std::string("missing value for argument ") + argv[argc - 1]));
    }

    for (const auto& [key, value] : args) {
        if (key == "--density") {
            opts.density = value;
        } else if (key == "--dimension") {
            opts.dimension = spatial::io::parse_count(key, value);
        } else if (key == "--grid") {
            opts.grid_path = value;
        } else if (key == "--n") {
            opts.n = spatial::io::parse_count(key, value);
        } else if (key == "--bounds") {
            opts.bounds = value;
        } else if (key == "--kwargs") {
            opts.kwargs = value;
        } else if (key == "--algo") {
            opts.algo = value;
        } else if (key == "--blocksize") {
            opts.blocksize = spatial::io::parse_count(key, value);
        } else if (key == "--max-blocks") {
            opts.max_blocks = spatial::io::parse_count(key, value);
        } else if (key == "--restarts") {
            opts.restarts = spatial::io::parse_count(key, value);
        } else if (key == "--seed") {
            opts.seed = static_cast<std::uint64_t>(spatial::io::parse_count(key, value));
        } else if (key == "--output") {
            opts.output = value;
        } else if (key == "--log") {
            opts.log_path = value;
        } else if (key == "--log-level") {
            opts.log_level = value;
        } else {
            SPATIAL_THROW(std::invalid_argument("unknown argument " + key));
        }
    }
    return opts;
}

void ensure_parent_directory(const std::filesystem::path& path) {
    if (!path.has_parent_path()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        std::ostringstream oss;
        oss << "Failed to create directory " << path.parent_path() << ": " << ec.message();
        SPATIAL_THROW(std::runtime_error(oss.str()));
    }
}

SpatialPointProcess build_process(const Options& opts, Bounds& bounds) {
    const DensityKwargs kwargs = spatial::io::parse_kwargs(opts.kwargs);
    if (opts.density == "grid") {
        if (opts.grid_path.empty()) {
            SPATIAL_THROW(std::invalid_argument("--density grid requires --grid <csv>"));
        }
        auto density = spatial::make_discrete_density(spatial::io::read_weight_grid_csv(opts.grid_path));
        if (bounds.empty()) {
            bounds = density->sampling_region(bounds);
        }
        return SpatialPointProcess(std::move(density), kwargs);
    }
    return SpatialPointProcess(spatial::library::by_name(opts.density, opts.dimension), kwargs);
}

std::string summary_payload(const Options& opts, const SampleResult& result) {
    const auto& report = result.report;
    std::ostringstream oss;
    oss << std::setprecision(10);
    oss << "{\"event\":\"sample_complete\",\"density\":\"" << opts.density
        << "\",\"n\":" << spatial::point_count(result.points)
        << ",\"dimension\":" << spatial::point_dimension(result.points)
        << ",\"lmax\":" << report.lmax
        << ",\"envelope_converged\":" << (report.envelope.converged ? "true" : "false")
        << ",\"blocks\":" << report.blocks
        << ",\"candidates\":" << report.candidates
        << ",\"acceptance_rate\":" << report.acceptance_rate()
        << ",\"envelope_violations\":" << report.envelope_violations
        << ",\"elapsed_us\":" << report.elapsed_microseconds
        << ",\"output\":\"" << opts.output << "\"}";
    return oss.str();
}

} // namespace

int main(int argc, char** argv) {
    try {
        const Options opts = parse_arguments(argc, argv);

        const std::filesystem::path log_path(opts.log_path);
        ensure_parent_directory(log_path);
        const auto logger = spdlog::basic_logger_mt("spatial_sample", log_path.string());
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(opts.log_level));

        Bounds bounds = opts.bounds.empty() ? Bounds{} : Bounds::parse(opts.bounds);
        const SpatialPointProcess process = build_process(opts, bounds);
        spdlog::info("{}", process.to_string());

        SampleRequest request;
        request.n = opts.n;
        request.bounds = bounds;
        request.algo = opts.algo;
        request.blocksize = opts.blocksize;
        request.max_blocks = opts.max_blocks;
        request.seed = opts.seed;
        request.envelope.restarts = opts.restarts;

        const SampleResult result = process.sample(request);

        const std::filesystem::path output(opts.output);
        ensure_parent_directory(output);
        spatial::io::write_points_csv(output, result.points);

        spdlog::info("{}", summary_payload(opts, result));
        logger->flush();

        std::cout << "Sampled " << spatial::point_count(result.points) << " point(s) from "
                  << process.density().describe() << '\n';
        std::cout << "Envelope lmax    : " << result.report.lmax << '\n';
        std::cout << "Acceptance rate  : " << result.report.acceptance_rate() << '\n';
        std::cout << "Points written to: " << output << '\n';
        return 0;
    } catch (const std::exception& ex) {
        spdlog::error("spatial_sample_cli error: {}", ex.what());
        std::cerr << "spatial_sample_cli error: " << ex.what() << std::endl;
        return 1;
    }
}
