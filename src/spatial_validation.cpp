#include "point_process/Diagnostics.hpp"
#include "point_process/DensityLibrary.hpp"
#include "point_process/PointIO.hpp"
#include "point_process/SpatialPointProcess.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "error.hpp"

namespace {

using spatial::Bounds;
using spatial::DensityKwargs;
using spatial::SampleRequest;
using spatial::SampleResult;
using spatial::SpatialPointProcess;
using spatial::WeightGrid;

enum class Check { Uniformity, CellFrequencies, Containment };

struct Scenario {
    std::string label;
    std::string density; // library name, or "grid"
    Bounds bounds;
    DensityKwargs kwargs;
    std::size_t n;
    std::size_t blocksize;
    std::size_t replicates;
    std::uint64_t seed;
    Check check;
};

struct Options {
    std::string output_dir{"results/validation"};
    std::string scenario_filter{};
    std::size_t replicates_override{0};
};

struct ReplicateRow {
    std::size_t replicate{};
    std::uint64_t seed{};
    std::size_t points{};
    double lmax{};
    std::size_t blocks{};
    double acceptance_rate{};
    std::size_t envelope_violations{};
    double statistic{};
    double p_value{};
    bool within_region{};
};

const WeightGrid& validation_grid() {
    static const WeightGrid grid(std::vector<std::vector<double>>{
        {1.0, 2.0, 3.0, 4.0},
        {0.0, 1.0, 1.0, 0.0},
        {4.0, 0.5, 0.0, 2.0}});
    return grid;
}

std::vector<Scenario> default_scenarios() {
    return {
        {"uniform_1d", "uniform", Bounds{{0.0, 1.0}}, {}, 10000, 1000, 20, 1337, Check::Uniformity},
        {"uniform_1d_unit_block", "uniform", Bounds{{0.0, 1.0}}, {}, 2000, 1, 20, 2337, Check::Uniformity},
        {"grid_3x4", "grid", Bounds{{0.0, 3.0}, {0.0, 4.0}}, {}, 20000, 1000, 20, 3337, Check::CellFrequencies},
        {"gaussian_2d", "gaussian", Bounds{{-1.0, 1.0}, {-1.0, 1.0}}, {{"sigma", 0.3}}, 5000, 1000, 20, 4337,
         Check::Containment},
    };
}

Options parse_arguments(int argc, char** argv) {
    Options opts;
    for (int i = 1; i + 1 < argc; i += 2) {
        const std::string key(argv[i]);
        const std::string value(argv[i + 1]);
        if (key == "--output") {
            opts.output_dir = value;
        } else if (key == "--scenario") {
            opts.scenario_filter = value;
        } else if (key == "--replicates") {
            opts.replicates_override = spatial::io::parse_count(key, value);
        } else {
            std::cerr << "Unknown argument: " << key << '\n';
        }
    }
    return opts;
}

void ensure_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        SPATIAL_THROW(std::runtime_error("Failed to create directory: " + path.string()));
    }
}

SpatialPointProcess make_process(const Scenario& scenario) {
    if (scenario.density == "grid") {
        return SpatialPointProcess(validation_grid());
    }
    return SpatialPointProcess(spatial::library::by_name(scenario.density, scenario.bounds.dimension()),
                               scenario.kwargs);
}

ReplicateRow evaluate_replicate(const Scenario& scenario, const SpatialPointProcess& process,
                                std::size_t replicate, std::uint64_t seed) {
    SampleRequest request;
    request.n = scenario.n;
    request.bounds = scenario.bounds;
    request.blocksize = scenario.blocksize;
    request.max_blocks = 10 * scenario.n + 1000;
    request.seed = seed;
    const SampleResult result = process.sample(request);

    ReplicateRow row;
    row.replicate = replicate;
    row.seed = seed;
    row.points = spatial::point_count(result.points);
    row.lmax = result.report.lmax;
    row.blocks = result.report.blocks;
    row.acceptance_rate = result.report.acceptance_rate();
    row.envelope_violations = result.report.envelope_violations;

    switch (scenario.check) {
        case Check::Uniformity: {
            const auto& points = std::get<spatial::ContinuousPoints>(result.points);
            const auto ks = spatial::diagnostics::ks_uniform(points.column(0), scenario.bounds[0].low,
                                                             scenario.bounds[0].high);
            row.statistic = ks.statistic;
            row.p_value = ks.p_value;
            row.within_region = spatial::diagnostics::all_within(points, scenario.bounds);
            break;
        }
        case Check::CellFrequencies: {
            const auto& points = std::get<spatial::LatticePoints>(result.points);
            const auto cells = spatial::diagnostics::chi_square_cells(points, validation_grid());
            row.statistic = cells.statistic;
            row.p_value = cells.p_value;
            row.within_region = spatial::diagnostics::all_within(points, validation_grid()) &&
                                cells.zero_weight_hits == 0;
            break;
        }
        case Check::Containment: {
            const auto& points = std::get<spatial::ContinuousPoints>(result.points);
            row.within_region = spatial::diagnostics::all_within(points, scenario.bounds);
            break;
        }
    }
    return row;
}

void write_summary_csv(const std::filesystem::path& path, const std::vector<ReplicateRow>& rows) {
    std::ofstream out(path);
    if (!out) {
        SPATIAL_THROW(std::runtime_error("Unable to open summary CSV: " + path.string()));
    }
    out << "replicate,seed,points,lmax,blocks,acceptance_rate,envelope_violations,statistic,p_value,within_region\n";
    out << std::setprecision(10);
    for (const auto& row : rows) {
        out << row.replicate << ','
            << row.seed << ','
            << row.points << ','
            << row.lmax << ','
            << row.blocks << ','
            << row.acceptance_rate << ','
            << row.envelope_violations << ','
            << row.statistic << ','
            << row.p_value << ','
            << (row.within_region ? 1 : 0) << '\n';
    }
}

void write_metadata(const std::filesystem::path& path, const Scenario& scenario, std::size_t replicates) {
    std::ofstream out(path);
    if (!out) {
        SPATIAL_THROW(std::runtime_error("Unable to write metadata: " + path.string()));
    }
    out << "{\n"
        << "  \"label\": \"" << scenario.label << "\",\n"
        << "  \"density\": \"" << scenario.density << "\",\n"
        << "  \"bounds\": \"" << scenario.bounds.to_string() << "\",\n"
        << "  \"n\": " << scenario.n << ",\n"
        << "  \"blocksize\": " << scenario.blocksize << ",\n"
        << "  \"replicates\": " << replicates << ",\n"
        << "  \"seed\": " << scenario.seed << "\n"
        << "}\n";
}

void run_scenario(const Scenario& scenario, const Options& options, const std::filesystem::path& root) {
    const std::size_t replicates =
        options.replicates_override > 0 ? options.replicates_override : scenario.replicates;

    const auto scenario_dir = root / scenario.label;
    ensure_directory(scenario_dir);

    const SpatialPointProcess process = make_process(scenario);

    std::vector<ReplicateRow> rows;
    rows.reserve(replicates);
    std::size_t rejected = 0;
    for (std::size_t i = 0; i < replicates; ++i) {
        const std::uint64_t seed = scenario.seed + static_cast<std::uint64_t>(i);
        rows.push_back(evaluate_replicate(scenario, process, i, seed));
        if (scenario.check != Check::Containment && rows.back().p_value < 0.01) {
            ++rejected;
        }
    }

    write_summary_csv(scenario_dir / "replicates.csv", rows);
    write_metadata(scenario_dir / "metadata.json", scenario, replicates);

    std::ostringstream oss;
    oss << "{\"event\":\"scenario_complete\",\"label\":\"" << scenario.label
        << "\",\"replicates\":" << replicates
        << ",\"rejections_at_1pct\":" << rejected << "}";
    spdlog::info("{}", oss.str());
    std::cout << "Scenario " << scenario.label << ": wrote " << rows.size()
              << " rows to " << (scenario_dir / "replicates.csv") << '\n';
}

} // namespace

int main(int argc, char** argv) {
    try {
        const Options options = parse_arguments(argc, argv);
        const std::filesystem::path output_root(options.output_dir);
        ensure_directory(output_root);

        const auto logger = spdlog::basic_logger_mt("spatial_validation", (output_root / "validation.log").string());
        spdlog::set_default_logger(logger);

        std::vector<Scenario> scenarios = default_scenarios();
        if (!options.scenario_filter.empty()) {
            std::vector<Scenario> filtered;
            for (const auto& scenario : scenarios) {
                if (scenario.label == options.scenario_filter) {
                    filtered.push_back(scenario);
                }
            }
            if (filtered.empty()) {
                std::cerr << "No scenario matched filter: " << options.scenario_filter << '\n';
                return 1;
            }
            scenarios = std::move(filtered);
        }

        for (const auto& scenario : scenarios) {
            run_scenario(scenario, options, output_root);
        }
        logger->flush();
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "spatial_validation error: " << ex.what() << std::endl;
        return 1;
    }
}
