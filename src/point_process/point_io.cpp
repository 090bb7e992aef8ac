#include "point_process/PointIO.hpp"
#include "point_process/Errors.hpp"

#include <fstream>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "error.hpp"

namespace spatial::io {

namespace {

template <typename T>
void write_matrix(std::ostream& out, const PointMatrix<T>& points) {
    for (std::size_t j = 0; j < points.cols(); ++j) {
        out << (j == 0 ? "" : ",") << 'x' << j;
    }
    out << '\n';
    for (std::size_t i = 0; i < points.rows(); ++i) {
        for (std::size_t j = 0; j < points.cols(); ++j) {
            if (j > 0) {
                out << ',';
            }
            out << points(i, j);
        }
        out << '\n';
    }
}

std::vector<double> parse_row(const std::string& line, std::size_t line_number) {
    std::vector<double> row;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        std::size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(cell, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        while (consumed < cell.size() && (cell[consumed] == ' ' || cell[consumed] == '\r')) {
            ++consumed;
        }
        if (consumed == 0 || consumed != cell.size()) {
            std::ostringstream oss;
            oss << "weight grid line " << line_number << ": cannot parse '" << cell << "' as a number";
            SPATIAL_THROW(std::invalid_argument(oss.str()));
        }
        row.push_back(value);
    }
    return row;
}

} // namespace

void write_points_csv(std::ostream& out, const PointSet& points) {
    out << std::setprecision(17);
    std::visit([&out](const auto& matrix) { write_matrix(out, matrix); }, points);
}

void write_points_csv(const std::filesystem::path& path, const PointSet& points) {
    std::ofstream out(path);
    if (!out) {
        SPATIAL_THROW(std::runtime_error("Failed to open points CSV for writing: " + path.string()));
    }
    write_points_csv(out, points);
}

WeightGrid read_weight_grid_csv(std::istream& in) {
    std::vector<std::vector<double>> rows;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty() || line == "\r" || line.front() == '#') {
            continue;
        }
        rows.push_back(parse_row(line, line_number));
    }
    if (rows.empty()) {
        SPATIAL_THROW(std::invalid_argument("weight grid CSV contains no rows"));
    }
    if (rows.size() == 1) {
        const std::size_t cols = rows.front().size();
        return WeightGrid({cols}, std::move(rows.front()));
    }
    return WeightGrid(rows);
}

WeightGrid read_weight_grid_csv(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        SPATIAL_THROW(std::runtime_error("Failed to open weight grid CSV: " + path.string()));
    }
    return read_weight_grid_csv(in);
}

std::size_t parse_count(const std::string& key, const std::string& value) {
    // stoull accepts "-1" and wraps it to the largest value.
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos || !std::isdigit(static_cast<unsigned char>(value[first]))) {
        SPATIAL_THROW(std::invalid_argument("argument " + key + " expects an unsigned integer, got '" + value + "'"));
    }
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::out_of_range&) {
        SPATIAL_THROW(std::invalid_argument("argument " + key + " is out of range: '" + value + "'"));
    }
    if (consumed != value.size()) {
        SPATIAL_THROW(std::invalid_argument("argument " + key + " expects an unsigned integer, got '" + value + "'"));
    }
    return static_cast<std::size_t>(parsed);
}

DensityKwargs parse_kwargs(const std::string& text) {
    DensityKwargs kwargs;
    if (text.empty()) {
        return kwargs;
    }
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            SPATIAL_THROW(InvalidDensityKwargs(item, "expected key=value"));
        }
        const std::string key = item.substr(0, eq);
        const std::string value = item.substr(eq + 1);
        std::size_t consumed = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(value, &consumed);
        } catch (const std::logic_error&) {
            SPATIAL_THROW(InvalidDensityKwargs(key, "cannot parse '" + value + "' as a number"));
        }
        if (consumed != value.size()) {
            SPATIAL_THROW(InvalidDensityKwargs(key, "cannot parse '" + value + "' as a number"));
        }
        kwargs[key] = parsed;
    }
    return kwargs;
}

} // namespace spatial::io
