#include "point_process/Bounds.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "error.hpp"

namespace spatial {

namespace {

void check_interval(double low, double high, std::size_t dim) {
    if (!std::isfinite(low) || !std::isfinite(high)) {
        std::ostringstream oss;
        oss << "bounds for dimension " << dim << " must be finite";
        SPATIAL_THROW(std::invalid_argument(oss.str()));
    }
    if (!(low < high)) {
        std::ostringstream oss;
        oss << "bounds for dimension " << dim << " require low < high, got ("
            << low << ", " << high << ')';
        SPATIAL_THROW(std::invalid_argument(oss.str()));
    }
}

double parse_number(std::string_view token, std::string_view whole) {
    const std::string text(token);
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        SPATIAL_THROW(std::invalid_argument("malformed bounds '" + std::string(whole) + "'"));
    }
    if (consumed != text.size()) {
        SPATIAL_THROW(std::invalid_argument("malformed bounds '" + std::string(whole) + "'"));
    }
    return value;
}

} // namespace

Bounds::Bounds(std::initializer_list<std::pair<double, double>> pairs) {
    intervals_.reserve(pairs.size());
    for (const auto& [low, high] : pairs) {
        add(low, high);
    }
}

Bounds::Bounds(Container intervals) {
    for (std::size_t i = 0; i < intervals.size(); ++i) {
        check_interval(intervals[i].low, intervals[i].high, i);
    }
    intervals_ = std::move(intervals);
}

void Bounds::add(double low, double high) {
    check_interval(low, high, intervals_.size());
    intervals_.push_back(Interval{low, high});
}

std::size_t Bounds::dimension() const noexcept {
    return intervals_.size();
}

bool Bounds::empty() const noexcept {
    return intervals_.empty();
}

const Interval& Bounds::operator[](std::size_t i) const {
    return intervals_.at(i);
}

const Bounds::Container& Bounds::intervals() const noexcept {
    return intervals_;
}

Bounds::const_iterator Bounds::begin() const noexcept {
    return intervals_.begin();
}

Bounds::const_iterator Bounds::end() const noexcept {
    return intervals_.end();
}

std::vector<double> Bounds::midpoint() const {
    std::vector<double> mid;
    mid.reserve(intervals_.size());
    for (const auto& interval : intervals_) {
        mid.push_back(interval.midpoint());
    }
    return mid;
}

double Bounds::volume() const noexcept {
    if (intervals_.empty()) {
        return 0.0;
    }
    double v = 1.0;
    for (const auto& interval : intervals_) {
        v *= interval.width();
    }
    return v;
}

bool Bounds::contains(const std::vector<double>& point) const {
    if (point.size() != intervals_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < point.size(); ++i) {
        if (!intervals_[i].contains(point[i])) {
            return false;
        }
    }
    return true;
}

std::vector<double> Bounds::clamp(std::vector<double> point) const {
    const std::size_t n = std::min(point.size(), intervals_.size());
    for (std::size_t i = 0; i < n; ++i) {
        point[i] = std::clamp(point[i], intervals_[i].low, intervals_[i].high);
    }
    return point;
}

std::string Bounds::to_string() const {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < intervals_.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << '(' << intervals_[i].low << ", " << intervals_[i].high << ')';
    }
    oss << ']';
    return oss.str();
}

Bounds Bounds::parse(std::string_view text) {
    Bounds bounds;
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t comma = text.find(',', start);
        const std::string_view pair = text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        const std::size_t colon = pair.find(':');
        if (pair.empty() || colon == std::string_view::npos) {
            SPATIAL_THROW(std::invalid_argument("malformed bounds '" + std::string(text) + "'"));
        }
        const double low = parse_number(pair.substr(0, colon), text);
        const double high = parse_number(pair.substr(colon + 1), text);
        bounds.add(low, high);
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return bounds;
}

} // namespace spatial
