#include "point_process/Errors.hpp"

#include <sstream>
#include <utility>

namespace spatial {

namespace {

std::string describe_missing(bool n_missing, bool bounds_missing) {
    std::ostringstream oss;
    oss << "sample requires both n and bounds; missing:";
    if (n_missing) {
        oss << " n";
    }
    if (bounds_missing) {
        oss << " bounds";
    }
    return oss.str();
}

std::string describe_shape(std::size_t expected, std::size_t actual, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": expected " << expected << " dimension(s), got " << actual;
    return oss.str();
}

std::string describe_degenerate(double lmax) {
    std::ostringstream oss;
    oss << "density maximum over the sampling region is " << lmax
        << "; no candidate can ever be accepted";
    return oss.str();
}

std::string describe_budget(std::size_t accepted, std::size_t target, std::size_t blocks, double lmax) {
    std::ostringstream oss;
    oss << "sampling budget of " << blocks << " block(s) exhausted with "
        << accepted << '/' << target << " points accepted (lmax=" << lmax << ')';
    return oss.str();
}

std::string describe_cancelled(std::size_t accepted, std::size_t target, std::size_t blocks) {
    std::ostringstream oss;
    oss << "sampling cancelled after " << blocks << " block(s) with "
        << accepted << '/' << target << " points accepted";
    return oss.str();
}

} // namespace

InvalidDensity::InvalidDensity(const std::string& reason)
    : std::invalid_argument("invalid density: " + reason) {}

InvalidDensityKwargs::InvalidDensityKwargs(std::string key, const std::string& reason)
    : std::invalid_argument("invalid density kwarg '" + key + "': " + reason),
      key_(std::move(key)) {}

const std::string& InvalidDensityKwargs::key() const noexcept {
    return key_;
}

MissingArguments::MissingArguments(bool n_missing, bool bounds_missing)
    : std::invalid_argument(describe_missing(n_missing, bounds_missing)),
      n_missing_(n_missing),
      bounds_missing_(bounds_missing) {}

bool MissingArguments::n_missing() const noexcept {
    return n_missing_;
}

bool MissingArguments::bounds_missing() const noexcept {
    return bounds_missing_;
}

UnsupportedAlgorithm::UnsupportedAlgorithm(std::string algorithm)
    : std::invalid_argument("unsupported sampling algorithm '" + algorithm + "' (supported: thinning)"),
      algorithm_(std::move(algorithm)) {}

const std::string& UnsupportedAlgorithm::algorithm() const noexcept {
    return algorithm_;
}

ShapeMismatch::ShapeMismatch(std::size_t expected, std::size_t actual, const std::string& context)
    : std::invalid_argument(describe_shape(expected, actual, context)),
      expected_(expected),
      actual_(actual) {}

std::size_t ShapeMismatch::expected() const noexcept {
    return expected_;
}

std::size_t ShapeMismatch::actual() const noexcept {
    return actual_;
}

DegenerateDensity::DegenerateDensity(double lmax)
    : std::runtime_error(describe_degenerate(lmax)), lmax_(lmax) {}

double DegenerateDensity::lmax() const noexcept {
    return lmax_;
}

SamplingBudgetExceeded::SamplingBudgetExceeded(std::size_t accepted, std::size_t target, std::size_t blocks, double lmax)
    : std::runtime_error(describe_budget(accepted, target, blocks, lmax)),
      accepted_(accepted),
      target_(target),
      blocks_(blocks),
      lmax_(lmax) {}

std::size_t SamplingBudgetExceeded::accepted() const noexcept {
    return accepted_;
}

std::size_t SamplingBudgetExceeded::target() const noexcept {
    return target_;
}

std::size_t SamplingBudgetExceeded::blocks() const noexcept {
    return blocks_;
}

double SamplingBudgetExceeded::lmax() const noexcept {
    return lmax_;
}

SamplingCancelled::SamplingCancelled(std::size_t accepted, std::size_t target, std::size_t blocks)
    : std::runtime_error(describe_cancelled(accepted, target, blocks)),
      accepted_(accepted),
      target_(target),
      blocks_(blocks) {}

std::size_t SamplingCancelled::accepted() const noexcept {
    return accepted_;
}

std::size_t SamplingCancelled::target() const noexcept {
    return target_;
}

std::size_t SamplingCancelled::blocks() const noexcept {
    return blocks_;
}

} // namespace spatial
