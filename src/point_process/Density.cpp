#include "point_process/Density.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <utility>

#include "error.hpp"
#include "point_process/Errors.hpp"

namespace spatial {

void validate_density_kwargs(const DensityKwargs& kwargs) {
    for (const auto& [key, value] : kwargs) {
        if (key.empty()) {
            SPATIAL_THROW(InvalidDensityKwargs(key, "keys must be non-empty"));
        }
        if (!std::isfinite(value)) {
            SPATIAL_THROW(InvalidDensityKwargs(key, "value must be finite"));
        }
    }
}

void DensityModel::validate_kwargs(const DensityKwargs& kwargs) const {
    validate_density_kwargs(kwargs);
}

ContinuousDensity::ContinuousDensity(PointFn fn, std::size_t arity, std::vector<std::string> required_kwargs)
    : ContinuousDensity(std::move(fn), BlockFn{}, arity, std::move(required_kwargs)) {}

ContinuousDensity::ContinuousDensity(PointFn fn, BlockFn block_fn, std::size_t arity,
                                     std::vector<std::string> required_kwargs)
    : fn_(std::move(fn)),
      block_fn_(std::move(block_fn)),
      arity_(arity),
      required_kwargs_(std::move(required_kwargs)) {
    if (!fn_) {
        SPATIAL_THROW(InvalidDensity("continuous density requires a callable"));
    }
    if (arity_ == 0) {
        SPATIAL_THROW(InvalidDensity("continuous density requires arity >= 1"));
    }
    for (const auto& name : required_kwargs_) {
        if (name.empty()) {
            SPATIAL_THROW(InvalidDensity("required kwarg names must be non-empty"));
        }
    }
}

std::size_t ContinuousDensity::dimension() const noexcept {
    return arity_;
}

bool ContinuousDensity::is_continuous() const noexcept {
    return true;
}

void ContinuousDensity::evaluate(const CandidateBlock& block, const DensityKwargs& kwargs,
                                 std::vector<double>& out) const {
    if (block.dimension() != arity_) {
        SPATIAL_THROW(ShapeMismatch(arity_, block.dimension(), "continuous density evaluation"));
    }
    if (block_fn_) {
        out.clear();
        block_fn_(block, kwargs, out);
        if (out.size() != block.size()) {
            SPATIAL_THROW(ShapeMismatch(block.size(), out.size(), "vectorized density output length"));
        }
        return;
    }
    out.resize(block.size());
    std::vector<double> point(arity_);
    for (std::size_t j = 0; j < block.size(); ++j) {
        block.point(j, point);
        out[j] = fn_(point, kwargs);
    }
}

double ContinuousDensity::evaluate_single(const std::vector<double>& point, const DensityKwargs& kwargs) const {
    if (point.size() != arity_) {
        SPATIAL_THROW(ShapeMismatch(arity_, point.size(), "continuous density evaluation"));
    }
    return fn_(point, kwargs);
}

Bounds ContinuousDensity::sampling_region(const Bounds& bounds) const {
    if (bounds.dimension() != arity_) {
        SPATIAL_THROW(ShapeMismatch(arity_, bounds.dimension(), "bounds for continuous density"));
    }
    return bounds;
}

envelope::EnvelopeEstimate ContinuousDensity::envelope(
    const Bounds& bounds,
    const DensityKwargs& kwargs,
    const envelope::EnvelopeSearchConfig& config) const {
    if (bounds.dimension() != arity_) {
        SPATIAL_THROW(ShapeMismatch(arity_, bounds.dimension(), "bounds for continuous density"));
    }
    const envelope::Objective objective = [this, &kwargs](const std::vector<double>& x) {
        return fn_(x, kwargs);
    };
    return envelope::maximize_over_bounds(objective, bounds, config);
}

void ContinuousDensity::validate_kwargs(const DensityKwargs& kwargs) const {
    validate_density_kwargs(kwargs);
    for (const auto& name : required_kwargs_) {
        if (kwargs.find(name) == kwargs.end()) {
            SPATIAL_THROW(InvalidDensityKwargs(name, "required by the density but not supplied"));
        }
    }
}

std::string ContinuousDensity::describe() const {
    std::ostringstream oss;
    oss << "continuous density (arity " << arity_;
    if (!required_kwargs_.empty()) {
        oss << ", requires";
        for (const auto& name : required_kwargs_) {
            oss << ' ' << name;
        }
    }
    if (block_fn_) {
        oss << ", vectorized";
    }
    oss << ')';
    return oss.str();
}

const std::vector<std::string>& ContinuousDensity::required_kwargs() const noexcept {
    return required_kwargs_;
}

WeightGrid::WeightGrid(std::vector<std::size_t> shape, std::vector<double> values)
    : shape_(std::move(shape)), values_(std::move(values)) {
    validate();
}

WeightGrid::WeightGrid(std::initializer_list<double> values)
    : shape_{values.size()}, values_(values) {
    validate();
}

WeightGrid::WeightGrid(const std::vector<std::vector<double>>& rows) {
    const std::size_t cols = rows.empty() ? 0 : rows.front().size();
    shape_ = {rows.size(), cols};
    values_.reserve(rows.size() * cols);
    for (const auto& row : rows) {
        if (row.size() != cols) {
            SPATIAL_THROW(InvalidDensity("weight grid rows must all have the same length"));
        }
        values_.insert(values_.end(), row.begin(), row.end());
    }
    validate();
}

void WeightGrid::validate() {
    if (shape_.empty()) {
        SPATIAL_THROW(InvalidDensity("weight grid requires at least one dimension"));
    }
    std::size_t expected = 1;
    for (std::size_t i = 0; i < shape_.size(); ++i) {
        if (shape_[i] == 0) {
            std::ostringstream oss;
            oss << "weight grid extent along axis " << i << " is zero";
            SPATIAL_THROW(InvalidDensity(oss.str()));
        }
        expected *= shape_[i];
    }
    if (expected != values_.size()) {
        std::ostringstream oss;
        oss << "weight grid shape holds " << expected << " cells but " << values_.size() << " values were given";
        SPATIAL_THROW(InvalidDensity(oss.str()));
    }
    for (std::size_t i = 0; i < values_.size(); ++i) {
        if (!std::isfinite(values_[i]) || values_[i] < 0.0) {
            std::ostringstream oss;
            oss << "weight at flat index " << i << " is " << values_[i] << "; weights must be finite and >= 0";
            SPATIAL_THROW(InvalidDensity(oss.str()));
        }
    }
    strides_.assign(shape_.size(), 1);
    for (std::size_t i = shape_.size() - 1; i > 0; --i) {
        strides_[i - 1] = strides_[i] * shape_[i];
    }
}

std::size_t WeightGrid::rank() const noexcept {
    return shape_.size();
}

const std::vector<std::size_t>& WeightGrid::shape() const noexcept {
    return shape_;
}

const std::vector<double>& WeightGrid::values() const noexcept {
    return values_;
}

std::size_t WeightGrid::size() const noexcept {
    return values_.size();
}

std::size_t WeightGrid::flat_index(const std::vector<std::size_t>& index) const {
    if (index.size() != shape_.size()) {
        SPATIAL_THROW(ShapeMismatch(shape_.size(), index.size(), "weight grid index"));
    }
    std::size_t flat = 0;
    for (std::size_t i = 0; i < index.size(); ++i) {
        if (index[i] >= shape_[i]) {
            SPATIAL_THROW(std::out_of_range("weight grid index out of range"));
        }
        flat += index[i] * strides_[i];
    }
    return flat;
}

std::vector<std::size_t> WeightGrid::unravel(std::size_t flat) const {
    std::vector<std::size_t> index(shape_.size());
    for (std::size_t i = 0; i < shape_.size(); ++i) {
        index[i] = flat / strides_[i];
        flat %= strides_[i];
    }
    return index;
}

double WeightGrid::at(const std::vector<std::size_t>& index) const {
    return values_[flat_index(index)];
}

double WeightGrid::max_value() const noexcept {
    return *std::max_element(values_.begin(), values_.end());
}

std::size_t WeightGrid::argmax() const noexcept {
    return static_cast<std::size_t>(std::distance(values_.begin(), std::max_element(values_.begin(), values_.end())));
}

double WeightGrid::total() const noexcept {
    return std::accumulate(values_.begin(), values_.end(), 0.0);
}

DiscreteDensity::DiscreteDensity(WeightGrid weights) : weights_(std::move(weights)) {}

std::size_t DiscreteDensity::dimension() const noexcept {
    return weights_.rank();
}

bool DiscreteDensity::is_continuous() const noexcept {
    return false;
}

void DiscreteDensity::evaluate(const CandidateBlock& block, const DensityKwargs&, std::vector<double>& out) const {
    if (block.dimension() != weights_.rank()) {
        SPATIAL_THROW(ShapeMismatch(weights_.rank(), block.dimension(), "discrete density evaluation"));
    }
    out.resize(block.size());
    std::vector<double> point(weights_.rank());
    for (std::size_t j = 0; j < block.size(); ++j) {
        block.point(j, point);
        const std::size_t cell = cell_of(point);
        out[j] = cell < weights_.size() ? weights_.values()[cell] : 0.0;
    }
}

double DiscreteDensity::evaluate_single(const std::vector<double>& point, const DensityKwargs&) const {
    if (point.size() != weights_.rank()) {
        SPATIAL_THROW(ShapeMismatch(weights_.rank(), point.size(), "discrete density evaluation"));
    }
    const std::size_t cell = cell_of(point);
    return cell < weights_.size() ? weights_.values()[cell] : 0.0;
}

Bounds DiscreteDensity::sampling_region(const Bounds&) const {
    Bounds region;
    for (std::size_t extent : weights_.shape()) {
        region.add(0.0, static_cast<double>(extent));
    }
    return region;
}

envelope::EnvelopeEstimate DiscreteDensity::envelope(
    const Bounds&,
    const DensityKwargs&,
    const envelope::EnvelopeSearchConfig&) const {
    envelope::EnvelopeEstimate estimate;
    estimate.value = weights_.max_value();
    for (std::size_t index : weights_.unravel(weights_.argmax())) {
        estimate.location.push_back(static_cast<double>(index));
    }
    estimate.converged = true;
    return estimate;
}

std::string DiscreteDensity::describe() const {
    std::ostringstream oss;
    oss << "discrete density (shape ";
    for (std::size_t i = 0; i < weights_.rank(); ++i) {
        if (i > 0) {
            oss << 'x';
        }
        oss << weights_.shape()[i];
    }
    oss << ')';
    return oss.str();
}

const WeightGrid& DiscreteDensity::weights() const noexcept {
    return weights_;
}

// Flat cell for an index tuple; size() when the point is off the lattice.
std::size_t DiscreteDensity::cell_of(const std::vector<double>& point) const {
    const auto& shape = weights_.shape();
    std::size_t flat = 0;
    std::size_t stride = 1;
    for (std::size_t i = shape.size(); i-- > 0;) {
        const double coord = point[i];
        if (!(coord >= 0.0) || coord >= static_cast<double>(shape[i]) || coord != std::floor(coord)) {
            return weights_.size();
        }
        flat += static_cast<std::size_t>(coord) * stride;
        stride *= shape[i];
    }
    return flat;
}

std::shared_ptr<const DensityModel> make_continuous_density(
    ContinuousDensity::PointFn fn,
    std::size_t arity,
    std::vector<std::string> required_kwargs) {
    return std::make_shared<ContinuousDensity>(std::move(fn), arity, std::move(required_kwargs));
}

std::shared_ptr<const DensityModel> make_discrete_density(WeightGrid weights) {
    return std::make_shared<DiscreteDensity>(std::move(weights));
}

} // namespace spatial
