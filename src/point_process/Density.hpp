#pragma once

#include "point_process/Bounds.hpp"
#include "point_process/Envelope.hpp"
#include "point_process/Points.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace spatial {

using DensityKwargs = std::map<std::string, double>;

// Checks keys are non-empty and values finite.
void validate_density_kwargs(const DensityKwargs& kwargs);

class DensityModel {
public:
    virtual ~DensityModel() = default;

    [[nodiscard]] virtual std::size_t dimension() const noexcept = 0;
    [[nodiscard]] virtual bool is_continuous() const noexcept = 0;

    // Vectorized evaluation; `out` is resized to block.size().
    virtual void evaluate(const CandidateBlock& block, const DensityKwargs& kwargs, std::vector<double>& out) const = 0;
    [[nodiscard]] virtual double evaluate_single(const std::vector<double>& point, const DensityKwargs& kwargs) const = 0;

    // Box candidates are drawn from.
    [[nodiscard]] virtual Bounds sampling_region(const Bounds& bounds) const = 0;

    [[nodiscard]] virtual envelope::EnvelopeEstimate envelope(
        const Bounds& bounds,
        const DensityKwargs& kwargs,
        const envelope::EnvelopeSearchConfig& config) const = 0;

    virtual void validate_kwargs(const DensityKwargs& kwargs) const;

    [[nodiscard]] virtual std::string describe() const = 0;
};

class ContinuousDensity final : public DensityModel {
public:
    using PointFn = std::function<double(const std::vector<double>&, const DensityKwargs&)>;
    using BlockFn = std::function<void(const CandidateBlock&, const DensityKwargs&, std::vector<double>&)>;

    ContinuousDensity(PointFn fn, std::size_t arity, std::vector<std::string> required_kwargs = {});
    ContinuousDensity(PointFn fn, BlockFn block_fn, std::size_t arity, std::vector<std::string> required_kwargs = {});

    [[nodiscard]] std::size_t dimension() const noexcept override;
    [[nodiscard]] bool is_continuous() const noexcept override;
    void evaluate(const CandidateBlock& block, const DensityKwargs& kwargs, std::vector<double>& out) const override;
    [[nodiscard]] double evaluate_single(const std::vector<double>& point, const DensityKwargs& kwargs) const override;
    [[nodiscard]] Bounds sampling_region(const Bounds& bounds) const override;
    [[nodiscard]] envelope::EnvelopeEstimate envelope(
        const Bounds& bounds,
        const DensityKwargs& kwargs,
        const envelope::EnvelopeSearchConfig& config) const override;
    void validate_kwargs(const DensityKwargs& kwargs) const override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::vector<std::string>& required_kwargs() const noexcept;

private:
    PointFn fn_;
    BlockFn block_fn_;
    std::size_t arity_;
    std::vector<std::string> required_kwargs_;
};

// Row-major d-dimensional array of nonnegative weights.
class WeightGrid {
public:
    WeightGrid(std::vector<std::size_t> shape, std::vector<double> values);
    WeightGrid(std::initializer_list<double> values);
    explicit WeightGrid(const std::vector<std::vector<double>>& rows);

    [[nodiscard]] std::size_t rank() const noexcept;
    [[nodiscard]] const std::vector<std::size_t>& shape() const noexcept;
    [[nodiscard]] const std::vector<double>& values() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] std::size_t flat_index(const std::vector<std::size_t>& index) const;
    [[nodiscard]] std::vector<std::size_t> unravel(std::size_t flat) const;
    [[nodiscard]] double at(const std::vector<std::size_t>& index) const;
    [[nodiscard]] double max_value() const noexcept;
    [[nodiscard]] std::size_t argmax() const noexcept;
    [[nodiscard]] double total() const noexcept;

private:
    void validate();

    std::vector<std::size_t> shape_;
    std::vector<std::size_t> strides_;
    std::vector<double> values_;
};

class DiscreteDensity final : public DensityModel {
public:
    explicit DiscreteDensity(WeightGrid weights);

    [[nodiscard]] std::size_t dimension() const noexcept override;
    [[nodiscard]] bool is_continuous() const noexcept override;
    void evaluate(const CandidateBlock& block, const DensityKwargs& kwargs, std::vector<double>& out) const override;
    [[nodiscard]] double evaluate_single(const std::vector<double>& point, const DensityKwargs& kwargs) const override;
    [[nodiscard]] Bounds sampling_region(const Bounds& bounds) const override;
    [[nodiscard]] envelope::EnvelopeEstimate envelope(
        const Bounds& bounds,
        const DensityKwargs& kwargs,
        const envelope::EnvelopeSearchConfig& config) const override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const WeightGrid& weights() const noexcept;

private:
    [[nodiscard]] std::size_t cell_of(const std::vector<double>& point) const;

    WeightGrid weights_;
};

[[nodiscard]] std::shared_ptr<const DensityModel> make_continuous_density(
    ContinuousDensity::PointFn fn,
    std::size_t arity,
    std::vector<std::string> required_kwargs = {});

[[nodiscard]] std::shared_ptr<const DensityModel> make_discrete_density(WeightGrid weights);

} // namespace spatial
