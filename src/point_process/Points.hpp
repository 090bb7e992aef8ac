#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"

namespace spatial {

// Row-major n x d matrix; one row per point.
template <typename T>
class PointMatrix {
public:
    using value_type = T;

    PointMatrix() = default;
    PointMatrix(std::size_t rows, std::size_t cols)
        : rows_(rows), cols_(cols), data_(rows * cols) {}
    PointMatrix(std::size_t rows, std::size_t cols, std::vector<T> data)
        : rows_(rows), cols_(cols), data_(std::move(data)) {
        if (data_.size() != rows_ * cols_) {
            SPATIAL_THROW(std::invalid_argument("PointMatrix data size does not match rows * cols"));
        }
    }

    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t cols() const noexcept { return cols_; }
    [[nodiscard]] bool empty() const noexcept { return rows_ == 0; }

    T& operator()(std::size_t row, std::size_t col) noexcept { return data_[row * cols_ + col]; }
    const T& operator()(std::size_t row, std::size_t col) const noexcept { return data_[row * cols_ + col]; }

    [[nodiscard]] std::vector<T> row(std::size_t i) const {
        const auto first = data_.begin() + static_cast<std::ptrdiff_t>(i * cols_);
        return std::vector<T>(first, first + static_cast<std::ptrdiff_t>(cols_));
    }

    [[nodiscard]] std::vector<T> column(std::size_t j) const {
        std::vector<T> out;
        out.reserve(rows_);
        for (std::size_t i = 0; i < rows_; ++i) {
            out.push_back(data_[i * cols_ + j]);
        }
        return out;
    }

    [[nodiscard]] const std::vector<T>& data() const noexcept { return data_; }

    bool operator==(const PointMatrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_ && data_ == other.data_;
    }

private:
    std::size_t rows_{0};
    std::size_t cols_{0};
    std::vector<T> data_;
};

using ContinuousPoints = PointMatrix<double>;
using LatticePoints = PointMatrix<std::int64_t>;

// Continuous densities yield coordinates, discrete densities yield grid indices.
using PointSet = std::variant<ContinuousPoints, LatticePoints>;

[[nodiscard]] inline std::size_t point_count(const PointSet& points) noexcept {
    return std::visit([](const auto& m) { return m.rows(); }, points);
}

[[nodiscard]] inline std::size_t point_dimension(const PointSet& points) noexcept {
    return std::visit([](const auto& m) { return m.cols(); }, points);
}

// Candidates for one iteration, stored dimension-major (d rows of blocksize
// coordinates). Discrete candidates hold integral grid indices.
class CandidateBlock {
public:
    CandidateBlock(std::size_t dimension, std::size_t size)
        : dimension_(dimension), size_(size), coords_(dimension * size) {}

    [[nodiscard]] std::size_t dimension() const noexcept { return dimension_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    double* axis(std::size_t dim) noexcept { return coords_.data() + dim * size_; }
    const double* axis(std::size_t dim) const noexcept { return coords_.data() + dim * size_; }

    [[nodiscard]] double coordinate(std::size_t dim, std::size_t j) const noexcept {
        return coords_[dim * size_ + j];
    }

    void point(std::size_t j, std::vector<double>& out) const {
        out.resize(dimension_);
        for (std::size_t dim = 0; dim < dimension_; ++dim) {
            out[dim] = coords_[dim * size_ + j];
        }
    }

private:
    std::size_t dimension_;
    std::size_t size_;
    std::vector<double> coords_;
};

} // namespace spatial
