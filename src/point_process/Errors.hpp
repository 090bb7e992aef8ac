#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace spatial {

// Construction-time and call-time argument errors.

class InvalidDensity final : public std::invalid_argument {
public:
    explicit InvalidDensity(const std::string& reason);
};

class InvalidDensityKwargs final : public std::invalid_argument {
public:
    InvalidDensityKwargs(std::string key, const std::string& reason);

    [[nodiscard]] const std::string& key() const noexcept;

private:
    std::string key_;
};

class MissingArguments final : public std::invalid_argument {
public:
    MissingArguments(bool n_missing, bool bounds_missing);

    [[nodiscard]] bool n_missing() const noexcept;
    [[nodiscard]] bool bounds_missing() const noexcept;

private:
    bool n_missing_;
    bool bounds_missing_;
};

class UnsupportedAlgorithm final : public std::invalid_argument {
public:
    explicit UnsupportedAlgorithm(std::string algorithm);

    [[nodiscard]] const std::string& algorithm() const noexcept;

private:
    std::string algorithm_;
};

class ShapeMismatch final : public std::invalid_argument {
public:
    ShapeMismatch(std::size_t expected, std::size_t actual, const std::string& context);

    [[nodiscard]] std::size_t expected() const noexcept;
    [[nodiscard]] std::size_t actual() const noexcept;

private:
    std::size_t expected_;
    std::size_t actual_;
};

// Failures of the rejection loop itself. These are never retried internally.

class DegenerateDensity final : public std::runtime_error {
public:
    explicit DegenerateDensity(double lmax);

    [[nodiscard]] double lmax() const noexcept;

private:
    double lmax_;
};

class SamplingBudgetExceeded final : public std::runtime_error {
public:
    SamplingBudgetExceeded(std::size_t accepted, std::size_t target, std::size_t blocks, double lmax);

    [[nodiscard]] std::size_t accepted() const noexcept;
    [[nodiscard]] std::size_t target() const noexcept;
    [[nodiscard]] std::size_t blocks() const noexcept;
    [[nodiscard]] double lmax() const noexcept;

private:
    std::size_t accepted_;
    std::size_t target_;
    std::size_t blocks_;
    double lmax_;
};

class SamplingCancelled final : public std::runtime_error {
public:
    SamplingCancelled(std::size_t accepted, std::size_t target, std::size_t blocks);

    [[nodiscard]] std::size_t accepted() const noexcept;
    [[nodiscard]] std::size_t target() const noexcept;
    [[nodiscard]] std::size_t blocks() const noexcept;

private:
    std::size_t accepted_;
    std::size_t target_;
    std::size_t blocks_;
};

} // namespace spatial
