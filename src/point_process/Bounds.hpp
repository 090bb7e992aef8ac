#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spatial {

struct Interval {
    double low{};
    double high{};

    [[nodiscard]] double width() const noexcept { return high - low; }
    [[nodiscard]] double midpoint() const noexcept { return 0.5 * (low + high); }
    [[nodiscard]] bool contains(double x) const noexcept { return x >= low && x <= high; }
};

// Axis-aligned sampling box, one interval per dimension.
class Bounds {
public:
    using Container = std::vector<Interval>;
    using const_iterator = Container::const_iterator;

    Bounds() = default;
    Bounds(std::initializer_list<std::pair<double, double>> pairs);
    explicit Bounds(Container intervals);

    void add(double low, double high);

    [[nodiscard]] std::size_t dimension() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const Interval& operator[](std::size_t i) const;
    [[nodiscard]] const Container& intervals() const noexcept;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    [[nodiscard]] std::vector<double> midpoint() const;
    [[nodiscard]] double volume() const noexcept;
    [[nodiscard]] bool contains(const std::vector<double>& point) const;
    [[nodiscard]] std::vector<double> clamp(std::vector<double> point) const;
    [[nodiscard]] std::string to_string() const;

    // "lo:hi,lo:hi,..." as accepted on the command line.
    static Bounds parse(std::string_view text);

private:
    Container intervals_;
};

} // namespace spatial
