#include "point_process/Envelope.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

#include "error.hpp"

namespace spatial::envelope {

namespace {

using Vector = std::vector<double>;
using Matrix = std::vector<double>; // row-major, d x d

double dot(const Vector& lhs, const Vector& rhs) {
    double acc = 0.0;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        acc += lhs[i] * rhs[i];
    }
    return acc;
}

Vector subtract(const Vector& lhs, const Vector& rhs) {
    Vector out(lhs.size());
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        out[i] = lhs[i] - rhs[i];
    }
    return out;
}

Vector add_scaled(const Vector& x, const Vector& direction, double step) {
    Vector out(x.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
        out[i] = x[i] + step * direction[i];
    }
    return out;
}

double vector_norm(const Vector& v) {
    return std::sqrt(dot(v, v));
}

double max_abs(const Vector& v) {
    double m = 0.0;
    for (double value : v) {
        m = std::max(m, std::abs(value));
    }
    return m;
}

Matrix identity_matrix(std::size_t d) {
    Matrix mat(d * d, 0.0);
    for (std::size_t i = 0; i < d; ++i) {
        mat[i * d + i] = 1.0;
    }
    return mat;
}

Vector mat_vec(const Matrix& mat, const Vector& vec) {
    const std::size_t d = vec.size();
    Vector out(d, 0.0);
    for (std::size_t row = 0; row < d; ++row) {
        double value = 0.0;
        for (std::size_t col = 0; col < d; ++col) {
            value += mat[row * d + col] * vec[col];
        }
        out[row] = value;
    }
    return out;
}

// Inverse-Hessian update H <- (I - rho s y^T) H (I - rho y s^T) + rho s s^T.
void bfgs_update(Matrix& H, const Vector& s, const Vector& y) {
    const std::size_t d = s.size();
    const double ys = dot(y, s);
    if (ys <= 1e-12) {
        H = identity_matrix(d);
        return;
    }
    const double rho = 1.0 / ys;
    const Vector Hy = mat_vec(H, y);
    Vector yH(d, 0.0); // y^T H
    for (std::size_t col = 0; col < d; ++col) {
        for (std::size_t k = 0; k < d; ++k) {
            yH[col] += y[k] * H[k * d + col];
        }
    }
    const double yHy = dot(y, Hy);
    for (std::size_t row = 0; row < d; ++row) {
        for (std::size_t col = 0; col < d; ++col) {
            H[row * d + col] += -rho * (s[row] * yH[col] + Hy[row] * s[col])
                                + (rho * rho * yHy + rho) * s[row] * s[col];
        }
    }
}

class CountingObjective {
public:
    explicit CountingObjective(const Objective& fn) : fn_(fn) {}

    double operator()(const Vector& x) {
        ++evaluations_;
        return fn_(x);
    }

    [[nodiscard]] std::size_t evaluations() const noexcept { return evaluations_; }

private:
    const Objective& fn_;
    std::size_t evaluations_{0};
};

struct Evaluation {
    bool valid{false};
    double value{-std::numeric_limits<double>::infinity()};
    Vector x;
    Vector gradient;
    // Steepest one-sided slope per axis, zero where neither side rises. Differs
    // from `gradient` only at kinks and cusps, where central differences cancel.
    Vector ascent;
};

// Central differences, one-sided where the box edge cuts the stencil. The same
// evaluations give the one-sided ascent slopes.
Vector finite_difference_gradient(
    CountingObjective& f,
    const Vector& x,
    double fx,
    const Bounds& bounds,
    double relative_step,
    Vector& ascent) {
    Vector gradient(x.size(), 0.0);
    ascent.assign(x.size(), 0.0);
    Vector shifted = x;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const Interval& interval = bounds[i];
        const double h = std::max(relative_step * interval.width(), 1e-12);
        const double up = std::min(x[i] + h, interval.high);
        const double down = std::max(x[i] - h, interval.low);
        const double span = up - down;
        if (!(span > 0.0)) {
            continue;
        }
        double f_up = fx;
        double f_down = fx;
        if (up != x[i]) {
            shifted[i] = up;
            f_up = f(shifted);
        }
        if (down != x[i]) {
            shifted[i] = down;
            f_down = f(shifted);
        }
        shifted[i] = x[i];
        gradient[i] = (f_up - f_down) / span;

        const double up_slope = up != x[i] ? (f_up - fx) / (up - x[i]) : 0.0;
        const double down_slope = down != x[i] ? (f_down - fx) / (x[i] - down) : 0.0;
        if (up_slope > 0.0 && up_slope >= down_slope) {
            ascent[i] = up_slope;
        } else if (down_slope > 0.0) {
            ascent[i] = -down_slope;
        }
    }
    return gradient;
}

Evaluation evaluate_point(CountingObjective& f, Vector x, const Bounds& bounds, const EnvelopeSearchConfig& config) {
    Evaluation eval;
    eval.value = f(x);
    eval.x = std::move(x);
    if (!std::isfinite(eval.value)) {
        return eval;
    }
    eval.gradient =
        finite_difference_gradient(f, eval.x, eval.value, bounds, config.finite_difference_step, eval.ascent);
    const auto finite = [](double g) { return std::isfinite(g); };
    eval.valid = std::all_of(eval.gradient.begin(), eval.gradient.end(), finite) &&
                 std::all_of(eval.ascent.begin(), eval.ascent.end(), finite);
    return eval;
}

// Ascent components pointing out of the box at an active bound are dropped.
Vector projected_gradient(const Vector& x, const Vector& gradient, const Bounds& bounds) {
    Vector pg = gradient;
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (x[i] <= bounds[i].low && pg[i] < 0.0) {
            pg[i] = 0.0;
        }
        if (x[i] >= bounds[i].high && pg[i] > 0.0) {
            pg[i] = 0.0;
        }
    }
    return pg;
}

EnvelopeEstimate local_search(
    CountingObjective& f,
    const Vector& start,
    const Bounds& bounds,
    const EnvelopeSearchConfig& config) {
    EnvelopeEstimate result;
    result.starts = 1;

    Evaluation current = evaluate_point(f, bounds.clamp(start), bounds, config);
    result.value = current.value;
    result.location = current.x;
    if (!current.valid) {
        return result;
    }

    const std::size_t d = start.size();
    Matrix H = identity_matrix(d);

    std::size_t completed_iters = 0;
    while (completed_iters < config.max_iterations) {
        Vector pg = projected_gradient(current.x, current.gradient, bounds);
        bool escaping = false;
        if (vector_norm(pg) <= config.gradient_tolerance) {
            // A vanishing central difference is also what a kink or cusp looks
            // like (|x - c| at c). Leave along the rising side if there is one.
            pg = projected_gradient(current.x, current.ascent, bounds);
            if (vector_norm(pg) <= config.gradient_tolerance) {
                result.converged = true;
                break;
            }
            current.gradient = pg;
            H = identity_matrix(d);
            escaping = true;
        }

        Vector direction = mat_vec(H, pg);
        if (dot(direction, pg) <= 0.0) {
            H = identity_matrix(d);
            direction = pg;
        }

        double step = 1.0;
        Evaluation candidate;
        bool accepted = false;
        for (std::size_t ls = 0; ls < config.max_line_search_steps; ++ls) {
            Vector x_candidate = bounds.clamp(add_scaled(current.x, direction, step));
            if (x_candidate == current.x) {
                break;
            }
            candidate = evaluate_point(f, std::move(x_candidate), bounds, config);
            if (!candidate.valid) {
                step *= config.backtracking_shrink;
                continue;
            }
            const double sufficient =
                current.value + config.armijo_c1 * dot(current.gradient, subtract(candidate.x, current.x));
            if (candidate.value < sufficient) {
                step *= config.backtracking_shrink;
                continue;
            }
            accepted = true;
            break;
        }

        if (!accepted) {
            // No rising side survived the line search: a stationary point after all.
            result.converged = escaping;
            break;
        }

        // Curvature of the negated objective, so H stays positive definite.
        const Vector s = subtract(candidate.x, current.x);
        if (escaping) {
            H = identity_matrix(d);
        } else {
            const Vector y = subtract(current.gradient, candidate.gradient);
            bfgs_update(H, s, y);
        }

        current = std::move(candidate);
        result.value = current.value;
        result.location = current.x;
        ++completed_iters;

        if (max_abs(s) <= config.parameter_tolerance) {
            result.converged = true;
            break;
        }
    }

    result.iterations = completed_iters;
    return result;
}

} // namespace

EnvelopeEstimate maximize_over_bounds(
    const Objective& objective,
    const Bounds& bounds,
    const EnvelopeSearchConfig& config) {
    if (!objective) {
        SPATIAL_THROW(std::invalid_argument("maximize_over_bounds requires an objective"));
    }
    if (bounds.empty()) {
        SPATIAL_THROW(std::invalid_argument("maximize_over_bounds requires non-empty bounds"));
    }
    if (!(config.backtracking_shrink > 0.0 && config.backtracking_shrink < 1.0)) {
        SPATIAL_THROW(std::invalid_argument("backtracking_shrink must lie in (0, 1)"));
    }

    CountingObjective f(objective);
    EnvelopeEstimate best = local_search(f, bounds.midpoint(), bounds, config);

    if (config.restarts > 0) {
        std::mt19937_64 rng(config.restart_seed);
        Vector start(bounds.dimension());
        for (std::size_t r = 0; r < config.restarts; ++r) {
            for (std::size_t i = 0; i < start.size(); ++i) {
                std::uniform_real_distribution<double> unif(bounds[i].low, bounds[i].high);
                start[i] = unif(rng);
            }
            EnvelopeEstimate trial = local_search(f, start, bounds, config);
            const std::size_t iterations = best.iterations + trial.iterations;
            const std::size_t starts = best.starts + trial.starts;
            if (trial.value > best.value || std::isnan(best.value)) {
                best = std::move(trial);
            }
            best.iterations = iterations;
            best.starts = starts;
        }
    }

    best.evaluations = f.evaluations();
    return best;
}

} // namespace spatial::envelope
