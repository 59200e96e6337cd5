#include "brayton/numerics/interpolant.hpp"
#include "brayton/core/constants.hpp"
#include "brayton/numerics/tridiagonal_solver.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

namespace brayton::numerics {

auto Interpolant::create(std::span<const double> x, std::span<const double> y, InterpolationKind kind)
    -> std::expected<Interpolant, NumericsError> {

  const auto n = x.size();

  if (n != y.size()) {
    return std::unexpected(NumericsError(std::format("Knot count mismatch: {} abscissae, {} ordinates", n, y.size())));
  }

  if (n < constants::indexing::min_table_rows) {
    return std::unexpected(
        NumericsError(std::format("Interpolation needs at least {} knots, got {}", constants::indexing::min_table_rows, n)));
  }

  for (std::size_t i = 0; i < n; ++i) {
    if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
      return std::unexpected(NumericsError(std::format("Non-finite knot at index {}", i)));
    }
    if (i > 0 && x[i] <= x[i - 1]) {
      return std::unexpected(
          NumericsError(std::format("Abscissae must be strictly increasing (x[{}]={} <= x[{}]={})", i, x[i], i - 1, x[i - 1])));
    }
  }

  core::MathVector<double> xs = Eigen::Map<const core::MathVector<double>>(x.data(), static_cast<Eigen::Index>(n));
  core::MathVector<double> ys = Eigen::Map<const core::MathVector<double>>(y.data(), static_cast<Eigen::Index>(n));
  core::MathVector<double> moments = core::MathVector<double>::Zero(static_cast<Eigen::Index>(n));

  if (kind == InterpolationKind::NaturalCubicSpline) {
    // Moment equations, natural end conditions M_0 = M_{n-1} = 0
    std::vector<double> lower(n, 0.0), main_diag(n, 1.0), upper(n, 0.0), rhs(n, 0.0);
    for (std::size_t i = 1; i + 1 < n; ++i) {
      const double h_left = x[i] - x[i - 1];
      const double h_right = x[i + 1] - x[i];
      lower[i] = h_left;
      main_diag[i] = 2.0 * (h_left + h_right);
      upper[i] = h_right;
      rhs[i] = 6.0 * ((y[i + 1] - y[i]) / h_right - (y[i] - y[i - 1]) / h_left);
    }

    auto solution = solve_tridiagonal(lower, main_diag, upper, rhs);
    if (!solution) {
      return std::unexpected(NumericsError(std::format("Spline moment system failed: {}", solution.error().message())));
    }
    for (std::size_t i = 0; i < n; ++i) {
      moments[static_cast<Eigen::Index>(i)] = (*solution)[i];
    }
  }

  return Interpolant(std::move(xs), std::move(ys), std::move(moments), kind);
}

auto Interpolant::segment_index(double x) const noexcept -> Eigen::Index {
  Eigen::Index lo = 0;
  Eigen::Index hi = x_.size() - 1;
  while (hi - lo > 1) {
    const Eigen::Index mid = (lo + hi) / 2;
    if (x_[mid] <= x) {
      lo = mid;
    } else {
      hi = mid;
    }
  }
  return lo;
}

auto Interpolant::operator()(double x) const noexcept -> double {
  const Eigen::Index last = x_.size() - 1;

  if (x < x_[0]) {
    return y_[0] + derivative(x_[0]) * (x - x_[0]);
  }
  if (x > x_[last]) {
    return y_[last] + derivative(x_[last]) * (x - x_[last]);
  }

  const auto i = segment_index(x);
  const double h = x_[i + 1] - x_[i];
  const double a = (x_[i + 1] - x) / h;
  const double b = (x - x_[i]) / h;

  return a * y_[i] + b * y_[i + 1] + ((a * a * a - a) * moments_[i] + (b * b * b - b) * moments_[i + 1]) * h * h / 6.0;
}

auto Interpolant::derivative(double x) const noexcept -> double {
  const Eigen::Index last = x_.size() - 1;

  // Constant end slopes outside the table
  const double xc = std::clamp(x, x_[0], x_[last]);

  const auto i = segment_index(xc);
  const double h = x_[i + 1] - x_[i];
  const double a = (x_[i + 1] - xc) / h;
  const double b = (xc - x_[i]) / h;

  return (y_[i + 1] - y_[i]) / h - (3.0 * a * a - 1.0) * h * moments_[i] / 6.0 +
         (3.0 * b * b - 1.0) * h * moments_[i + 1] / 6.0;
}

} // namespace brayton::numerics
