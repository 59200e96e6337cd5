#pragma once
#include "../core/containers.hpp"
#include "numerics_errors.hpp"
#include <expected>
#include <span>

namespace brayton::numerics {

enum class InterpolationKind { NaturalCubicSpline, Linear };

/**
 * @brief Piecewise-cubic interpolant of tabulated data
 *
 * Stores the knots and the second derivative at each knot. A natural cubic
 * spline solves the tridiagonal moment system with zero end moments; the
 * linear variant keeps every moment at zero, which reduces each segment to a
 * straight line. Outside the knots the interpolant continues linearly with the
 * end slope, so a monotonic table stays monotonic under extrapolation.
 */
class Interpolant {
private:
  core::MathVector<double> x_;
  core::MathVector<double> y_;
  core::MathVector<double> moments_;
  InterpolationKind kind_ = InterpolationKind::NaturalCubicSpline;

  Interpolant(core::MathVector<double> x, core::MathVector<double> y, core::MathVector<double> moments,
              InterpolationKind kind)
      : x_(std::move(x)), y_(std::move(y)), moments_(std::move(moments)), kind_(kind) {}

  [[nodiscard]] auto segment_index(double x) const noexcept -> Eigen::Index;

public:
  [[nodiscard]] static auto create(std::span<const double> x, std::span<const double> y,
                                   InterpolationKind kind = InterpolationKind::NaturalCubicSpline)
      -> std::expected<Interpolant, NumericsError>;

  [[nodiscard]] auto operator()(double x) const noexcept -> double;

  [[nodiscard]] auto derivative(double x) const noexcept -> double;

  [[nodiscard]] auto x_min() const noexcept -> double { return x_[0]; }
  [[nodiscard]] auto x_max() const noexcept -> double { return x_[x_.size() - 1]; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return static_cast<std::size_t>(x_.size()); }
  [[nodiscard]] auto kind() const noexcept -> InterpolationKind { return kind_; }
};

} // namespace brayton::numerics
