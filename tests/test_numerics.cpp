#include "brayton/numerics/interpolant.hpp"
#include "brayton/numerics/root_finding.hpp"
#include "brayton/numerics/tridiagonal_solver.hpp"
#include <cmath>
#include <iostream>
#include <vector>

using namespace brayton;

int main() {
  // 3x3 system with known solution {1, 2, 3}
  std::vector<double> lower{0.0, 1.0, 1.0};
  std::vector<double> diag{4.0, 4.0, 4.0};
  std::vector<double> upper{1.0, 1.0, 0.0};
  std::vector<double> rhs{6.0, 12.0, 14.0};
  auto x = numerics::solve_tridiagonal(lower, diag, upper, rhs);
  if (!x) {
    std::cerr << x.error().message() << "\n";
    return 1;
  }
  const double expected[] = {1.0, 2.0, 3.0};
  for (std::size_t i = 0; i < 3; ++i) {
    if (std::abs((*x)[i] - expected[i]) > 1e-12) {
      std::cerr << "Tridiagonal solution mismatch at " << i << "\n";
      return 1;
    }
  }

  // Zero pivot must be reported
  std::vector<double> singular{0.0, 4.0, 4.0};
  if (numerics::solve_tridiagonal(lower, singular, upper, rhs)) {
    std::cerr << "Expected failure for zero pivot\n";
    return 1;
  }

  // A natural spline reproduces linear data exactly, inside and outside the knots
  std::vector<double> knots{1.0, 2.0, 4.0, 7.0};
  std::vector<double> line{3.0, 5.0, 9.0, 15.0};
  auto spline = numerics::Interpolant::create(knots, line);
  if (!spline) {
    std::cerr << spline.error().message() << "\n";
    return 1;
  }
  for (double t : {1.0, 1.5, 3.3, 6.9, 0.0, 9.0}) {
    if (std::abs((*spline)(t) - (2.0 * t + 1.0)) > 1e-10 || std::abs(spline->derivative(t) - 2.0) > 1e-10) {
      std::cerr << "Spline does not reproduce linear data at " << t << "\n";
      return 1;
    }
  }

  // Spline passes through its knots
  std::vector<double> curve{1.0, 4.0, 16.0, 49.0};
  auto through = numerics::Interpolant::create(knots, curve);
  if (!through) {
    std::cerr << through.error().message() << "\n";
    return 1;
  }
  for (std::size_t i = 0; i < knots.size(); ++i) {
    if (std::abs((*through)(knots[i]) - curve[i]) > 1e-12) {
      std::cerr << "Spline misses knot " << i << "\n";
      return 1;
    }
  }

  // Linear interpolation halfway between knots
  auto linear = numerics::Interpolant::create(knots, curve, numerics::InterpolationKind::Linear);
  if (!linear || std::abs((*linear)(3.0) - 10.0) > 1e-12) {
    std::cerr << "Linear interpolation mismatch\n";
    return 1;
  }

  // Non-increasing abscissae are rejected
  std::vector<double> unordered{1.0, 3.0, 2.0, 4.0};
  if (numerics::Interpolant::create(unordered, line)) {
    std::cerr << "Expected failure for unordered knots\n";
    return 1;
  }

  // Root of T^2 - 2 seeded far away
  numerics::ResidualFunction f = [](double t) -> std::expected<double, core::BraytonException> { return t * t - 2.0; };
  numerics::RootFinderConfig config;
  config.lower_limit = 1e-3;
  auto root = numerics::solve_increasing(f, 40.0, config);
  if (!root || std::abs(root->root - std::sqrt(2.0)) > 1e-9) {
    std::cerr << "Root finder missed sqrt(2)\n";
    return 1;
  }

  // Seed already on the root returns it unchanged
  numerics::ResidualFunction shifted = [](double t) -> std::expected<double, core::BraytonException> {
    return t - 500.0;
  };
  auto exact = numerics::solve_increasing(shifted, 500.0, config);
  if (!exact || exact->root != 500.0 || exact->iterations != 0) {
    std::cerr << "Exact seed should be returned without iterating\n";
    return 1;
  }

  // No sign change inside the limits
  numerics::ResidualFunction positive = [](double t) -> std::expected<double, core::BraytonException> {
    return t + 1.0;
  };
  auto missing = numerics::solve_increasing(positive, 100.0, config);
  if (missing) {
    std::cerr << "Expected failure when no root is bracketed\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
