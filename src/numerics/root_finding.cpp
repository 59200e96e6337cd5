#include "brayton/numerics/root_finding.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace brayton::numerics {

namespace {

[[nodiscard]] auto evaluate(const ResidualFunction& f, double x, int iterations)
    -> std::expected<double, RootFindingError> {
  auto value = f(x);
  if (!value) {
    return std::unexpected(
        RootFindingError(std::format("residual evaluation at x={} failed: {}", x, value.error().message()), x, iterations));
  }
  if (!std::isfinite(*value)) {
    return std::unexpected(RootFindingError(std::format("non-finite residual at x={}", x), x, iterations));
  }
  return *value;
}

} // namespace

auto bracket_increasing_root(const ResidualFunction& f, double seed, double f_seed, const RootFinderConfig& config)
    -> std::expected<Bracket, RootFindingError> {

  const bool search_upward = f_seed < 0.0;
  double anchor = seed;
  double f_anchor = f_seed;

  for (int expansion = 1; expansion <= config.max_bracket_expansions; ++expansion) {
    const double probe = search_upward ? std::min(anchor * config.bracket_growth, config.upper_limit)
                                       : std::max(anchor / config.bracket_growth, config.lower_limit);

    if (probe == anchor) {
      return std::unexpected(RootFindingError(
          std::format("residual keeps its sign up to the search limit {} (residual {:.6e})", probe, f_anchor), anchor,
          expansion));
    }

    auto f_probe = evaluate(f, probe, expansion);
    if (!f_probe) {
      return std::unexpected(f_probe.error());
    }

    const bool sign_change = search_upward ? (*f_probe >= 0.0) : (*f_probe <= 0.0);
    if (sign_change) {
      if (search_upward) {
        return Bracket{anchor, probe, f_anchor, *f_probe, expansion};
      }
      return Bracket{probe, anchor, *f_probe, f_anchor, expansion};
    }

    anchor = probe;
    f_anchor = *f_probe;
  }

  return std::unexpected(RootFindingError(
      std::format("no sign change after {} bracket expansions", config.max_bracket_expansions), anchor,
      config.max_bracket_expansions));
}

auto brent_solve(const ResidualFunction& f, const Bracket& bracket, const RootFinderConfig& config)
    -> std::expected<RootResult, RootFindingError> {

  double a = bracket.lower;
  double b = bracket.upper;
  double fa = bracket.f_lower;
  double fb = bracket.f_upper;

  if (fa == 0.0) {
    return RootResult{a, 0.0, 0};
  }
  if (fb == 0.0) {
    return RootResult{b, 0.0, 0};
  }
  if (fa * fb > 0.0) {
    return std::unexpected(RootFindingError(
        std::format("interval [{}, {}] does not bracket a root (f={:.6e}, {:.6e})", a, b, fa, fb), b, 0));
  }

  if (std::abs(fa) < std::abs(fb)) {
    std::swap(a, b);
    std::swap(fa, fb);
  }

  double c = a;
  double fc = fa;
  double d = c;
  bool mflag = true;

  for (int iteration = 1; iteration <= config.max_iterations; ++iteration) {

    if (std::abs(fb) <= config.residual_tolerance || std::abs(b - a) <= config.tolerance) {
      return RootResult{b, fb, iteration - 1};
    }

    double s;
    if (fa != fc && fb != fc) {
      // Inverse quadratic interpolation
      s = a * fb * fc / ((fa - fb) * (fa - fc)) + b * fa * fc / ((fb - fa) * (fb - fc)) +
          c * fa * fb / ((fc - fa) * (fc - fb));
    } else {
      // Secant step
      s = b - fb * (b - a) / (fb - fa);
    }

    const double quarter = (3.0 * a + b) / 4.0;
    const bool condition1 = !((s > std::min(quarter, b)) && (s < std::max(quarter, b)));
    const bool condition2 = mflag && (std::abs(s - b) >= std::abs(b - c) / 2.0);
    const bool condition3 = !mflag && (std::abs(s - b) >= std::abs(c - d) / 2.0);
    const bool condition4 = mflag && (std::abs(b - c) < config.tolerance);
    const bool condition5 = !mflag && (std::abs(c - d) < config.tolerance);

    if (condition1 || condition2 || condition3 || condition4 || condition5 || !std::isfinite(s)) {
      s = (a + b) / 2.0;
      mflag = true;
    } else {
      mflag = false;
    }

    auto fs_result = evaluate(f, s, iteration);
    if (!fs_result) {
      return std::unexpected(fs_result.error());
    }
    const double fs = *fs_result;

    d = c;
    c = b;
    fc = fb;

    if (fa * fs < 0.0) {
      b = s;
      fb = fs;
    } else {
      a = s;
      fa = fs;
    }

    if (std::abs(fa) < std::abs(fb)) {
      std::swap(a, b);
      std::swap(fa, fb);
    }
  }

  if (std::abs(fb) <= config.residual_tolerance || std::abs(b - a) <= config.tolerance) {
    return RootResult{b, fb, config.max_iterations};
  }

  return std::unexpected(RootFindingError(
      std::format("no convergence within {} iterations (|b-a|={:.3e}, residual={:.3e})", config.max_iterations,
                  std::abs(b - a), fb),
      b, config.max_iterations));
}

auto solve_increasing(const ResidualFunction& f, double seed, const RootFinderConfig& config)
    -> std::expected<RootResult, RootFindingError> {

  if (!std::isfinite(seed) || seed < config.lower_limit || seed > config.upper_limit) {
    return std::unexpected(RootFindingError(
        std::format("seed {} outside the search interval [{}, {}]", seed, config.lower_limit, config.upper_limit), seed,
        0));
  }

  auto f_seed = evaluate(f, seed, 0);
  if (!f_seed) {
    return std::unexpected(f_seed.error());
  }

  // Seed already on the root (zero entropy change, for instance)
  if (std::abs(*f_seed) <= config.residual_tolerance) {
    return RootResult{seed, *f_seed, 0};
  }

  auto bracket = bracket_increasing_root(f, seed, *f_seed, config);
  if (!bracket) {
    return std::unexpected(bracket.error());
  }

  auto result = brent_solve(f, *bracket, config);
  if (!result) {
    return std::unexpected(result.error());
  }

  result->iterations += bracket->expansions;
  return result;
}

} // namespace brayton::numerics
