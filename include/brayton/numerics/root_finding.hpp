#pragma once
#include "../core/constants.hpp"
#include "../core/exceptions.hpp"
#include "numerics_errors.hpp"
#include <expected>
#include <functional>

namespace brayton::numerics {

struct RootFinderConfig {
  double tolerance = constants::tolerance::temperature;
  double residual_tolerance = constants::tolerance::residual;
  int max_iterations = constants::iteration_limits::root_finder_max;
  int max_bracket_expansions = constants::iteration_limits::bracket_expansions_max;
  double bracket_growth = constants::defaults::bracket_growth;
  double lower_limit = constants::defaults::min_search_temperature;
  double upper_limit = constants::defaults::max_search_temperature;
};

struct Bracket {
  double lower;
  double upper;
  double f_lower;
  double f_upper;
  int expansions = 0;
};

struct RootResult {
  double root;
  double residual;
  int iterations = 0;
};

using ResidualFunction = std::function<std::expected<double, core::BraytonException>(double)>;

// Grow a sign-changing bracket from the seed, assuming f is increasing
[[nodiscard]] auto bracket_increasing_root(const ResidualFunction& f, double seed, double f_seed,
                                           const RootFinderConfig& config) -> std::expected<Bracket, RootFindingError>;

// Brent's method (inverse quadratic interpolation, secant and bisection safeguards)
[[nodiscard]] auto brent_solve(const ResidualFunction& f, const Bracket& bracket,
                               const RootFinderConfig& config) -> std::expected<RootResult, RootFindingError>;

// Seeded solve of an increasing function: seed check, bracket search, then Brent
[[nodiscard]] auto solve_increasing(const ResidualFunction& f, double seed,
                                    const RootFinderConfig& config) -> std::expected<RootResult, RootFindingError>;

} // namespace brayton::numerics
