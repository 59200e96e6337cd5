#include "brayton/cycle/isentropic_state_resolver.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace brayton::cycle {

auto IsentropicStateResolver::solve(const numerics::ResidualFunction& residual, double target, double seed,
                                    std::string_view what) const -> std::expected<ResolvedTemperature, CycleError> {

  if (!std::isfinite(target)) {
    return std::unexpected(RootFindingFailure(std::format("non-finite {} target", what), target, seed));
  }

  const double start = std::clamp(seed, settings_.min_temperature, settings_.max_temperature);

  auto result = numerics::solve_increasing(residual, start, settings_.root_finder_config());
  if (!result) {
    return std::unexpected(RootFindingFailure(std::format("{} solve: {}", what, result.error().message()), target,
                                              result.error().last_estimate()));
  }

  return ResolvedTemperature{.temperature = result->root,
                             .residual = result->residual,
                             .iterations = result->iterations,
                             .extrapolated = !provider_.is_within_domain(result->root)};
}

auto IsentropicStateResolver::resolve_isentropic_temperature(double entropy_target, double seed_temperature) const
    -> std::expected<ResolvedTemperature, CycleError> {

  auto residual = [this, entropy_target](double T) -> std::expected<double, core::BraytonException> {
    auto s = provider_.entropy(T);
    if (!s) {
      return std::unexpected(s.error());
    }
    return *s - entropy_target;
  };

  return solve(residual, entropy_target, seed_temperature, "entropy");
}

auto IsentropicStateResolver::resolve_enthalpy_temperature(double enthalpy_target, double seed_temperature) const
    -> std::expected<ResolvedTemperature, CycleError> {

  auto residual = [this, enthalpy_target](double T) -> std::expected<double, core::BraytonException> {
    auto h = provider_.enthalpy(T);
    if (!h) {
      return std::unexpected(h.error());
    }
    return *h - enthalpy_target;
  };

  return solve(residual, enthalpy_target, seed_temperature, "enthalpy");
}

auto IsentropicStateResolver::enthalpy_within_domain(double enthalpy) const -> std::expected<bool, CycleError> {
  const auto domain = provider_.temperature_domain();
  auto h_min = provider_.enthalpy(domain.min);
  if (!h_min) {
    return std::unexpected(PropertyEvaluationFailure(h_min.error().message()));
  }
  auto h_max = provider_.enthalpy(domain.max);
  if (!h_max) {
    return std::unexpected(PropertyEvaluationFailure(h_max.error().message()));
  }
  return enthalpy >= *h_min && enthalpy <= *h_max;
}

auto IsentropicStateResolver::state_at(double temperature) const -> std::expected<ThermodynamicState, CycleError> {
  auto h = provider_.enthalpy(temperature);
  if (!h) {
    return std::unexpected(PropertyEvaluationFailure(h.error().message()));
  }
  auto s = provider_.entropy(temperature);
  if (!s) {
    return std::unexpected(PropertyEvaluationFailure(s.error().message()));
  }
  return ThermodynamicState{.temperature = temperature,
                            .enthalpy = *h,
                            .entropy = *s,
                            .extrapolated = !provider_.is_within_domain(temperature)};
}

auto IsentropicStateResolver::compression_seed(double inlet_temperature, double compression_ratio) const noexcept
    -> double {
  return inlet_temperature * std::pow(compression_ratio, settings_.seed_exponent);
}

auto IsentropicStateResolver::expansion_seed(double inlet_temperature, double compression_ratio) const noexcept
    -> double {
  return inlet_temperature / std::pow(compression_ratio, settings_.seed_exponent);
}

} // namespace brayton::cycle
