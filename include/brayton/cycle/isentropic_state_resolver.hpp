#pragma once
#include "../thermophysics/property_provider.hpp"
#include "cycle_errors.hpp"
#include "cycle_types.hpp"
#include <expected>

namespace brayton::cycle {

struct ResolvedTemperature {
  double temperature;  // [K]
  double residual;     // property units
  int iterations = 0;
  bool extrapolated = false;
};

/**
 * @brief Inverts the property functions of a provider
 *
 * Both solves look for the temperature at which a monotonic property curve
 * reaches a target value. The seed only starts the bracket search, so any
 * seed inside the search interval converges when the target is reachable.
 */
class IsentropicStateResolver {
private:
  const thermophysics::PropertyProvider& provider_;
  SolverSettings settings_;

  [[nodiscard]] auto solve(const numerics::ResidualFunction& residual, double target, double seed,
                           std::string_view what) const -> std::expected<ResolvedTemperature, CycleError>;

public:
  IsentropicStateResolver(const thermophysics::PropertyProvider& provider, SolverSettings settings = {}) noexcept
      : provider_(provider), settings_(settings) {}

  // Temperature at which entropy(T) equals the target
  [[nodiscard]] auto resolve_isentropic_temperature(double entropy_target, double seed_temperature) const
      -> std::expected<ResolvedTemperature, CycleError>;

  // Temperature at which enthalpy(T) equals the target
  [[nodiscard]] auto resolve_enthalpy_temperature(double enthalpy_target, double seed_temperature) const
      -> std::expected<ResolvedTemperature, CycleError>;

  // Whether an enthalpy lies within [h(T_min), h(T_max)] of the property table
  [[nodiscard]] auto enthalpy_within_domain(double enthalpy) const -> std::expected<bool, CycleError>;

  // Full state at a known temperature
  [[nodiscard]] auto state_at(double temperature) const -> std::expected<ThermodynamicState, CycleError>;

  // Ideal-gas style starting points T_in * r^k and T_in / r^k
  [[nodiscard]] auto compression_seed(double inlet_temperature, double compression_ratio) const noexcept -> double;
  [[nodiscard]] auto expansion_seed(double inlet_temperature, double compression_ratio) const noexcept -> double;

  [[nodiscard]] auto settings() const noexcept -> const SolverSettings& { return settings_; }
  [[nodiscard]] auto provider() const noexcept -> const thermophysics::PropertyProvider& { return provider_; }
};

} // namespace brayton::cycle
