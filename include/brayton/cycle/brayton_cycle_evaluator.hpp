#pragma once
#include "../thermophysics/property_provider.hpp"
#include "cycle_errors.hpp"
#include "cycle_types.hpp"
#include "isentropic_state_resolver.hpp"
#include <expected>

namespace brayton::cycle {

/**
 * @brief Simple gas-turbine cycle with variable specific heats
 *
 * States: 1 compressor inlet, 2s/2 compressor exit, 3 turbine inlet,
 * 4s/4 turbine exit. The provider is held by reference and must outlive the
 * evaluator; evaluate() has no side effects.
 */
class BraytonCycleEvaluator {
private:
  IsentropicStateResolver resolver_;

public:
  explicit BraytonCycleEvaluator(const thermophysics::PropertyProvider& provider, SolverSettings settings = {}) noexcept
      : resolver_(provider, settings) {}

  [[nodiscard]] auto evaluate(const CycleParameters& params) const -> std::expected<CycleResult, CycleError>;

  [[nodiscard]] auto resolver() const noexcept -> const IsentropicStateResolver& { return resolver_; }
};

} // namespace brayton::cycle
