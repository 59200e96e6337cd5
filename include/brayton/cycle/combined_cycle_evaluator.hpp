#pragma once
#include "brayton_cycle_evaluator.hpp"

namespace brayton::cycle {

/**
 * @brief Brayton cycle with an exhaust-driven Rankine bottoming cycle
 *
 * The bottoming cycle only runs when the actual turbine exit temperature
 * reaches the configured threshold. Below it the combined efficiency falls
 * back to the Brayton efficiency and a BottomingInactive warning is attached.
 */
class CombinedCycleEvaluator {
private:
  BraytonCycleEvaluator brayton_;

public:
  explicit CombinedCycleEvaluator(const thermophysics::PropertyProvider& provider, SolverSettings settings = {}) noexcept
      : brayton_(provider, settings) {}

  [[nodiscard]] auto evaluate(const CycleParameters& params, const BottomingCycleParameters& bottoming) const
      -> std::expected<CombinedCycleResult, CycleError>;

  [[nodiscard]] auto brayton() const noexcept -> const BraytonCycleEvaluator& { return brayton_; }
};

} // namespace brayton::cycle
