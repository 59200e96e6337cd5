#pragma once
#include "cycle_errors.hpp"
#include "cycle_types.hpp"
#include <expected>

namespace brayton::cycle {

/**
 * @brief Rejects physically meaningless inputs before any property solve
 *
 * Every check returns an InvalidParameter error naming the offending field.
 */
class ParameterValidator {
public:
    /**
     * @brief Validate Brayton cycle parameters
     *
     * Requires r > 1, efficiencies in (0, 1], positive T1 and gas constant and
     * a turbine inlet temperature above the compressor inlet temperature.
     */
    [[nodiscard]] static auto validate_cycle(const CycleParameters& params) -> std::expected<void, CycleError>;

    /**
     * @brief Validate bottoming (Rankine) cycle parameters
     */
    [[nodiscard]] static auto validate_bottoming(const BottomingCycleParameters& params)
        -> std::expected<void, CycleError>;

    [[nodiscard]] static auto validate_solver(const SolverSettings& settings) -> std::expected<void, CycleError>;
};

} // namespace brayton::cycle
