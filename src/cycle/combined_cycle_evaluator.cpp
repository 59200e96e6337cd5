#include "brayton/cycle/combined_cycle_evaluator.hpp"
#include "brayton/core/constants.hpp"
#include "brayton/core/expected_utils.hpp"
#include "brayton/cycle/parameter_validator.hpp"
#include <algorithm>
#include <format>

namespace brayton::cycle {

auto CombinedCycleEvaluator::evaluate(const CycleParameters& params, const BottomingCycleParameters& bottoming) const
    -> std::expected<CombinedCycleResult, CycleError> {

  BRAYTON_TRY_VOID(ParameterValidator::validate_bottoming(bottoming));

  CombinedCycleResult combined{};
  BRAYTON_TRY_ASSIGN(combined.cycle, brayton_.evaluate(params));

  auto& cycle = combined.cycle;
  const auto& resolver = brayton_.resolver();

  // Actual turbine exit temperature from h(T4) = h4, started from the isentropic exit
  ResolvedTemperature T4{};
  BRAYTON_TRY_ASSIGN(T4, resolver.resolve_enthalpy_temperature(cycle.states.turbine_exit.enthalpy,
                                                               cycle.states.turbine_exit_isentropic.temperature));

  // The Brayton evaluation already warns when h4 lies outside the table's enthalpy range
  const bool flagged_by_enthalpy = cycle.states.turbine_exit.extrapolated;
  cycle.states.turbine_exit.temperature = T4.temperature;
  cycle.states.turbine_exit.extrapolated = flagged_by_enthalpy || T4.extrapolated;
  cycle.turbine_exit_temperature = T4.temperature;

  if (T4.extrapolated && !flagged_by_enthalpy) {
    cycle.warnings.push_back({CycleWarning::Kind::DomainViolation,
                              std::format("state 4 at {:.2f} K lies outside the property table", T4.temperature)});
  }

  // Hard switch at the threshold
  if (T4.temperature < bottoming.exhaust_temperature_threshold) {
    combined.bottoming.active = false;
    cycle.combined_efficiency = cycle.thermal_efficiency;
    cycle.warnings.push_back(
        {CycleWarning::Kind::BottomingInactive,
         std::format("turbine exit {:.2f} K is below the bottoming threshold {:.2f} K", T4.temperature,
                     bottoming.exhaust_temperature_threshold)});
    return combined;
  }

  const auto& provider = resolver.provider();
  auto h_stack = provider.enthalpy(bottoming.stack_temperature);
  if (!h_stack) {
    return std::unexpected(PropertyEvaluationFailure(h_stack.error().message()));
  }

  auto& rankine = combined.bottoming;
  rankine.active = true;
  rankine.stack_enthalpy = *h_stack;
  rankine.heat_to_bottoming = std::max(0.0, cycle.states.turbine_exit.enthalpy - rankine.stack_enthalpy);
  rankine.steam_mass_fraction = rankine.heat_to_bottoming / bottoming.rankine_heat_input_per_kg;
  rankine.work = rankine.steam_mass_fraction * bottoming.rankine_heat_input_per_kg *
                 bottoming.rankine_efficiency_percent / constants::conversion::to_percentage;

  cycle.combined_efficiency = (cycle.net_work + rankine.work) / cycle.heat_input;

  return combined;
}

} // namespace brayton::cycle
