#include "brayton/cycle/brayton_cycle_evaluator.hpp"
#include "brayton/core/expected_utils.hpp"
#include "brayton/cycle/component_state_model.hpp"
#include "brayton/cycle/parameter_validator.hpp"
#include <cmath>
#include <format>

namespace brayton::cycle {

namespace {

void flag_if_extrapolated(std::vector<CycleWarning>& warnings, const ThermodynamicState& state,
                          std::string_view label) {
  if (state.extrapolated) {
    warnings.push_back({CycleWarning::Kind::DomainViolation,
                        std::format("state {} at {:.2f} K lies outside the property table", label, state.temperature)});
  }
}

// Actual exit states carry only an enthalpy, so they are checked against the table's enthalpy range
auto flag_enthalpy_outside(std::vector<CycleWarning>& warnings, const IsentropicStateResolver& resolver,
                           ComponentExit& state, std::string_view label) -> std::expected<void, CycleError> {
  bool within = true;
  BRAYTON_TRY_ASSIGN(within, resolver.enthalpy_within_domain(state.enthalpy));
  if (!within) {
    state.extrapolated = true;
    warnings.push_back(
        {CycleWarning::Kind::DomainViolation,
         std::format("state {} enthalpy {:.2f} kJ/kg lies outside the property table", label, state.enthalpy)});
  }
  return {};
}

} // anonymous namespace

auto BraytonCycleEvaluator::evaluate(const CycleParameters& params) const -> std::expected<CycleResult, CycleError> {

  BRAYTON_TRY_VOID(ParameterValidator::validate_cycle(params));

  const double r = params.compression_ratio;
  const double entropy_change = params.gas_constant * std::log(r);

  ThermodynamicState state1{};
  ThermodynamicState state3{};
  BRAYTON_TRY_ASSIGN(state1, resolver_.state_at(params.inlet_temperature));
  BRAYTON_TRY_ASSIGN(state3, resolver_.state_at(params.turbine_inlet_temperature));

  // Isentropic compression: s°(T2s) = s°(T1) + R ln r
  ResolvedTemperature T2s{};
  BRAYTON_TRY_ASSIGN(T2s, resolver_.resolve_isentropic_temperature(
                              state1.entropy + entropy_change, resolver_.compression_seed(state1.temperature, r)));

  // Isentropic expansion: s°(T4s) = s°(T3) - R ln r
  ResolvedTemperature T4s{};
  BRAYTON_TRY_ASSIGN(T4s, resolver_.resolve_isentropic_temperature(
                              state3.entropy - entropy_change, resolver_.expansion_seed(state3.temperature, r)));

  ThermodynamicState state2s{};
  ThermodynamicState state4s{};
  BRAYTON_TRY_ASSIGN(state2s, resolver_.state_at(T2s.temperature));
  BRAYTON_TRY_ASSIGN(state4s, resolver_.state_at(T4s.temperature));

  double h2 = 0.0;
  double h4 = 0.0;
  BRAYTON_TRY_ASSIGN(h2, apply_isentropic_efficiency(state1.enthalpy, state2s.enthalpy, params.compressor_efficiency,
                                                     ComponentMode::Compression));
  BRAYTON_TRY_ASSIGN(h4, apply_isentropic_efficiency(state3.enthalpy, state4s.enthalpy, params.turbine_efficiency,
                                                     ComponentMode::Expansion));

  const ComponentWork work{.compressor = h2 - state1.enthalpy,
                           .compressor_isentropic = state2s.enthalpy - state1.enthalpy,
                           .turbine = state3.enthalpy - h4,
                           .turbine_isentropic = state3.enthalpy - state4s.enthalpy};

  const double net_work = work.turbine - work.compressor;
  const double heat_input = state3.enthalpy - h2;

  if (!std::isfinite(heat_input) || heat_input <= 0.0) {
    return std::unexpected(DegenerateCycle(std::format(
        "heat input must be positive (h3 = {:.3f} kJ/kg, h2 = {:.3f} kJ/kg at r = {})", state3.enthalpy, h2, r)));
  }
  if (!std::isfinite(net_work) || net_work <= 0.0) {
    return std::unexpected(
        DegenerateCycle(std::format("net work {:.3f} kJ/kg is not positive at r = {}", net_work, r)));
  }

  const double thermal_efficiency = net_work / heat_input;
  if (!std::isfinite(thermal_efficiency)) {
    return std::unexpected(DegenerateCycle("non-finite thermal efficiency"));
  }

  CycleResult result{
      .net_work = net_work,
      .heat_input = heat_input,
      .thermal_efficiency = thermal_efficiency,
      .turbine_exit_temperature = std::nullopt,
      .combined_efficiency = std::nullopt,
      .states = {.inlet = state1,
                 .compressor_exit_isentropic = state2s,
                 .compressor_exit = {.enthalpy = h2, .temperature = std::nullopt, .extrapolated = false},
                 .turbine_inlet = state3,
                 .turbine_exit_isentropic = state4s,
                 .turbine_exit = {.enthalpy = h4, .temperature = std::nullopt, .extrapolated = false}},
      .work = work,
      .warnings = {}};

  flag_if_extrapolated(result.warnings, state1, "1");
  flag_if_extrapolated(result.warnings, state2s, "2s");
  flag_if_extrapolated(result.warnings, state3, "3");
  flag_if_extrapolated(result.warnings, state4s, "4s");
  BRAYTON_TRY_VOID(flag_enthalpy_outside(result.warnings, resolver_, result.states.compressor_exit, "2"));
  BRAYTON_TRY_VOID(flag_enthalpy_outside(result.warnings, resolver_, result.states.turbine_exit, "4"));

  return result;
}

} // namespace brayton::cycle
