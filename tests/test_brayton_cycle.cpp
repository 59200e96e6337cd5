#include "brayton/cycle/brayton_cycle_evaluator.hpp"
#include <cmath>
#include <iostream>

using namespace brayton;

int main() {
  auto provider_result = thermophysics::create_property_provider(io::PropertyConfig{});
  if (!provider_result) {
    std::cerr << provider_result.error().message() << "\n";
    return 1;
  }
  const cycle::BraytonCycleEvaluator evaluator(*provider_result.value());

  // Reference case: T1 = 298.15 K, T3 = 1200 K, r = 10, eta = 0.90
  cycle::CycleParameters params;
  auto reference = evaluator.evaluate(params);
  if (!reference) {
    std::cerr << reference.error().message() << "\n";
    return 1;
  }
  const double eta_percent = reference->thermal_efficiency * 100.0;
  if (std::abs(eta_percent - 34.71) > 0.5) {
    std::cerr << "Reference efficiency " << eta_percent << " % outside 34.71 +/- 0.5\n";
    return 1;
  }

  // First-law bookkeeping
  const auto& states = reference->states;
  const auto& work = reference->work;
  if (std::abs(reference->net_work - (work.turbine - work.compressor)) > 1e-12 ||
      std::abs(reference->heat_input - (states.turbine_inlet.enthalpy - states.compressor_exit.enthalpy)) > 1e-12) {
    std::cerr << "Net work or heat input inconsistent with the states\n";
    return 1;
  }

  // Irreversible components: more compressor work, less turbine work than ideal
  if (work.compressor <= work.compressor_isentropic || work.turbine >= work.turbine_isentropic) {
    std::cerr << "Component work does not reflect the efficiencies\n";
    return 1;
  }
  if (states.compressor_exit_isentropic.temperature <= params.inlet_temperature ||
      states.turbine_exit_isentropic.temperature >= params.turbine_inlet_temperature) {
    std::cerr << "Isentropic temperatures on the wrong side of the inlets\n";
    return 1;
  }
  if (reference->extrapolated() || !reference->warnings.empty()) {
    std::cerr << "Reference case should stay inside the table\n";
    return 1;
  }

  // Ideal components: actual exits equal the isentropic exits
  cycle::CycleParameters ideal = params;
  ideal.compressor_efficiency = 1.0;
  ideal.turbine_efficiency = 1.0;
  auto ideal_result = evaluator.evaluate(ideal);
  if (!ideal_result ||
      ideal_result->states.compressor_exit.enthalpy != ideal_result->states.compressor_exit_isentropic.enthalpy ||
      ideal_result->states.turbine_exit.enthalpy != ideal_result->states.turbine_exit_isentropic.enthalpy ||
      ideal_result->thermal_efficiency <= reference->thermal_efficiency) {
    std::cerr << "Ideal cycle should keep isentropic exits and beat the real one\n";
    return 1;
  }

  // Rejected before any solve
  auto expect_invalid = [&](cycle::CycleParameters bad, const char* what) {
    auto result = evaluator.evaluate(bad);
    if (result || result.error().kind() != cycle::CycleErrorKind::InvalidParameter) {
      std::cerr << "Expected InvalidParameter for " << what << "\n";
      return false;
    }
    return true;
  };
  cycle::CycleParameters bad = params;
  bad.compression_ratio = 1.0;
  if (!expect_invalid(bad, "r = 1")) {
    return 1;
  }
  bad = params;
  bad.compressor_efficiency = 0.0;
  if (!expect_invalid(bad, "zero compressor efficiency")) {
    return 1;
  }
  bad = params;
  bad.turbine_efficiency = 1.2;
  if (!expect_invalid(bad, "turbine efficiency above 1")) {
    return 1;
  }
  bad = params;
  bad.turbine_inlet_temperature = params.inlet_temperature;
  if (!expect_invalid(bad, "T3 = T1")) {
    return 1;
  }

  // Compressor exit hotter than the turbine inlet
  cycle::CycleParameters degenerate = params;
  degenerate.turbine_inlet_temperature = 450.0;
  auto degenerate_result = evaluator.evaluate(degenerate);
  if (degenerate_result || degenerate_result.error().kind() != cycle::CycleErrorKind::DegenerateCycle) {
    std::cerr << "Expected DegenerateCycle when heat input is negative\n";
    return 1;
  }

  // Turbine inlet above the table: evaluated, but flagged
  cycle::CycleParameters hot = params;
  hot.turbine_inlet_temperature = 2200.0;
  auto hot_result = evaluator.evaluate(hot);
  if (!hot_result || !hot_result->extrapolated() ||
      !hot_result->has_warning(cycle::CycleWarning::Kind::DomainViolation)) {
    std::cerr << "Expected a domain warning above the table\n";
    return 1;
  }
  // h2 and h4 stay inside the enthalpy range here
  if (hot_result->states.compressor_exit.extrapolated || hot_result->states.turbine_exit.extrapolated) {
    std::cerr << "Actual exit states flagged without leaving the table\n";
    return 1;
  }

  // A poor compressor at high pressure ratio pushes h2 past h(T_max) while T2s stays inside the table
  cycle::CycleParameters overheated = params;
  overheated.compression_ratio = 100.0;
  overheated.compressor_efficiency = 0.375;
  overheated.turbine_efficiency = 1.0;
  overheated.turbine_inlet_temperature = 5000.0;
  auto overheated_result = evaluator.evaluate(overheated);
  if (!overheated_result) {
    std::cerr << overheated_result.error().message() << "\n";
    return 1;
  }
  if (overheated_result->states.compressor_exit_isentropic.extrapolated ||
      !overheated_result->states.compressor_exit.extrapolated ||
      !overheated_result->states.turbine_exit.extrapolated) {
    std::cerr << "Expected states 2 and 4 flagged by enthalpy\n";
    return 1;
  }
  bool state2_warned = false;
  for (const auto& warning : overheated_result->warnings) {
    if (warning.kind == cycle::CycleWarning::Kind::DomainViolation &&
        warning.message.find("state 2 enthalpy") != std::string::npos) {
      state2_warned = true;
    }
  }
  if (!state2_warned) {
    std::cerr << "Missing domain warning for state 2\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
