#include "brayton/cycle/combined_cycle_evaluator.hpp"
#include <cmath>
#include <iostream>

using namespace brayton;

int main() {
  auto provider_result = thermophysics::create_property_provider(io::PropertyConfig{});
  if (!provider_result) {
    std::cerr << provider_result.error().message() << "\n";
    return 1;
  }
  const cycle::CombinedCycleEvaluator evaluator(*provider_result.value());
  const cycle::BottomingCycleParameters bottoming;

  // Documented design point: exhaust above the threshold couples the steam cycle
  cycle::CycleParameters params;
  params.compression_ratio = 13.59;
  auto design = evaluator.evaluate(params, bottoming);
  if (!design) {
    std::cerr << design.error().message() << "\n";
    return 1;
  }
  if (!design->bottoming.active || design->turbine_exit_temperature() <= bottoming.exhaust_temperature_threshold) {
    std::cerr << "Bottoming cycle should be active at r = 13.59 (T4 = " << design->turbine_exit_temperature()
              << " K)\n";
    return 1;
  }
  if (design->combined_efficiency() <= design->brayton_efficiency()) {
    std::cerr << "Combined efficiency must exceed the Brayton efficiency\n";
    return 1;
  }

  // Actual T4 reproduces h4 and sits above the isentropic exit
  const auto& states = design->cycle.states;
  auto h4 = provider_result.value()->enthalpy(design->turbine_exit_temperature());
  if (!h4 || std::abs(*h4 - states.turbine_exit.enthalpy) > 1e-8 ||
      design->turbine_exit_temperature() <= states.turbine_exit_isentropic.temperature) {
    std::cerr << "Turbine exit temperature inconsistent with h4\n";
    return 1;
  }

  // Rankine terms: heat recovered down to the stack, work at the configured efficiency
  const auto& rankine = design->bottoming;
  const double expected_work = (states.turbine_exit.enthalpy - rankine.stack_enthalpy) *
                               bottoming.rankine_efficiency_percent / 100.0;
  if (std::abs(rankine.work - expected_work) > 1e-9 ||
      std::abs(rankine.steam_mass_fraction * bottoming.rankine_heat_input_per_kg - rankine.heat_to_bottoming) > 1e-9) {
    std::cerr << "Bottoming work mismatch\n";
    return 1;
  }
  const double expected_combined = (design->cycle.net_work + rankine.work) / design->cycle.heat_input;
  if (std::abs(design->combined_efficiency() - expected_combined) > 1e-12) {
    std::cerr << "Combined efficiency mismatch\n";
    return 1;
  }

  // High ratio: exhaust too cold, combined efficiency falls back to the Brayton value
  params.compression_ratio = 25.0;
  auto cold = evaluator.evaluate(params, bottoming);
  if (!cold) {
    std::cerr << cold.error().message() << "\n";
    return 1;
  }
  if (cold->bottoming.active || cold->combined_efficiency() != cold->brayton_efficiency() ||
      !cold->cycle.has_warning(cycle::CycleWarning::Kind::BottomingInactive)) {
    std::cerr << "Bottoming cycle should be inactive at r = 25\n";
    return 1;
  }

  // Invalid bottoming constants
  cycle::BottomingCycleParameters bad = bottoming;
  bad.rankine_efficiency_percent = 140.0;
  auto rejected = evaluator.evaluate(params, bad);
  if (rejected || rejected.error().kind() != cycle::CycleErrorKind::InvalidParameter) {
    std::cerr << "Expected InvalidParameter for Rankine efficiency above 100 %\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
