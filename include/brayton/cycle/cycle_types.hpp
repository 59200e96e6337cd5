#pragma once
#include "../core/constants.hpp"
#include "../numerics/root_finding.hpp"
#include <optional>
#include <string>
#include <vector>

namespace brayton::cycle {

struct CycleParameters {
  double compression_ratio = constants::defaults::compression_ratio;
  double compressor_efficiency = constants::defaults::isentropic_efficiency;
  double turbine_efficiency = constants::defaults::isentropic_efficiency;
  double inlet_temperature = constants::defaults::inlet_temperature;                   // T1 [K]
  double turbine_inlet_temperature = constants::defaults::turbine_inlet_temperature;   // T3 [K]
  double gas_constant = constants::defaults::gas_constant_air;                         // [kJ/(kg·K)]
};

struct BottomingCycleParameters {
  double stack_temperature = constants::defaults::bottoming::stack_temperature;                          // [K]
  double exhaust_temperature_threshold = constants::defaults::bottoming::exhaust_temperature_threshold;  // [K]
  double rankine_heat_input_per_kg = constants::defaults::bottoming::rankine_heat_input_per_kg;          // [kJ/kg]
  double rankine_efficiency_percent = constants::defaults::bottoming::rankine_efficiency_percent;        // [%]
};

struct SolverSettings {
  double tolerance = constants::tolerance::temperature;
  double residual_tolerance = constants::tolerance::residual;
  int max_iterations = constants::iteration_limits::root_finder_max;
  int max_bracket_expansions = constants::iteration_limits::bracket_expansions_max;
  double bracket_growth = constants::defaults::bracket_growth;
  double min_temperature = constants::defaults::min_search_temperature;
  double max_temperature = constants::defaults::max_search_temperature;
  double seed_exponent = constants::defaults::seed_exponent;

  [[nodiscard]] auto root_finder_config() const noexcept -> numerics::RootFinderConfig {
    return {.tolerance = tolerance,
            .residual_tolerance = residual_tolerance,
            .max_iterations = max_iterations,
            .max_bracket_expansions = max_bracket_expansions,
            .bracket_growth = bracket_growth,
            .lower_limit = min_temperature,
            .upper_limit = max_temperature};
  }
};

struct ThermodynamicState {
  double temperature;  // [K]
  double enthalpy;     // [kJ/kg]
  double entropy;      // s°(T) [kJ/(kg·K)]
  bool extrapolated = false;
};

// Actual component exit: the enthalpy is known, the temperature only once inverted
struct ComponentExit {
  double enthalpy;
  std::optional<double> temperature;
  bool extrapolated = false;
};

struct CycleStates {
  ThermodynamicState inlet;                       // 1
  ThermodynamicState compressor_exit_isentropic;  // 2s
  ComponentExit compressor_exit;                  // 2
  ThermodynamicState turbine_inlet;               // 3
  ThermodynamicState turbine_exit_isentropic;     // 4s
  ComponentExit turbine_exit;                     // 4
};

struct ComponentWork {
  double compressor;              // h2 - h1
  double compressor_isentropic;   // h2s - h1
  double turbine;                 // h3 - h4
  double turbine_isentropic;      // h3 - h4s
};

struct CycleWarning {
  enum class Kind { DomainViolation, BottomingInactive };
  Kind kind;
  std::string message;
};

struct CycleResult {
  double net_work;            // [kJ/kg]
  double heat_input;          // [kJ/kg]
  double thermal_efficiency;  // [-]
  std::optional<double> turbine_exit_temperature;
  std::optional<double> combined_efficiency;

  CycleStates states;
  ComponentWork work;
  std::vector<CycleWarning> warnings;

  [[nodiscard]] auto extrapolated() const noexcept -> bool {
    return states.inlet.extrapolated || states.compressor_exit_isentropic.extrapolated ||
           states.turbine_inlet.extrapolated || states.turbine_exit_isentropic.extrapolated ||
           states.compressor_exit.extrapolated || states.turbine_exit.extrapolated;
  }

  [[nodiscard]] auto has_warning(CycleWarning::Kind kind) const noexcept -> bool {
    for (const auto& warning : warnings) {
      if (warning.kind == kind) {
        return true;
      }
    }
    return false;
  }
};

struct BottomingCycleResult {
  bool active = false;
  double stack_enthalpy = 0.0;         // h(T_stack) [kJ/kg]
  double heat_to_bottoming = 0.0;      // [kJ/kg of gas]
  double steam_mass_fraction = 0.0;    // [kg steam / kg gas]
  double work = 0.0;                   // [kJ/kg of gas]
};

struct CombinedCycleResult {
  CycleResult cycle;  // turbine_exit_temperature and combined_efficiency are always set here
  BottomingCycleResult bottoming;

  [[nodiscard]] auto brayton_efficiency() const noexcept -> double { return cycle.thermal_efficiency; }
  [[nodiscard]] auto combined_efficiency() const noexcept -> double {
    return cycle.combined_efficiency.value_or(cycle.thermal_efficiency);
  }
  [[nodiscard]] auto turbine_exit_temperature() const noexcept -> double {
    return cycle.turbine_exit_temperature.value_or(0.0);
  }
  [[nodiscard]] auto extrapolated() const noexcept -> bool { return cycle.extrapolated(); }
};

} // namespace brayton::cycle
