#pragma once
#include "../core/constants.hpp"
#include "../core/exceptions.hpp"
#include <optional>
#include <string>
#include <vector>

namespace brayton::io {

struct PropertyConfig {
  enum class Source { BuiltinAir, InlineTable };
  enum class Interpolation { CubicSpline, Linear };
  Source source = Source::BuiltinAir;
  Interpolation interpolation = Interpolation::CubicSpline;

  // Only read when source = InlineTable
  std::string name = "air";
  std::vector<double> temperatures;  // [K]
  std::vector<double> enthalpies;    // [kJ/kg]
  std::vector<double> entropies;     // [kJ/(kg·K)]
};

struct CycleConfig {
  double compression_ratio = constants::defaults::compression_ratio;
  double compressor_efficiency = constants::defaults::isentropic_efficiency;
  double turbine_efficiency = constants::defaults::isentropic_efficiency;
  double inlet_temperature = constants::defaults::inlet_temperature;                   // [K]
  double turbine_inlet_temperature = constants::defaults::turbine_inlet_temperature;   // [K]
  double gas_constant = constants::defaults::gas_constant_air;                         // [kJ/(kg·K)]
};

struct SolverConfig {
  double tolerance = constants::tolerance::temperature;
  double residual_tolerance = constants::tolerance::residual;
  int max_iterations = constants::iteration_limits::root_finder_max;
  int max_bracket_expansions = constants::iteration_limits::bracket_expansions_max;
  double bracket_growth = constants::defaults::bracket_growth;
  double min_temperature = constants::defaults::min_search_temperature;
  double max_temperature = constants::defaults::max_search_temperature;
  double seed_exponent = constants::defaults::seed_exponent;
};

struct BottomingConfig {
  double stack_temperature = constants::defaults::bottoming::stack_temperature;
  double exhaust_temperature_threshold = constants::defaults::bottoming::exhaust_temperature_threshold;
  double rankine_heat_input_per_kg = constants::defaults::bottoming::rankine_heat_input_per_kg;
  double rankine_efficiency_percent = constants::defaults::bottoming::rankine_efficiency_percent;
};

struct AnalysesConfig {
  struct RatioRange {
    double start = constants::defaults::sweep::ratio_start;
    double stop = constants::defaults::sweep::ratio_stop;
    int points = constants::defaults::sweep::efficiency_points;
  };

  bool efficiency_sweep = true;
  RatioRange efficiency_range{};

  bool net_work_sweep = true;
  RatioRange net_work_range{constants::defaults::sweep::ratio_start, constants::defaults::sweep::ratio_stop,
                            constants::defaults::sweep::net_work_points};

  // Compressor and turbine efficiencies are varied together at a fixed ratio
  bool sensitivity = true;
  double sensitivity_compression_ratio = constants::defaults::compression_ratio;
  std::vector<double> sensitivity_efficiencies{0.86, 0.88, 0.90, 0.92, 0.94};

  bool combined_sweep = true;
  RatioRange combined_range{};
  std::vector<double> combined_design_points{13.59};

  // Optima ignore entries whose states left the tabulated domain
  bool exclude_extrapolated_optima = false;
};

struct OutputConfig {
  bool write_hdf5 = true;
  std::string output_directory = constants::io::default_output_directory;
  int compression_level = constants::io::default_hdf5_compression;
};

struct Configuration {
  PropertyConfig properties;
  CycleConfig cycle;
  SolverConfig solver;
  BottomingConfig bottoming;
  AnalysesConfig analyses;
  OutputConfig output;
  bool verbose = false;
};

} // namespace brayton::io
