#include "brayton/core/analysis_runner.hpp"
#include "brayton/core/constants.hpp"
#include "brayton/cycle/parameter_validator.hpp"
#include <chrono>
#include <format>
#include <iostream>

namespace brayton::core {

auto to_cycle_parameters(const io::CycleConfig& config) noexcept -> cycle::CycleParameters {
  return {.compression_ratio = config.compression_ratio,
          .compressor_efficiency = config.compressor_efficiency,
          .turbine_efficiency = config.turbine_efficiency,
          .inlet_temperature = config.inlet_temperature,
          .turbine_inlet_temperature = config.turbine_inlet_temperature,
          .gas_constant = config.gas_constant};
}

auto to_bottoming_parameters(const io::BottomingConfig& config) noexcept -> cycle::BottomingCycleParameters {
  return {.stack_temperature = config.stack_temperature,
          .exhaust_temperature_threshold = config.exhaust_temperature_threshold,
          .rankine_heat_input_per_kg = config.rankine_heat_input_per_kg,
          .rankine_efficiency_percent = config.rankine_efficiency_percent};
}

auto to_solver_settings(const io::SolverConfig& config) noexcept -> cycle::SolverSettings {
  return {.tolerance = config.tolerance,
          .residual_tolerance = config.residual_tolerance,
          .max_iterations = config.max_iterations,
          .max_bracket_expansions = config.max_bracket_expansions,
          .bracket_growth = config.bracket_growth,
          .min_temperature = config.min_temperature,
          .max_temperature = config.max_temperature,
          .seed_exponent = config.seed_exponent};
}

auto AnalysisRunner::run_analyses(const thermophysics::PropertyProvider& provider, const io::Configuration& config,
                                  PerformanceMetrics& metrics) -> std::expected<AnalysisResults, ApplicationError> {

  const auto params = to_cycle_parameters(config.cycle);
  const auto bottoming = to_bottoming_parameters(config.bottoming);
  const auto settings = to_solver_settings(config.solver);

  if (auto valid = cycle::ParameterValidator::validate_solver(settings); !valid) {
    return std::unexpected(ApplicationError{"Invalid solver settings: " + valid.error().message(),
                                            constants::indexing::second});
  }

  const analysis::SweepDriver driver(provider, settings);
  const auto& analyses = config.analyses;
  const bool exclude_extrapolated = analyses.exclude_extrapolated_optima;

  std::cout << "\n=== STARTING CYCLE ANALYSIS ===" << std::endl;
  auto start_time = std::chrono::high_resolution_clock::now();

  auto design_result = driver.evaluator().evaluate(params, bottoming);
  ++metrics.evaluations;
  if (!design_result) {
    ++metrics.failed_evaluations;
    return std::unexpected(ApplicationError{"Design point evaluation failed: " + design_result.error().message(),
                                            constants::indexing::second});
  }
  std::cout << "✓ Design point resolved (r = " << params.compression_ratio << ")" << std::endl;

  AnalysisResults results{.design_parameters = params,
                          .design_point = std::move(design_result.value()),
                          .efficiency_sweep = std::nullopt,
                          .net_work_sweep = std::nullopt,
                          .sensitivity = std::nullopt,
                          .combined_sweep = std::nullopt,
                          .combined_design_points = {}};

  if (analyses.efficiency_sweep) {
    auto ratios = ratio_range(analyses.efficiency_range, "efficiency_sweep");
    if (!ratios) {
      return std::unexpected(ratios.error());
    }
    auto sweep = driver.sweep_compression_ratio(params, *ratios);
    count_outcomes(sweep, metrics);
    auto optimum = analysis::find_optimum(sweep, analysis::SweepMetric::ThermalEfficiency, exclude_extrapolated);
    results.efficiency_sweep = SweepRun<analysis::BraytonSweep>{std::move(sweep), optimum};
    std::cout << "✓ Efficiency sweep: " << ratios->size() << " compression ratios" << std::endl;
  }

  if (analyses.net_work_sweep) {
    auto ratios = ratio_range(analyses.net_work_range, "net_work_sweep");
    if (!ratios) {
      return std::unexpected(ratios.error());
    }
    auto sweep = driver.sweep_compression_ratio(params, *ratios);
    count_outcomes(sweep, metrics);
    auto optimum = analysis::find_optimum(sweep, analysis::SweepMetric::NetWork, exclude_extrapolated);
    results.net_work_sweep = SweepRun<analysis::BraytonSweep>{std::move(sweep), optimum};
    std::cout << "✓ Net work sweep: " << ratios->size() << " compression ratios" << std::endl;
  }

  if (analyses.sensitivity) {
    auto sensitivity_params = params;
    sensitivity_params.compression_ratio = analyses.sensitivity_compression_ratio;
    const auto pairs = analysis::matched_efficiency_pairs(analyses.sensitivity_efficiencies);
    auto sweep = driver.sweep_efficiency(sensitivity_params, pairs);
    count_outcomes(sweep, metrics);
    auto optimum = analysis::find_optimum(sweep, analysis::SweepMetric::ThermalEfficiency, exclude_extrapolated);
    results.sensitivity = SweepRun<analysis::BraytonSweep>{std::move(sweep), optimum};
    std::cout << "✓ Efficiency sensitivity: " << pairs.size() << " values at r = "
              << analyses.sensitivity_compression_ratio << std::endl;
  }

  if (analyses.combined_sweep) {
    auto ratios = ratio_range(analyses.combined_range, "combined_sweep");
    if (!ratios) {
      return std::unexpected(ratios.error());
    }
    auto sweep = driver.sweep_combined(params, bottoming, *ratios);
    count_outcomes(sweep, metrics);
    auto optimum = analysis::find_optimum(sweep, analysis::SweepMetric::CombinedEfficiency, exclude_extrapolated);
    results.combined_sweep = SweepRun<analysis::CombinedSweep>{std::move(sweep), optimum};

    results.combined_design_points = driver.sweep_combined(params, bottoming, analyses.combined_design_points);
    count_outcomes(results.combined_design_points, metrics);
    std::cout << "✓ Combined-cycle sweep: " << ratios->size() << " compression ratios, "
              << analyses.combined_design_points.size() << " design points" << std::endl;
  }

  auto end_time = std::chrono::high_resolution_clock::now();
  metrics.analysis_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

  std::cout << "✓ Analysis completed in " << metrics.analysis_time.count() << " ms (" << metrics.evaluations
            << " evaluations)" << std::endl;

  return results;
}

auto AnalysisRunner::ratio_range(const io::AnalysesConfig::RatioRange& range, std::string_view name) const
    -> std::expected<std::vector<double>, ApplicationError> {
  auto values = analysis::linear_range(range.start, range.stop, range.points);
  if (!values) {
    return std::unexpected(
        ApplicationError{std::format("Invalid range for '{}': {}", name, values.error().message()),
                         constants::indexing::second});
  }
  return std::move(values.value());
}

template <typename Sweep> auto AnalysisRunner::count_outcomes(const Sweep& sweep, PerformanceMetrics& metrics) const -> void {
  for (const auto& entry : sweep) {
    ++metrics.evaluations;
    if (!entry.succeeded()) {
      ++metrics.failed_evaluations;
    }
  }
}

auto AnalysisRunner::display_results(const AnalysisResults& results) const -> void {
  display_design_point(results);

  std::cout << "\n=== OPTIMA ===" << std::endl;
  if (results.efficiency_sweep) {
    display_optimum("Max thermal efficiency", results.efficiency_sweep->optimum, "r", true);
    display_failures("efficiency sweep", results.efficiency_sweep->entries);
  }
  if (results.net_work_sweep) {
    display_optimum("Max net work [kJ/kg]", results.net_work_sweep->optimum, "r", false);
    display_failures("net work sweep", results.net_work_sweep->entries);
  }
  if (results.sensitivity) {
    display_optimum("Best sensitivity point", results.sensitivity->optimum, "η", true);
    display_failures("sensitivity", results.sensitivity->entries);
  }
  if (results.combined_sweep) {
    display_optimum("Max combined efficiency", results.combined_sweep->optimum, "r", true);
    display_failures("combined sweep", results.combined_sweep->entries);

    for (const auto& entry : results.combined_design_points) {
      if (!entry.outcome) {
        std::cerr << constants::string_processing::colors::red << "  Combined design point r = " << entry.input
                  << " failed: " << entry.outcome.error().full_message() << constants::string_processing::colors::reset
                  << std::endl;
        continue;
      }
      const auto& point = *entry.outcome;
      std::cout << std::format("  Combined at r = {:.2f}: Brayton {:.2f} %, combined {:.2f} %, T4 = {:.2f} K ({})",
                               entry.input, point.brayton_efficiency() * constants::conversion::to_percentage,
                               point.combined_efficiency() * constants::conversion::to_percentage,
                               point.turbine_exit_temperature(),
                               point.bottoming.active ? "bottoming active" : "bottoming inactive")
                << std::endl;
    }
  }
}

auto AnalysisRunner::display_design_point(const AnalysisResults& results) const -> void {
  const auto& point = results.design_point;
  const auto& cycle = point.cycle;
  const auto& states = cycle.states;
  constexpr int p = constants::string_processing::float_precision_2;

  std::cout << "\n=== DESIGN POINT (r = " << results.design_parameters.compression_ratio << ") ===" << std::endl;
  std::cout << std::format("  State 1  : T = {:8.{}f} K  h = {:8.{}f} kJ/kg", states.inlet.temperature, p,
                           states.inlet.enthalpy, p)
            << std::endl;
  std::cout << std::format("  State 2s : T = {:8.{}f} K  h = {:8.{}f} kJ/kg",
                           states.compressor_exit_isentropic.temperature, p,
                           states.compressor_exit_isentropic.enthalpy, p)
            << std::endl;
  std::cout << std::format("  State 2  :                 h = {:8.{}f} kJ/kg", states.compressor_exit.enthalpy, p)
            << std::endl;
  std::cout << std::format("  State 3  : T = {:8.{}f} K  h = {:8.{}f} kJ/kg", states.turbine_inlet.temperature, p,
                           states.turbine_inlet.enthalpy, p)
            << std::endl;
  std::cout << std::format("  State 4s : T = {:8.{}f} K  h = {:8.{}f} kJ/kg",
                           states.turbine_exit_isentropic.temperature, p, states.turbine_exit_isentropic.enthalpy, p)
            << std::endl;
  std::cout << std::format("  State 4  : T = {:8.{}f} K  h = {:8.{}f} kJ/kg", point.turbine_exit_temperature(), p,
                           states.turbine_exit.enthalpy, p)
            << std::endl;
  std::cout << std::format("  Net work           : {:.{}f} kJ/kg", cycle.net_work, p) << std::endl;
  std::cout << std::format("  Heat input         : {:.{}f} kJ/kg", cycle.heat_input, p) << std::endl;
  std::cout << std::format("  Thermal efficiency : {:.{}f} %",
                           cycle.thermal_efficiency * constants::conversion::to_percentage, p)
            << std::endl;
  std::cout << std::format("  Combined efficiency: {:.{}f} %",
                           point.combined_efficiency() * constants::conversion::to_percentage, p)
            << std::endl;

  for (const auto& warning : cycle.warnings) {
    std::cerr << constants::string_processing::colors::yellow << "  Warning: " << warning.message
              << constants::string_processing::colors::reset << std::endl;
  }
}

auto AnalysisRunner::display_optimum(std::string_view label, const std::optional<analysis::Optimum>& optimum,
                                     std::string_view input, bool as_percentage) const -> void {
  if (!optimum) {
    std::cerr << constants::string_processing::colors::yellow << "  " << label << ": no valid entry"
              << constants::string_processing::colors::reset << std::endl;
    return;
  }
  const double value = as_percentage ? optimum->value * constants::conversion::to_percentage : optimum->value;
  std::cout << std::format("  {:<26}: {:.{}f}{} at {} = {:.{}f}", label, value,
                           constants::string_processing::float_precision_2, as_percentage ? " %" : "", input,
                           optimum->input, constants::string_processing::float_precision_4)
            << std::endl;
}

template <typename Sweep> auto AnalysisRunner::display_failures(std::string_view label, const Sweep& sweep) const -> void {
  for (const auto& entry : sweep) {
    if (!entry.outcome) {
      std::cerr << constants::string_processing::colors::red << "  " << label << " at " << entry.input
                << " failed: " << entry.outcome.error().full_message() << constants::string_processing::colors::reset
                << std::endl;
    }
  }
}

} // namespace brayton::core
