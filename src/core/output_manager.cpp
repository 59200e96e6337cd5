#include "brayton/core/output_manager.hpp"
#include "brayton/core/constants.hpp"
#include "brayton/io/output/hdf5_writer.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <limits>

namespace brayton::core {

namespace {

using io::output::Column;
using io::output::OptimumRecord;
using io::output::RowStatus;
using io::output::SweepTable;

constexpr double missing = std::numeric_limits<double>::quiet_NaN();

auto metric_name(analysis::SweepMetric metric) -> std::string {
  switch (metric) {
  case analysis::SweepMetric::NetWork:
    return "net_work";
  case analysis::SweepMetric::ThermalEfficiency:
    return "thermal_efficiency";
  case analysis::SweepMetric::CombinedEfficiency:
    return "combined_efficiency";
  }
  return "unknown";
}

auto join_warnings(const cycle::CycleResult& result) -> std::string {
  std::string text;
  for (const auto& warning : result.warnings) {
    if (!text.empty()) {
      text.append("; ");
    }
    text.append(warning.message);
  }
  return text;
}

auto row_status(const cycle::CycleResult& result) -> RowStatus {
  return result.extrapolated() ? RowStatus::Extrapolated : RowStatus::Ok;
}

auto brayton_columns() -> std::vector<Column> {
  return {{"thermal_efficiency", "-", "Brayton thermal efficiency", {}},
          {"net_work", "kJ/kg", "Turbine work minus compressor work", {}},
          {"heat_input", "kJ/kg", "Combustor heat addition h3 - h2", {}},
          {"compressor_work", "kJ/kg", "Actual compressor work h2 - h1", {}},
          {"turbine_work", "kJ/kg", "Actual turbine work h3 - h4", {}},
          {"compressor_exit_isentropic_temperature", "K", "Isentropic compressor exit T2s", {}},
          {"turbine_exit_isentropic_temperature", "K", "Isentropic turbine exit T4s", {}},
          {"turbine_exit_temperature", "K", "Actual turbine exit T4, when resolved", {}}};
}

auto append_brayton_row(std::vector<Column>& columns, const cycle::CycleResult* result) -> void {
  if (result == nullptr) {
    for (auto& column : columns) {
      column.values.push_back(missing);
    }
    return;
  }
  const double row[] = {result->thermal_efficiency,
                        result->net_work,
                        result->heat_input,
                        result->work.compressor,
                        result->work.turbine,
                        result->states.compressor_exit_isentropic.temperature,
                        result->states.turbine_exit_isentropic.temperature,
                        result->turbine_exit_temperature.value_or(missing)};
  for (std::size_t i = 0; i < columns.size(); ++i) {
    columns[i].values.push_back(row[i]);
  }
}

auto combined_columns() -> std::vector<Column> {
  return {{"brayton_efficiency", "-", "Gas-turbine thermal efficiency", {}},
          {"combined_efficiency", "-", "Combined-cycle efficiency", {}},
          {"net_work", "kJ/kg", "Gas-turbine net work", {}},
          {"heat_input", "kJ/kg", "Combustor heat addition", {}},
          {"turbine_exit_temperature", "K", "Actual turbine exit T4", {}},
          {"heat_to_bottoming", "kJ/kg", "Exhaust heat recovered between T4 and the stack", {}},
          {"steam_mass_fraction", "-", "Steam mass per unit gas mass", {}},
          {"bottoming_work", "kJ/kg", "Rankine work per unit gas mass", {}},
          {"bottoming_active", "-", "1 when the exhaust is above the threshold", {}}};
}

auto append_combined_row(std::vector<Column>& columns, const cycle::CombinedCycleResult* result) -> void {
  if (result == nullptr) {
    for (auto& column : columns) {
      column.values.push_back(missing);
    }
    return;
  }
  const double row[] = {result->brayton_efficiency(),
                        result->combined_efficiency(),
                        result->cycle.net_work,
                        result->cycle.heat_input,
                        result->turbine_exit_temperature(),
                        result->bottoming.heat_to_bottoming,
                        result->bottoming.steam_mass_fraction,
                        result->bottoming.work,
                        result->bottoming.active ? 1.0 : 0.0};
  for (std::size_t i = 0; i < columns.size(); ++i) {
    columns[i].values.push_back(row[i]);
  }
}

auto to_record(const std::optional<analysis::Optimum>& optimum, analysis::SweepMetric metric)
    -> std::optional<OptimumRecord> {
  if (!optimum) {
    return std::nullopt;
  }
  return OptimumRecord{metric_name(metric), optimum->index, optimum->input, optimum->value};
}

auto brayton_table(std::string name, std::string input_name, std::string input_units,
                   const analysis::BraytonSweep& sweep) -> SweepTable {
  SweepTable table{.name = std::move(name),
                   .input_name = std::move(input_name),
                   .input_units = std::move(input_units),
                   .inputs = {},
                   .columns = brayton_columns(),
                   .status = {},
                   .messages = {},
                   .optimum = std::nullopt};
  for (const auto& entry : sweep) {
    table.inputs.push_back(entry.input);
    if (entry.outcome) {
      append_brayton_row(table.columns, &entry.outcome.value());
      table.status.push_back(row_status(*entry.outcome));
      table.messages.push_back(join_warnings(*entry.outcome));
    } else {
      append_brayton_row(table.columns, nullptr);
      table.status.push_back(RowStatus::Failed);
      table.messages.push_back(entry.outcome.error().message());
    }
  }
  return table;
}

auto combined_table(std::string name, const analysis::CombinedSweep& sweep) -> SweepTable {
  SweepTable table{.name = std::move(name),
                   .input_name = "compression_ratio",
                   .input_units = "-",
                   .inputs = {},
                   .columns = combined_columns(),
                   .status = {},
                   .messages = {},
                   .optimum = std::nullopt};
  for (const auto& entry : sweep) {
    table.inputs.push_back(entry.input);
    if (entry.outcome) {
      append_combined_row(table.columns, &entry.outcome.value());
      table.status.push_back(row_status(entry.outcome->cycle));
      table.messages.push_back(join_warnings(entry.outcome->cycle));
    } else {
      append_combined_row(table.columns, nullptr);
      table.status.push_back(RowStatus::Failed);
      table.messages.push_back(entry.outcome.error().message());
    }
  }
  return table;
}

auto design_point_table(const AnalysisRunner::AnalysisResults& results) -> SweepTable {
  analysis::CombinedSweep design;
  design.push_back({results.design_parameters.compression_ratio, results.design_point});
  auto table = combined_table("design_point", design);

  // Station enthalpies only exist for the design point
  const auto& states = results.design_point.cycle.states;
  const std::pair<const char*, double> stations[] = {{"h1", states.inlet.enthalpy},
                                                     {"h2s", states.compressor_exit_isentropic.enthalpy},
                                                     {"h2", states.compressor_exit.enthalpy},
                                                     {"h3", states.turbine_inlet.enthalpy},
                                                     {"h4s", states.turbine_exit_isentropic.enthalpy},
                                                     {"h4", states.turbine_exit.enthalpy}};
  for (const auto& [name, value] : stations) {
    table.columns.push_back({name, "kJ/kg", std::string("Specific enthalpy at station ") + (name + 1), {value}});
  }
  return table;
}

auto source_name(io::PropertyConfig::Source source) -> std::string {
  return source == io::PropertyConfig::Source::BuiltinAir ? "builtin_air" : "inline_table";
}

auto interpolation_name(io::PropertyConfig::Interpolation interpolation) -> std::string {
  return interpolation == io::PropertyConfig::Interpolation::CubicSpline ? "cubic_spline" : "linear";
}

} // namespace

auto OutputManager::initialize_output_system(const io::Configuration& config) -> std::expected<void, ApplicationError> {

  std::cout << "\nInitializing output system..." << std::endl;

  if (auto hdf5_init = initialize_hdf5(); !hdf5_init) {
    return std::unexpected(hdf5_init.error());
  }

  if (config.output.compression_level < 0 || config.output.compression_level > 9) {
    return std::unexpected(ApplicationError{"Output configuration error: compression_level must be within [0, 9]",
                                            constants::indexing::second});
  }

  std::cout << constants::string_processing::colors::green << "✓ Output system configured"
            << constants::string_processing::colors::reset << std::endl;

  return {};
}

auto OutputManager::build_dataset(const AnalysisRunner::AnalysisResults& results, const io::Configuration& config,
                                  const thermophysics::PropertyProvider& provider) const
    -> io::output::AnalysisDataset {

  io::output::AnalysisDataset dataset;
  dataset.metadata.creation_time = std::chrono::system_clock::now();
  dataset.metadata.property_source = source_name(config.properties.source) + ":" + std::string(provider.name());
  dataset.metadata.interpolation = interpolation_name(config.properties.interpolation);
  dataset.metadata.cycle = config.cycle;
  dataset.metadata.bottoming = config.bottoming;

  dataset.tables.push_back(design_point_table(results));

  if (results.efficiency_sweep) {
    auto table = brayton_table("efficiency_sweep", "compression_ratio", "-", results.efficiency_sweep->entries);
    table.optimum = to_record(results.efficiency_sweep->optimum, analysis::SweepMetric::ThermalEfficiency);
    dataset.tables.push_back(std::move(table));
  }

  if (results.net_work_sweep) {
    auto table = brayton_table("net_work_sweep", "compression_ratio", "-", results.net_work_sweep->entries);
    table.optimum = to_record(results.net_work_sweep->optimum, analysis::SweepMetric::NetWork);
    dataset.tables.push_back(std::move(table));
  }

  if (results.sensitivity) {
    auto table = brayton_table("sensitivity", "isentropic_efficiency", "-", results.sensitivity->entries);
    table.optimum = to_record(results.sensitivity->optimum, analysis::SweepMetric::ThermalEfficiency);
    dataset.tables.push_back(std::move(table));
  }

  if (results.combined_sweep) {
    auto table = combined_table("combined_sweep", results.combined_sweep->entries);
    table.optimum = to_record(results.combined_sweep->optimum, analysis::SweepMetric::CombinedEfficiency);
    dataset.tables.push_back(std::move(table));

    if (!results.combined_design_points.empty()) {
      dataset.tables.push_back(combined_table("combined_design_points", results.combined_design_points));
    }
  }

  return dataset;
}

auto OutputManager::write_analysis_results(const AnalysisRunner::AnalysisResults& results,
                                           const io::Configuration& config,
                                           const thermophysics::PropertyProvider& provider,
                                           const std::string& case_name, PerformanceMetrics& metrics)
    -> std::expected<std::vector<std::filesystem::path>, ApplicationError> {

  if (!config.output.write_hdf5) {
    std::cout << "\nHDF5 output disabled, skipping file output" << std::endl;
    return std::vector<std::filesystem::path>{};
  }

  std::cout << "\n=== WRITING OUTPUT FILES ===" << std::endl;

  const auto dataset = build_dataset(results, config, provider);
  const auto file_path = output_path(config, case_name);

  io::output::HDF5Config hdf5_config;
  hdf5_config.compression_level = config.output.compression_level;
  const io::output::HDF5Writer writer(hdf5_config);

  auto output_start = std::chrono::high_resolution_clock::now();
  auto output_result = writer.write(file_path, dataset);
  auto output_end = std::chrono::high_resolution_clock::now();

  metrics.output_time = std::chrono::duration_cast<std::chrono::milliseconds>(output_end - output_start);

  if (!output_result) {
    return std::unexpected(
        ApplicationError{"Failed to write output: " + output_result.error().message(), constants::indexing::second});
  }

  std::vector<std::filesystem::path> output_files{file_path};
  metrics.output_files = output_files;

  std::cout << constants::string_processing::colors::green << "✓ Output written successfully!"
            << constants::string_processing::colors::reset << std::endl;
  std::cout << "  Output time: " << metrics.output_time.count() << " ms" << std::endl;
  std::cout << "\nGenerated files:" << std::endl;

  for (const auto& path : output_files) {
    std::error_code ec;
    const auto file_size = std::filesystem::file_size(path, ec);
    std::cout << "  " << path.filename().string();
    if (!ec) {
      std::cout << " (" << std::setprecision(constants::string_processing::float_precision_2) << std::fixed
                << (static_cast<double>(file_size) / constants::io::bytes_to_kb) << " KB)";
    }
    std::cout << std::endl;
  }

  return output_files;
}

auto OutputManager::display_planned_outputs(const io::Configuration& config, const std::string& case_name) const
    -> void {
  if (!config.output.write_hdf5) {
    return;
  }
  std::cout << "\nPlanned output files:" << std::endl;
  std::cout << "  HDF5: " << output_path(config, case_name).string() << std::endl;
}

auto OutputManager::output_path(const io::Configuration& config, const std::string& case_name)
    -> std::filesystem::path {
  return std::filesystem::path(config.output.output_directory) / (case_name + "_cycle_analysis.h5");
}

auto OutputManager::initialize_hdf5() -> std::expected<void, ApplicationError> {
  if (auto hdf5_init = io::output::hdf5::initialize(); !hdf5_init) {
    std::cerr << "Warning: Failed to initialize HDF5: " << hdf5_init.error().message() << std::endl;
  } else {
    if (auto version = io::output::hdf5::check_version()) {
      std::cout << constants::string_processing::colors::green
                << "✓ HDF5 library version: " << constants::string_processing::colors::reset << version.value()
                << std::endl;
    }
  }
  return {};
}

} // namespace brayton::core
