#include "brayton/core/analysis_runner.hpp"
#include "brayton/core/output_manager.hpp"
#include "brayton/io/output/hdf5_writer.hpp"
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>

using namespace brayton;

int main() {
  if (auto init = io::output::hdf5::initialize(); !init) {
    std::cerr << init.error().message() << "\n";
    return 1;
  }

  const auto directory = std::filesystem::temp_directory_path() / "brayton_hdf5_test";
  std::filesystem::remove_all(directory);

  // Hand-built table with one failed row
  io::output::AnalysisDataset dataset;
  dataset.metadata.creation_time = std::chrono::system_clock::now();
  dataset.metadata.property_source = "builtin_air:test";
  dataset.metadata.interpolation = "linear";

  io::output::SweepTable table;
  table.name = "efficiency_sweep";
  table.input_name = "compression_ratio";
  table.input_units = "-";
  table.inputs = {5.0, 10.0, 15.0};
  table.columns.push_back({"thermal_efficiency", "-", "", {0.30, std::numeric_limits<double>::quiet_NaN(), 0.37}});
  table.status = {io::output::RowStatus::Ok, io::output::RowStatus::Failed, io::output::RowStatus::Extrapolated};
  table.messages = {"", "root finding failed", ""};
  table.optimum = io::output::OptimumRecord{"thermal_efficiency", 2, 15.0, 0.37};
  dataset.tables.push_back(table);

  const auto path = directory / "manual.h5";
  const io::output::HDF5Writer writer;
  if (auto written = writer.write(path, dataset); !written) {
    std::cerr << written.error().message() << "\n";
    return 1;
  }
  if (auto valid = io::output::hdf5::validate_file(path); !valid) {
    std::cerr << valid.error().message() << "\n";
    return 1;
  }

  {
    const io::output::HDF5Reader reader(path);
    auto inputs = reader.read_vector("/efficiency_sweep/compression_ratio");
    auto eta = reader.read_vector("/efficiency_sweep/thermal_efficiency");
    auto status = reader.read_int_vector("/efficiency_sweep/status");
    if (!inputs || *inputs != table.inputs || !eta || eta->size() != 3 || !std::isnan((*eta)[1]) ||
        (*eta)[2] != 0.37) {
      std::cerr << "Table columns not read back\n";
      return 1;
    }
    if (!status || *status != std::vector<int>{0, -1, 1}) {
      std::cerr << "Row status not read back\n";
      return 1;
    }
    auto optimum = reader.read_double_attribute("/efficiency_sweep", "optimum_input");
    auto metric = reader.read_string_attribute("/efficiency_sweep", "optimum_metric");
    auto source = reader.read_string_attribute("/", "property_source");
    if (!optimum || *optimum != 15.0 || !metric || *metric != "thermal_efficiency" || !source ||
        *source != "builtin_air:test") {
      std::cerr << "Attributes not read back\n";
      return 1;
    }
    if (!reader.has_object("/efficiency_sweep/messages") || !reader.has_object("/metadata/cycle/compression_ratio")) {
      std::cerr << "Expected messages and metadata datasets\n";
      return 1;
    }
  }

  // Mismatched column length is refused
  auto broken = dataset;
  broken.tables.front().columns.front().values.pop_back();
  if (writer.write(directory / "broken.h5", broken)) {
    std::cerr << "Expected failure for a short column\n";
    return 1;
  }

  // Whole pipeline: analyses to file
  io::Configuration config;
  config.analyses.efficiency_range.points = 5;
  config.analyses.combined_range.points = 5;
  config.output.output_directory = directory.string();

  auto provider = thermophysics::create_property_provider(config.properties);
  if (!provider) {
    std::cerr << provider.error().message() << "\n";
    return 1;
  }

  core::PerformanceMetrics metrics;
  core::AnalysisRunner runner;
  auto results = runner.run_analyses(**provider, config, metrics);
  if (!results) {
    std::cerr << results.error().message << "\n";
    return 1;
  }

  core::OutputManager output;
  auto files = output.write_analysis_results(*results, config, **provider, "pipeline", metrics);
  if (!files || files->size() != 1 || !std::filesystem::exists(files->front())) {
    std::cerr << "Pipeline output not written\n";
    return 1;
  }

  {
    const io::output::HDF5Reader reader(files->front());
    auto design_eta = reader.read_vector("/design_point/brayton_efficiency");
    if (!design_eta || design_eta->size() != 1 ||
        std::abs(design_eta->front() - results->design_point.brayton_efficiency()) > 1e-15) {
      std::cerr << "Design point not stored\n";
      return 1;
    }
    for (const char* group : {"/efficiency_sweep", "/net_work_sweep", "/sensitivity", "/combined_sweep",
                              "/combined_design_points"}) {
      if (!reader.has_object(group)) {
        std::cerr << "Missing group " << group << "\n";
        return 1;
      }
    }
    auto sensitivity_inputs = reader.read_vector("/sensitivity/isentropic_efficiency");
    if (!sensitivity_inputs || sensitivity_inputs->size() != 5) {
      std::cerr << "Sensitivity table not stored\n";
      return 1;
    }
  }

  std::filesystem::remove_all(directory);
  io::output::hdf5::finalize();

  std::cout << "OK\n";
  return 0;
}
