#include "brayton/io/config_manager.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace brayton;

namespace {

auto write_config(const std::string& name, const std::string& content) -> std::filesystem::path {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

auto load(const std::string& name, const std::string& content) -> std::expected<io::Configuration, core::ConfigurationError> {
  io::ConfigurationManager manager;
  auto path = write_config(name, content);
  auto result = manager.load(path.string());
  std::filesystem::remove(path);
  return result;
}

} // namespace

int main() {
  auto full = load("brayton_full.yaml", R"(
properties:
  source: Inline_Table
  interpolation: linear
  name: coarse_air
  table:
    temperature: [300.0, 400.0, 500.0]
    enthalpy: [300.19, 400.98, 503.02]
    entropy: [1.70203, 1.99194, 2.21952]
cycle:
  compression_ratio: 12.0
  isentropic_efficiency: 0.88
  turbine_efficiency: 0.91
  inlet_temperature: 290.0
  turbine_inlet_temperature: 1300.0
bottoming:
  stack_temperature: 450.0
analyses:
  net_work_sweep:
    enabled: false
  sensitivity:
    compression_ratio: 8.0
    efficiencies: [0.8, 0.9]
  combined_sweep:
    start: 5.0
    stop: 20.0
    points: 4
    design_points: [10.0, 14.0]
output:
  write_hdf5: false
  directory: results
  compression_level: 3
verbose: true
)");
  if (!full) {
    std::cerr << full.error().message() << "\n";
    return 1;
  }
  const auto& config = full.value();
  if (config.properties.source != io::PropertyConfig::Source::InlineTable ||
      config.properties.interpolation != io::PropertyConfig::Interpolation::Linear ||
      config.properties.name != "coarse_air" || config.properties.temperatures.size() != 3) {
    std::cerr << "Property section not parsed\n";
    return 1;
  }
  if (config.cycle.compression_ratio != 12.0 || config.cycle.compressor_efficiency != 0.88 ||
      config.cycle.turbine_efficiency != 0.91 || config.cycle.inlet_temperature != 290.0 ||
      config.cycle.gas_constant != 0.287) {
    std::cerr << "Cycle section not parsed\n";
    return 1;
  }
  if (config.bottoming.stack_temperature != 450.0 || config.bottoming.rankine_efficiency_percent != 36.53) {
    std::cerr << "Bottoming section not parsed\n";
    return 1;
  }
  if (config.analyses.net_work_sweep || !config.analyses.efficiency_sweep ||
      config.analyses.sensitivity_compression_ratio != 8.0 || config.analyses.sensitivity_efficiencies.size() != 2 ||
      config.analyses.combined_range.points != 4 || config.analyses.combined_design_points.size() != 2) {
    std::cerr << "Analyses section not parsed\n";
    return 1;
  }
  if (config.output.write_hdf5 || config.output.output_directory != "results" ||
      config.output.compression_level != 3 || !config.verbose) {
    std::cerr << "Output section not parsed\n";
    return 1;
  }

  // Minimal file: only the cycle section, everything else defaults
  auto minimal = load("brayton_minimal.yaml", R"(
cycle:
  compression_ratio: 10.0
  inlet_temperature: 298.15
  turbine_inlet_temperature: 1200.0
)");
  if (!minimal || minimal->properties.source != io::PropertyConfig::Source::BuiltinAir ||
      minimal->cycle.turbine_efficiency != 0.90 || minimal->analyses.net_work_range.points != 12) {
    std::cerr << "Defaults not applied\n";
    return 1;
  }

  const std::pair<const char*, const char*> rejected[] = {
      {"missing cycle section", "properties:\n  source: builtin\n"},
      {"missing turbine inlet temperature", "cycle:\n  compression_ratio: 10.0\n  inlet_temperature: 298.15\n"},
      {"unknown property source",
       "properties:\n  source: steam\ncycle:\n  compression_ratio: 10.0\n  inlet_temperature: 298.15\n"
       "  turbine_inlet_temperature: 1200.0\n"},
      {"inline table without table",
       "properties:\n  source: inline\ncycle:\n  compression_ratio: 10.0\n  inlet_temperature: 298.15\n"
       "  turbine_inlet_temperature: 1200.0\n"},
      {"reversed sweep range",
       "cycle:\n  compression_ratio: 10.0\n  inlet_temperature: 298.15\n  turbine_inlet_temperature: 1200.0\n"
       "analyses:\n  efficiency_sweep:\n    start: 30.0\n    stop: 2.0\n"},
      {"compression level out of range",
       "cycle:\n  compression_ratio: 10.0\n  inlet_temperature: 298.15\n  turbine_inlet_temperature: 1200.0\n"
       "output:\n  compression_level: 12\n"},
      {"non-numeric ratio",
       "cycle:\n  compression_ratio: ten\n  inlet_temperature: 298.15\n  turbine_inlet_temperature: 1200.0\n"}};

  for (const auto& [what, content] : rejected) {
    if (load("brayton_rejected.yaml", content)) {
      std::cerr << "Expected failure for " << what << "\n";
      return 1;
    }
  }

  // Non-ASCII enum values are lower-cased byte-wise and rejected with the original bytes intact
  auto non_ascii = load("brayton_non_ascii.yaml", "properties:\n  source: \xCE\xB7_AIR\ncycle:\n"
                                                  "  compression_ratio: 10.0\n  inlet_temperature: 298.15\n"
                                                  "  turbine_inlet_temperature: 1200.0\n");
  if (non_ascii || non_ascii.error().message().find("\xCE\xB7_air") == std::string::npos) {
    std::cerr << "Non-ASCII property source not rejected cleanly\n";
    return 1;
  }

  // Missing file
  io::ConfigurationManager manager;
  if (manager.load("/nonexistent/brayton.yaml")) {
    std::cerr << "Expected failure for a missing file\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
