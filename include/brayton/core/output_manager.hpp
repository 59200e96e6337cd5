#pragma once
#include "../io/config_types.hpp"
#include "../io/output/output_types.hpp"
#include "../thermophysics/property_provider.hpp"
#include "analysis_runner.hpp"
#include "application_types.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace brayton::core {

class OutputManager {
public:
  // Initialize output system
  [[nodiscard]] auto initialize_output_system(const io::Configuration& config) -> std::expected<void, ApplicationError>;

  // Gather every analysis into the tables written to disk
  [[nodiscard]] auto build_dataset(const AnalysisRunner::AnalysisResults& results, const io::Configuration& config,
                                   const thermophysics::PropertyProvider& provider) const -> io::output::AnalysisDataset;

  // Write analysis results
  [[nodiscard]] auto write_analysis_results(const AnalysisRunner::AnalysisResults& results,
                                            const io::Configuration& config,
                                            const thermophysics::PropertyProvider& provider,
                                            const std::string& case_name, PerformanceMetrics& metrics)
      -> std::expected<std::vector<std::filesystem::path>, ApplicationError>;

  // Display planned output files
  auto display_planned_outputs(const io::Configuration& config, const std::string& case_name) const -> void;

  [[nodiscard]] static auto output_path(const io::Configuration& config, const std::string& case_name)
      -> std::filesystem::path;

private:
  [[nodiscard]] auto initialize_hdf5() -> std::expected<void, ApplicationError>;
};

} // namespace brayton::core
