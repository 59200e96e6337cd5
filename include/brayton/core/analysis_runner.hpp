#pragma once
#include "../analysis/sweep_driver.hpp"
#include "../io/config_types.hpp"
#include "../thermophysics/property_provider.hpp"
#include "application_types.hpp"
#include <expected>
#include <optional>

namespace brayton::core {

// Configuration sections mapped onto the cycle model
[[nodiscard]] auto to_cycle_parameters(const io::CycleConfig& config) noexcept -> cycle::CycleParameters;
[[nodiscard]] auto to_bottoming_parameters(const io::BottomingConfig& config) noexcept
    -> cycle::BottomingCycleParameters;
[[nodiscard]] auto to_solver_settings(const io::SolverConfig& config) noexcept -> cycle::SolverSettings;

class AnalysisRunner {
public:
  template <typename Sweep> struct SweepRun {
    Sweep entries;
    std::optional<analysis::Optimum> optimum;
  };

  struct AnalysisResults {
    cycle::CycleParameters design_parameters;
    cycle::CombinedCycleResult design_point;
    std::optional<SweepRun<analysis::BraytonSweep>> efficiency_sweep;
    std::optional<SweepRun<analysis::BraytonSweep>> net_work_sweep;
    std::optional<SweepRun<analysis::BraytonSweep>> sensitivity;
    std::optional<SweepRun<analysis::CombinedSweep>> combined_sweep;
    analysis::CombinedSweep combined_design_points;
  };

  // Design point followed by every enabled analysis
  [[nodiscard]] auto run_analyses(const thermophysics::PropertyProvider& provider, const io::Configuration& config,
                                  PerformanceMetrics& metrics) -> std::expected<AnalysisResults, ApplicationError>;

  auto display_results(const AnalysisResults& results) const -> void;

private:
  [[nodiscard]] auto ratio_range(const io::AnalysesConfig::RatioRange& range, std::string_view name) const
      -> std::expected<std::vector<double>, ApplicationError>;

  template <typename Sweep> auto count_outcomes(const Sweep& sweep, PerformanceMetrics& metrics) const -> void;

  auto display_design_point(const AnalysisResults& results) const -> void;

  auto display_optimum(std::string_view label, const std::optional<analysis::Optimum>& optimum, std::string_view input,
                       bool as_percentage) const -> void;

  template <typename Sweep> auto display_failures(std::string_view label, const Sweep& sweep) const -> void;
};

} // namespace brayton::core
