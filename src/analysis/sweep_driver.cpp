#include "brayton/analysis/sweep_driver.hpp"
#include <cmath>
#include <format>
#include <string>
#include <utility>

namespace brayton::analysis {

namespace {

// Tags a failed outcome with the swept input so sweep reports can name the point
template <typename Outcome>
auto with_context(Outcome outcome, std::string context) -> Outcome {
  if (!outcome) {
    outcome.error().add_context(std::move(context));
  }
  return outcome;
}

} // namespace

auto linear_range(double start, double stop, int points) -> std::expected<std::vector<double>, AnalysisError> {

  if (!std::isfinite(start) || !std::isfinite(stop)) {
    return std::unexpected(AnalysisError(std::format("Non-finite range bounds [{}, {}]", start, stop)));
  }
  if (points < 1) {
    return std::unexpected(AnalysisError(std::format("Range needs at least one point, got {}", points)));
  }
  if (points == 1) {
    return std::vector<double>{start};
  }

  std::vector<double> values(static_cast<std::size_t>(points));
  const double step = (stop - start) / (points - 1);
  for (int i = 0; i < points; ++i) {
    values[i] = start + i * step;
  }
  // Exact end point regardless of rounding in the step
  values.back() = stop;
  return values;
}

auto matched_efficiency_pairs(std::span<const double> efficiencies) -> std::vector<EfficiencyPair> {
  std::vector<EfficiencyPair> pairs;
  pairs.reserve(efficiencies.size());
  for (const double eta : efficiencies) {
    pairs.push_back({eta, eta});
  }
  return pairs;
}

auto metric_value(const cycle::CycleResult& result, SweepMetric metric) noexcept -> std::optional<double> {
  switch (metric) {
  case SweepMetric::NetWork:
    return result.net_work;
  case SweepMetric::ThermalEfficiency:
    return result.thermal_efficiency;
  case SweepMetric::CombinedEfficiency:
    return result.combined_efficiency;
  }
  return std::nullopt;
}

auto SweepDriver::sweep_compression_ratio(const cycle::CycleParameters& base, std::span<const double> ratios) const
    -> BraytonSweep {
  BraytonSweep sweep;
  sweep.reserve(ratios.size());

  for (const double r : ratios) {
    auto params = base;
    params.compression_ratio = r;
    sweep.push_back({r, with_context(evaluator_.brayton().evaluate(params), std::format("compression_ratio = {}", r))});
  }
  return sweep;
}

auto SweepDriver::sweep_efficiency(const cycle::CycleParameters& base,
                                   std::span<const EfficiencyPair> efficiencies) const -> BraytonSweep {
  BraytonSweep sweep;
  sweep.reserve(efficiencies.size());

  for (const auto& pair : efficiencies) {
    auto params = base;
    params.compressor_efficiency = pair.compressor;
    params.turbine_efficiency = pair.turbine;
    sweep.push_back({pair.compressor, with_context(evaluator_.brayton().evaluate(params),
                                                   std::format("compressor_efficiency = {}, turbine_efficiency = {}",
                                                               pair.compressor, pair.turbine))});
  }
  return sweep;
}

auto SweepDriver::sweep_combined(const cycle::CycleParameters& base, const cycle::BottomingCycleParameters& bottoming,
                                 std::span<const double> ratios) const -> CombinedSweep {
  CombinedSweep sweep;
  sweep.reserve(ratios.size());

  for (const double r : ratios) {
    auto params = base;
    params.compression_ratio = r;
    sweep.push_back(
        {r, with_context(evaluator_.evaluate(params, bottoming), std::format("compression_ratio = {}", r))});
  }
  return sweep;
}

} // namespace brayton::analysis
