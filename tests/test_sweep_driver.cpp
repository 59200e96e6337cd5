#include "brayton/analysis/sweep_driver.hpp"
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace brayton;

int main() {
  // Range endpoints are exact
  auto ratios = analysis::linear_range(2.0, 30.0, 12);
  if (!ratios || ratios->size() != 12 || ratios->front() != 2.0 || ratios->back() != 30.0) {
    std::cerr << "linear_range must include both endpoints\n";
    return 1;
  }
  if (analysis::linear_range(2.0, 30.0, 0)) {
    std::cerr << "Expected failure for an empty range\n";
    return 1;
  }

  auto provider_result = thermophysics::create_property_provider(io::PropertyConfig{});
  if (!provider_result) {
    std::cerr << provider_result.error().message() << "\n";
    return 1;
  }
  const analysis::SweepDriver driver(*provider_result.value());
  const cycle::CycleParameters base;

  // Net work peaks inside the compression-ratio range
  auto work_sweep = driver.sweep_compression_ratio(base, *ratios);
  if (work_sweep.size() != ratios->size()) {
    std::cerr << "One entry per input expected\n";
    return 1;
  }
  for (std::size_t i = 0; i < work_sweep.size(); ++i) {
    if (!work_sweep[i].succeeded() || work_sweep[i].input != (*ratios)[i]) {
      std::cerr << "Sweep entry " << i << " failed or out of order\n";
      return 1;
    }
  }
  auto work_peak = analysis::find_optimum(work_sweep, analysis::SweepMetric::NetWork);
  if (!work_peak || work_peak->index == 0 || work_peak->index == work_sweep.size() - 1) {
    std::cerr << "Net-work maximum should be interior\n";
    return 1;
  }
  for (const auto& entry : work_sweep) {
    if (entry.outcome->net_work > work_peak->value) {
      std::cerr << "Optimum is not the maximum\n";
      return 1;
    }
  }

  // Efficiency sensitivity at r = 10 rises strictly with component efficiency
  const std::vector<double> efficiencies{0.86, 0.88, 0.90, 0.92, 0.94};
  const auto pairs = analysis::matched_efficiency_pairs(efficiencies);
  auto sensitivity = driver.sweep_efficiency(base, pairs);
  for (std::size_t i = 0; i < sensitivity.size(); ++i) {
    if (!sensitivity[i].succeeded() || sensitivity[i].input != efficiencies[i]) {
      std::cerr << "Sensitivity entry " << i << " failed\n";
      return 1;
    }
    if (i > 0 && sensitivity[i].outcome->thermal_efficiency <= sensitivity[i - 1].outcome->thermal_efficiency) {
      std::cerr << "Sensitivity sequence not strictly increasing at " << efficiencies[i] << "\n";
      return 1;
    }
  }

  // A failing point does not abort the sweep
  const std::vector<double> mixed{10.0, 0.5, 12.0};
  auto isolated = driver.sweep_compression_ratio(base, mixed);
  if (isolated.size() != 3 || !isolated[0].succeeded() || isolated[1].succeeded() || !isolated[2].succeeded() ||
      isolated[1].outcome.error().kind() != cycle::CycleErrorKind::InvalidParameter) {
    std::cerr << "Failure should stay local to its entry\n";
    return 1;
  }
  auto best = analysis::find_optimum(isolated, analysis::SweepMetric::ThermalEfficiency);
  if (!best || best->index != 2) {
    std::cerr << "Failed entries must not win the optimum\n";
    return 1;
  }

  // The failed entry names its swept input
  const auto& failure = isolated[1].outcome.error();
  if (failure.call_stack().size() != 1 || failure.call_stack().front() != "compression_ratio = 0.5" ||
      failure.full_message().find("compression_ratio = 0.5") == std::string::npos) {
    std::cerr << "Failed entry should carry its compression ratio as context\n";
    return 1;
  }

  // A degenerate point between two valid ones stays local as well
  cycle::CycleParameters cool = base;
  cool.turbine_inlet_temperature = 450.0;
  const std::vector<double> cool_ratios{1.5, 10.0, 2.0};
  auto cool_sweep = driver.sweep_compression_ratio(cool, cool_ratios);
  if (cool_sweep.size() != 3 || !cool_sweep[0].succeeded() || cool_sweep[1].succeeded() ||
      !cool_sweep[2].succeeded() || cool_sweep[1].outcome.error().kind() != cycle::CycleErrorKind::DegenerateCycle) {
    std::cerr << "DegenerateCycle should stay local to its entry\n";
    return 1;
  }

  // Every point above the table is extrapolated, so excluding them leaves no optimum
  cycle::CycleParameters hot = base;
  hot.turbine_inlet_temperature = 2200.0;
  const std::vector<double> hot_ratios{5.0, 10.0, 20.0};
  auto hot_sweep = driver.sweep_compression_ratio(hot, hot_ratios);
  if (!analysis::find_optimum(hot_sweep, analysis::SweepMetric::NetWork)) {
    std::cerr << "Extrapolated entries still count by default\n";
    return 1;
  }
  if (analysis::find_optimum(hot_sweep, analysis::SweepMetric::NetWork, true)) {
    std::cerr << "Excluding extrapolated entries should leave no optimum\n";
    return 1;
  }

  // Ties keep the first occurrence
  const std::vector<double> repeated{10.0, 10.0};
  auto tied = driver.sweep_compression_ratio(base, repeated);
  auto first = analysis::find_optimum(tied, analysis::SweepMetric::NetWork);
  if (!first || first->index != 0) {
    std::cerr << "Ties should keep the first entry\n";
    return 1;
  }

  // Combined sweep: the steam cycle drops out above the threshold ratio
  auto combined = driver.sweep_combined(base, cycle::BottomingCycleParameters{}, *ratios);
  if (!combined.front().succeeded() || !combined.front().outcome->bottoming.active || !combined.back().succeeded() ||
      combined.back().outcome->bottoming.active) {
    std::cerr << "Bottoming cycle should be active at low ratio and inactive at high ratio\n";
    return 1;
  }
  auto combined_peak = analysis::find_optimum(combined, analysis::SweepMetric::CombinedEfficiency);
  if (!combined_peak || !combined[combined_peak->index].outcome->bottoming.active) {
    std::cerr << "Combined optimum should lie where the bottoming cycle is active\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
