#pragma once
#include "../core/exceptions.hpp"
#include "../cycle/combined_cycle_evaluator.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace brayton::analysis {

class AnalysisError : public core::BraytonException {
public:
  explicit AnalysisError(std::string_view message, std::source_location location = std::source_location::current())
      : BraytonException(std::format("Analysis Error: {}", message), location) {}
};

// One evaluation of a sweep; a failed evaluation keeps its error and the sweep moves on
template <typename Result> struct SweepEntry {
  double input;
  std::expected<Result, cycle::CycleError> outcome;

  [[nodiscard]] auto succeeded() const noexcept -> bool { return outcome.has_value(); }
};

using BraytonSweep = std::vector<SweepEntry<cycle::CycleResult>>;
using CombinedSweep = std::vector<SweepEntry<cycle::CombinedCycleResult>>;

struct EfficiencyPair {
  double compressor;
  double turbine;
};

enum class SweepMetric { NetWork, ThermalEfficiency, CombinedEfficiency };

struct Optimum {
  std::size_t index;
  double input;
  double value;
};

// Evenly spaced samples from start to stop, both included
[[nodiscard]] auto linear_range(double start, double stop, int points) -> std::expected<std::vector<double>, AnalysisError>;

// Compressor and turbine sharing each efficiency value
[[nodiscard]] auto matched_efficiency_pairs(std::span<const double> efficiencies) -> std::vector<EfficiencyPair>;

[[nodiscard]] auto metric_value(const cycle::CycleResult& result, SweepMetric metric) noexcept -> std::optional<double>;

[[nodiscard]] inline auto metric_value(const cycle::CombinedCycleResult& result, SweepMetric metric) noexcept
    -> std::optional<double> {
  return metric_value(result.cycle, metric);
}

/**
 * @brief Linear scan for the maximising entry
 *
 * Failed entries never win, ties keep the first occurrence and extrapolated
 * entries are skipped on request. Returns nullopt when no entry qualifies.
 */
template <typename Result>
[[nodiscard]] auto find_optimum(const std::vector<SweepEntry<Result>>& sweep, SweepMetric metric,
                                bool exclude_extrapolated = false) -> std::optional<Optimum> {
  std::optional<Optimum> best;
  for (std::size_t i = 0; i < sweep.size(); ++i) {
    const auto& entry = sweep[i];
    if (!entry.outcome) {
      continue;
    }
    if (exclude_extrapolated && entry.outcome->extrapolated()) {
      continue;
    }
    const auto value = metric_value(*entry.outcome, metric);
    if (!value) {
      continue;
    }
    if (!best || *value > best->value) {
      best = Optimum{i, entry.input, *value};
    }
  }
  return best;
}

/**
 * @brief Runs the cycle evaluators over ordered parameter ranges
 *
 * Produces exactly one entry per input, in input order.
 */
class SweepDriver {
private:
  cycle::CombinedCycleEvaluator evaluator_;

public:
  explicit SweepDriver(const thermophysics::PropertyProvider& provider, cycle::SolverSettings settings = {}) noexcept
      : evaluator_(provider, settings) {}

  [[nodiscard]] auto sweep_compression_ratio(const cycle::CycleParameters& base,
                                             std::span<const double> ratios) const -> BraytonSweep;

  // Entry input is the compressor efficiency of each pair
  [[nodiscard]] auto sweep_efficiency(const cycle::CycleParameters& base,
                                      std::span<const EfficiencyPair> efficiencies) const -> BraytonSweep;

  [[nodiscard]] auto sweep_combined(const cycle::CycleParameters& base, const cycle::BottomingCycleParameters& bottoming,
                                    std::span<const double> ratios) const -> CombinedSweep;

  [[nodiscard]] auto evaluator() const noexcept -> const cycle::CombinedCycleEvaluator& { return evaluator_; }
};

} // namespace brayton::analysis
