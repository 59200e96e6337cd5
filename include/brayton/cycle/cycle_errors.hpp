#pragma once
#include "../core/exceptions.hpp"
#include <optional>
#include <source_location>
#include <string_view>

namespace brayton::cycle {

enum class CycleErrorKind { RootFindingFailure, InvalidParameter, DegenerateCycle, PropertyEvaluation };

[[nodiscard]] constexpr auto to_string(CycleErrorKind kind) noexcept -> std::string_view {
  switch (kind) {
  case CycleErrorKind::RootFindingFailure:
    return "RootFindingFailure";
  case CycleErrorKind::InvalidParameter:
    return "InvalidParameter";
  case CycleErrorKind::DegenerateCycle:
    return "DegenerateCycle";
  case CycleErrorKind::PropertyEvaluation:
    return "PropertyEvaluation";
  }
  return "Unknown";
}

// Every cycle failure travels as a CycleError; the subclasses only set the kind and payload
class CycleError : public core::BraytonException {
private:
  CycleErrorKind kind_;
  std::optional<double> target_;
  std::optional<double> last_temperature_;

protected:
  CycleError(CycleErrorKind kind, std::string_view message, std::optional<double> target,
             std::optional<double> last_temperature, std::source_location location)
      : BraytonException(std::format("Cycle Error [{}]: {}", to_string(kind), message), location), kind_(kind),
        target_(target), last_temperature_(last_temperature) {}

public:
  [[nodiscard]] auto kind() const noexcept -> CycleErrorKind { return kind_; }

  // Set for root-finding failures only
  [[nodiscard]] auto target() const noexcept -> std::optional<double> { return target_; }
  [[nodiscard]] auto last_temperature() const noexcept -> std::optional<double> { return last_temperature_; }
};

class RootFindingFailure : public CycleError {
public:
  RootFindingFailure(std::string_view message, double target, double last_temperature,
                     std::source_location location = std::source_location::current())
      : CycleError(CycleErrorKind::RootFindingFailure,
                   std::format("{} (target {:.6f}, last temperature {:.4f} K)", message, target, last_temperature),
                   target, last_temperature, location) {}
};

class InvalidParameter : public CycleError {
public:
  InvalidParameter(std::string_view parameter, std::string_view message,
                   std::source_location location = std::source_location::current())
      : CycleError(CycleErrorKind::InvalidParameter, std::format("'{}' {}", parameter, message), std::nullopt,
                   std::nullopt, location) {}
};

class DegenerateCycle : public CycleError {
public:
  explicit DegenerateCycle(std::string_view message, std::source_location location = std::source_location::current())
      : CycleError(CycleErrorKind::DegenerateCycle, message, std::nullopt, std::nullopt, location) {}
};

class PropertyEvaluationFailure : public CycleError {
public:
  explicit PropertyEvaluationFailure(std::string_view message,
                                     std::source_location location = std::source_location::current())
      : CycleError(CycleErrorKind::PropertyEvaluation, message, std::nullopt, std::nullopt, location) {}
};

} // namespace brayton::cycle
