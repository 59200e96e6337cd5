#pragma once
#include "../core/exceptions.hpp"
#include "../io/config_types.hpp"
#include <expected>
#include <memory>
#include <string_view>

namespace brayton::thermophysics {

// Error type for thermophysics operations
class ThermophysicsError : public core::BraytonException {
public:
  explicit ThermophysicsError(std::string_view message, std::source_location location = std::source_location::current())
      : BraytonException(std::format("Thermophysics Error: {}", message), location) {}
};

struct TemperatureDomain {
  double min;  // [K]
  double max;  // [K]

  [[nodiscard]] auto contains(double temperature) const noexcept -> bool {
    return temperature >= min && temperature <= max;
  }
};

// Abstract interface for temperature-dependent working fluid properties
class PropertyProvider {
public:
  virtual ~PropertyProvider() = default;

  // Specific enthalpy [kJ/kg]
  [[nodiscard]] virtual auto enthalpy(double temperature) const -> std::expected<double, ThermophysicsError> = 0;

  // Standard-state specific entropy s°(T) [kJ/(kg·K)]
  [[nodiscard]] virtual auto entropy(double temperature) const -> std::expected<double, ThermophysicsError> = 0;

  // Range covered by the underlying data; values outside are extrapolated
  [[nodiscard]] virtual auto temperature_domain() const noexcept -> TemperatureDomain = 0;

  [[nodiscard]] virtual auto is_within_domain(double temperature) const noexcept -> bool {
    return temperature_domain().contains(temperature);
  }

  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;
};

// Factory function to create the configured property provider
[[nodiscard]] auto create_property_provider(const io::PropertyConfig& config)
    -> std::expected<std::unique_ptr<PropertyProvider>, ThermophysicsError>;

} // namespace brayton::thermophysics
