#pragma once
#include "../numerics/interpolant.hpp"
#include "property_provider.hpp"
#include <string>
#include <vector>

namespace brayton::thermophysics {

struct PropertyTable {
  std::vector<double> temperature;  // [K]
  std::vector<double> enthalpy;     // [kJ/kg]
  std::vector<double> entropy;      // [kJ/(kg·K)]
};

// Checks row count, column lengths, finiteness and monotonicity of the table
[[nodiscard]] auto validate_property_table(const PropertyTable& table) -> std::expected<void, ThermophysicsError>;

/**
 * @brief Property provider backed by a T, h, s° table
 *
 * Enthalpy and entropy are interpolated independently in temperature. The
 * table is validated and both interpolants are built in the constructor, which
 * throws ThermophysicsError on invalid data; use create_property_provider to
 * get the error as a value.
 */
class TabulatedAirProperties : public PropertyProvider {
private:
  std::string name_;
  numerics::Interpolant enthalpy_curve_;
  numerics::Interpolant entropy_curve_;

  [[nodiscard]] auto validate_temperature(double temperature) const -> std::expected<void, ThermophysicsError>;

public:
  TabulatedAirProperties(std::string name, const PropertyTable& table,
                         numerics::InterpolationKind kind = numerics::InterpolationKind::NaturalCubicSpline);

  [[nodiscard]] auto enthalpy(double temperature) const -> std::expected<double, ThermophysicsError> override;

  [[nodiscard]] auto entropy(double temperature) const -> std::expected<double, ThermophysicsError> override;

  [[nodiscard]] auto temperature_domain() const noexcept -> TemperatureDomain override;

  [[nodiscard]] auto name() const noexcept -> std::string_view override { return name_; }

  [[nodiscard]] auto interpolation() const noexcept -> numerics::InterpolationKind { return enthalpy_curve_.kind(); }
};

} // namespace brayton::thermophysics
