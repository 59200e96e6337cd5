#include "brayton/thermophysics/tabulated_air_properties.hpp"
#include "brayton/core/constants.hpp"
#include "brayton/thermophysics/air_reference_table.hpp"
#include <cmath>
#include <format>

namespace brayton::thermophysics {

namespace {

auto build_curve_or_throw(const std::vector<double>& temperature, const std::vector<double>& values,
                          numerics::InterpolationKind kind, std::string_view column) -> numerics::Interpolant {
  auto curve = numerics::Interpolant::create(temperature, values, kind);
  if (!curve) {
    throw ThermophysicsError(std::format("Failed to build {} interpolant: {}", column, curve.error().message()));
  }
  return std::move(curve.value());
}

auto validated_table_or_throw(const PropertyTable& table) -> const PropertyTable& {
  if (auto valid = validate_property_table(table); !valid) {
    throw valid.error();
  }
  return table;
}

auto to_interpolation_kind(io::PropertyConfig::Interpolation interpolation) -> numerics::InterpolationKind {
  switch (interpolation) {
  case io::PropertyConfig::Interpolation::Linear:
    return numerics::InterpolationKind::Linear;
  case io::PropertyConfig::Interpolation::CubicSpline:
    break;
  }
  return numerics::InterpolationKind::NaturalCubicSpline;
}

} // anonymous namespace

auto validate_property_table(const PropertyTable& table) -> std::expected<void, ThermophysicsError> {

  const auto n_rows = table.temperature.size();
  if (table.enthalpy.size() != n_rows || table.entropy.size() != n_rows) {
    return std::unexpected(ThermophysicsError(std::format("Property table column lengths differ: T={}, h={}, s={}",
                                                          n_rows, table.enthalpy.size(), table.entropy.size())));
  }

  if (n_rows < constants::indexing::min_table_rows) {
    return std::unexpected(ThermophysicsError(
        std::format("Property table needs at least {} rows, got {}", constants::indexing::min_table_rows, n_rows)));
  }

  for (std::size_t i = 0; i < n_rows; ++i) {
    const double T = table.temperature[i];
    if (!std::isfinite(T) || !std::isfinite(table.enthalpy[i]) || !std::isfinite(table.entropy[i])) {
      return std::unexpected(ThermophysicsError(std::format("Non-finite value in property table row {}", i)));
    }
    if (T <= 0.0) {
      return std::unexpected(ThermophysicsError(std::format("Non-positive temperature {} K in row {}", T, i)));
    }
    if (i == 0) {
      continue;
    }
    if (T <= table.temperature[i - 1]) {
      return std::unexpected(ThermophysicsError(
          std::format("Temperature column must be strictly increasing (row {}: {} K after {} K)", i, T,
                      table.temperature[i - 1])));
    }
    if (table.entropy[i] <= table.entropy[i - 1]) {
      return std::unexpected(
          ThermophysicsError(std::format("Entropy column must be strictly increasing (row {} at {} K)", i, T)));
    }
    if (table.enthalpy[i] < table.enthalpy[i - 1]) {
      return std::unexpected(
          ThermophysicsError(std::format("Enthalpy column must not decrease (row {} at {} K)", i, T)));
    }
  }

  return {};
}

TabulatedAirProperties::TabulatedAirProperties(std::string name, const PropertyTable& table,
                                               numerics::InterpolationKind kind)
    : name_(std::move(name)),
      enthalpy_curve_(build_curve_or_throw(validated_table_or_throw(table).temperature, table.enthalpy, kind,
                                           "enthalpy")),
      entropy_curve_(build_curve_or_throw(table.temperature, table.entropy, kind, "entropy")) {}

auto TabulatedAirProperties::validate_temperature(double temperature) const
    -> std::expected<void, ThermophysicsError> {
  if (!std::isfinite(temperature) || temperature <= 0.0) {
    return std::unexpected(
        ThermophysicsError(std::format("Invalid temperature {} K requested from '{}'", temperature, name_)));
  }
  return {};
}

auto TabulatedAirProperties::enthalpy(double temperature) const -> std::expected<double, ThermophysicsError> {
  if (auto valid = validate_temperature(temperature); !valid) {
    return std::unexpected(valid.error());
  }
  return enthalpy_curve_(temperature);
}

auto TabulatedAirProperties::entropy(double temperature) const -> std::expected<double, ThermophysicsError> {
  if (auto valid = validate_temperature(temperature); !valid) {
    return std::unexpected(valid.error());
  }
  return entropy_curve_(temperature);
}

auto TabulatedAirProperties::temperature_domain() const noexcept -> TemperatureDomain {
  return {entropy_curve_.x_min(), entropy_curve_.x_max()};
}

auto create_property_provider(const io::PropertyConfig& config)
    -> std::expected<std::unique_ptr<PropertyProvider>, ThermophysicsError> {

  const auto kind = to_interpolation_kind(config.interpolation);

  try {
    switch (config.source) {
    case io::PropertyConfig::Source::BuiltinAir:
      return std::make_unique<TabulatedAirProperties>(std::string(reference_air_name), reference_air_table(), kind);
    case io::PropertyConfig::Source::InlineTable: {
      PropertyTable table{config.temperatures, config.enthalpies, config.entropies};
      return std::make_unique<TabulatedAirProperties>(config.name, table, kind);
    }
    }
  } catch (const ThermophysicsError& e) {
    return std::unexpected(e);
  } catch (const std::exception& e) {
    return std::unexpected(ThermophysicsError(std::format("Failed to create property provider: {}", e.what())));
  }

  return std::unexpected(ThermophysicsError("Unknown property source"));
}

} // namespace brayton::thermophysics
