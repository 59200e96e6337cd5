#include "brayton/thermophysics/air_reference_table.hpp"
#include "brayton/thermophysics/property_provider.hpp"
#include "brayton/thermophysics/tabulated_air_properties.hpp"
#include <cmath>
#include <iostream>
#include <limits>

using namespace brayton;

int main() {
  io::PropertyConfig config;
  auto provider_result = thermophysics::create_property_provider(config);
  if (!provider_result) {
    std::cerr << provider_result.error().message() << "\n";
    return 1;
  }
  const auto& air = *provider_result.value();

  // Tabulated knots are reproduced exactly
  const auto& table = thermophysics::reference_air_table();
  for (std::size_t i = 0; i < table.temperature.size(); ++i) {
    auto h = air.enthalpy(table.temperature[i]);
    auto s = air.entropy(table.temperature[i]);
    if (!h || !s || std::abs(*h - table.enthalpy[i]) > 1e-9 || std::abs(*s - table.entropy[i]) > 1e-9) {
      std::cerr << "Built-in table not reproduced at " << table.temperature[i] << " K\n";
      return 1;
    }
  }

  // Between knots the curves stay monotonic
  double previous_h = -1.0;
  double previous_s = -1.0;
  for (double T = 210.0; T < 2000.0; T += 17.0) {
    auto h = air.enthalpy(T);
    auto s = air.entropy(T);
    if (!h || !s || *h <= previous_h || *s <= previous_s) {
      std::cerr << "Properties not increasing at " << T << " K\n";
      return 1;
    }
    previous_h = *h;
    previous_s = *s;
  }

  // Domain
  const auto domain = air.temperature_domain();
  if (domain.min != 200.0 || domain.max != 2000.0 || air.is_within_domain(2500.0) || !air.is_within_domain(300.0)) {
    std::cerr << "Unexpected temperature domain\n";
    return 1;
  }

  // Extrapolation beyond the table is allowed and continues upward
  auto h_hot = air.enthalpy(2400.0);
  if (!h_hot || *h_hot <= table.enthalpy.back()) {
    std::cerr << "Extrapolated enthalpy should exceed the last table value\n";
    return 1;
  }

  // Non-physical temperatures are rejected
  if (air.enthalpy(0.0) || air.entropy(-10.0) || air.enthalpy(std::numeric_limits<double>::quiet_NaN())) {
    std::cerr << "Expected failure for non-physical temperature\n";
    return 1;
  }

  // Inline tables are validated
  io::PropertyConfig inline_config;
  inline_config.source = io::PropertyConfig::Source::InlineTable;
  inline_config.temperatures = {300.0, 400.0, 500.0};
  inline_config.enthalpies = {300.19, 400.98};
  inline_config.entropies = {1.70203, 1.99194, 2.21952};
  if (thermophysics::create_property_provider(inline_config)) {
    std::cerr << "Expected failure for mismatched column lengths\n";
    return 1;
  }

  inline_config.enthalpies = {300.19, 400.98, 503.02};
  inline_config.entropies = {1.70203, 1.60000, 2.21952};
  if (thermophysics::create_property_provider(inline_config)) {
    std::cerr << "Expected failure for decreasing entropy\n";
    return 1;
  }

  inline_config.temperatures = {300.0, 300.0, 500.0};
  inline_config.entropies = {1.70203, 1.99194, 2.21952};
  if (thermophysics::create_property_provider(inline_config)) {
    std::cerr << "Expected failure for repeated temperature\n";
    return 1;
  }

  // A valid linear inline table interpolates halfway between rows
  inline_config.temperatures = {300.0, 400.0, 500.0};
  inline_config.interpolation = io::PropertyConfig::Interpolation::Linear;
  inline_config.name = "coarse";
  auto coarse = thermophysics::create_property_provider(inline_config);
  if (!coarse) {
    std::cerr << coarse.error().message() << "\n";
    return 1;
  }
  auto h_mid = (*coarse)->enthalpy(350.0);
  if (!h_mid || std::abs(*h_mid - 0.5 * (300.19 + 400.98)) > 1e-12 || (*coarse)->name() != "coarse") {
    std::cerr << "Linear inline table mismatch\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
