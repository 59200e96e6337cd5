#include "brayton/cycle/isentropic_state_resolver.hpp"
#include <cmath>
#include <iostream>
#include <limits>

using namespace brayton;

int main() {
  auto provider_result = thermophysics::create_property_provider(io::PropertyConfig{});
  if (!provider_result) {
    std::cerr << provider_result.error().message() << "\n";
    return 1;
  }
  const auto& air = *provider_result.value();
  const cycle::IsentropicStateResolver resolver(air);

  // Entropy and enthalpy inversions recover the temperature they came from
  for (double T : {250.0, 575.0, 1130.0, 1850.0}) {
    const double s = *air.entropy(T);
    const double h = *air.enthalpy(T);

    auto from_s = resolver.resolve_isentropic_temperature(s, 0.6 * T);
    if (!from_s || std::abs(from_s->temperature - T) > 1e-6) {
      std::cerr << "Entropy inversion missed " << T << " K\n";
      return 1;
    }
    auto from_h = resolver.resolve_enthalpy_temperature(h, 1.7 * T);
    if (!from_h || std::abs(from_h->temperature - T) > 1e-6 || from_h->extrapolated) {
      std::cerr << "Enthalpy inversion missed " << T << " K\n";
      return 1;
    }
  }

  // r = 1: no entropy change, the inlet temperature comes back exactly
  const double T1 = 298.15;
  const double s1 = *air.entropy(T1);
  const double R = 0.287;
  auto unchanged = resolver.resolve_isentropic_temperature(s1 + R * std::log(1.0), resolver.compression_seed(T1, 1.0));
  if (!unchanged || unchanged->temperature != T1) {
    std::cerr << "r = 1 should return the inlet temperature\n";
    return 1;
  }

  // Compression raises and expansion lowers the temperature
  auto compressed = resolver.resolve_isentropic_temperature(s1 + R * std::log(10.0), resolver.compression_seed(T1, 10.0));
  if (!compressed || compressed->temperature <= T1) {
    std::cerr << "Isentropic compression should raise the temperature\n";
    return 1;
  }
  const double s3 = *air.entropy(1200.0);
  auto expanded = resolver.resolve_isentropic_temperature(s3 - R * std::log(10.0), resolver.expansion_seed(1200.0, 10.0));
  if (!expanded || expanded->temperature >= 1200.0) {
    std::cerr << "Isentropic expansion should lower the temperature\n";
    return 1;
  }

  // States outside the table are flagged
  auto hot = resolver.state_at(2300.0);
  if (!hot || !hot->extrapolated) {
    std::cerr << "State beyond the table should be flagged as extrapolated\n";
    return 1;
  }

  // Unreachable target within the search limits
  cycle::SolverSettings narrow;
  narrow.max_temperature = 2500.0;
  const cycle::IsentropicStateResolver limited(air, narrow);
  const double far_entropy = *air.entropy(5000.0);
  auto failed = limited.resolve_isentropic_temperature(far_entropy, 1000.0);
  if (failed || failed.error().kind() != cycle::CycleErrorKind::RootFindingFailure ||
      !failed.error().last_temperature() || !failed.error().target()) {
    std::cerr << "Expected RootFindingFailure with diagnostics\n";
    return 1;
  }

  // Non-finite target
  auto nan_target = resolver.resolve_enthalpy_temperature(std::numeric_limits<double>::quiet_NaN(), 500.0);
  if (nan_target) {
    std::cerr << "Expected failure for non-finite target\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
