#include "brayton/cycle/component_state_model.hpp"
#include <cmath>
#include <iostream>

using namespace brayton;

int main() {
  using cycle::ComponentMode;

  // Ideal components pass the isentropic enthalpy through unchanged
  auto ideal_c = cycle::apply_isentropic_efficiency(298.4, 575.8, 1.0, ComponentMode::Compression);
  auto ideal_t = cycle::apply_isentropic_efficiency(1277.8, 666.3, 1.0, ComponentMode::Expansion);
  if (!ideal_c || *ideal_c != 575.8 || !ideal_t || *ideal_t != 666.3) {
    std::cerr << "Efficiency of 1 must return the isentropic enthalpy\n";
    return 1;
  }

  // Compressor: h2 = h1 + (h2s - h1) / eta
  auto h2 = cycle::apply_isentropic_efficiency(300.0, 580.0, 0.8, ComponentMode::Compression);
  if (!h2 || std::abs(*h2 - 650.0) > 1e-12) {
    std::cerr << "Compressor exit enthalpy mismatch\n";
    return 1;
  }

  // Turbine: h4 = h3 - eta (h3 - h4s)
  auto h4 = cycle::apply_isentropic_efficiency(1300.0, 700.0, 0.9, ComponentMode::Expansion);
  if (!h4 || std::abs(*h4 - 760.0) > 1e-12) {
    std::cerr << "Turbine exit enthalpy mismatch\n";
    return 1;
  }

  // Efficiencies outside (0, 1]
  for (double eta : {0.0, -0.2, 1.05}) {
    auto bad = cycle::apply_isentropic_efficiency(300.0, 580.0, eta, ComponentMode::Compression);
    if (bad || bad.error().kind() != cycle::CycleErrorKind::InvalidParameter) {
      std::cerr << "Expected InvalidParameter for efficiency " << eta << "\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
