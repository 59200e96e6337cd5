#include "brayton/cycle/component_state_model.hpp"
#include <cmath>
#include <format>

namespace brayton::cycle {

auto apply_isentropic_efficiency(double h_in, double h_out_isentropic, double efficiency, ComponentMode mode)
    -> std::expected<double, CycleError> {

  if (!std::isfinite(efficiency) || efficiency <= 0.0 || efficiency > 1.0) {
    return std::unexpected(
        InvalidParameter("isentropic_efficiency", std::format("must lie in (0, 1], got {}", efficiency)));
  }
  if (!std::isfinite(h_in) || !std::isfinite(h_out_isentropic)) {
    return std::unexpected(DegenerateCycle("non-finite enthalpy passed to the component model"));
  }

  // Ideal component: keep the isentropic enthalpy bit for bit
  if (efficiency == 1.0) {
    return h_out_isentropic;
  }

  switch (mode) {
  case ComponentMode::Compression:
    return h_in + (h_out_isentropic - h_in) / efficiency;
  case ComponentMode::Expansion:
    return h_in - efficiency * (h_in - h_out_isentropic);
  }

  return std::unexpected(InvalidParameter("mode", "unknown component mode"));
}

} // namespace brayton::cycle
