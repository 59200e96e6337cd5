#pragma once
#include "cycle_errors.hpp"
#include <expected>

namespace brayton::cycle {

enum class ComponentMode { Compression, Expansion };

// Actual exit enthalpy of a compressor or turbine leg from its isentropic exit enthalpy
[[nodiscard]] auto apply_isentropic_efficiency(double h_in, double h_out_isentropic, double efficiency,
                                               ComponentMode mode) -> std::expected<double, CycleError>;

} // namespace brayton::cycle
