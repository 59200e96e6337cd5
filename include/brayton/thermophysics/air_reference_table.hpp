#pragma once
#include "tabulated_air_properties.hpp"

namespace brayton::thermophysics {

// Ideal-gas air, 200-2000 K: h [kJ/kg] and s° [kJ/(kg·K)] referenced to 0 K
[[nodiscard]] auto reference_air_table() -> const PropertyTable&;

inline constexpr std::string_view reference_air_name = "ideal-gas air (built-in reference table)";

} // namespace brayton::thermophysics
