#pragma once
#include "numerics_errors.hpp"
#include <expected>
#include <span>
#include <vector>

namespace brayton::numerics {

// Solve a scalar tridiagonal system with the Thomas algorithm.
// lower[0] and upper[n-1] are ignored.
[[nodiscard]] auto solve_tridiagonal(std::span<const double> lower, std::span<const double> main_diag,
                                     std::span<const double> upper,
                                     std::span<const double> rhs) -> std::expected<std::vector<double>, NumericsError>;

} // namespace brayton::numerics
