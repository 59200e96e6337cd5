#include "brayton/numerics/tridiagonal_solver.hpp"
#include "brayton/core/constants.hpp"
#include <cmath>
#include <format>

namespace brayton::numerics {

namespace {

// Forward elimination, overwrites the modified upper diagonal and rhs
[[nodiscard]] auto thomas_forward_sweep(std::span<const double> lower, std::span<const double> main_diag,
                                        std::span<double> upper_mod,
                                        std::span<double> rhs_mod) -> std::expected<void, NumericsError> {
  const auto n = main_diag.size();

  if (std::abs(main_diag[0]) < constants::tolerance::diagonal) {
    return std::unexpected(NumericsError("Zero diagonal element at position 0"));
  }

  upper_mod[0] /= main_diag[0];
  rhs_mod[0] /= main_diag[0];

  for (std::size_t i = 1; i < n; ++i) {
    const double pivot = main_diag[i] - lower[i] * upper_mod[i - 1];
    if (std::abs(pivot) < constants::tolerance::diagonal) {
      return std::unexpected(NumericsError(std::format("Zero diagonal element at position {}", i)));
    }
    if (i + 1 < n) {
      upper_mod[i] /= pivot;
    }
    rhs_mod[i] = (rhs_mod[i] - lower[i] * rhs_mod[i - 1]) / pivot;
  }

  return {};
}

} // namespace

auto solve_tridiagonal(std::span<const double> lower, std::span<const double> main_diag, std::span<const double> upper,
                       std::span<const double> rhs) -> std::expected<std::vector<double>, NumericsError> {
  const auto n = main_diag.size();

  if (lower.size() != n || upper.size() != n || rhs.size() != n) {
    return std::unexpected(NumericsError("Incompatible array sizes in Thomas algorithm"));
  }

  if (n == 0) {
    return std::unexpected(NumericsError("Empty tridiagonal system"));
  }

  std::vector<double> upper_mod(upper.begin(), upper.end());
  std::vector<double> solution(rhs.begin(), rhs.end());

  if (auto result = thomas_forward_sweep(lower, main_diag, upper_mod, solution); !result) {
    return std::unexpected(result.error());
  }

  // Backward substitution
  for (std::size_t i = n - 1; i-- > 0;) {
    solution[i] -= upper_mod[i] * solution[i + 1];
  }

  return solution;
}

} // namespace brayton::numerics
