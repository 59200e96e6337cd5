#pragma once
#include "../core/exceptions.hpp"
#include <format>
#include <source_location>
#include <string_view>

namespace brayton::numerics {

class NumericsError : public core::BraytonException {
public:
  explicit NumericsError(std::string_view message, std::source_location location = std::source_location::current())
      : BraytonException(std::format("Numerics Error: {}", message), location) {}
};

// Raised by the scalar root finders; keeps the last iterate so callers can report it
class RootFindingError : public NumericsError {
private:
  double last_estimate_;
  int iterations_;

public:
  RootFindingError(std::string_view message, double last_estimate, int iterations,
                   std::source_location location = std::source_location::current())
      : NumericsError(std::format("Root finding failed: {}", message), location), last_estimate_(last_estimate),
        iterations_(iterations) {}

  [[nodiscard]] auto last_estimate() const noexcept -> double { return last_estimate_; }
  [[nodiscard]] auto iterations() const noexcept -> int { return iterations_; }
};

} // namespace brayton::numerics
