#include "brayton/cycle/parameter_validator.hpp"
#include <cmath>
#include <format>

namespace brayton::cycle {

namespace {

auto require_finite(std::string_view name, double value) -> std::expected<void, CycleError> {
    if (!std::isfinite(value)) {
        return std::unexpected(InvalidParameter(name, std::format("must be finite, got {}", value)));
    }
    return {};
}

auto require_positive(std::string_view name, double value) -> std::expected<void, CycleError> {
    if (auto finite = require_finite(name, value); !finite) {
        return finite;
    }
    if (value <= 0.0) {
        return std::unexpected(InvalidParameter(name, std::format("must be positive, got {}", value)));
    }
    return {};
}

auto require_efficiency(std::string_view name, double value) -> std::expected<void, CycleError> {
    if (auto positive = require_positive(name, value); !positive) {
        return positive;
    }
    if (value > 1.0) {
        return std::unexpected(InvalidParameter(name, std::format("must lie in (0, 1], got {}", value)));
    }
    return {};
}

} // anonymous namespace

auto ParameterValidator::validate_cycle(const CycleParameters& params) -> std::expected<void, CycleError> {

    if (auto r = require_finite("compression_ratio", params.compression_ratio); !r) {
        return r;
    }
    if (params.compression_ratio <= 1.0) {
        return std::unexpected(InvalidParameter(
            "compression_ratio", std::format("must be greater than 1, got {}", params.compression_ratio)));
    }

    if (auto e = require_efficiency("compressor_efficiency", params.compressor_efficiency); !e) {
        return e;
    }
    if (auto e = require_efficiency("turbine_efficiency", params.turbine_efficiency); !e) {
        return e;
    }
    if (auto t = require_positive("inlet_temperature", params.inlet_temperature); !t) {
        return t;
    }
    if (auto t = require_positive("turbine_inlet_temperature", params.turbine_inlet_temperature); !t) {
        return t;
    }
    if (params.turbine_inlet_temperature <= params.inlet_temperature) {
        return std::unexpected(InvalidParameter(
            "turbine_inlet_temperature",
            std::format("must exceed the inlet temperature ({} K <= {} K)", params.turbine_inlet_temperature,
                        params.inlet_temperature)));
    }
    if (auto r = require_positive("gas_constant", params.gas_constant); !r) {
        return r;
    }

    return {};
}

auto ParameterValidator::validate_bottoming(const BottomingCycleParameters& params)
    -> std::expected<void, CycleError> {

    if (auto t = require_positive("stack_temperature", params.stack_temperature); !t) {
        return t;
    }
    if (auto t = require_positive("exhaust_temperature_threshold", params.exhaust_temperature_threshold); !t) {
        return t;
    }
    if (auto q = require_positive("rankine_heat_input_per_kg", params.rankine_heat_input_per_kg); !q) {
        return q;
    }
    if (auto eta = require_finite("rankine_efficiency_percent", params.rankine_efficiency_percent); !eta) {
        return eta;
    }
    if (params.rankine_efficiency_percent < 0.0 || params.rankine_efficiency_percent > 100.0) {
        return std::unexpected(InvalidParameter(
            "rankine_efficiency_percent",
            std::format("must lie in [0, 100], got {}", params.rankine_efficiency_percent)));
    }

    return {};
}

auto ParameterValidator::validate_solver(const SolverSettings& settings) -> std::expected<void, CycleError> {

    if (auto t = require_positive("tolerance", settings.tolerance); !t) {
        return t;
    }
    if (auto t = require_positive("residual_tolerance", settings.residual_tolerance); !t) {
        return t;
    }
    if (settings.max_iterations <= 0) {
        return std::unexpected(InvalidParameter("max_iterations", "must be positive"));
    }
    if (settings.max_bracket_expansions <= 0) {
        return std::unexpected(InvalidParameter("max_bracket_expansions", "must be positive"));
    }
    if (auto g = require_finite("bracket_growth", settings.bracket_growth); !g) {
        return g;
    }
    if (settings.bracket_growth <= 1.0) {
        return std::unexpected(InvalidParameter("bracket_growth", "must be greater than 1"));
    }
    if (auto t = require_positive("min_temperature", settings.min_temperature); !t) {
        return t;
    }
    if (auto t = require_finite("max_temperature", settings.max_temperature); !t) {
        return t;
    }
    if (settings.max_temperature <= settings.min_temperature) {
        return std::unexpected(InvalidParameter("max_temperature", "must exceed min_temperature"));
    }
    if (auto k = require_finite("seed_exponent", settings.seed_exponent); !k) {
        return k;
    }

    return {};
}

} // namespace brayton::cycle
