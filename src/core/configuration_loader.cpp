#include "brayton/core/configuration_loader.hpp"
#include "brayton/core/constants.hpp"
#include "brayton/io/config_manager.hpp"
#include <format>
#include <iomanip>
#include <iostream>

namespace brayton::core {

auto ConfigurationLoader::load_configuration(const std::string& config_file)
  -> std::expected<LoadResult, ApplicationError> {

  auto config_result = load_config_file(config_file);
  if (!config_result) {
    return std::unexpected(config_result.error());
  }
  auto config = std::move(config_result.value());

  std::cout << "✓ Configuration loaded successfully" << std::endl;

  auto provider_result = create_provider(config.properties);
  if (!provider_result) {
    return std::unexpected(provider_result.error());
  }
  auto provider = std::move(provider_result.value());

  const auto domain = provider->temperature_domain();
  std::cout << std::format("✓ Property provider created ({:.0f}-{:.0f} K)", domain.min, domain.max) << std::endl;

  display_configuration_info(config, *provider);

  return LoadResult{std::move(config), std::move(provider)};
}

auto ConfigurationLoader::display_configuration_info(const io::Configuration& config,
                                                     const thermophysics::PropertyProvider& provider) const -> void {
  display_property_info(config, provider);
  display_cycle_info(config);
  if (config.verbose) {
    display_solver_info(config);
  }
}

auto ConfigurationLoader::load_config_file(const std::string& config_file)
  -> std::expected<io::Configuration, ApplicationError> {

  io::ConfigurationManager config_manager;
  auto config_result = config_manager.load(config_file);

  if (!config_result) {
    return std::unexpected(ApplicationError{
      "Failed to load config: " + config_result.error().message(),
      constants::indexing::second
    });
  }

  return std::move(config_result.value());
}

auto ConfigurationLoader::create_provider(const io::PropertyConfig& property_config)
  -> std::expected<std::unique_ptr<thermophysics::PropertyProvider>, ApplicationError> {

  std::cout << "Creating property provider: "
            << (property_config.source == io::PropertyConfig::Source::BuiltinAir ? "built-in air table"
                                                                                 : property_config.name)
            << std::endl;

  auto provider_result = thermophysics::create_property_provider(property_config);
  if (!provider_result) {
    return std::unexpected(ApplicationError{
      "Failed to create property provider: " + provider_result.error().message(),
      constants::indexing::second
    });
  }

  return std::move(provider_result.value());
}

auto ConfigurationLoader::display_property_info(const io::Configuration& config,
                                                const thermophysics::PropertyProvider& provider) const -> void {
  const auto domain = provider.temperature_domain();
  std::cout << "\nProperty data:" << std::endl;
  std::cout << "  Source        : " << provider.name() << std::endl;
  std::cout << "  Interpolation : "
            << (config.properties.interpolation == io::PropertyConfig::Interpolation::Linear ? "linear"
                                                                                             : "natural cubic spline")
            << std::endl;
  std::cout << std::format("  Domain        : {:.1f} K - {:.1f} K", domain.min, domain.max) << std::endl;
}

auto ConfigurationLoader::display_cycle_info(const io::Configuration& config) const -> void {
  const auto& cycle = config.cycle;
  std::cout << "\n" << constants::string_processing::colors::cyan
            << "┌─ CYCLE SETUP ─────────────────────────────┐"
            << constants::string_processing::colors::reset << std::endl;
  std::cout << "│ Compression ratio  : " << std::setw(20) << std::left << cycle.compression_ratio << " │" << std::endl;
  std::cout << "│ Inlet T1 [K]       : " << std::setw(20) << std::left << cycle.inlet_temperature << " │" << std::endl;
  std::cout << "│ Turbine inlet T3 [K]: " << std::setw(19) << std::left << cycle.turbine_inlet_temperature << " │"
            << std::endl;
  std::cout << "│ η compressor       : " << std::setw(20) << std::left << cycle.compressor_efficiency << " │"
            << std::endl;
  std::cout << "│ η turbine          : " << std::setw(20) << std::left << cycle.turbine_efficiency << " │" << std::endl;
  std::cout << "│ R [kJ/(kg·K)]      : " << std::setw(20) << std::left << cycle.gas_constant << " │" << std::endl;
  std::cout << "│ Exhaust threshold  : " << std::setw(20) << std::left
            << config.bottoming.exhaust_temperature_threshold << " │" << std::endl;
  std::cout << constants::string_processing::colors::cyan
            << "└───────────────────────────────────────────┘"
            << constants::string_processing::colors::reset << std::endl;
}

auto ConfigurationLoader::display_solver_info(const io::Configuration& config) const -> void {
  const auto& solver = config.solver;
  const auto& bottoming = config.bottoming;
  std::cout << "\nSolver settings:" << std::endl;
  std::cout << "  Tolerance          : " << solver.tolerance << " K (residual " << solver.residual_tolerance << ")"
            << std::endl;
  std::cout << "  Max iterations     : " << solver.max_iterations << " (" << solver.max_bracket_expansions
            << " bracket expansions, growth " << solver.bracket_growth << ")" << std::endl;
  std::cout << "  Search interval    : [" << solver.min_temperature << ", " << solver.max_temperature << "] K"
            << std::endl;
  std::cout << "  Seed exponent      : " << solver.seed_exponent << std::endl;
  std::cout << "\nBottoming cycle:" << std::endl;
  std::cout << "  Stack temperature  : " << bottoming.stack_temperature << " K" << std::endl;
  std::cout << "  Rankine heat input : " << bottoming.rankine_heat_input_per_kg << " kJ/kg" << std::endl;
  std::cout << "  Rankine efficiency : " << bottoming.rankine_efficiency_percent << " %" << std::endl;
}

} // namespace brayton::core
