#pragma once
#include "../io/config_types.hpp"
#include "../thermophysics/property_provider.hpp"
#include "application_types.hpp"
#include <expected>
#include <memory>
#include <string>

namespace brayton::core {

class ConfigurationLoader {
public:
  struct LoadResult {
    io::Configuration config;
    std::unique_ptr<thermophysics::PropertyProvider> provider;
  };

  // Load configuration and create the property provider
  [[nodiscard]] auto load_configuration(const std::string& config_file)
    -> std::expected<LoadResult, ApplicationError>;

  // Display configuration information
  auto display_configuration_info(const io::Configuration& config,
                                  const thermophysics::PropertyProvider& provider) const -> void;

private:
  [[nodiscard]] auto load_config_file(const std::string& config_file)
    -> std::expected<io::Configuration, ApplicationError>;

  [[nodiscard]] auto create_provider(const io::PropertyConfig& property_config)
    -> std::expected<std::unique_ptr<thermophysics::PropertyProvider>, ApplicationError>;

  auto display_property_info(const io::Configuration& config,
                             const thermophysics::PropertyProvider& provider) const -> void;

  auto display_cycle_info(const io::Configuration& config) const -> void;

  auto display_solver_info(const io::Configuration& config) const -> void;
};

} // namespace brayton::core
