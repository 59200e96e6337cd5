#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <algorithm>
#include <cctype>
#include <concepts>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace brayton::io {

class YamlParser {
private:
  YAML::Node root_;
  std::string file_path_;

  template <typename T>
  [[nodiscard]] auto extract_value(const YAML::Node& node,
                                   std::string_view key) const -> std::expected<T, core::ConfigurationError>;

  // Keeps the default already stored in target when the key is absent
  template <typename T>
  [[nodiscard]] auto extract_optional(const YAML::Node& node, std::string_view key,
                                      T& target) const -> std::expected<void, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto extract_enum(const YAML::Node& node, std::string_view key,
                                  const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_property_config(const YAML::Node& node) const -> std::expected<PropertyConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_cycle_config(const YAML::Node& node) const -> std::expected<CycleConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_solver_config(const YAML::Node& node) const -> std::expected<SolverConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_bottoming_config(const YAML::Node& node) const -> std::expected<BottomingConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_analyses_config(const YAML::Node& node) const -> std::expected<AnalysesConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_ratio_range(const YAML::Node& node, std::string_view section,
                                       AnalysesConfig::RatioRange defaults) const
      -> std::expected<AnalysesConfig::RatioRange, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_output_config(const YAML::Node& node) const -> std::expected<OutputConfig, core::ConfigurationError>;

public:
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  [[nodiscard]] auto parse() const -> std::expected<Configuration, core::ConfigurationError>;
};

// Implementation of template methods
template <typename T>
auto YamlParser::extract_value(const YAML::Node& node,
                               std::string_view key) const -> std::expected<T, core::ConfigurationError> {
  try {
    if (!node[std::string(key)]) {
      return std::unexpected(core::ConfigurationError(std::format("Required field '{}' is missing", key)));
    }

    if constexpr (std::same_as<T, std::vector<double>>) {
      auto sequence = node[std::string(key)];
      if (!sequence.IsSequence()) {
        return std::unexpected(core::ConfigurationError(std::format("Field '{}' must be a sequence", key)));
      }
      std::vector<double> result;
      result.reserve(sequence.size());

      for (const auto& item : sequence) {
        result.push_back(item.as<double>());
      }
      return result;
    } else {
      return node[std::string(key)].as<T>();
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Failed to parse field '{}': {}", key, e.what())));
  }
}

template <typename T>
auto YamlParser::extract_optional(const YAML::Node& node, std::string_view key,
                                  T& target) const -> std::expected<void, core::ConfigurationError> {
  if (!node || !node[std::string(key)]) {
    return {};
  }
  auto result = extract_value<T>(node, key);
  if (!result) {
    return std::unexpected(result.error());
  }
  target = std::move(result.value());
  return {};
}

template <typename EnumType>
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key,
                              const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_result = extract_value<std::string>(node, key);
  if (!str_result) {
    return std::unexpected(str_result.error());
  }

  auto str_value = str_result.value();
  std::ranges::transform(str_value, str_value.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto it = mapping.find(str_value);
  if (it == mapping.end()) {
    std::string valid_options;
    for (const auto& [option, _] : mapping) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - 2);

    return std::unexpected(core::ConfigurationError(
        std::format("Invalid value '{}' for field '{}'. Valid options: {}", str_value, key, valid_options)));
  }

  return it->second;
}

// Enum mappings
namespace enum_mappings {

inline const std::unordered_map<std::string, PropertyConfig::Source> property_sources = {
    {"builtin", PropertyConfig::Source::BuiltinAir},
    {"builtin_air", PropertyConfig::Source::BuiltinAir},
    {"air", PropertyConfig::Source::BuiltinAir},
    {"inline", PropertyConfig::Source::InlineTable},
    {"inline_table", PropertyConfig::Source::InlineTable},
    {"table", PropertyConfig::Source::InlineTable}};

inline const std::unordered_map<std::string, PropertyConfig::Interpolation> interpolations = {
    {"cubic", PropertyConfig::Interpolation::CubicSpline},
    {"cubic_spline", PropertyConfig::Interpolation::CubicSpline},
    {"spline", PropertyConfig::Interpolation::CubicSpline},
    {"linear", PropertyConfig::Interpolation::Linear}};

} // namespace enum_mappings

} // namespace brayton::io
