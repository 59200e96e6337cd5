#include "brayton/io/yaml_parser.hpp"
#include "brayton/core/constants.hpp"
#include "brayton/core/exceptions.hpp"

#include <cmath>

namespace brayton::io {

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile& e) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(core::FileError{std::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::parse() const -> std::expected<Configuration, core::ConfigurationError> {
  try {
    if (!root_ || root_.IsNull()) { // !root_ is overloaded by yaml-cpp, so check emptiness as well
      return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
    }
    if (!root_.IsMap()) {
      return std::unexpected(core::ConfigurationError("Top level of the configuration must be a mapping"));
    }

    Configuration config;

    if (!root_["cycle"]) {
      return std::unexpected(core::ConfigurationError("Missing required 'cycle' section."));
    }

    auto cycle_result = parse_cycle_config(root_["cycle"]);
    if (!cycle_result) {
      return std::unexpected(cycle_result.error());
    }
    config.cycle = std::move(cycle_result.value());

    // Remaining sections fall back to the reference defaults
    if (root_["properties"]) {
      auto prop_result = parse_property_config(root_["properties"]);
      if (!prop_result) {
        return std::unexpected(prop_result.error());
      }
      config.properties = std::move(prop_result.value());
    }

    if (root_["solver"]) {
      auto solver_result = parse_solver_config(root_["solver"]);
      if (!solver_result) {
        return std::unexpected(solver_result.error());
      }
      config.solver = solver_result.value();
    }

    if (root_["bottoming"]) {
      auto bottoming_result = parse_bottoming_config(root_["bottoming"]);
      if (!bottoming_result) {
        return std::unexpected(bottoming_result.error());
      }
      config.bottoming = bottoming_result.value();
    }

    if (root_["analyses"]) {
      auto analyses_result = parse_analyses_config(root_["analyses"]);
      if (!analyses_result) {
        return std::unexpected(analyses_result.error());
      }
      config.analyses = std::move(analyses_result.value());
    }

    if (root_["output"]) {
      auto out_result = parse_output_config(root_["output"]);
      if (!out_result) {
        return std::unexpected(out_result.error());
      }
      config.output = std::move(out_result.value());
    }

    if (auto verbose = extract_optional(root_, "verbose", config.verbose); !verbose) {
      return std::unexpected(verbose.error());
    }

    return config;

  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("YAML error: {}", e.what())));
  } catch (const std::exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Unexpected error while parsing: {}", e.what())));
  }
}

auto YamlParser::parse_property_config(const YAML::Node& node) const
    -> std::expected<PropertyConfig, core::ConfigurationError> {

  PropertyConfig config;

  try {
    auto source_result = extract_enum(node, "source", enum_mappings::property_sources);
    if (!source_result)
      return std::unexpected(source_result.error());
    config.source = source_result.value();

    if (node["interpolation"]) {
      auto interp_result = extract_enum(node, "interpolation", enum_mappings::interpolations);
      if (!interp_result)
        return std::unexpected(interp_result.error());
      config.interpolation = interp_result.value();
    }

    if (config.source == PropertyConfig::Source::InlineTable) {
      if (!node["table"]) {
        throw core::ConfigurationError("Required field 'table' is missing for an inline property source");
      }
      const auto table = node["table"];

      if (auto name = extract_optional(node, "name", config.name); !name)
        return std::unexpected(name.error());

      auto t_result = extract_value<std::vector<double>>(table, "temperature");
      if (!t_result)
        return std::unexpected(t_result.error());
      config.temperatures = std::move(t_result.value());

      auto h_result = extract_value<std::vector<double>>(table, "enthalpy");
      if (!h_result)
        return std::unexpected(h_result.error());
      config.enthalpies = std::move(h_result.value());

      auto s_result = extract_value<std::vector<double>>(table, "entropy");
      if (!s_result)
        return std::unexpected(s_result.error());
      config.entropies = std::move(s_result.value());

      if (config.temperatures.size() != config.enthalpies.size() ||
          config.temperatures.size() != config.entropies.size()) {
        throw core::ValidationError("table", "temperature, enthalpy and entropy must have the same length");
      }
    }

    return config;

  } catch (const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'properties' section: {}", e.message())));
  }
}

auto YamlParser::parse_cycle_config(const YAML::Node& node) const
    -> std::expected<CycleConfig, core::ConfigurationError> {

  CycleConfig config;

  try {
    auto ratio_result = extract_value<double>(node, "compression_ratio");
    if (!ratio_result)
      return std::unexpected(ratio_result.error());
    config.compression_ratio = ratio_result.value();

    auto t1_result = extract_value<double>(node, "inlet_temperature");
    if (!t1_result)
      return std::unexpected(t1_result.error());
    config.inlet_temperature = t1_result.value();

    auto t3_result = extract_value<double>(node, "turbine_inlet_temperature");
    if (!t3_result)
      return std::unexpected(t3_result.error());
    config.turbine_inlet_temperature = t3_result.value();

    // A single 'isentropic_efficiency' sets both components; per-component keys override it
    double shared_efficiency = constants::defaults::isentropic_efficiency;
    if (auto eta = extract_optional(node, "isentropic_efficiency", shared_efficiency); !eta)
      return std::unexpected(eta.error());
    config.compressor_efficiency = shared_efficiency;
    config.turbine_efficiency = shared_efficiency;

    if (auto eta_c = extract_optional(node, "compressor_efficiency", config.compressor_efficiency); !eta_c)
      return std::unexpected(eta_c.error());
    if (auto eta_t = extract_optional(node, "turbine_efficiency", config.turbine_efficiency); !eta_t)
      return std::unexpected(eta_t.error());
    if (auto R = extract_optional(node, "gas_constant", config.gas_constant); !R)
      return std::unexpected(R.error());

    return config;

  } catch (const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'cycle' section: {}", e.message())));
  }
}

auto YamlParser::parse_solver_config(const YAML::Node& node) const
    -> std::expected<SolverConfig, core::ConfigurationError> {

  SolverConfig config;

  try {
    if (auto r = extract_optional(node, "tolerance", config.tolerance); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "residual_tolerance", config.residual_tolerance); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "max_iterations", config.max_iterations); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "max_bracket_expansions", config.max_bracket_expansions); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "bracket_growth", config.bracket_growth); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "min_temperature", config.min_temperature); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "max_temperature", config.max_temperature); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "seed_exponent", config.seed_exponent); !r)
      return std::unexpected(r.error());

    if (config.tolerance <= 0.0) {
      throw core::ValidationError("tolerance", "must be positive");
    }
    if (config.max_iterations <= 0) {
      throw core::ValidationError("max_iterations", "must be positive");
    }
    if (config.bracket_growth <= 1.0) {
      throw core::ValidationError("bracket_growth", "must be greater than 1");
    }
    if (config.max_temperature <= config.min_temperature) {
      throw core::ValidationError("max_temperature", "must exceed min_temperature");
    }

    return config;

  } catch (const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'solver' section: {}", e.message())));
  }
}

auto YamlParser::parse_bottoming_config(const YAML::Node& node) const
    -> std::expected<BottomingConfig, core::ConfigurationError> {

  BottomingConfig config;

  try {
    if (auto r = extract_optional(node, "stack_temperature", config.stack_temperature); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "exhaust_temperature_threshold", config.exhaust_temperature_threshold); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "rankine_heat_input_per_kg", config.rankine_heat_input_per_kg); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "rankine_efficiency_percent", config.rankine_efficiency_percent); !r)
      return std::unexpected(r.error());

    return config;

  } catch (const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'bottoming' section: {}", e.message())));
  }
}

auto YamlParser::parse_ratio_range(const YAML::Node& node, std::string_view section,
                                   AnalysesConfig::RatioRange defaults) const
    -> std::expected<AnalysesConfig::RatioRange, core::ConfigurationError> {

  auto range = defaults;
  if (!node) {
    return range;
  }

  if (auto r = extract_optional(node, "start", range.start); !r)
    return std::unexpected(r.error());
  if (auto r = extract_optional(node, "stop", range.stop); !r)
    return std::unexpected(r.error());
  if (auto r = extract_optional(node, "points", range.points); !r)
    return std::unexpected(r.error());

  if (!(range.stop > range.start)) {
    return std::unexpected(core::ValidationError(std::format("{}.stop", section), "must exceed start"));
  }
  if (range.points < 2) {
    return std::unexpected(core::ValidationError(std::format("{}.points", section), "must be at least 2"));
  }
  return range;
}

auto YamlParser::parse_analyses_config(const YAML::Node& node) const
    -> std::expected<AnalysesConfig, core::ConfigurationError> {

  AnalysesConfig config;

  try {
    if (const auto eff = node["efficiency_sweep"]) {
      if (auto r = extract_optional(eff, "enabled", config.efficiency_sweep); !r)
        return std::unexpected(r.error());
      auto range = parse_ratio_range(eff, "efficiency_sweep", config.efficiency_range);
      if (!range)
        return std::unexpected(range.error());
      config.efficiency_range = range.value();
    }

    if (const auto work = node["net_work_sweep"]) {
      if (auto r = extract_optional(work, "enabled", config.net_work_sweep); !r)
        return std::unexpected(r.error());
      auto range = parse_ratio_range(work, "net_work_sweep", config.net_work_range);
      if (!range)
        return std::unexpected(range.error());
      config.net_work_range = range.value();
    }

    if (const auto sens = node["sensitivity"]) {
      if (auto r = extract_optional(sens, "enabled", config.sensitivity); !r)
        return std::unexpected(r.error());
      if (auto r = extract_optional(sens, "compression_ratio", config.sensitivity_compression_ratio); !r)
        return std::unexpected(r.error());
      if (auto r = extract_optional(sens, "efficiencies", config.sensitivity_efficiencies); !r)
        return std::unexpected(r.error());
      if (config.sensitivity && config.sensitivity_efficiencies.empty()) {
        throw core::ValidationError("sensitivity.efficiencies", "must list at least one value");
      }
    }

    if (const auto comb = node["combined_sweep"]) {
      if (auto r = extract_optional(comb, "enabled", config.combined_sweep); !r)
        return std::unexpected(r.error());
      auto range = parse_ratio_range(comb, "combined_sweep", config.combined_range);
      if (!range)
        return std::unexpected(range.error());
      config.combined_range = range.value();
      if (auto r = extract_optional(comb, "design_points", config.combined_design_points); !r)
        return std::unexpected(r.error());
    }

    if (auto r = extract_optional(node, "exclude_extrapolated_optima", config.exclude_extrapolated_optima); !r)
      return std::unexpected(r.error());

    return config;

  } catch (const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'analyses' section: {}", e.message())));
  }
}

auto YamlParser::parse_output_config(const YAML::Node& node) const
    -> std::expected<OutputConfig, core::ConfigurationError> {

  OutputConfig config;

  try {
    if (auto r = extract_optional(node, "write_hdf5", config.write_hdf5); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "directory", config.output_directory); !r)
      return std::unexpected(r.error());
    if (auto r = extract_optional(node, "compression_level", config.compression_level); !r)
      return std::unexpected(r.error());

    if (config.compression_level < 0 || config.compression_level > 9) {
      throw core::ValidationError("compression_level", "must lie in [0, 9]");
    }

    return config;

  } catch (const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'output' section: {}", e.message())));
  }
}

} // namespace brayton::io
