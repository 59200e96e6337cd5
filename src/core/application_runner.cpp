#include "brayton/core/application_runner.hpp"
#include "brayton/core/constants.hpp"
#include "brayton/io/output/hdf5_writer.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>

namespace brayton::core {

ApplicationRunner::ApplicationRunner()
    : config_loader_(std::make_unique<ConfigurationLoader>()), output_manager_(std::make_unique<OutputManager>()),
      analysis_runner_(std::make_unique<AnalysisRunner>()) {}

ApplicationRunner::~ApplicationRunner() = default;

auto ApplicationRunner::run(int argc, char* argv[]) -> ApplicationResult {
  auto start_time = std::chrono::high_resolution_clock::now();
  PerformanceMetrics metrics;

  try {
    // Parse command line arguments
    auto args_result = parse_command_line(argc, argv);
    if (!args_result) {
      display_usage(argc > 0 ? argv[constants::indexing::first] : "brayton");
      return handle_error(args_result.error());
    }
    auto args = args_result.value();

    if (args.help_requested) {
      display_usage(argv[constants::indexing::first]);
      return {true, constants::indexing::first, "Help displayed"};
    }

    display_header();

    // Load configuration and create the property provider
    auto config_result = config_loader_->load_configuration(args.config_file);
    if (!config_result) {
      return handle_error(config_result.error());
    }
    auto [config, provider] = std::move(config_result.value());

    // Initialize output system
    if (auto output_init = output_manager_->initialize_output_system(config); !output_init) {
      return handle_error(output_init.error());
    }
    output_manager_->display_planned_outputs(config, args.output_name);

    // Run analyses
    auto analysis_result = analysis_runner_->run_analyses(*provider, config, metrics);
    if (!analysis_result) {
      return handle_error(analysis_result.error());
    }
    auto results = std::move(analysis_result.value());

    // Write output files
    auto output_result =
        output_manager_->write_analysis_results(results, config, *provider, args.output_name, metrics);
    if (!output_result) {
      return handle_error(output_result.error());
    }

    // Calculate total time
    auto end_time = std::chrono::high_resolution_clock::now();
    metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    // Display results and performance
    analysis_runner_->display_results(results);
    display_performance_summary(metrics);
    display_completion_message(metrics);

    cleanup();

    return {true, constants::indexing::first, "Success"};

  } catch (const std::exception& e) {
    cleanup();
    return handle_error(ApplicationError{"Unexpected error: " + std::string(e.what()), constants::indexing::second});
  }
}

auto ApplicationRunner::parse_command_line(int argc, char* argv[]) -> std::expected<CommandLineArgs, ApplicationError> {

  constexpr int min_required_args = 2;
  constexpr int max_accepted_args = 3;

  if (argc < min_required_args) {
    return std::unexpected(ApplicationError{"Insufficient arguments provided", constants::indexing::second});
  }
  if (argc > max_accepted_args) {
    return std::unexpected(ApplicationError{"Too many arguments provided", constants::indexing::second});
  }

  CommandLineArgs args;
  const std::string_view first_arg = argv[constants::indexing::second];
  if (first_arg == "-h" || first_arg == "--help") {
    args.help_requested = true;
    return args;
  }
  args.config_file = argv[constants::indexing::second];

  if (argc == max_accepted_args) {
    args.output_name = argv[max_accepted_args - 1];
    if (args.output_name.empty()) {
      return std::unexpected(ApplicationError{"Output name must not be empty", constants::indexing::second});
    }
  }

  return args;
}

auto ApplicationRunner::display_usage(const std::string& program_name) const -> void {
  std::cerr << "Usage: " << program_name << " <config_file.yaml> [output_name]\n";
  std::cerr << "       " << program_name << " --help\n";
}

auto ApplicationRunner::display_header() const -> void {
  std::cout << "=== BRAYTON Cycle Analysis ===" << std::endl;
}

auto ApplicationRunner::display_performance_summary(const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== PERFORMANCE SUMMARY ===" << std::endl;
  std::cout << "Total runtime: " << metrics.total_time.count() << " ms" << std::endl;

  const auto total = metrics.total_time.count();
  if (total > 0) {
    std::cout << "  Analysis: " << metrics.analysis_time.count() << " ms (" << std::setprecision(1) << std::fixed
              << (constants::conversion::to_percentage * metrics.analysis_time.count() / total) << "%)" << std::endl;
    std::cout << "  Output: " << metrics.output_time.count() << " ms (" << std::setprecision(1) << std::fixed
              << (constants::conversion::to_percentage * metrics.output_time.count() / total) << "%)" << std::endl;
  }
  std::cout << "Cycle evaluations: " << metrics.evaluations << " (" << metrics.failed_evaluations << " failed)"
            << std::endl;
}

auto ApplicationRunner::display_completion_message(const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== CALCULATION COMPLETED SUCCESSFULLY ===" << std::endl;
  if (!metrics.output_files.empty()) {
    std::cout << "\nPost-processing recommendations:" << std::endl;
    std::cout << "  • Open .h5 files with HDFView or Python (h5py, pandas)" << std::endl;
  }
}

auto ApplicationRunner::cleanup() -> void {
  io::output::hdf5::finalize();
}

auto ApplicationRunner::handle_error(const ApplicationError& error) -> ApplicationResult {
  std::cerr << constants::string_processing::colors::red << "Error: " << error.message
            << constants::string_processing::colors::reset << std::endl;
  cleanup();
  return {false, error.exit_code, error.message};
}

} // namespace brayton::core
