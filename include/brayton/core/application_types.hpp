#pragma once
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace brayton::core {

// Application-level error handling
struct ApplicationError {
  std::string message;
  int exit_code;
};

// Command line arguments structure
struct CommandLineArgs {
  std::string config_file;
  std::string output_name = "brayton";
  bool help_requested = false;
};

// Application result for clean exit handling
struct ApplicationResult {
  bool success;
  int exit_code;
  std::string message;
};

// Performance metrics for reporting
struct PerformanceMetrics {
  std::chrono::milliseconds total_time{0};
  std::chrono::milliseconds analysis_time{0};
  std::chrono::milliseconds output_time{0};
  int evaluations = 0;
  int failed_evaluations = 0;
  std::vector<std::filesystem::path> output_files;
};

} // namespace brayton::core
