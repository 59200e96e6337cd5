#pragma once
#include "../../core/exceptions.hpp"
#include "../config_types.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace brayton::io::output {

// Per-row outcome stored next to every sweep
enum class RowStatus : int { Failed = -1, Ok = 0, Extrapolated = 1 };

struct Column {
  std::string name;
  std::string units;
  std::string description;
  std::vector<double> values;  // NaN where the row failed
};

struct OptimumRecord {
  std::string metric;
  std::size_t index;
  double input;
  double value;
};

// One evaluated range: design point, sweep or sensitivity study
struct SweepTable {
  std::string name;          // HDF5 group name
  std::string input_name;    // e.g. "compression_ratio"
  std::string input_units;
  std::vector<double> inputs;
  std::vector<Column> columns;
  std::vector<RowStatus> status;
  std::vector<std::string> messages;  // error or warning text per row, empty when clean
  std::optional<OptimumRecord> optimum;

  [[nodiscard]] auto rows() const noexcept -> std::size_t { return inputs.size(); }
};

struct AnalysisMetadata {
  std::string brayton_version = constants::io::default_brayton_version;
  std::chrono::system_clock::time_point creation_time;
  std::string property_source;
  std::string interpolation;
  CycleConfig cycle;
  BottomingConfig bottoming;
};

struct AnalysisDataset {
  AnalysisMetadata metadata;
  std::vector<SweepTable> tables;
};

// Output error types
class OutputError : public core::BraytonException {
public:
  explicit OutputError(std::string_view message, std::source_location location = std::source_location::current())
      : BraytonException(std::format("Output Error: {}", message), location) {}
};

class FileWriteError : public OutputError {
private:
  std::filesystem::path file_path_;

public:
  explicit FileWriteError(const std::filesystem::path& path, std::string_view message,
                          std::source_location location = std::source_location::current())
      : OutputError(std::format("File '{}': {}", path.string(), message), location), file_path_(path) {}

  [[nodiscard]] auto file_path() const noexcept -> const std::filesystem::path& { return file_path_; }
};

} // namespace brayton::io::output
