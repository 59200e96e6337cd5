#pragma once
#include "../../core/containers.hpp"
#include "output_types.hpp"
#include <expected>
#include <filesystem>
#include <hdf5.h>
#include <string>
#include <string_view>
#include <vector>

namespace brayton::io::output {

// HDF5-specific configuration
struct HDF5Config {
  int compression_level = 6;      // 0-9, higher = better compression
  bool use_shuffle_filter = true; // Reorder bytes for better compression
  bool use_fletcher32 = false;    // Checksum filter
  std::size_t chunk_size = 1024;  // Chunk size for datasets
};

// RAII wrapper for HDF5 handles
template <typename HandleType, auto CloseFunc> class HDF5Handle {
private:
  HandleType handle_;

public:
  explicit HDF5Handle(HandleType handle) : handle_(handle) {
    if (handle_ < 0) {
      throw OutputError("Invalid HDF5 handle");
    }
  }

  ~HDF5Handle() {
    if (handle_ >= 0) {
      CloseFunc(handle_);
    }
  }

  // Move semantics only
  HDF5Handle(HDF5Handle&& other) noexcept : handle_(other.handle_) { other.handle_ = -1; }

  HDF5Handle& operator=(HDF5Handle&& other) noexcept {
    if (this != &other) {
      if (handle_ >= 0) {
        CloseFunc(handle_);
      }
      handle_ = other.handle_;
      other.handle_ = -1;
    }
    return *this;
  }

  HDF5Handle(const HDF5Handle&) = delete;
  HDF5Handle& operator=(const HDF5Handle&) = delete;

  [[nodiscard]] auto get() const noexcept -> HandleType { return handle_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return handle_ >= 0; }

  // Implicit conversion for C API
  operator HandleType() const noexcept { return handle_; }
};

using FileHandle = HDF5Handle<hid_t, H5Fclose>;
using GroupHandle = HDF5Handle<hid_t, H5Gclose>;
using DatasetHandle = HDF5Handle<hid_t, H5Dclose>;
using DataspaceHandle = HDF5Handle<hid_t, H5Sclose>;
using PropertyHandle = HDF5Handle<hid_t, H5Pclose>;
using TypeHandle = HDF5Handle<hid_t, H5Tclose>;
using AttributeHandle = HDF5Handle<hid_t, H5Aclose>;

/**
 * @brief Writes an AnalysisDataset to a single .h5 file
 *
 * Layout:
 *   /                    version, creation_time, property_source, interpolation attributes
 *   /metadata/cycle      reference cycle parameters as scalars
 *   /<table>/<input>     sweep inputs
 *   /<table>/<column>    one dataset per result column
 *   /<table>/status      0 ok, 1 extrapolated, -1 failed
 *   /<table>/summary     [rows x (1 + columns)] matrix with column_names
 * The optimum of a table, when known, is stored as attributes of its group.
 */
class HDF5Writer {
private:
  HDF5Config hdf5_config_;

  [[nodiscard]] auto
  create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError>;

  [[nodiscard]] auto write_metadata(FileHandle& file,
                                    const AnalysisMetadata& metadata) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_table(FileHandle& file, const SweepTable& table) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_group(hid_t parent,
                                  const std::string& name) const -> std::expected<GroupHandle, OutputError>;

  [[nodiscard]] auto write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                                  const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_int_vector(hid_t parent, const std::string& name,
                                      const std::vector<int>& data) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_scalar(hid_t parent, const std::string& name, double value, const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_string(hid_t parent, const std::string& name,
                                  const std::string& value) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_double_attribute(hid_t parent, const std::string& name,
                                            double value) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto
  write_string_array(hid_t parent, const std::string& name,
                     const std::vector<std::string>& values) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_dataset_properties(std::size_t size) const -> std::expected<PropertyHandle, OutputError>;

public:
  explicit HDF5Writer(HDF5Config config = {}) : hdf5_config_(config) {}

  [[nodiscard]] auto write(const std::filesystem::path& file_path,
                           const AnalysisDataset& dataset) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view { return ".h5"; }

  [[nodiscard]] auto get_hdf5_config() const noexcept -> const HDF5Config& { return hdf5_config_; }
};

// Read-back of files produced by HDF5Writer, for post-processing and checks
class HDF5Reader {
private:
  FileHandle file_;

public:
  explicit HDF5Reader(const std::filesystem::path& file_path);

  [[nodiscard]] auto has_object(const std::string& path) const -> bool;

  [[nodiscard]] auto read_vector(const std::string& dataset_path) const
      -> std::expected<std::vector<double>, OutputError>;

  [[nodiscard]] auto read_int_vector(const std::string& dataset_path) const
      -> std::expected<std::vector<int>, OutputError>;

  [[nodiscard]] auto read_double_attribute(const std::string& object_path, const std::string& name) const
      -> std::expected<double, OutputError>;

  [[nodiscard]] auto read_string_attribute(const std::string& object_path, const std::string& name) const
      -> std::expected<std::string, OutputError>;
};

// Convenience functions for HDF5
namespace hdf5 {

// Initialize HDF5 library (call once at program start)
auto initialize() -> std::expected<void, OutputError>;

// Cleanup HDF5 library (call at program end)
auto finalize() -> void;

[[nodiscard]] auto check_version() -> std::expected<std::string, OutputError>;

[[nodiscard]] auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError>;

} // namespace hdf5

} // namespace brayton::io::output
