#include "brayton/io/output/hdf5_writer.hpp"
#include <algorithm>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace brayton::io::output {

auto HDF5Writer::write(const std::filesystem::path& file_path,
                       const AnalysisDataset& dataset) const -> std::expected<void, OutputError> {

  try {
    if (file_path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(file_path.parent_path(), ec);
      if (ec) {
        return std::unexpected(FileWriteError(file_path, std::format("cannot create directory: {}", ec.message())));
      }
    }

    auto file_result = create_file(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    if (auto meta_result = write_metadata(file, dataset.metadata); !meta_result) {
      return std::unexpected(meta_result.error());
    }

    for (const auto& table : dataset.tables) {
      if (auto table_result = write_table(file, table); !table_result) {
        return std::unexpected(table_result.error());
      }
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(OutputError(std::format("HDF5 write failed: {}", e.what())));
  }
}

auto HDF5Writer::create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError> {

  auto fapl = H5Pcreate(H5P_FILE_ACCESS);
  if (fapl < 0) {
    return std::unexpected(OutputError("Failed to create file access property list"));
  }

  // Close every object still open when the file goes away
  H5Pset_fclose_degree(fapl, H5F_CLOSE_STRONG);

  auto file_id = H5Fcreate(file_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, fapl);
  H5Pclose(fapl);

  if (file_id < 0) {
    return std::unexpected(FileWriteError(file_path, "failed to create HDF5 file"));
  }

  return FileHandle(file_id);
}

auto HDF5Writer::write_metadata(FileHandle& file,
                                const AnalysisMetadata& metadata) const -> std::expected<void, OutputError> {

  auto root_id = H5Gopen2(file, "/", H5P_DEFAULT);
  if (root_id < 0) {
    return std::unexpected(OutputError("Failed to open root group"));
  }
  GroupHandle root(root_id);

  if (auto result = write_string(root, "brayton_version", metadata.brayton_version); !result) {
    return std::unexpected(result.error());
  }

  auto time_t = std::chrono::system_clock::to_time_t(metadata.creation_time);
  auto tm = *std::gmtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  if (auto result = write_string(root, "creation_time", oss.str()); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(root, "property_source", metadata.property_source); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(root, "interpolation", metadata.interpolation); !result) {
    return std::unexpected(result.error());
  }

  auto metadata_group_result = create_group(file, "metadata");
  if (!metadata_group_result) {
    return std::unexpected(metadata_group_result.error());
  }
  auto metadata_group = std::move(metadata_group_result.value());

  auto cycle_group_result = create_group(metadata_group, "cycle");
  if (!cycle_group_result) {
    return std::unexpected(cycle_group_result.error());
  }
  auto cycle_group = std::move(cycle_group_result.value());

  const auto& cycle = metadata.cycle;
  if (auto result = write_scalar(cycle_group, "compression_ratio", cycle.compression_ratio, "", "Design compression ratio");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(cycle_group, "compressor_efficiency", cycle.compressor_efficiency); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(cycle_group, "turbine_efficiency", cycle.turbine_efficiency); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(cycle_group, "inlet_temperature", cycle.inlet_temperature, "K"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(cycle_group, "turbine_inlet_temperature", cycle.turbine_inlet_temperature, "K");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(cycle_group, "gas_constant", cycle.gas_constant, "kJ/(kg K)"); !result) {
    return std::unexpected(result.error());
  }

  auto bottoming_group_result = create_group(metadata_group, "bottoming");
  if (!bottoming_group_result) {
    return std::unexpected(bottoming_group_result.error());
  }
  auto bottoming_group = std::move(bottoming_group_result.value());

  const auto& bottoming = metadata.bottoming;
  if (auto result = write_scalar(bottoming_group, "stack_temperature", bottoming.stack_temperature, "K"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(bottoming_group, "exhaust_temperature_threshold",
                                 bottoming.exhaust_temperature_threshold, "K");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result =
          write_scalar(bottoming_group, "rankine_heat_input_per_kg", bottoming.rankine_heat_input_per_kg, "kJ/kg");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result =
          write_scalar(bottoming_group, "rankine_efficiency_percent", bottoming.rankine_efficiency_percent, "%");
      !result) {
    return std::unexpected(result.error());
  }

  return {};
}

auto HDF5Writer::write_table(FileHandle& file, const SweepTable& table) const -> std::expected<void, OutputError> {

  if (table.status.size() != table.rows()) {
    return std::unexpected(OutputError(
        std::format("Table '{}' has {} status entries for {} rows", table.name, table.status.size(), table.rows())));
  }

  auto group_result = create_group(file, table.name);
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  if (auto result = write_vector(group, table.input_name, table.inputs, table.input_units, "Sweep input"); !result) {
    return std::unexpected(result.error());
  }

  for (const auto& column : table.columns) {
    if (column.values.size() != table.rows()) {
      return std::unexpected(OutputError(std::format("Column '{}' of table '{}' has {} values for {} rows", column.name,
                                                     table.name, column.values.size(), table.rows())));
    }
    if (auto result = write_vector(group, column.name, column.values, column.units, column.description); !result) {
      return std::unexpected(result.error());
    }
  }

  std::vector<int> status(table.status.size());
  std::ranges::transform(table.status, status.begin(), [](RowStatus s) { return static_cast<int>(s); });
  if (auto result = write_int_vector(group, "status", status); !result) {
    return std::unexpected(result.error());
  }

  if (std::ranges::any_of(table.messages, [](const std::string& m) { return !m.empty(); })) {
    if (auto result = write_string_array(group, "messages", table.messages); !result) {
      return std::unexpected(result.error());
    }
  }

  // Summary matrix: input column followed by every result column
  core::Matrix<double> summary(table.rows(), table.columns.size() + 1);
  std::vector<std::string> column_names{table.input_name};
  for (std::size_t i = 0; i < table.rows(); ++i) {
    summary(i, 0) = table.inputs[i];
  }
  for (std::size_t j = 0; j < table.columns.size(); ++j) {
    column_names.push_back(table.columns[j].name);
    for (std::size_t i = 0; i < table.rows(); ++i) {
      summary(i, j + 1) = table.columns[j].values[i];
    }
  }
  if (auto result = write_matrix(group, "summary", summary, "Rows of the sweep, input first"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string_array(group, "column_names", column_names); !result) {
    return std::unexpected(result.error());
  }

  if (table.optimum) {
    const auto& optimum = *table.optimum;
    if (auto result = write_string(group, "optimum_metric", optimum.metric); !result) {
      return std::unexpected(result.error());
    }
    if (auto result = write_double_attribute(group, "optimum_input", optimum.input); !result) {
      return std::unexpected(result.error());
    }
    if (auto result = write_double_attribute(group, "optimum_value", optimum.value); !result) {
      return std::unexpected(result.error());
    }
    if (auto result = write_double_attribute(group, "optimum_index", static_cast<double>(optimum.index)); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

// Utility function implementations
auto HDF5Writer::create_group(hid_t parent, const std::string& name) const -> std::expected<GroupHandle, OutputError> {

  auto group_id = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create group '{}'", name)));
  }
  return GroupHandle(group_id);
}

auto HDF5Writer::write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                              const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  if (data.empty()) {
    return {}; // Skip empty datasets
  }

  hsize_t dims = data.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_dataset_properties(data.size());
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }
  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_int_vector(hid_t parent, const std::string& name,
                                  const std::vector<int>& data) const -> std::expected<void, OutputError> {

  if (data.empty()) {
    return {};
  }

  hsize_t dims = data.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_INT, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  if (H5Dwrite(dataset, H5T_NATIVE_INT, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  return {};
}

auto HDF5Writer::write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                              const std::string& description) const -> std::expected<void, OutputError> {

  if (data.rows() == 0 || data.cols() == 0) {
    return {}; // Skip empty matrices
  }

  hsize_t dims[2] = {static_cast<hsize_t>(data.rows()), static_cast<hsize_t>(data.cols())};
  auto space_id = H5Screate_simple(2, dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for matrix '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  // Eigen storage is column-major, HDF5 expects row-major
  const auto row_major_data = data.to_row_major();
  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, row_major_data.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write matrix data for '{}'", name)));
  }

  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_scalar(hid_t parent, const std::string& name, double value, const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value);
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write scalar value for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }
  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_string(hid_t parent, const std::string& name,
                              const std::string& value) const -> std::expected<void, OutputError> {

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  // Room for the terminator, and never a zero-sized type
  H5Tset_size(string_type, value.length() + 1);
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string '{}'", name)));
  }
  DataspaceHandle space(space_id);

  // Strings are always attributes of a group or dataset
  H5I_type_t obj_type = H5Iget_type(parent);
  if (obj_type != H5I_DATASET && obj_type != H5I_GROUP) {
    return std::unexpected(OutputError(std::format("Cannot attach string attribute '{}' to this object", name)));
  }

  auto attr_id = H5Acreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string attribute '{}'", name)));
  }
  AttributeHandle attribute(attr_id);

  if (H5Awrite(attribute, string_type, value.c_str()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string attribute '{}'", name)));
  }

  return {};
}

auto HDF5Writer::write_double_attribute(hid_t parent, const std::string& name,
                                        double value) const -> std::expected<void, OutputError> {

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for attribute '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto attr_id = H5Acreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create attribute '{}'", name)));
  }
  AttributeHandle attribute(attr_id);

  if (H5Awrite(attribute, H5T_NATIVE_DOUBLE, &value) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write attribute '{}'", name)));
  }

  return {};
}

auto HDF5Writer::write_string_array(hid_t parent, const std::string& name,
                                    const std::vector<std::string>& values) const -> std::expected<void, OutputError> {

  if (values.empty()) {
    return {}; // Skip empty arrays
  }

  std::size_t max_len = 0;
  for (const auto& str : values) {
    max_len = std::max(max_len, str.length());
  }
  ++max_len; // For null terminator

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  H5Tset_size(string_type, max_len);
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  hsize_t dims = values.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string array '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string array dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  std::vector<char> buffer(values.size() * max_len, '\0');
  for (std::size_t i = 0; i < values.size(); ++i) {
    std::strncpy(&buffer[i * max_len], values[i].c_str(), max_len - 1);
  }

  auto status = H5Dwrite(dataset, string_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string array data for '{}'", name)));
  }

  return {};
}

auto HDF5Writer::create_dataset_properties(std::size_t size) const -> std::expected<PropertyHandle, OutputError> {

  auto plist_id = H5Pcreate(H5P_DATASET_CREATE);
  if (plist_id < 0) {
    return std::unexpected(OutputError("Failed to create dataset property list"));
  }
  PropertyHandle props(plist_id);

  if (hdf5_config_.compression_level <= 0) {
    return props;
  }

  // Filters need a chunked layout; chunk size must be <= data size
  hsize_t chunk_size = std::min(size, hdf5_config_.chunk_size);
  if (chunk_size == 0) {
    chunk_size = 1;
  }

  if (H5Pset_chunk(props, 1, &chunk_size) < 0) {
    return std::unexpected(OutputError("Failed to set chunking"));
  }

  if (hdf5_config_.use_shuffle_filter) {
    H5Pset_shuffle(props);
  }

  H5Pset_deflate(props, static_cast<unsigned>(hdf5_config_.compression_level));

  if (hdf5_config_.use_fletcher32) {
    H5Pset_fletcher32(props);
  }

  return props;
}

// HDF5Reader implementation
HDF5Reader::HDF5Reader(const std::filesystem::path& file_path)
    : file_(H5Fopen(file_path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT)) {}

auto HDF5Reader::has_object(const std::string& path) const -> bool {
  return H5Lexists(file_, path.c_str(), H5P_DEFAULT) > 0;
}

auto HDF5Reader::read_vector(const std::string& dataset_path) const
    -> std::expected<std::vector<double>, OutputError> {

  if (!has_object(dataset_path)) {
    return std::unexpected(OutputError(std::format("Dataset '{}' not found", dataset_path)));
  }

  auto dataset_id = H5Dopen2(file_, dataset_path.c_str(), H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to open dataset '{}'", dataset_path)));
  }
  DatasetHandle dataset(dataset_id);
  DataspaceHandle space(H5Dget_space(dataset));

  const auto n_points = H5Sget_simple_extent_npoints(space);
  if (n_points < 0) {
    return std::unexpected(OutputError(std::format("Failed to query size of '{}'", dataset_path)));
  }

  std::vector<double> data(static_cast<std::size_t>(n_points));
  if (H5Dread(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to read dataset '{}'", dataset_path)));
  }
  return data;
}

auto HDF5Reader::read_int_vector(const std::string& dataset_path) const
    -> std::expected<std::vector<int>, OutputError> {

  if (!has_object(dataset_path)) {
    return std::unexpected(OutputError(std::format("Dataset '{}' not found", dataset_path)));
  }

  auto dataset_id = H5Dopen2(file_, dataset_path.c_str(), H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to open dataset '{}'", dataset_path)));
  }
  DatasetHandle dataset(dataset_id);
  DataspaceHandle space(H5Dget_space(dataset));

  const auto n_points = H5Sget_simple_extent_npoints(space);
  if (n_points < 0) {
    return std::unexpected(OutputError(std::format("Failed to query size of '{}'", dataset_path)));
  }

  std::vector<int> data(static_cast<std::size_t>(n_points));
  if (H5Dread(dataset, H5T_NATIVE_INT, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to read dataset '{}'", dataset_path)));
  }
  return data;
}

auto HDF5Reader::read_double_attribute(const std::string& object_path, const std::string& name) const
    -> std::expected<double, OutputError> {

  if (H5Aexists_by_name(file_, object_path.c_str(), name.c_str(), H5P_DEFAULT) <= 0) {
    return std::unexpected(OutputError(std::format("Attribute '{}' not found on '{}'", name, object_path)));
  }

  auto attr_id = H5Aopen_by_name(file_, object_path.c_str(), name.c_str(), H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to open attribute '{}'", name)));
  }
  AttributeHandle attribute(attr_id);

  double value = 0.0;
  if (H5Aread(attribute, H5T_NATIVE_DOUBLE, &value) < 0) {
    return std::unexpected(OutputError(std::format("Failed to read attribute '{}'", name)));
  }
  return value;
}

auto HDF5Reader::read_string_attribute(const std::string& object_path, const std::string& name) const
    -> std::expected<std::string, OutputError> {

  if (H5Aexists_by_name(file_, object_path.c_str(), name.c_str(), H5P_DEFAULT) <= 0) {
    return std::unexpected(OutputError(std::format("Attribute '{}' not found on '{}'", name, object_path)));
  }

  auto attr_id = H5Aopen_by_name(file_, object_path.c_str(), name.c_str(), H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to open attribute '{}'", name)));
  }
  AttributeHandle attribute(attr_id);
  TypeHandle type(H5Aget_type(attribute));

  const auto size = H5Tget_size(type);
  std::vector<char> buffer(size + 1, '\0');
  if (H5Aread(attribute, type, buffer.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to read attribute '{}'", name)));
  }
  return std::string(buffer.data());
}

// HDF5 convenience functions
namespace hdf5 {

auto initialize() -> std::expected<void, OutputError> {
  if (H5open() < 0) {
    return std::unexpected(OutputError("Failed to initialize HDF5 library"));
  }
  return {};
}

auto finalize() -> void { H5close(); }

auto check_version() -> std::expected<std::string, OutputError> {
  unsigned majnum, minnum, relnum;
  if (H5get_libversion(&majnum, &minnum, &relnum) < 0) {
    return std::unexpected(OutputError("Failed to get HDF5 version"));
  }

  return std::format("{}.{}.{}", majnum, minnum, relnum);
}

auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError> {

  if (!std::filesystem::exists(file_path)) {
    return std::unexpected(OutputError(std::format("File does not exist: {}", file_path.string())));
  }

  auto result = H5Fis_hdf5(file_path.c_str());
  if (result <= 0) {
    return std::unexpected(OutputError(std::format("Not a valid HDF5 file: {}", file_path.string())));
  }

  return {};
}

} // namespace hdf5

} // namespace brayton::io::output
