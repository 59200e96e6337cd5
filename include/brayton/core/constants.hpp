#pragma once

#include <cstddef>

namespace brayton::constants {

// ================================================================================================
// NUMERICAL TOLERANCES
// ================================================================================================

namespace tolerance {
/// Temperature tolerance of the isentropic/inverse-enthalpy solves [K]
inline constexpr double temperature = 1e-9;

/// Residual tolerance of the property root-finders (property units)
inline constexpr double residual = 1e-12;

/// Smallest pivot accepted by the tridiagonal solver
inline constexpr double diagonal = 1e-14;
}  // namespace tolerance

// ================================================================================================
// ITERATION LIMITS
// ================================================================================================

namespace iteration_limits {
/// Maximum Brent iterations for one temperature solve
inline constexpr int root_finder_max = 100;

/// Maximum geometric bracket expansions around the seed
inline constexpr int bracket_expansions_max = 60;
}  // namespace iteration_limits

// ================================================================================================
// DEFAULT CYCLE CONDITIONS
// ================================================================================================

namespace defaults {
/// Compressor inlet temperature [K]
inline constexpr double inlet_temperature = 298.15;

/// Turbine inlet temperature [K]
inline constexpr double turbine_inlet_temperature = 1200.0;

/// Specific gas constant of air [kJ/(kg·K)]
inline constexpr double gas_constant_air = 0.287;

/// Design compression ratio
inline constexpr double compression_ratio = 10.0;

/// Compressor and turbine isentropic efficiency
inline constexpr double isentropic_efficiency = 0.90;

/// Exponent of the ideal-gas seed T_in * r^k used to start the isentropic solves
inline constexpr double seed_exponent = 0.3;

/// Geometric growth factor of the bracket search
inline constexpr double bracket_growth = 1.25;

/// Absolute limits of the temperature search [K]
inline constexpr double min_search_temperature = 1.0;
inline constexpr double max_search_temperature = 10000.0;

/// Bottoming (Rankine) cycle reference operating point
namespace bottoming {
inline constexpr double stack_temperature = 460.0;
inline constexpr double exhaust_temperature_threshold = 673.15;
inline constexpr double rankine_heat_input_per_kg = 2917.0;
inline constexpr double rankine_efficiency_percent = 36.53;
}  // namespace bottoming

/// Compression ratio sweep range
namespace sweep {
inline constexpr double ratio_start = 2.0;
inline constexpr double ratio_stop = 30.0;
inline constexpr int efficiency_points = 20;
inline constexpr int net_work_points = 12;
}  // namespace sweep
}  // namespace defaults

// ================================================================================================
// FILE I/O AND FORMATTING CONSTANTS
// ================================================================================================

namespace io {
/// HDF5 default compression level (0-9, higher = better compression)
inline constexpr int default_hdf5_compression = 6;

/// Bytes to KB conversion factor
inline constexpr double bytes_to_kb = 1024.0;

/// Default version string stored in output files
inline constexpr const char* default_brayton_version = "1.0.0";

/// Default output directory
inline constexpr const char* default_output_directory = "BRAYTON_outputs";
}  // namespace io

// ================================================================================================
// ARRAY AND INDEXING CONSTANTS
// ================================================================================================

namespace indexing {
inline constexpr std::size_t first = 0;
inline constexpr std::size_t second = 1;

/// Minimum number of rows for a property table
inline constexpr std::size_t min_table_rows = 3;
}  // namespace indexing

// ================================================================================================
// STRING PROCESSING CONSTANTS
// ================================================================================================

namespace string_processing {
inline constexpr int float_precision_2 = 2;
inline constexpr int float_precision_4 = 4;

namespace colors {
inline constexpr const char* reset = "\033[0m";
inline constexpr const char* red = "\033[31m";
inline constexpr const char* green = "\033[32m";
inline constexpr const char* yellow = "\033[33m";
inline constexpr const char* cyan = "\033[36m";
}  // namespace colors
}  // namespace string_processing

// ================================================================================================
// UNIT CONVERSION FACTORS
// ================================================================================================

namespace conversion {
inline constexpr double to_percentage = 100.0;
}  // namespace conversion

}  // namespace brayton::constants
