#pragma once

/// @file config_loader.hpp
/// @brief Loading warning/error thresholds from JSON.
/// @ingroup io_config

#include <joblog/core/thresholds.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace joblog::io {

/// @brief Load thresholds from a JSON file.
///
/// The file holds a single object:
/// @code{.json}
/// {"warning_threshold_sec": 300, "error_threshold_sec": 600}
/// @endcode
/// Both keys are optional; a missing key keeps its default value.
/// Unknown keys are ignored.
///
/// @param path  Filesystem path to the JSON configuration.
/// @return Validated thresholds.
///
/// @throws LoaderError  If the file cannot be read, is not valid JSON, or
///                      holds invalid values.
///
/// @see load_thresholds_from_string, core::Thresholds
core::Thresholds load_thresholds(const std::filesystem::path& path);

/// @brief Load thresholds from a JSON string.
///
/// Behaves like load_thresholds except that the input is already in memory.
///
/// @param json  JSON content.
/// @return Validated thresholds.
///
/// @throws LoaderError  If the JSON is malformed or holds invalid values.
core::Thresholds load_thresholds_from_string(std::string_view json);

/// @brief Merge an optional configuration file with explicit overrides.
///
/// Starts from the defaults, replaces them with the contents of @p config
/// when given, then applies @p warning and @p error on top. The ordering
/// check runs on the merged pair, so a single override may conflict with
/// the other threshold's file or default value.
///
/// @param config   Optional JSON configuration file.
/// @param warning  Warning threshold override in seconds.
/// @param error    Error threshold override in seconds.
/// @return Validated thresholds.
///
/// @throws LoaderError  If the file cannot be loaded or the merged values
///                      are invalid.
core::Thresholds resolve_thresholds(const std::optional<std::filesystem::path>& config,
                                    std::optional<double> warning,
                                    std::optional<double> error);

} // namespace joblog::io
