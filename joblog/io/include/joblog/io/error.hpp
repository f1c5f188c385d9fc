#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the joblog I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace joblog::io {

/// @brief Base exception for I/O errors (files, streams, configuration).
///
/// @ingroup io
/// @see LoaderError, InputError, OutputError
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct an error with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Additional context such as the file path or field name.
    IoError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

/// @brief Thrown when a threshold configuration cannot be loaded.
///
/// Raised when the JSON input is malformed, the root is not an object, or
/// values fail validation (non-numeric, negative, badly ordered).
///
/// @ingroup io
/// @see load_thresholds
class LoaderError : public IoError {
public:
    using IoError::IoError;
};

/// @brief Thrown when the input log cannot be opened.
/// @ingroup io
/// @see process_log_file
class InputError : public IoError {
public:
    using IoError::IoError;
};

/// @brief Thrown when a report or log file cannot be created or written.
/// @ingroup io
/// @see CsvReportWriter, open_output_file
class OutputError : public IoError {
public:
    using IoError::IoError;
};

} // namespace joblog::io
