#pragma once

#include <stdexcept>
#include <string>

namespace joblog::core {

/// @brief Base exception for all correlation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch job-log errors separately from other
/// `std::runtime_error` exceptions.
///
/// Malformed log lines are never reported through exceptions; they are
/// skipped and surfaced as warning diagnostics instead.
///
/// @see InvalidThresholdsError, InputReadError, InvalidStateError
/// @ingroup core
class JoblogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when warning/error thresholds are not strictly ordered.
///
/// Thresholds must satisfy `0 <= warning < error`.
///
/// @see Thresholds, JoblogError
/// @ingroup core
class InvalidThresholdsError : public JoblogError {
public:
    using JoblogError::JoblogError;
};

/// @brief Thrown when the input stream fails at the I/O level.
///
/// Raised when the underlying stream reports `badbit` while lines are
/// being read. Rows already written to the report sink are kept.
///
/// @see correlate, JoblogError
/// @ingroup core
class InputReadError : public JoblogError {
public:
    using JoblogError::JoblogError;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, feeding a line to an EventCorrelator after finish() has
/// been called.
///
/// @see EventCorrelator::finish, JoblogError
/// @ingroup core
class InvalidStateError : public JoblogError {
public:
    using JoblogError::JoblogError;
};

} // namespace joblog::core
