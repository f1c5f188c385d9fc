#pragma once

/// @defgroup io I/O Library
/// @brief Diagnostic sinks, report writers, configuration and file handling.
///
/// The I/O library supplies the collaborators the core consumes: sinks for
/// diagnostics, CSV and in-memory report writers, the JSON threshold
/// loader, and the driver that ties an input file to a report file.
/// Depends on core only.

/// @defgroup io_diagnostics Diagnostic Sinks
/// @ingroup io
/// @brief Null, memory, stream and tee diagnostic sinks.

/// @defgroup io_report Report Writers
/// @ingroup io
/// @brief CSV and memory report writers.

/// @defgroup io_config Configuration
/// @ingroup io
/// @brief JSON threshold loader.

/// @defgroup io_processing Processing
/// @ingroup io
/// @brief File-level correlation driver.

// Convenience header for the I/O library

#include <joblog/io/error.hpp>
#include <joblog/io/diagnostic_sinks.hpp>
#include <joblog/io/report_writers.hpp>
#include <joblog/io/config_loader.hpp>
#include <joblog/io/log_processor.hpp>
