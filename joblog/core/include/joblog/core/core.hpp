#pragma once

/// @defgroup core Core Library
/// @brief Job event parsing, correlation and classification.
///
/// The core library turns a stream of `TIMESTAMP,JOB,EVENT,PID` lines into
/// report rows for jobs that ran longer than the configured thresholds.
/// It talks to the outside world only through the abstract DiagnosticSink
/// and ReportWriter interfaces and has no file-system dependencies.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Time-of-day handling, thresholds and flags.

/// @defgroup core_parsing Parsing
/// @ingroup core
/// @brief Line splitting and record validation.

/// @defgroup core_correlation Correlation
/// @ingroup core
/// @brief START/END pairing and the run summary.

/// @defgroup core_diagnostics Diagnostics
/// @ingroup core
/// @brief Leveled diagnostic side channel.

/// @defgroup core_report Report
/// @ingroup core
/// @brief Report rows and the writer interface.

// Convenience header for the core library
#include <joblog/core/types.hpp>
#include <joblog/core/error.hpp>
#include <joblog/core/thresholds.hpp>
#include <joblog/core/diagnostic_sink.hpp>
#include <joblog/core/report_writer.hpp>
#include <joblog/core/line_parser.hpp>
#include <joblog/core/correlator.hpp>
