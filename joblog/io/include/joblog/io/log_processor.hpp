#pragma once

/// @file log_processor.hpp
/// @brief File-level driver: input log in, CSV report out.
/// @ingroup io_processing

#include <joblog/core/correlator.hpp>
#include <joblog/core/diagnostic_sink.hpp>
#include <joblog/core/thresholds.hpp>

#include <filesystem>

namespace joblog::io {

/// @brief Correlate a job log file and write the CSV report.
///
/// Opens @p input_path, creates the parent directories of @p output_path,
/// writes the report there with a CsvReportWriter and returns the run
/// summary. Start, completion and a count summary are logged at info level.
///
/// @param input_path   Job event log to analyse.
/// @param output_path  Report destination (truncated if it exists).
/// @param thresholds   Warning/error thresholds.
/// @param diagnostics  Destination of diagnostic messages.
/// @return The correlation summary.
///
/// @throws InputError           If the input is missing or cannot be opened.
/// @throws OutputError          If the report cannot be created or written.
/// @throws core::InputReadError If reading the input fails midway.
///
/// @see core::correlate, CsvReportWriter
core::CorrelationSummary process_log_file(const std::filesystem::path& input_path,
                                          const std::filesystem::path& output_path,
                                          const core::Thresholds& thresholds,
                                          core::DiagnosticSink& diagnostics);

} // namespace joblog::io
