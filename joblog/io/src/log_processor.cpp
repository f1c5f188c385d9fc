#include <joblog/io/log_processor.hpp>
#include <joblog/io/error.hpp>
#include <joblog/io/report_writers.hpp>

#include <fstream>
#include <string>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace joblog::io {

namespace fs = std::filesystem;

core::CorrelationSummary process_log_file(const fs::path& input_path,
                                          const fs::path& output_path,
                                          const core::Thresholds& thresholds,
                                          core::DiagnosticSink& diagnostics) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    diagnostics.info("Processing started for file " + input_path.string());

    if (!fs::exists(input_path)) {
        throw InputError("file missing", input_path.string());
    }
    if (fs::is_directory(input_path)) {
        throw InputError("is a directory", input_path.string());
    }

    std::ifstream input(input_path);
    if (!input) {
        throw InputError("cannot open file", input_path.string());
    }

    auto output = open_output_file(output_path);
    CsvReportWriter report(output);

    auto summary = core::correlate(input, thresholds, report, diagnostics);
    report.flush();
    output.close();
    if (output.fail()) {
        throw OutputError("cannot close file", output_path.string());
    }

    diagnostics.info("Read " + std::to_string(summary.lines_read) + " lines: " +
                     std::to_string(summary.rejected_lines) + " rejected, " +
                     std::to_string(summary.completed) + " jobs completed, " +
                     std::to_string(summary.warnings_flagged) + " WARNING, " +
                     std::to_string(summary.errors_flagged) + " ERROR, " +
                     std::to_string(summary.unterminated.size()) + " still running");
    diagnostics.info("Processing finished. Report saved to " + output_path.string());

    return summary;
}

} // namespace joblog::io
