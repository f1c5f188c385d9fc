#include <joblog/core/core.hpp>
#include <joblog/io/io.hpp>

#include <cxxopts.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace {

namespace core = joblog::core;
namespace io = joblog::io;

struct Config {
    std::string log_file;
    std::string output_file;
    std::string config_file;
    std::optional<double> warning_seconds;
    std::optional<double> error_seconds;
    std::string diagnostics_file;  // empty = no log file
    core::Level level{core::Level::info};
};

std::string local_stamp(const char* format) {
    return io::format_local_time(std::chrono::system_clock::now(), format);
}

Config parse_args(int argc, char** argv) {
    cxxopts::Options options(
        "joblog-monitor",
        "Analyse a CSV job log, calculate runtimes, and emit a report highlighting jobs that "
        "exceed certain thresholds.");

    const std::string default_output = "out/report_" + local_stamp("%Y-%m-%d-%H-%M-%S") + ".csv";
    const std::string default_log = "logs/joblog_monitor_" + local_stamp("%Y-%m-%d") + ".log";

    // clang-format off
    options.add_options()
        ("logfile", "Full path to the CSV log file to analyse", cxxopts::value<std::string>())
        ("o,output", "Full path (including filename) for the generated report CSV", cxxopts::value<std::string>()->default_value(default_output))
        ("c,config", "JSON file with warning_threshold_sec / error_threshold_sec", cxxopts::value<std::string>())
        ("warning", "Warning threshold in seconds (default: 300)", cxxopts::value<double>())
        ("error", "Error threshold in seconds (default: 600)", cxxopts::value<double>())
        ("log-file", "Diagnostics log file (appended)", cxxopts::value<std::string>()->default_value(default_log))
        ("no-log-file", "Write diagnostics to stderr only")
        ("log-level", "Diagnostics level: trace|debug|info|warning|error", cxxopts::value<std::string>()->default_value("info"))
        ("v,verbose", "Same as --log-level debug")
        ("h,help", "Show help");
    // clang-format on

    options.parse_positional({"logfile"});
    options.positional_help("<logfile>");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("logfile") == 0U) {
        std::cerr << "Error: logfile is required" << std::endl;
        std::cerr << options.help() << std::endl;
        std::exit(64);
    }

    Config config;
    config.log_file = result["logfile"].as<std::string>();
    config.output_file = result["output"].as<std::string>();
    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    }
    if (result.count("warning") != 0U) {
        config.warning_seconds = result["warning"].as<double>();
    }
    if (result.count("error") != 0U) {
        config.error_seconds = result["error"].as<double>();
    }
    if (result.count("no-log-file") == 0U) {
        config.diagnostics_file = result["log-file"].as<std::string>();
    }

    auto level = core::parse_level(result["log-level"].as<std::string>());
    if (!level) {
        std::cerr << "Error: unknown --log-level '" << result["log-level"].as<std::string>() << "'"
                  << std::endl;
        std::exit(64);
    }
    config.level = *level;
    if (result.count("verbose") != 0U && config.level > core::Level::debug) {
        config.level = core::Level::debug;
    }

    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    Config config;
    try {
        config = parse_args(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 64;
    }

    io::StreamDiagnosticSink console(std::cerr, config.level);
    io::TeeDiagnosticSink diagnostics;
    diagnostics.attach(console);

    std::ofstream log_stream;
    std::unique_ptr<io::StreamDiagnosticSink> file_sink;

    try {
        if (!config.diagnostics_file.empty()) {
            log_stream = io::open_output_file(config.diagnostics_file, std::ios::app);
            file_sink = std::make_unique<io::StreamDiagnosticSink>(log_stream, config.level);
            diagnostics.attach(*file_sink);
        }

        diagnostics.info("Program started.");
        diagnostics.debug("Log file to analyze: " + config.log_file);
        diagnostics.debug("Report file: " + config.output_file);
        if (!config.config_file.empty()) {
            diagnostics.debug("Threshold configuration: " + config.config_file);
        }

        std::optional<std::filesystem::path> config_file;
        if (!config.config_file.empty()) {
            config_file = config.config_file;
        }
        const auto thresholds =
            io::resolve_thresholds(config_file, config.warning_seconds, config.error_seconds);
        diagnostics.debug("Thresholds: warning " + std::to_string(thresholds.warning_seconds()) +
                          " s, error " + std::to_string(thresholds.error_seconds()) + " s");

        io::process_log_file(config.log_file, config.output_file, thresholds, diagnostics);

        diagnostics.info("Program ended.");
        return EXIT_SUCCESS;
    }
    catch (const std::exception& e) {
        diagnostics.error(std::string("Error: ") + e.what());
    }

    return EXIT_FAILURE;
}
