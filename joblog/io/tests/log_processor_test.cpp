#include <joblog/io/diagnostic_sinks.hpp>
#include <joblog/io/error.hpp>
#include <joblog/io/log_processor.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace joblog::io;
using joblog::core::Level;
using joblog::core::Thresholds;

class LogProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "joblog_log_processor_test";
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    std::filesystem::path write_input(const std::string& content) {
        auto path = root_ / "jobs.log";
        std::ofstream file(path);
        file << content;
        return path;
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    std::filesystem::path root_;
    MemoryDiagnosticSink diagnostics_;
};

TEST_F(LogProcessorTest, WritesReportForMixedLog) {
    auto input = write_input("09:00:00,Backup,START,101\n"
                             "09:00:00,ETL,START,202\n"
                             "09:00:00,Job,START,303\n"
                             "garbage,missing,fields\n"
                             "\n"
                             "09:04:00,Quick,START,404\n"
                             "09:06:00,Backup,END,101\n"
                             "09:08:00,Quick,END,404\n"
                             "09:12:00,ETL,END,202\n");
    auto output = root_ / "out" / "report.csv";

    auto summary = process_log_file(input, output, Thresholds{}, diagnostics_);

    EXPECT_EQ(read_file(output),
              "pid,job,duration_sec,flag\r\n"
              "101,Backup,360,WARNING\r\n"
              "202,ETL,720,ERROR\r\n");

    EXPECT_EQ(summary.lines_read, 9u);
    EXPECT_EQ(summary.rejected_lines, 1u);
    EXPECT_EQ(summary.completed, 3u);
    ASSERT_EQ(summary.unterminated.size(), 1u);
    EXPECT_EQ(summary.unterminated[0].pid, "303");

    EXPECT_TRUE(diagnostics_.contains(Level::info, "Processing started for file"));
    EXPECT_TRUE(diagnostics_.contains(Level::info, "PID 303 (Job) still running"));
    EXPECT_TRUE(diagnostics_.contains(Level::info, "Report saved to " + output.string()));
    EXPECT_TRUE(diagnostics_.contains(Level::warning, "Line 4 malformed (3 fields)"));
}

TEST_F(LogProcessorTest, EmptyReportStillHasHeader) {
    auto input = write_input("09:00:00,Backup,START,101\n"
                             "09:04:00,Backup,END,101\n");
    auto output = root_ / "report.csv";

    process_log_file(input, output, Thresholds{}, diagnostics_);

    EXPECT_EQ(read_file(output), "pid,job,duration_sec,flag\r\n");
}

TEST_F(LogProcessorTest, OverwritesExistingReport) {
    auto input = write_input("");
    auto output = root_ / "report.csv";
    {
        std::ofstream stale(output);
        stale << "stale content\n";
    }

    process_log_file(input, output, Thresholds{}, diagnostics_);

    EXPECT_EQ(read_file(output), "pid,job,duration_sec,flag\r\n");
}

TEST_F(LogProcessorTest, MissingInputThrows) {
    EXPECT_THROW(process_log_file(root_ / "absent.log", root_ / "report.csv", Thresholds{},
                                  diagnostics_),
                 InputError);
    EXPECT_FALSE(std::filesystem::exists(root_ / "report.csv"));
}

TEST_F(LogProcessorTest, DirectoryInputThrows) {
    EXPECT_THROW(process_log_file(root_, root_ / "report.csv", Thresholds{}, diagnostics_),
                 InputError);
}

TEST_F(LogProcessorTest, UncreatableOutputThrows) {
    auto input = write_input("09:00:00,Backup,START,101\n");
    {
        std::ofstream blocker(root_ / "blocker");
        blocker << "file";
    }

    EXPECT_THROW(process_log_file(input, root_ / "blocker" / "report.csv", Thresholds{},
                                  diagnostics_),
                 OutputError);
}
