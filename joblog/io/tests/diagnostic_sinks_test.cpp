#include <joblog/io/diagnostic_sinks.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <regex>
#include <sstream>
#include <string>

using namespace joblog::io;
using joblog::core::Level;

// =============================================================================
// NullDiagnosticSink
// =============================================================================

TEST(DiagnosticSinksTest, NullSinkAcceptsAllCalls) {
    NullDiagnosticSink sink;

    // Should not throw or crash
    sink.trace("trace");
    sink.debug("debug");
    sink.info("info");
    sink.warning("warning");
    sink.error("error");
}

// =============================================================================
// MemoryDiagnosticSink
// =============================================================================

TEST(DiagnosticSinksTest, MemorySinkRecordsEveryLevel) {
    MemoryDiagnosticSink sink;
    sink.trace("a");
    sink.debug("b");
    sink.warning("c");
    sink.warning("d");

    ASSERT_EQ(sink.records().size(), 4u);
    EXPECT_EQ(sink.records()[0].level, Level::trace);
    EXPECT_EQ(sink.records()[0].message, "a");
    EXPECT_EQ(sink.count(Level::warning), 2u);
    EXPECT_EQ(sink.count(Level::info), 0u);
    EXPECT_TRUE(sink.contains(Level::warning, "d"));
    EXPECT_FALSE(sink.contains(Level::debug, "d"));

    sink.clear();
    EXPECT_TRUE(sink.records().empty());
}

// =============================================================================
// StreamDiagnosticSink
// =============================================================================

TEST(DiagnosticSinksTest, StreamSinkFormatsWithoutTimestamp) {
    std::ostringstream oss;
    StreamDiagnosticSink sink(oss, Level::info, false);

    sink.info("Program started.");
    sink.warning("Line 3 bad timestamp 'x'");

    EXPECT_EQ(oss.str(), "[INFO] Program started.\n[WARNING] Line 3 bad timestamp 'x'\n");
}

TEST(DiagnosticSinksTest, StreamSinkFiltersBelowThreshold) {
    std::ostringstream oss;
    StreamDiagnosticSink sink(oss, Level::warning, false);

    sink.trace("hidden");
    sink.debug("hidden");
    sink.info("hidden");
    sink.error("shown");

    EXPECT_EQ(oss.str(), "[ERROR] shown\n");

    sink.set_threshold(Level::trace);
    EXPECT_EQ(sink.threshold(), Level::trace);
    sink.trace("now shown");
    EXPECT_NE(oss.str().find("[TRACE] now shown"), std::string::npos);
}

TEST(DiagnosticSinksTest, StreamSinkTimestampFormat) {
    std::ostringstream oss;
    StreamDiagnosticSink sink(oss);

    sink.info("hello");

    const std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2},\d{3} \[INFO\] hello\n)");
    EXPECT_TRUE(std::regex_match(oss.str(), pattern)) << oss.str();
}

TEST(DiagnosticSinksTest, FormatLocalTimePattern) {
    const auto now = std::chrono::system_clock::now();

    EXPECT_TRUE(std::regex_match(format_local_time(now, "%Y-%m-%d-%H-%M-%S"),
                                 std::regex(R"(\d{4}-\d{2}-\d{2}-\d{2}-\d{2}-\d{2})")));
    EXPECT_EQ(format_local_time(now, "report_%%"), "report_%");
}

// =============================================================================
// TeeDiagnosticSink
// =============================================================================

TEST(DiagnosticSinksTest, TeeForwardsToAllSinks) {
    MemoryDiagnosticSink first;
    MemoryDiagnosticSink second;
    TeeDiagnosticSink tee;
    tee.attach(first);
    tee.attach(second);
    tee.attach(first);  // ignored

    tee.warning("both");

    EXPECT_EQ(tee.size(), 2u);
    EXPECT_EQ(first.records().size(), 1u);
    EXPECT_EQ(second.records().size(), 1u);
    EXPECT_TRUE(second.contains(Level::warning, "both"));
}

TEST(DiagnosticSinksTest, TeeWithoutSinksIsNoOp) {
    TeeDiagnosticSink tee;
    tee.info("nobody listens");
    EXPECT_EQ(tee.size(), 0u);
}
