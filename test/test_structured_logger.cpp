#include <iostream>
#include <thread>
#include <chrono>
#include <cstdio>
#include <fstream>
#include "test_support.h"
#include "common/structured_logger.h"

using namespace reticle;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<MemoryLogSink> captureOnly() {
    auto& logger = StructuredLogger::getInstance();
    auto sink = std::make_shared<MemoryLogSink>();
    logger.clearSinks();
    logger.addSink(sink);
    logger.setLogLevel(LogLevel::DEBUG);
    return sink;
}

}

void testBasicLogging() {
    std::cout << "[TEST] Basic Logging\n";

    auto sink = captureOnly();
    auto& logger = StructuredLogger::getInstance();

    logger.debug().message("Debug message").context("key", "value");
    logger.info().message("Info message");
    logger.warning().message("Warning message");
    logger.error().message("Error message");
    logger.critical().message("Critical message");

    std::vector<LogEntry> entries = sink->entries();
    CHECK(entries.size() == 5);
    CHECK(entries[0].level == LogLevel::DEBUG);
    CHECK(entries[0].context["key"] == "value");
    CHECK(sink->countAtLeast(LogLevel::WARNING) == 3);
    CHECK(sink->containsMessage("Critical"));

    std::cout << "[OK] Basic logging test passed\n\n";
}

void testMacrosRecordComponentAndLocation() {
    std::cout << "[TEST] Logging macros\n";

    auto sink = captureOnly();
    RETICLE_LOG_INFO().component("L3").message("Direct hit accepted").context("score", 0.97);

    std::vector<LogEntry> entries = sink->entries();
    CHECK(entries.size() == 1);
    CHECK(entries[0].component == "L3");
    CHECK(entries[0].line > 0);
    CHECK(entries[0].file.find("test_structured_logger") != std::string::npos);

    std::string text = TextLogFormatter().format(entries[0]);
    CHECK(text.find("Direct hit accepted") != std::string::npos);
    CHECK(text.find("L3") != std::string::npos);

    nlohmann::json json = nlohmann::json::parse(JsonLogFormatter().format(entries[0]));
    CHECK(json["message"] == "Direct hit accepted");
    CHECK(json["level"] == "INFO");

    std::cout << "[OK] Logging macro test passed\n\n";
}

void testLogLevels() {
    std::cout << "[TEST] Log Level Filtering\n";

    auto sink = captureOnly();
    auto& logger = StructuredLogger::getInstance();
    logger.setLogLevel(LogLevel::WARNING);

    logger.debug().message("Should not see this debug message");
    logger.info().message("Should not see this info message");
    logger.warning().message("Should see this warning message");
    logger.error().message("Should see this error message");

    CHECK(sink->entries().size() == 2);
    CHECK(!sink->containsMessage("Should not see"));

    logger.setLogLevel(LogLevel::INFO);

    CHECK(parseLogLevel("debug") == LogLevel::DEBUG);
    CHECK(parseLogLevel(" Warn ") == LogLevel::WARNING);
    CHECK(parseLogLevel("ERROR") == LogLevel::ERROR_LEVEL);
    CHECK(parseLogLevel("fatal") == LogLevel::CRITICAL);
    CHECK(parseLogLevel("loud", LogLevel::WARNING) == LogLevel::WARNING);

    std::cout << "[OK] Log level filtering test passed\n\n";
}

void testPerformanceTracking() {
    std::cout << "[TEST] Performance Tracking\n";

    auto& tracker = StructuredLogger::getInstance().getPerformanceTracker();
    tracker.reset();

    for (int i = 1; i <= 4; ++i) {
        tracker.recordOperation("pipeline.refine", std::chrono::milliseconds(i * 10), i != 4);
    }

    PerformanceTracker::MetricsSnapshot metrics = tracker.getMetrics("pipeline.refine");
    CHECK(metrics.count == 4);
    CHECK(metrics.errors == 1);
    CHECK_NEAR(metrics.getAverageDurationMs(), 25.0, 1e-6);
    CHECK(metrics.min_duration_ns == 10000000u);
    CHECK(metrics.max_duration_ns == 40000000u);
    CHECK(tracker.getMetrics("never.recorded").count == 0);
    CHECK(tracker.report().contains("pipeline.refine"));

    std::cout << "[OK] Performance tracking test passed\n\n";
}

void testScopedTimer() {
    std::cout << "[TEST] Scoped Timer\n";

    auto sink = captureOnly();
    auto& logger = StructuredLogger::getInstance();
    auto& tracker = logger.getPerformanceTracker();
    tracker.reset();
    logger.setSlowOperationThreshold(20ms);

    {
        RETICLE_SCOPED_TIMER("pipeline.confirm");
        std::this_thread::sleep_for(40ms);
    }
    {
        ScopedTimer timer("pipeline.execute");
        timer.markFailed();
    }
    {
        ScopedTimer timer("pipeline.cancelled");
        timer.cancel();
    }

    CHECK(tracker.getMetrics("pipeline.confirm").count == 1);
    CHECK(tracker.getMetrics("pipeline.execute").errors == 1);
    CHECK(tracker.getMetrics("pipeline.cancelled").count == 0);
    CHECK(sink->containsMessage("Slow operation"));

    logger.setSlowOperationThreshold(250ms);

    std::cout << "[OK] Scoped timer test passed\n\n";
}

void testAsyncLogging() {
    std::cout << "[TEST] Async Logging\n";

    auto sink = captureOnly();
    auto& logger = StructuredLogger::getInstance();
    logger.setAsyncLogging(true);

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&logger, t]() {
            for (int i = 0; i < 50; ++i) {
                logger.info().message("Async log message").context("writer", t).context("index", i);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    // Turning async off drains the queue
    logger.setAsyncLogging(false);
    CHECK(sink->entries().size() == 200);

    std::cout << "[OK] Async logging test passed\n\n";
}

void testConfigure() {
    std::cout << "[TEST] Configure from logging section\n";

    auto& logger = StructuredLogger::getInstance();
    const std::string path = "test_logs/reticle_test.log";
    std::remove(path.c_str());

    logger.configure({
        {"level", "warning"},
        {"format", "json"},
        {"console", false},
        {"file", path},
        {"max_files", 2}
    });
    CHECK(logger.getLogLevel() == LogLevel::WARNING);

    logger.info().message("filtered out");
    logger.warning().component("config").message("Written to file");
    logger.flush();

    std::ifstream file(path);
    CHECK(file.good());
    std::string line;
    int lines = 0;
    while (std::getline(file, line)) {
        nlohmann::json entry = nlohmann::json::parse(line);
        CHECK(entry["message"] == "Written to file");
        ++lines;
    }
    CHECK(lines == 1);

    // Non-object sections are ignored
    logger.configure(nlohmann::json("verbose"));
    CHECK(logger.getLogLevel() == LogLevel::WARNING);

    std::cout << "[OK] Configure test passed\n\n";
}

int main() {
    std::cout << "=== Reticle Structured Logger Test Suite ===\n\n";

    try {
        testBasicLogging();
        testMacrosRecordComponentAndLocation();
        testLogLevels();
        testPerformanceTracking();
        testScopedTimer();
        testAsyncLogging();
        testConfigure();

        StructuredLogger::getInstance().shutdown();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
