#ifndef RETICLE_STRUCTURED_LOGGER_H
#define RETICLE_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <atomic>
#include <unordered_map>
#include <thread>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include <fstream>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "thread_safe_queue.h"

namespace reticle {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,  // Avoids the Windows ERROR macro
    CRITICAL
};

std::string logLevelToString(LogLevel level);

/**
 * @brief Parse a level name ("debug", "INFO", "warn", "error", ...)
 * @return fallback when the name is not recognised
 */
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Log entry structure with structured data
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string component;   // Pipeline stage or subsystem, e.g. "L3" or "config"
    std::string file;
    int line;
    std::thread::id thread_id;
    nlohmann::json context;

    std::chrono::nanoseconds duration;
    std::string operation_name;

    LogEntry() : level(LogLevel::INFO), line(0), duration(0) {}
};

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

/**
 * @brief One JSON object per line
 */
class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Human-readable single line format
 */
class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Writes to stdout, errors and above to stderr
 */
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    std::mutex m_mutex;
};

/**
 * @brief File log sink with size based rotation
 */
class RotatingFileLogSink : public ILogSink {
public:
    struct Config {
        std::string base_path;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
    };

    RotatingFileLogSink(const Config& config, std::shared_ptr<ILogFormatter> formatter);
    ~RotatingFileLogSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    Config m_config;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::unique_ptr<std::ofstream> m_file;
    std::mutex m_mutex;
    size_t m_current_size;

    void rotateIfNeeded();
    void openNewFile();
    std::string generateFileName(int index = 0) const;
};

/**
 * @brief Keeps entries in memory; used by tests and by callers that attach
 *        log output to a replay report
 */
class MemoryLogSink : public ILogSink {
public:
    explicit MemoryLogSink(size_t max_entries = 4096);

    void write(const LogEntry& entry) override;
    void flush() override {}

    std::vector<LogEntry> entries() const;
    size_t countAtLeast(LogLevel level) const;
    bool containsMessage(const std::string& fragment) const;
    void clear();

private:
    size_t m_max_entries;
    mutable std::mutex m_mutex;
    std::vector<LogEntry> m_entries;
};

/**
 * @brief Per-operation latency statistics
 */
class PerformanceTracker {
public:
    struct Metrics {
        std::atomic<uint64_t> count{0};
        std::atomic<uint64_t> total_duration_ns{0};
        std::atomic<uint64_t> min_duration_ns{UINT64_MAX};
        std::atomic<uint64_t> max_duration_ns{0};
        std::atomic<uint64_t> errors{0};
    };

    struct MetricsSnapshot {
        uint64_t count = 0;
        uint64_t total_duration_ns = 0;
        uint64_t min_duration_ns = UINT64_MAX;
        uint64_t max_duration_ns = 0;
        uint64_t errors = 0;

        double getAverageDurationMs() const;
        nlohmann::json toJson() const;
    };

    void recordOperation(const std::string& operation,
                         std::chrono::nanoseconds duration,
                         bool success = true);

    MetricsSnapshot getMetrics(const std::string& operation) const;
    std::unordered_map<std::string, MetricsSnapshot> getAllMetrics() const;
    nlohmann::json report() const;
    void reset();

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<Metrics>> m_metrics;

    static MetricsSnapshot snapshotOf(const Metrics& metrics);
};

/**
 * @brief RAII timer feeding the PerformanceTracker
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void markFailed() { m_success = false; }
    void cancel() { m_cancelled = true; }

private:
    std::string m_operation_name;
    std::chrono::steady_clock::time_point m_start;
    bool m_success;
    bool m_cancelled;
};

class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();
    void setAsyncLogging(bool async);

    /**
     * @brief Durations above this threshold are logged as slow operations
     */
    void setSlowOperationThreshold(std::chrono::milliseconds threshold);

    /**
     * @brief Apply the "logging" configuration section
     *
     * Recognised keys: level, format ("text" or "json"), console, file,
     * max_size_mb, max_files, async, slow_operation_ms. Replaces the current
     * sinks.
     */
    void configure(const nlohmann::json& loggingSection);

    void log(const LogEntry& entry);
    void log(LogLevel level, const std::string& message,
             const nlohmann::json& context = {});

    void logPerformance(const std::string& operation,
                        std::chrono::nanoseconds duration,
                        bool success = true);

    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);
        LogBuilder(LogBuilder&& other) noexcept;
        LogBuilder(const LogBuilder&) = delete;
        LogBuilder& operator=(const LogBuilder&) = delete;
        LogBuilder& operator=(LogBuilder&&) = delete;

        LogBuilder& message(const std::string& msg);
        LogBuilder& component(const std::string& name);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& file(const char* file, int line);
        LogBuilder& operation(const std::string& op);
        LogBuilder& duration(std::chrono::nanoseconds ns);

        ~LogBuilder();  // Logs on destruction

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    PerformanceTracker& getPerformanceTracker() { return m_performance_tracker; }

    void shutdown();
    void flush();

private:
    StructuredLogger();
    ~StructuredLogger();

    std::atomic<LogLevel> m_min_level;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    mutable std::mutex m_config_mutex;

    std::atomic<bool> m_async_enabled;
    ThreadSafeQueue<LogEntry> m_log_queue;
    std::thread m_logging_thread;
    std::atomic<bool> m_shutdown{false};
    std::atomic<int64_t> m_slow_threshold_ms;

    PerformanceTracker m_performance_tracker;

    void asyncLoggingLoop();
    void processLogEntry(const LogEntry& entry);
};

#define RETICLE_LOG_DEBUG() reticle::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define RETICLE_LOG_INFO() reticle::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define RETICLE_LOG_WARNING() reticle::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define RETICLE_LOG_ERROR() reticle::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define RETICLE_LOG_CRITICAL() reticle::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

#define RETICLE_SCOPED_TIMER(operation) reticle::ScopedTimer _reticle_timer(operation)

} // namespace reticle

#endif // RETICLE_STRUCTURED_LOGGER_H
