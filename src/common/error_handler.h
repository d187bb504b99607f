#ifndef RETICLE_ERROR_HANDLER_H
#define RETICLE_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <mutex>
#include <vector>
#include <chrono>

namespace reticle {

enum class ErrorType {
    SIGNATURE_FORMAT_ERROR,
    SNAPSHOT_FORMAT_ERROR,
    CONFIGURATION_ERROR,
    FILE_IO_ERROR,
    INTROSPECTION_ERROR,
    ACTION_ERROR,
    TIMEOUT_ERROR,
    VALIDATION_ERROR,
    UNKNOWN_ERROR
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

std::string errorTypeToString(ErrorType type);
std::string errorSeverityToString(ErrorSeverity severity);

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : type(t), severity(s), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

class ReticleException : public std::exception {
public:
    explicit ReticleException(const ErrorInfo& error) : m_errorInfo(error) {}

    const char* what() const noexcept override {
        return m_errorInfo.message.c_str();
    }

    const ErrorInfo& getErrorInfo() const { return m_errorInfo; }
    ErrorType type() const { return m_errorInfo.type; }

private:
    ErrorInfo m_errorInfo;
};

/**
 * @brief Records and logs errors raised outside the replay pipeline
 *
 * Pipeline stages report failures through PipelineResult; this handler
 * covers loading of configuration, recordings and snapshots, and
 * collaborator exceptions caught at stage boundaries.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    /**
     * @brief Log and record an error. CRITICAL errors are rethrown as
     *        ReticleException after being recorded.
     */
    void handleError(const ErrorInfo& error);

    /**
     * @brief Convert any exception to ErrorInfo and record it
     * @return The recorded error
     */
    ErrorInfo handleException(const std::exception& e, const std::string& context = "");

    void logError(const ErrorInfo& error);
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    size_t getErrorCount() const;
    void clearErrorHistory();

    void setMaxHistory(size_t maxHistory);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    mutable std::mutex m_mutex;
    std::vector<ErrorInfo> m_errorHistory;
    size_t m_maxHistory = 1000;
};

#define RETICLE_THROW(type, severity, message, details, context) \
    throw reticle::ReticleException(reticle::ErrorInfo(type, severity, message, details, context))

#define RETICLE_HANDLE_ERROR(type, severity, message, details, context) \
    reticle::ErrorHandler::getInstance().handleError(reticle::ErrorInfo(type, severity, message, details, context))

} // namespace reticle

#endif // RETICLE_ERROR_HANDLER_H
