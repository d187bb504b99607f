#include "error_handler.h"
#include "structured_logger.h"
#include <sstream>

namespace reticle {

std::string errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::SIGNATURE_FORMAT_ERROR: return "SIGNATURE_FORMAT";
        case ErrorType::SNAPSHOT_FORMAT_ERROR: return "SNAPSHOT_FORMAT";
        case ErrorType::CONFIGURATION_ERROR: return "CONFIGURATION";
        case ErrorType::FILE_IO_ERROR: return "FILE_IO";
        case ErrorType::INTROSPECTION_ERROR: return "INTROSPECTION";
        case ErrorType::ACTION_ERROR: return "ACTION";
        case ErrorType::TIMEOUT_ERROR: return "TIMEOUT";
        case ErrorType::VALIDATION_ERROR: return "VALIDATION";
        case ErrorType::UNKNOWN_ERROR: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

std::string errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::handleError(const ErrorInfo& error) {
    logError(error);

    if (error.severity == ErrorSeverity::CRITICAL) {
        throw ReticleException(error);
    }
}

ErrorInfo ErrorHandler::handleException(const std::exception& e, const std::string& context) {
    const ReticleException* reticleError = dynamic_cast<const ReticleException*>(&e);
    if (reticleError) {
        ErrorInfo info = reticleError->getErrorInfo();
        if (info.context.empty()) {
            info.context = context;
        }
        logError(info);
        return info;
    }

    ErrorInfo info(ErrorType::UNKNOWN_ERROR, ErrorSeverity::HIGH, e.what(), "", context);
    logError(info);
    return info;
}

void ErrorHandler::logError(const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errorHistory.push_back(error);
        if (m_errorHistory.size() > m_maxHistory) {
            m_errorHistory.erase(m_errorHistory.begin(),
                                 m_errorHistory.begin() + (m_errorHistory.size() - m_maxHistory));
        }
    }

    std::ostringstream logMessage;
    logMessage << "[" << errorTypeToString(error.type) << "] " << error.message;
    if (!error.details.empty()) {
        logMessage << " - Details: " << error.details;
    }

    nlohmann::json ctx = {
        {"error_type", errorTypeToString(error.type)},
        {"severity", errorSeverityToString(error.severity)}
    };
    if (!error.context.empty()) {
        ctx["where"] = error.context;
    }

    switch (error.severity) {
        case ErrorSeverity::LOW:
            RETICLE_LOG_DEBUG().message(logMessage.str()).context("error", ctx);
            break;
        case ErrorSeverity::MEDIUM:
            RETICLE_LOG_WARNING().message(logMessage.str()).context("error", ctx);
            break;
        case ErrorSeverity::HIGH:
            RETICLE_LOG_ERROR().message(logMessage.str()).context("error", ctx);
            break;
        case ErrorSeverity::CRITICAL:
        default:
            RETICLE_LOG_CRITICAL().message(logMessage.str()).context("error", ctx);
            break;
    }
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t start = (m_errorHistory.size() > count) ? m_errorHistory.size() - count : 0;
    return std::vector<ErrorInfo>(m_errorHistory.begin() + start, m_errorHistory.end());
}

size_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errorHistory.size();
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorHistory.clear();
}

void ErrorHandler::setMaxHistory(size_t maxHistory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_maxHistory = maxHistory == 0 ? 1 : maxHistory;
    if (m_errorHistory.size() > m_maxHistory) {
        m_errorHistory.erase(m_errorHistory.begin(),
                             m_errorHistory.begin() + (m_errorHistory.size() - m_maxHistory));
    }
}

} // namespace reticle
