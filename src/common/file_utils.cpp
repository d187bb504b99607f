#include "file_utils.h"
#include "structured_logger.h"
#include <fstream>
#include <filesystem>
#include <sstream>

namespace reticle {
namespace utils {

bool FileUtils::loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput) {
    std::string content;
    if (!readFileToString(filePath, content)) {
        return false;
    }

    std::string errorMessage;
    if (!parseJson(content, jsonOutput, errorMessage)) {
        RETICLE_LOG_ERROR().message("JSON parse error").context("path", filePath).context("error", errorMessage);
        return false;
    }

    if (jsonOutput.is_null()) {
        RETICLE_LOG_WARNING().message("Loaded empty JSON from file").context("path", filePath);
    }

    RETICLE_LOG_DEBUG().message("Loaded JSON from file").context("path", filePath);
    return true;
}

bool FileUtils::parseJson(const std::string& text, nlohmann::json& jsonOutput, std::string& errorMessage) {
    try {
        jsonOutput = nlohmann::json::parse(text);
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        errorMessage = e.what();
        return false;
    }
}

bool FileUtils::saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData) {
    std::string serialized;
    try {
        serialized = jsonData.dump(2);
    } catch (const nlohmann::json::type_error& e) {
        RETICLE_LOG_ERROR().message("JSON serialization error").context("path", filePath).context("error", e.what());
        return false;
    }
    return writeStringToFile(filePath, serialized + "\n");
}

bool FileUtils::fileExists(const std::string& filePath) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    std::error_code ec;
    return std::filesystem::is_regular_file(filePath, ec);
}

bool FileUtils::createDirectoryIfNotExists(const std::string& directoryPath) {
    if (directoryPath.empty()) {
        RETICLE_LOG_ERROR().message("Empty directory path provided to createDirectoryIfNotExists");
        return false;
    }

    std::error_code ec;
    if (std::filesystem::exists(directoryPath, ec)) {
        if (std::filesystem::is_directory(directoryPath, ec)) {
            return true;
        }
        RETICLE_LOG_ERROR().message("Path exists but is not a directory").context("path", directoryPath);
        return false;
    }

    if (!std::filesystem::create_directories(directoryPath, ec) || ec) {
        RETICLE_LOG_ERROR().message("Could not create directory")
            .context("path", directoryPath)
            .context("error", ec.message());
        return false;
    }

    RETICLE_LOG_DEBUG().message("Created directory").context("path", directoryPath);
    return true;
}

bool FileUtils::readFileToString(const std::string& filePath, std::string& content) {
    if (!validateFilePath(filePath)) {
        RETICLE_LOG_ERROR().message("Invalid file path provided to readFileToString");
        return false;
    }

    if (!fileExists(filePath)) {
        RETICLE_LOG_WARNING().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        RETICLE_LOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        RETICLE_LOG_ERROR().message("Error reading file content").context("path", filePath);
        return false;
    }

    content = buffer.str();
    return true;
}

bool FileUtils::writeStringToFile(const std::string& filePath, const std::string& content) {
    if (!validateFilePath(filePath)) {
        RETICLE_LOG_ERROR().message("Invalid file path provided to writeStringToFile");
        return false;
    }

    if (!ensureParentDirectoryExists(filePath)) {
        RETICLE_LOG_ERROR().message("Cannot create parent directory").context("path", filePath);
        return false;
    }

    std::string tempFilePath = filePath + ".tmp";
    std::error_code ec;

    {
        std::ofstream tempFile(tempFilePath, std::ios::binary | std::ios::trunc);
        if (!tempFile.is_open()) {
            RETICLE_LOG_ERROR().message("Cannot create temporary file").context("temp_path", tempFilePath);
            return false;
        }

        tempFile << content;
        tempFile.flush();

        if (tempFile.fail()) {
            RETICLE_LOG_ERROR().message("Failed to write temporary file").context("temp_path", tempFilePath);
            tempFile.close();
            std::filesystem::remove(tempFilePath, ec);
            return false;
        }
    }

    std::filesystem::rename(tempFilePath, filePath, ec);
    if (ec) {
        RETICLE_LOG_ERROR().message("Failed to rename temporary file")
            .context("path", filePath)
            .context("error", ec.message());
        std::error_code cleanup;
        std::filesystem::remove(tempFilePath, cleanup);
        return false;
    }

    RETICLE_LOG_DEBUG().message("Wrote file").context("path", filePath).context("bytes", content.length());
    return true;
}

bool FileUtils::validateFilePath(const std::string& filePath) {
    if (filePath.empty()) {
        RETICLE_LOG_ERROR().message("Empty file path provided");
        return false;
    }

    if (filePath.find('\0') != std::string::npos) {
        RETICLE_LOG_ERROR().message("Embedded NUL in file path");
        return false;
    }

    return true;
}

bool FileUtils::ensureParentDirectoryExists(const std::string& filePath) {
    std::filesystem::path parentPath = std::filesystem::path(filePath).parent_path();
    if (parentPath.empty()) {
        return true;
    }
    return createDirectoryIfNotExists(parentPath.string());
}

} // namespace utils
} // namespace reticle
