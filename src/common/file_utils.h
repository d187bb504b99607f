#ifndef RETICLE_FILE_UTILS_H
#define RETICLE_FILE_UTILS_H

#include <string>
#include <nlohmann/json.hpp>

namespace reticle {
namespace utils {

/**
 * @brief File I/O for configuration, recordings and UI snapshots
 *
 * Functions return false on failure and log the cause; callers decide
 * whether the failure is fatal.
 */
class FileUtils {
public:
    /**
     * @brief Load and parse a JSON file
     * @param filePath Path to JSON file (must not be empty)
     * @param jsonOutput Parsed document (output parameter)
     * @return true if the file exists and parsed
     */
    static bool loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput);

    /**
     * @brief Parse JSON text
     * @param text JSON document text
     * @param jsonOutput Parsed document (output parameter)
     * @param errorMessage Parser message on failure (output parameter)
     */
    static bool parseJson(const std::string& text, nlohmann::json& jsonOutput, std::string& errorMessage);

    /**
     * @brief Save JSON pretty-printed, via a temporary file and rename
     */
    static bool saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData);

    static bool fileExists(const std::string& filePath);

    /**
     * @brief Create directory and parents if they do not exist
     */
    static bool createDirectoryIfNotExists(const std::string& directoryPath);

    static bool readFileToString(const std::string& filePath, std::string& content);

    /**
     * @brief Write content via a temporary file and rename
     */
    static bool writeStringToFile(const std::string& filePath, const std::string& content);

private:
    static bool validateFilePath(const std::string& filePath);
    static bool ensureParentDirectoryExists(const std::string& filePath);
};

} // namespace utils
} // namespace reticle

#endif // RETICLE_FILE_UTILS_H
