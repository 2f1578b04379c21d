#ifndef DESKPILOT_FILE_UTILS_H
#define DESKPILOT_FILE_UTILS_H

#include <string>
#include <nlohmann/json.hpp>

namespace deskpilot {
namespace utils {

/**
 * @brief JSON file I/O used by the configuration and scenario loaders
 */
class FileUtils {
public:
    /**
     * @brief Load and parse a JSON file
     * @param error Receives a description of the failure (optional)
     * @return false if the file is missing, unreadable or not valid JSON
     */
    static bool loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput,
                                 std::string* error = nullptr);

    /**
     * @brief Write JSON through a temporary file and rename it into place
     * @note Creates missing parent directories
     */
    static bool saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData);

    static bool fileExists(const std::string& filePath);

private:
    static bool ensureParentDirectoryExists(const std::string& filePath);
};

} // namespace utils
} // namespace deskpilot

#endif // DESKPILOT_FILE_UTILS_H
