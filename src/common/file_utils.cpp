#include "file_utils.h"
#include "structured_logger.h"
#include <fstream>
#include <filesystem>

namespace deskpilot {
namespace utils {

namespace {
    void setError(std::string* error, const std::string& message) {
        if (error) {
            *error = message;
        }
    }
}

bool FileUtils::loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput,
                                 std::string* error) {
    if (filePath.empty()) {
        setError(error, "empty file path");
        return false;
    }
    if (!fileExists(filePath)) {
        setError(error, "file not found: " + filePath);
        SLOG_ERROR().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        setError(error, "cannot open " + filePath);
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    try {
        file >> jsonOutput;
    } catch (const nlohmann::json::parse_error& e) {
        setError(error, filePath + ": " + e.what());
        SLOG_ERROR().message("JSON parse error").context("path", filePath).context("error", e.what());
        return false;
    }

    SLOG_DEBUG().message("Loaded JSON file").context("path", filePath);
    return true;
}

bool FileUtils::saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData) {
    if (filePath.empty()) {
        SLOG_ERROR().message("Invalid file path provided to saveJsonToFile");
        return false;
    }
    if (!ensureParentDirectoryExists(filePath)) {
        SLOG_ERROR().message("Cannot create parent directory").context("path", filePath);
        return false;
    }

    const std::string tempFilePath = filePath + ".tmp";
    {
        std::ofstream tempFile(tempFilePath);
        if (!tempFile.is_open()) {
            SLOG_ERROR().message("Cannot create temporary file").context("temp_path", tempFilePath);
            return false;
        }
        tempFile << jsonData.dump(2) << "\n";
        if (!tempFile.flush()) {
            SLOG_ERROR().message("Failed to write temporary file").context("temp_path", tempFilePath);
            std::error_code ec;
            std::filesystem::remove(tempFilePath, ec);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempFilePath, filePath, ec);
    if (ec) {
        SLOG_ERROR().message("Failed to rename temporary file")
            .context("path", filePath)
            .context("error", ec.message());
        std::filesystem::remove(tempFilePath, ec);
        return false;
    }
    return true;
}

bool FileUtils::fileExists(const std::string& filePath) {
    std::error_code ec;
    return !filePath.empty() && std::filesystem::is_regular_file(filePath, ec);
}

bool FileUtils::ensureParentDirectoryExists(const std::string& filePath) {
    std::filesystem::path parent = std::filesystem::path(filePath).parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    return !ec && std::filesystem::is_directory(parent, ec);
}

} // namespace utils
} // namespace deskpilot
