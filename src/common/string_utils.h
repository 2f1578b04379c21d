#ifndef DESKPILOT_STRING_UTILS_H
#define DESKPILOT_STRING_UTILS_H

#include <string>
#include <vector>

namespace deskpilot {
namespace utils {

/**
 * @brief String helpers shared by the safety gate, the proposal parser and the CLI
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string trim(const std::string& str);

    /**
     * @brief ASCII lowercase copy of the string
     */
    static std::string toLowerCase(const std::string& str);

    /**
     * @brief Case-insensitive substring test
     * @return true if needle occurs in haystack; an empty needle never matches
     */
    static bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

    static std::string join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Cut the string to maxChars, appending "..." when shortened
     */
    static std::string truncate(const std::string& str, size_t maxChars);
};

} // namespace utils
} // namespace deskpilot

#endif // DESKPILOT_STRING_UTILS_H
