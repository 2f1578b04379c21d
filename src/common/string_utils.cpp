#include "string_utils.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace deskpilot {
namespace utils {

std::string StringUtils::trim(const std::string& str) {
    if (str.empty()) {
        return str;
    }

    size_t first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }

    size_t last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, (last - first + 1));
}

std::string StringUtils::toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool StringUtils::containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty() || needle.size() > haystack.size()) {
        return false;
    }

    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
    return it != haystack.end();
}

std::string StringUtils::join(const std::vector<std::string>& strings, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << strings[i];
    }
    return oss.str();
}

std::string StringUtils::truncate(const std::string& str, size_t maxChars) {
    if (str.size() <= maxChars) {
        return str;
    }
    if (maxChars <= 3) {
        return str.substr(0, maxChars);
    }
    return str.substr(0, maxChars - 3) + "...";
}

} // namespace utils
} // namespace deskpilot
