#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline constexpr const char* kWhitespace = " \t\n\v\f\r";

inline bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(kWhitespace);
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(kWhitespace);
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Splits a comma list, trimming items and dropping empty ones.
inline std::vector<std::string> splitList(std::string_view s, char separator = ',') {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(separator, start);
        if (end == std::string_view::npos) end = s.size();
        std::string item = trim(s.substr(start, end - start));
        if (!item.empty()) out.push_back(std::move(item));
        start = end + 1;
    }
    return out;
}

} // namespace CommonUtils
