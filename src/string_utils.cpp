#include <string>
#include <string_view>
#include <vector>

#include "string_utils.hpp"

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;

    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) {
            result.append(separator);
        }
        result.append(parts[i]);
    }

    return result;
}

// Skips empty parts, the rest are separated by one space
std::string join_present(const std::vector<std::string_view>& parts) {
    std::string result;

    for (auto part : parts) {
        if (part.empty())
            continue;

        if (!result.empty()) {
            result.push_back(' ');
        }
        result.append(part);
    }

    return result;
}

std::string normalize_newlines(std::string_view sv) {
    std::string result;
    result.reserve(sv.length());

    for (size_t i = 0; i < sv.length(); ++i) {
        char c = sv[i];

        if (c == '\r') {
            // \r\n and a lone \r both become a single \n
            if (i + 1 < sv.length() && sv[i + 1] == '\n') {
                ++i;
            }
            c = '\n';
        }

        result.push_back(c);
    }

    return result;
}
