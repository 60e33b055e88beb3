#pragma once

#include <string>
#include <string_view>
#include <vector>

std::string join(const std::vector<std::string>& parts, std::string_view separator);
std::string join_present(const std::vector<std::string_view>& parts);
std::string normalize_newlines(std::string_view sv);

// Source data marks absent values with this literal
static constexpr std::string_view missing_data_sentinel = "N/A";

// Tabular presence rule: anything except "" and "N/A" is data, even blanks
constexpr bool is_valid_data(const std::string_view sv) {
    return !sv.empty() && sv != missing_data_sentinel;
}

static constexpr std::string_view whitespace = " \t\r\n\f\v";

inline void lstrip(std::string_view& sv, std::string_view chars = whitespace) {
    size_t start = sv.find_first_not_of(chars);
    if (start == std::string_view::npos) {
        // Oh no! All whitespace
        sv = std::string_view();
    } else {
        sv.remove_prefix(start);
    }
}

inline void rstrip(std::string_view& sv, std::string_view chars = whitespace) {
    size_t end = sv.find_last_not_of(chars);
    if (end == std::string_view::npos) {
        // Oh no! All whitespace
        sv = std::string_view();
    } else {
        // end is the index, so +1 to make it a length
        sv = sv.substr(0, end + 1);
    }
}

inline void strip(std::string_view& sv, std::string_view chars = whitespace) {
    size_t start = sv.find_first_not_of(chars);

    if (start == std::string_view::npos) {
        // Oh no! All whitespace
        sv = std::string_view();
    } else {
        size_t end = sv.find_last_not_of(chars);
        // end is the index, so +1 to make it a length
        sv = sv.substr(start, (end - start) + 1);
    }
}

inline std::string_view stripped(std::string_view sv) {
    strip(sv);
    return sv;
}
