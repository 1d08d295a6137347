#pragma once

/// @file strings.hpp
/// @brief Small string helpers shared by the config and asset layers

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace media_core {

/// Lower-case copy (ASCII)
[[nodiscard]] inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Case-insensitive equality (ASCII)
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// Case-insensitive ordering for std::map keys
struct CaseInsensitiveLess {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

/// Trim ASCII whitespace from both ends
[[nodiscard]] inline std::string trim(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(begin, end - begin));
}

/// Split a config list string on commas and whitespace, dropping empty items.
/// "a, b c,,d" -> {"a", "b", "c", "d"}
[[nodiscard]] inline std::vector<std::string> split_list(std::string_view s) {
    std::vector<std::string> items;
    std::string current;
    for (char c : s) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                items.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        items.push_back(std::move(current));
    }
    return items;
}

} // namespace media_core
