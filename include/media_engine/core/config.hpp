#pragma once

/// @file config.hpp
/// @brief JSON configuration helpers

#include "error.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace media_core {

/// Parse a JSON file
[[nodiscard]] Result<nlohmann::json> load_json_file(const std::string& path);

/// Parse a JSON string; `source_name` is used in error messages
[[nodiscard]] Result<nlohmann::json> parse_json(const std::string& text,
                                                const std::string& source_name = "<string>");

/// Copy every top-level key of `overlay` into `base`, replacing existing keys.
/// Non-object arguments are ignored.
void merge_json(nlohmann::json& base, const nlohmann::json& overlay);

/// Read `key` from an object, falling back when absent or of the wrong type
template<typename T>
[[nodiscard]] T json_value_or(const nlohmann::json& j, const std::string& key, T fallback) {
    if (!j.is_object()) return fallback;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    try {
        return it->template get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

} // namespace media_core
