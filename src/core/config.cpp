/// @file config.cpp
/// @brief JSON configuration helpers

#include <media_engine/core/config.hpp>

#include <fstream>
#include <sstream>

namespace media_core {

Result<nlohmann::json> load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<nlohmann::json>(LookupError::file_not_found(path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_json(buffer.str(), path);
}

Result<nlohmann::json> parse_json(const std::string& text, const std::string& source_name) {
    try {
        return Ok(nlohmann::json::parse(text));
    } catch (const nlohmann::json::parse_error& err) {
        return Err<nlohmann::json>(Error(ErrorCode::ParseError,
            "Failed to parse '" + source_name + "': " + err.what()));
    }
}

void merge_json(nlohmann::json& base, const nlohmann::json& overlay) {
    if (!overlay.is_object()) {
        return;
    }
    if (!base.is_object()) {
        base = nlohmann::json::object();
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        base[it.key()] = it.value();
    }
}

} // namespace media_core
