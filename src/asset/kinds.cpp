/// @file kinds.cpp
/// @brief BytesAsset and TextAsset

#include <media_engine/asset/kinds.hpp>

#include <fstream>

namespace media_asset {

media_core::Result<std::vector<std::uint8_t>> read_file_bytes(const std::string& path) {
    using Bytes = std::vector<std::uint8_t>;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return media_core::Err<Bytes>(media_core::LookupError::file_not_found(path));
    }

    file.seekg(0, std::ios::end);
    auto size = file.tellg();
    if (size < 0) {
        return media_core::Err<Bytes>(media_core::Error(media_core::ErrorCode::IOError,
            "Failed to size '" + path + "'"));
    }
    file.seekg(0, std::ios::beg);

    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        return media_core::Err<Bytes>(media_core::Error(media_core::ErrorCode::IOError,
            "Failed to read '" + path + "'"));
    }

    return media_core::Ok(std::move(data));
}

// =============================================================================
// BytesAsset
// =============================================================================

AssetClassInfo BytesAsset::class_info() {
    AssetClassInfo info;
    info.attribute = "bytes";
    info.config_section = "bytes";
    info.path_string = "bytes";
    info.with_extensions({"bin", "dat"}).with_group_section("byte_groups");
    return info;
}

std::vector<std::uint8_t> BytesAsset::data() const {
    std::lock_guard lock(m_data_mutex);
    return m_data;
}

std::size_t BytesAsset::size() const {
    std::lock_guard lock(m_data_mutex);
    return m_data.size();
}

media_core::Result<void> BytesAsset::do_load() {
    auto bytes = read_file_bytes(file());
    if (!bytes) {
        return media_core::Err(std::move(bytes.error()));
    }

    std::lock_guard lock(m_data_mutex);
    m_data = std::move(*bytes);
    return media_core::Ok();
}

void BytesAsset::do_unload() {
    std::lock_guard lock(m_data_mutex);
    m_data.clear();
    m_data.shrink_to_fit();
}

// =============================================================================
// TextAsset
// =============================================================================

AssetClassInfo TextAsset::class_info() {
    AssetClassInfo info;
    info.attribute = "texts";
    info.config_section = "texts";
    info.path_string = "texts";
    info.with_extensions({"txt", "json", "yaml"}).with_group_section("text_groups").with_priority(1);
    return info;
}

std::string TextAsset::text() const {
    std::lock_guard lock(m_text_mutex);
    return m_text;
}

media_core::Result<void> TextAsset::do_load() {
    auto bytes = read_file_bytes(file());
    if (!bytes) {
        return media_core::Err(std::move(bytes.error()));
    }

    std::lock_guard lock(m_text_mutex);
    m_text.assign(bytes->begin(), bytes->end());
    return media_core::Ok();
}

void TextAsset::do_unload() {
    std::lock_guard lock(m_text_mutex);
    m_text.clear();
    m_text.shrink_to_fit();
}

} // namespace media_asset
