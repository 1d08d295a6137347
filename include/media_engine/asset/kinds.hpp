#pragma once

/// @file kinds.hpp
/// @brief Built-in asset kinds that read whole files into memory

#include "base.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace media_asset {

/// Read a whole file
[[nodiscard]] media_core::Result<std::vector<std::uint8_t>> read_file_bytes(const std::string& path);

// =============================================================================
// BytesAsset
// =============================================================================

/// Raw bytes asset
class BytesAsset : public Asset {
public:
    BytesAsset(AssetDescriptor descriptor, LoadDispatcher& dispatcher)
        : Asset(std::move(descriptor), dispatcher) {}

    [[nodiscard]] static AssetClassInfo class_info();

    /// Copy of the file contents, empty unless loaded
    [[nodiscard]] std::vector<std::uint8_t> data() const;

    /// Size of the file contents in bytes
    [[nodiscard]] std::size_t size() const;

protected:
    [[nodiscard]] media_core::Result<void> do_load() override;
    void do_unload() override;

private:
    mutable std::mutex m_data_mutex;
    std::vector<std::uint8_t> m_data;
};

// =============================================================================
// TextAsset
// =============================================================================

/// Text asset
class TextAsset : public Asset {
public:
    TextAsset(AssetDescriptor descriptor, LoadDispatcher& dispatcher)
        : Asset(std::move(descriptor), dispatcher) {}

    [[nodiscard]] static AssetClassInfo class_info();

    /// Copy of the text, empty unless loaded
    [[nodiscard]] std::string text() const;

protected:
    [[nodiscard]] media_core::Result<void> do_load() override;
    void do_unload() override;

private:
    mutable std::mutex m_text_mutex;
    std::string m_text;
};

} // namespace media_asset
