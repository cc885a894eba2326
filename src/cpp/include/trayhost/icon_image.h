#pragma once

#include "trayhost/platform/native_types.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace trayhost {

class NativeWindowSystem;

// One image of an .ico directory
struct IconEntry {
    int width = 0;
    int height = 0;
    int bit_count = 0;
    size_t offset = 0;
    size_t size = 0;
    bool png = false;
};

/**
 * Icon resource (.ico file content) parsed from memory.
 *
 * Only the container is validated here, the pixels are decoded by the OS
 * when the selected image is turned into a native icon.
 */
class IconImage {
public:
    /**
     * Parse an icon buffer and select the image closest to the requested size.
     * A missing height takes the width (and the other way round). Without
     * either, default_size is used.
     * @throws IconLoadingException if the buffer is not a valid icon resource
     */
    static IconImage parse(std::vector<uint8_t> buffer,
                           std::optional<uint32_t> width,
                           std::optional<uint32_t> height,
                           Size default_size);

    const std::vector<IconEntry>& entries() const { return entries_; }
    const IconEntry& selected() const { return entries_[selected_]; }

    // Bytes of the selected image, as expected by CreateIconFromResourceEx
    const uint8_t* data() const { return buffer_.data() + selected().offset; }
    size_t size() const { return selected().size; }

    // Size the native icon should be created at
    Size target_size() const { return target_; }

private:
    IconImage() = default;

    std::vector<uint8_t> buffer_;
    std::vector<IconEntry> entries_;
    size_t selected_ = 0;
    Size target_;
};

/**
 * Owns a native icon handle. Move-only.
 */
class NativeIcon {
public:
    NativeIcon() = default;
    NativeIcon(std::shared_ptr<NativeWindowSystem> system, IconHandle handle);
    ~NativeIcon();

    NativeIcon(NativeIcon&& other) noexcept;
    NativeIcon& operator=(NativeIcon&& other) noexcept;
    NativeIcon(const NativeIcon&) = delete;
    NativeIcon& operator=(const NativeIcon&) = delete;

    /**
     * Create a native icon from an in-memory .ico buffer.
     * @throws IconLoadingException if parsing or the OS conversion fails
     */
    static NativeIcon from_buffer(std::shared_ptr<NativeWindowSystem> system,
                                  std::vector<uint8_t> buffer,
                                  std::optional<uint32_t> width = std::nullopt,
                                  std::optional<uint32_t> height = std::nullopt);

    IconHandle handle() const { return handle_; }
    explicit operator bool() const { return handle_ != 0; }

    void reset();

private:
    std::shared_ptr<NativeWindowSystem> system_;
    IconHandle handle_ = 0;
};

} // namespace trayhost
