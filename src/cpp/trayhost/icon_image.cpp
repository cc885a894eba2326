#include "trayhost/icon_image.h"
#include "trayhost/error_types.h"
#include "trayhost/platform/native_window_system.h"
#include "trayhost/utils/logging.h"
#include <algorithm>
#include <utility>

namespace trayhost {

namespace {
    // ICONDIR is 6 bytes, each ICONDIRENTRY 16 bytes
    constexpr size_t ICONDIR_SIZE = 6;
    constexpr size_t ICONDIRENTRY_SIZE = 16;
    constexpr size_t BITMAPINFOHEADER_SIZE = 40;
    constexpr uint16_t RESOURCE_TYPE_ICON = 1;

    const uint8_t PNG_SIGNATURE[8] = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };

    uint16_t read_u16_le(const uint8_t* p) {
        return static_cast<uint16_t>(p[0] | (p[1] << 8));
    }

    uint32_t read_u32_le(const uint8_t* p) {
        return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
    }

    uint32_t read_u32_be(const uint8_t* p) {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }

    bool is_png(const uint8_t* p, size_t len) {
        return len >= sizeof(PNG_SIGNATURE) && std::equal(std::begin(PNG_SIGNATURE), std::end(PNG_SIGNATURE), p);
    }

    // Validate the payload of one entry and fill in what the directory leaves out
    void inspect_payload(const uint8_t* p, IconEntry& entry, size_t index) {
        std::string where = "image " + std::to_string(index);

        if (is_png(p, entry.size)) {
            // Signature, then the IHDR chunk: length, type, width, height
            if (entry.size < 24 || std::string(reinterpret_cast<const char*>(p + 12), 4) != "IHDR") {
                throw IconLoadingException(where + " is a truncated PNG");
            }
            uint32_t width = read_u32_be(p + 16);
            uint32_t height = read_u32_be(p + 20);
            if (!width || !height) {
                throw IconLoadingException(where + " has an empty PNG");
            }
            entry.png = true;
            if (!entry.bit_count) {
                entry.bit_count = 32;
            }
            return;
        }

        if (entry.size < BITMAPINFOHEADER_SIZE) {
            throw IconLoadingException(where + " is too small for a bitmap header");
        }
        uint32_t header_size = read_u32_le(p);
        if (header_size < BITMAPINFOHEADER_SIZE || header_size > entry.size) {
            throw IconLoadingException(where + " has an invalid bitmap header");
        }
        if (!entry.bit_count) {
            entry.bit_count = read_u16_le(p + 14);
        }
    }

    bool better_depth(const IconEntry& a, const IconEntry& b) {
        return a.bit_count > b.bit_count;
    }
}

IconImage IconImage::parse(std::vector<uint8_t> buffer,
                           std::optional<uint32_t> width,
                           std::optional<uint32_t> height,
                           Size default_size) {
    if (buffer.size() < ICONDIR_SIZE) {
        throw IconLoadingException("buffer is too small (" + std::to_string(buffer.size()) + " bytes)");
    }

    const uint8_t* base = buffer.data();
    if (read_u16_le(base) != 0 || read_u16_le(base + 2) != RESOURCE_TYPE_ICON) {
        throw IconLoadingException("buffer is not an icon resource");
    }

    size_t count = read_u16_le(base + 4);
    if (!count) {
        throw IconLoadingException("icon resource contains no image");
    }
    if (buffer.size() < ICONDIR_SIZE + count * ICONDIRENTRY_SIZE) {
        throw IconLoadingException("icon directory is truncated");
    }

    IconImage image;
    image.entries_.reserve(count);

    for (size_t i = 0; i < count; i++) {
        const uint8_t* p = base + ICONDIR_SIZE + i * ICONDIRENTRY_SIZE;

        IconEntry entry;
        entry.width = p[0] ? p[0] : 256;
        entry.height = p[1] ? p[1] : 256;
        entry.bit_count = read_u16_le(p + 6);
        entry.size = read_u32_le(p + 8);
        entry.offset = read_u32_le(p + 12);

        if (!entry.size || entry.offset > buffer.size() || entry.size > buffer.size() - entry.offset) {
            throw IconLoadingException("image " + std::to_string(i) + " lies outside the buffer");
        }
        inspect_payload(base + entry.offset, entry, i);

        image.entries_.push_back(entry);
    }

    // Resolve the requested size
    for (const std::optional<uint32_t>& requested : { width, height }) {
        if (requested && (*requested < 1 || *requested > 256)) {
            throw IconLoadingException("requested size " + std::to_string(*requested) + " is outside 1 to 256");
        }
    }
    Size target = default_size;
    if (width || height) {
        target.width = static_cast<int>(width ? *width : *height);
        target.height = static_cast<int>(height ? *height : *width);
    }
    image.target_ = target;

    const std::vector<IconEntry>& entries = image.entries_;
    auto pick = [&](auto accept, auto better) -> std::optional<size_t> {
        std::optional<size_t> best;
        for (size_t i = 0; i < entries.size(); i++) {
            if (!accept(entries[i])) {
                continue;
            }
            if (!best || better(entries[i], entries[*best])) {
                best = i;
            }
        }
        return best;
    };
    auto area = [](const IconEntry& e) { return e.width * e.height; };

    std::optional<size_t> selected;
    if (target.width > 0 && target.height > 0) {
        // Exact size, deepest colors first
        selected = pick([&](const IconEntry& e) { return e.width == target.width && e.height == target.height; },
                        better_depth);
        // Smallest image that can be scaled down
        if (!selected) {
            selected = pick([&](const IconEntry& e) { return e.width >= target.width && e.height >= target.height; },
                            [&](const IconEntry& a, const IconEntry& b) {
                                return area(a) < area(b) || (area(a) == area(b) && better_depth(a, b));
                            });
        }
    }
    if (!selected) {
        selected = pick([](const IconEntry&) { return true; },
                        [&](const IconEntry& a, const IconEntry& b) {
                            return area(a) > area(b) || (area(a) == area(b) && better_depth(a, b));
                        });
    }

    image.selected_ = *selected;
    if (image.target_.width <= 0 || image.target_.height <= 0) {
        image.target_ = Size{ entries[image.selected_].width, entries[image.selected_].height };
    }
    image.buffer_ = std::move(buffer);

    return image;
}

NativeIcon::NativeIcon(std::shared_ptr<NativeWindowSystem> system, IconHandle handle)
    : system_(std::move(system))
    , handle_(handle)
{
}

NativeIcon::~NativeIcon() {
    reset();
}

NativeIcon::NativeIcon(NativeIcon&& other) noexcept
    : system_(std::move(other.system_))
    , handle_(std::exchange(other.handle_, 0))
{
}

NativeIcon& NativeIcon::operator=(NativeIcon&& other) noexcept {
    if (this != &other) {
        reset();
        system_ = std::move(other.system_);
        handle_ = std::exchange(other.handle_, 0);
    }
    return *this;
}

void NativeIcon::reset() {
    if (handle_ && system_) {
        system_->destroy_icon(handle_);
    }
    handle_ = 0;
}

NativeIcon NativeIcon::from_buffer(std::shared_ptr<NativeWindowSystem> system,
                                   std::vector<uint8_t> buffer,
                                   std::optional<uint32_t> width,
                                   std::optional<uint32_t> height) {
    IconImage image = IconImage::parse(std::move(buffer), width, height, system->small_icon_size());

    const IconEntry& entry = image.selected();
    TRAYHOST_LOG_DEBUG("Selected " << entry.width << "x" << entry.height << " "
                       << (entry.png ? "PNG" : "DIB") << " image, target "
                       << image.target_size().width << "x" << image.target_size().height);

    IconHandle handle = system->create_icon_from_resource(image.data(), image.size(), image.target_size());
    if (!handle) {
        throw IconLoadingException("the system rejected the icon image (error " +
                                   std::to_string(system->last_error()) + ")");
    }

    return NativeIcon(std::move(system), handle);
}

} // namespace trayhost
