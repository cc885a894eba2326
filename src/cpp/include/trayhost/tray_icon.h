#pragma once

#include "trayhost/error_types.h"
#include "trayhost/event_channel.h"
#include "trayhost/icon_image.h"
#include "trayhost/popup_menu.h"
#include "trayhost/tray_window.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trayhost {

class NativeWindowSystem;
template<typename T> class TrayIconBuilder;

/**
 * A notification area icon that reports interactions as events of type T.
 *
 * Dropping it closes the hidden window, which removes the icon and ends the
 * message loop of the thread that runs it.
 */
template<typename T>
class TrayIcon {
public:
    ~TrayIcon() {
        window_->close(key_);
    }

    TrayIcon(const TrayIcon&) = delete;
    TrayIcon& operator=(const TrayIcon&) = delete;

    void set_icon_from_buffer(std::vector<uint8_t> buffer,
                              std::optional<uint32_t> width = std::nullopt,
                              std::optional<uint32_t> height = std::nullopt) {
        window_->set_icon_from_buffer(std::move(buffer), width, height);
    }

    void set_tooltip(const std::string& tooltip) { window_->set_tooltip(tooltip); }

    void set_menu(std::unique_ptr<PopupMenu> menu, std::map<uint32_t, T> menu_events = {}) {
        window_->set_menu(std::move(menu), std::move(menu_events));
    }

    bool show_menu() { return window_->show_menu(); }

    WindowHandle window() const { return window_->window(); }
    TrayWindowState state() const { return window_->state(); }
    const TrayWindow<T>& tray_window() const { return *window_; }

private:
    friend class TrayIconBuilder<T>;

    TrayIcon(std::shared_ptr<TrayWindow<T>> window, RegistryKey key)
        : window_(std::move(window)), key_(key) {}

    std::shared_ptr<TrayWindow<T>> window_;
    RegistryKey key_;
};

template<typename T>
class TrayIconBuilder {
public:
    TrayIconBuilder() = default;

    TrayIconBuilder& sender(Sender<T> sender) {
        sender_ = std::move(sender);
        return *this;
    }

    TrayIconBuilder& icon_from_buffer(std::vector<uint8_t> buffer,
                                      std::optional<uint32_t> width = std::nullopt,
                                      std::optional<uint32_t> height = std::nullopt) {
        icon_buffer_ = std::move(buffer);
        icon_width_ = width;
        icon_height_ = height;
        return *this;
    }

    TrayIconBuilder& tooltip(const std::string& tooltip) {
        tooltip_ = tooltip;
        return *this;
    }

    TrayIconBuilder& menu(std::unique_ptr<PopupMenu> menu) {
        menu_ = std::move(menu);
        return *this;
    }

    TrayIconBuilder& parent(WindowHandle parent) {
        parent_ = parent;
        return *this;
    }

    TrayIconBuilder& on_click(T event) {
        events_.click = std::move(event);
        return *this;
    }

    TrayIconBuilder& on_double_click(T event) {
        events_.double_click = std::move(event);
        return *this;
    }

    TrayIconBuilder& on_right_click(T event) {
        events_.right_click = std::move(event);
        return *this;
    }

    TrayIconBuilder& menu_event(uint32_t id, T event) {
        events_.menu.insert_or_assign(id, std::move(event));
        return *this;
    }

    TrayIconBuilder& menu_events(std::map<uint32_t, T> events) {
        for (auto& it : events) {
            events_.menu.insert_or_assign(it.first, std::move(it.second));
        }
        return *this;
    }

    /**
     * Create the tray icon. The builder is consumed.
     * @throws InvalidConfigException if the sender or the icon is missing
     * @throws IconLoadingException if the icon buffer cannot be used
     * @throws OsErrorException if the native window cannot be created
     */
    std::unique_ptr<TrayIcon<T>> build(std::shared_ptr<NativeWindowSystem> system) {
        if (!sender_) {
            throw InvalidConfigException("tray icon needs an event sender");
        }
        if (!icon_buffer_) {
            throw InvalidConfigException("tray icon needs an icon");
        }

        NativeIcon icon = NativeIcon::from_buffer(system, std::move(*icon_buffer_), icon_width_, icon_height_);
        icon_buffer_.reset();

        auto window = std::make_shared<TrayWindow<T>>(system, std::move(sender_), std::move(events_),
                                                      std::move(icon), std::move(menu_), tooltip_);
        RegistryKey key = TrayWindowCore::open(window, parent_);

        return std::unique_ptr<TrayIcon<T>>(new TrayIcon<T>(std::move(window), key));
    }

private:
    Sender<T> sender_;
    std::optional<std::vector<uint8_t>> icon_buffer_;
    std::optional<uint32_t> icon_width_;
    std::optional<uint32_t> icon_height_;
    std::string tooltip_;
    std::unique_ptr<PopupMenu> menu_;
    WindowHandle parent_ = 0;
    TrayEvents<T> events_;
};

} // namespace trayhost
