#pragma once

#include "trayhost/icon_image.h"
#include "trayhost/platform/native_types.h"
#include <memory>
#include <string>

namespace trayhost {

class NativeWindowSystem;

// Notification area entry of one tray window, owns the displayed icon
class NotifyIcon {
public:
    static constexpr uint32_t DEFAULT_ID = 1;

    NotifyIcon(std::shared_ptr<NativeWindowSystem> system, NativeIcon icon, const std::string& tooltip = "");
    ~NotifyIcon();

    NotifyIcon(const NotifyIcon&) = delete;
    NotifyIcon& operator=(const NotifyIcon&) = delete;

    // Register with the shell. Also used after the taskbar was recreated.
    bool add(WindowHandle hwnd);
    void remove();

    // Takes ownership of the new icon, the old one is released after the swap
    void set_icon(NativeIcon icon);
    void set_tooltip(const std::string& tooltip);

    bool is_added() const { return added_; }
    IconHandle icon() const { return icon_.handle(); }
    const std::string& tooltip() const { return data_.tooltip; }

private:
    bool modify();

    std::shared_ptr<NativeWindowSystem> system_;
    NativeIcon icon_;
    NotifyIconData data_;
    bool added_ = false;
};

} // namespace trayhost
