#include "trayhost/notify_icon.h"
#include "trayhost/platform/native_window_system.h"
#include "trayhost/utils/logging.h"

namespace trayhost {

NotifyIcon::NotifyIcon(std::shared_ptr<NativeWindowSystem> system, NativeIcon icon, const std::string& tooltip)
    : system_(std::move(system))
    , icon_(std::move(icon))
{
    data_.id = DEFAULT_ID;
    data_.callback_message = Msg::APP_TRAYICON;
    data_.icon = icon_.handle();
    data_.tooltip = tooltip;
}

NotifyIcon::~NotifyIcon() {
    remove();
}

bool NotifyIcon::add(WindowHandle hwnd) {
    data_.window = hwnd;
    data_.icon = icon_.handle();

    // After an explorer restart the shell may still know the icon
    if (!system_->notify_icon(NotifyIconAction::ADD, data_) &&
        !system_->notify_icon(NotifyIconAction::MODIFY, data_)) {
        TRAYHOST_LOG_ERROR("Shell_NotifyIcon failed to add the tray icon");
        return false;
    }

    added_ = true;
    return true;
}

void NotifyIcon::remove() {
    if (!added_) {
        return;
    }
    system_->notify_icon(NotifyIconAction::REMOVE, data_);
    added_ = false;
}

void NotifyIcon::set_icon(NativeIcon icon) {
    // Keep the previous icon alive until the shell switched over
    NativeIcon previous = std::move(icon_);
    icon_ = std::move(icon);
    data_.icon = icon_.handle();

    if (added_ && !modify()) {
        TRAYHOST_LOG_WARNING("Shell_NotifyIcon failed to update the tray icon");
    }
}

void NotifyIcon::set_tooltip(const std::string& tooltip) {
    data_.tooltip = tooltip;

    if (added_ && !modify()) {
        TRAYHOST_LOG_WARNING("Shell_NotifyIcon failed to update the tooltip");
    }
}

bool NotifyIcon::modify() {
    return system_->notify_icon(NotifyIconAction::MODIFY, data_);
}

} // namespace trayhost
