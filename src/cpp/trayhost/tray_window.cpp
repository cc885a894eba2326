#include "trayhost/tray_window.h"
#include "trayhost/error_types.h"
#include "trayhost/platform/native_window_system.h"

namespace trayhost {

TrayWindowCore::TrayWindowCore(std::shared_ptr<NativeWindowSystem> system, NativeIcon icon,
                               std::unique_ptr<PopupMenu> menu, const std::string& tooltip)
    : system_(system)
    , notify_icon_(system, std::move(icon), tooltip)
    , menu_(std::move(menu))
{
}

TrayWindowCore::~TrayWindowCore() = default;

RegistryKey TrayWindowCore::open(std::shared_ptr<TrayWindowCore> window, WindowHandle parent) {
    NativeWindowSystem& system = *window->system_;

    if (!system.ensure_window_class(WINDOW_CLASS)) {
        throw OsErrorException("RegisterClassEx", system.last_error());
    }

    RegistryKey key = system.registry().insert(window);

    TRAYHOST_LOG_DEBUG("Creating hidden window...");
    WindowHandle hwnd = system.create_window(WINDOW_CLASS, WINDOW_TITLE, parent);
    if (!hwnd) {
        uint32_t error = system.last_error();
        system.registry().remove(key);
        throw OsErrorException("CreateWindowEx", error);
    }
    window->hwnd_ = hwnd;

    if (!system.attach_subclass(hwnd, key)) {
        uint32_t error = system.last_error();
        system.destroy_window(hwnd);
        window->hwnd_ = 0;
        system.registry().remove(key);
        throw OsErrorException("SetWindowSubclass", error);
    }

    window->taskbar_created_ = system.register_window_message(TASKBAR_CREATED);
    if (!window->taskbar_created_) {
        TRAYHOST_LOG_WARNING("Cannot register " << TASKBAR_CREATED << ", the icon will not survive an explorer restart");
    }

    return key;
}

void TrayWindowCore::close(RegistryKey key) {
    if (hwnd_ && state_ != TrayWindowState::DESTROYED) {
        TRAYHOST_LOG_DEBUG("Closing tray window");
        system_->send_message(hwnd_, Msg::CLOSE, 0, 0);
    }

    system_->registry().remove(key);
}

MessageResult TrayWindowCore::handle_message(WindowHandle hwnd, MessageId msg,
                                             MessageWParam wparam, MessageLParam lparam) {
    if (taskbar_created_ && msg == taskbar_created_) {
        on_taskbar_created(hwnd);
        return 0;
    }

    switch (msg) {
        case Msg::APP_CREATE:
            on_create(hwnd);
            return 0;

        case Msg::APP_TRAYICON:
            on_tray_icon(lparam);
            return 0;

        case Msg::COMMAND:
            // High word is 0 for menus, 1 for accelerators, else a control notification
            if (high_word(wparam) == 0 && lparam == 0) {
                if (state_ == TrayWindowState::RUNNING) {
                    on_interaction(TrayInteraction::MENU_ITEM, low_word(wparam));
                }
                return 0;
            }
            break;

        case Msg::MENUCOMMAND:
            // Menus with MNS_NOTIFYBYPOS report the position instead of the id
            if (state_ == TrayWindowState::RUNNING) {
                uint32_t id = system_->menu_item_id(static_cast<MenuHandle>(lparam), static_cast<int>(wparam));
                on_interaction(TrayInteraction::MENU_ITEM, id);
            }
            return 0;

        case Msg::DESTROY:
            on_destroy();
            return 0;
    }

    return system_->default_subclass_proc(hwnd, msg, wparam, lparam);
}

void TrayWindowCore::on_create(WindowHandle hwnd) {
    if (state_ != TrayWindowState::UNINITIALIZED) {
        return;
    }

    TRAYHOST_LOG_DEBUG("Adding tray icon...");
    notify_icon_.add(hwnd);
    state_ = TrayWindowState::RUNNING;
}

void TrayWindowCore::on_taskbar_created(WindowHandle hwnd) {
    if (state_ != TrayWindowState::RUNNING) {
        return;
    }

    TRAYHOST_LOG_INFO("Taskbar was recreated, restoring tray icon");
    notify_icon_.add(hwnd);
}

void TrayWindowCore::on_tray_icon(MessageLParam lparam) {
    if (state_ != TrayWindowState::RUNNING) {
        return;
    }

    // With NOTIFYICON_VERSION_4, the message is in LOWORD(lParam)
    MessageId msg = low_word(static_cast<std::uintptr_t>(lparam));
    MessageId previous = last_tray_message_;
    if (msg != Msg::MOUSEMOVE) {
        last_tray_message_ = msg;
    }

    switch (msg) {
        case Msg::LBUTTONUP:
            TRAYHOST_LOG_DEBUG("Left-click detected");
            on_interaction(TrayInteraction::CLICK, 0);
            break;

        case Msg::LBUTTONDBLCLK:
            TRAYHOST_LOG_DEBUG("Double-click detected");
            on_interaction(TrayInteraction::DOUBLE_CLICK, 0);
            break;

        case Msg::RBUTTONUP:
            TRAYHOST_LOG_DEBUG("Right-click detected");
            on_interaction(TrayInteraction::RIGHT_CLICK, 0);
            show_menu();
            break;

        case Msg::CONTEXTMENU:
            // Follows every right button up; only Shift+F10 and the menu key arrive alone
            if (previous == Msg::RBUTTONUP) {
                break;
            }
            TRAYHOST_LOG_DEBUG("Keyboard context menu detected");
            on_interaction(TrayInteraction::RIGHT_CLICK, 0);
            show_menu();
            break;

        case Msg::KEYSELECT:
            TRAYHOST_LOG_DEBUG("Keyboard select detected");
            show_menu();
            break;

        default:
            // Mouse moves, button downs and balloon notifications
            break;
    }
}

void TrayWindowCore::on_destroy() {
    notify_icon_.remove();
    state_ = TrayWindowState::DESTROYED;
    system_->post_quit_message(0);
}

void TrayWindowCore::set_icon_from_buffer(std::vector<uint8_t> buffer,
                                          std::optional<uint32_t> width,
                                          std::optional<uint32_t> height) {
    NativeIcon icon = NativeIcon::from_buffer(system_, std::move(buffer), width, height);
    notify_icon_.set_icon(std::move(icon));
}

void TrayWindowCore::set_tooltip(const std::string& tooltip) {
    notify_icon_.set_tooltip(tooltip);
}

void TrayWindowCore::set_menu(std::unique_ptr<PopupMenu> menu) {
    menu_ = std::move(menu);
}

bool TrayWindowCore::show_menu() {
    if (!menu_ || !hwnd_) {
        return false;
    }

    Point cursor = system_->cursor_position();
    TRAYHOST_LOG_DEBUG("Showing popup menu at " << cursor.x << ", " << cursor.y);

    // Required for the menu to close properly
    system_->set_foreground_window(hwnd_);
    bool shown = menu_->track(hwnd_, cursor);
    system_->post_message(hwnd_, Msg::NULL_MESSAGE, 0, 0);

    return shown;
}

} // namespace trayhost
