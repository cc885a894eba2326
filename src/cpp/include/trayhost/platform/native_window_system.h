#pragma once

#include "trayhost/platform/native_types.h"
#include "trayhost/window_registry.h"
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace trayhost {

/**
 * Abstract windowing subsystem: the OS primitives needed to host a tray icon.
 * The Win32 backend implements it on Windows, tests substitute a fake.
 *
 * Handles returned as 0 mean failure; last_error() then reports the OS code.
 */
class NativeWindowSystem {
public:
    virtual ~NativeWindowSystem() = default;

    /**
     * Register a window class once per name. Later calls are no-ops.
     * @return false if the registration failed
     */
    bool ensure_window_class(const std::string& class_name);

    // Handlers of windows created through this system, addressed by RegistryKey
    WindowRegistry& registry() { return registry_; }

    // Entry point of the subclass callback: routes a message to its handler
    MessageResult dispatch(WindowHandle hwnd, MessageId msg, MessageWParam wparam,
                           MessageLParam lparam, RegistryKey key);

    // Entry point of the window class procedure
    MessageResult class_window_proc(WindowHandle hwnd, MessageId msg,
                                    MessageWParam wparam, MessageLParam lparam);

    // Messages and windows
    virtual MessageId register_window_message(const std::string& name) = 0;
    virtual WindowHandle create_window(const std::string& class_name, const std::string& title,
                                       WindowHandle parent) = 0;
    virtual bool attach_subclass(WindowHandle hwnd, RegistryKey key) = 0;
    virtual void destroy_window(WindowHandle hwnd) = 0;
    virtual bool post_message(WindowHandle hwnd, MessageId msg, MessageWParam wparam, MessageLParam lparam) = 0;
    virtual MessageResult send_message(WindowHandle hwnd, MessageId msg, MessageWParam wparam, MessageLParam lparam) = 0;
    virtual void post_quit_message(int exit_code) = 0;
    virtual MessageResult default_window_proc(WindowHandle hwnd, MessageId msg,
                                              MessageWParam wparam, MessageLParam lparam) = 0;
    virtual MessageResult default_subclass_proc(WindowHandle hwnd, MessageId msg,
                                                MessageWParam wparam, MessageLParam lparam) = 0;
    virtual int run_message_loop() = 0;

    // Shell
    virtual bool notify_icon(NotifyIconAction action, const NotifyIconData& data) = 0;
    virtual Point cursor_position() = 0;
    virtual void set_foreground_window(WindowHandle hwnd) = 0;
    virtual Size small_icon_size() = 0;

    // Menus
    virtual MenuHandle create_popup_menu() = 0;
    virtual bool append_menu_item(MenuHandle menu, const MenuItemSpec& item) = 0;
    virtual bool set_menu_item_checked(MenuHandle menu, uint32_t id, bool checked) = 0;
    virtual uint32_t menu_item_id(MenuHandle menu, int position) = 0;
    virtual bool track_popup_menu(MenuHandle menu, WindowHandle owner, Point position) = 0;
    virtual void destroy_menu(MenuHandle menu) = 0;

    // Icons, data is a single image of an icon resource (DIB or PNG)
    virtual IconHandle create_icon_from_resource(const uint8_t* data, size_t size, Size size_hint) = 0;
    virtual void destroy_icon(IconHandle icon) = 0;

    virtual uint32_t last_error() const = 0;

protected:
    virtual bool register_window_class(const std::string& class_name) = 0;

private:
    WindowRegistry registry_;
    std::set<std::string> registered_classes_;
    std::mutex classes_mutex_;
};

// Factory function to create the platform window system
std::shared_ptr<NativeWindowSystem> create_native_window_system();

} // namespace trayhost
