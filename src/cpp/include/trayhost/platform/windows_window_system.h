#pragma once

#ifdef _WIN32

#include "native_window_system.h"
#include <windows.h>
#include <shellapi.h>
#include <commctrl.h>

// Undefine Windows macros that conflict with our code
#ifdef ERROR
#undef ERROR
#endif

#include <memory>

namespace trayhost {

/**
 * Win32 implementation. Window classes and subclass procedures are process
 * wide, so there is a single instance, reached by the static procedures.
 */
class WindowsWindowSystem : public NativeWindowSystem {
public:
    static std::shared_ptr<WindowsWindowSystem> instance();

    MessageId register_window_message(const std::string& name) override;
    WindowHandle create_window(const std::string& class_name, const std::string& title,
                               WindowHandle parent) override;
    bool attach_subclass(WindowHandle hwnd, RegistryKey key) override;
    void destroy_window(WindowHandle hwnd) override;
    bool post_message(WindowHandle hwnd, MessageId msg, MessageWParam wparam, MessageLParam lparam) override;
    MessageResult send_message(WindowHandle hwnd, MessageId msg, MessageWParam wparam, MessageLParam lparam) override;
    void post_quit_message(int exit_code) override;
    MessageResult default_window_proc(WindowHandle hwnd, MessageId msg,
                                      MessageWParam wparam, MessageLParam lparam) override;
    MessageResult default_subclass_proc(WindowHandle hwnd, MessageId msg,
                                        MessageWParam wparam, MessageLParam lparam) override;
    int run_message_loop() override;

    bool notify_icon(NotifyIconAction action, const NotifyIconData& data) override;
    Point cursor_position() override;
    void set_foreground_window(WindowHandle hwnd) override;
    Size small_icon_size() override;

    MenuHandle create_popup_menu() override;
    bool append_menu_item(MenuHandle menu, const MenuItemSpec& item) override;
    bool set_menu_item_checked(MenuHandle menu, uint32_t id, bool checked) override;
    uint32_t menu_item_id(MenuHandle menu, int position) override;
    bool track_popup_menu(MenuHandle menu, WindowHandle owner, Point position) override;
    void destroy_menu(MenuHandle menu) override;

    IconHandle create_icon_from_resource(const uint8_t* data, size_t size, Size size_hint) override;
    void destroy_icon(IconHandle icon) override;

    uint32_t last_error() const override;

protected:
    bool register_window_class(const std::string& class_name) override;

private:
    WindowsWindowSystem();

    // Window procedures
    static LRESULT CALLBACK window_proc_static(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam);
    static LRESULT CALLBACK subclass_proc_static(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam,
                                                 UINT_PTR subclass_id, DWORD_PTR ref_data);

    HINSTANCE hinst_;
    DWORD last_error_;
};

} // namespace trayhost

#endif // _WIN32
