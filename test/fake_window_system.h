#pragma once

#include <trayhost/platform/native_window_system.h>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace trayhost {
namespace testing {

/**
 * In-memory window system. Routes messages the way Win32 does: the class
 * procedure sees WM_CREATE during create_window(), subclassed windows go
 * through dispatch(), and WM_CLOSE reaching the default procedure destroys
 * the window. Posted messages wait in a queue until pump().
 */
class FakeWindowSystem : public NativeWindowSystem {
public:
    struct Message {
        WindowHandle hwnd;
        MessageId msg;
        MessageWParam wparam;
        MessageLParam lparam;
    };

    struct Window {
        std::string class_name;
        WindowHandle parent = 0;
        bool alive = true;
        bool subclassed = false;
        RegistryKey key;
    };

    struct NotifyCall {
        NotifyIconAction action;
        NotifyIconData data;
    };

    struct TrackCall {
        MenuHandle menu;
        WindowHandle owner;
        Point position;
    };

    struct Menu {
        std::vector<MenuItemSpec> items;
        bool alive = true;
    };

    struct IconRequest {
        std::vector<uint8_t> bytes;
        Size size_hint;
    };

    // Failure injection
    bool fail_register_class = false;
    bool fail_create_window = false;
    bool fail_subclass = false;
    bool fail_notify_add = false;
    bool fail_create_menu = false;
    bool fail_create_icon = false;

    Point cursor{ 1180, 1050 };
    Size small_icon{ 16, 16 };

    // Observations
    int class_registrations = 0;
    int close_requests = 0;
    int quit_posts = 0;
    int quit_code = -1;
    int default_proc_calls = 0;
    std::map<WindowHandle, Window> windows;
    std::deque<Message> queue;
    std::vector<NotifyCall> notify_calls;
    std::vector<TrackCall> tracked_menus;
    std::vector<WindowHandle> foreground_windows;
    std::map<MenuHandle, Menu> menus;
    std::set<IconHandle> live_icons;
    std::vector<IconRequest> icon_requests;

    // Deliver queued messages, returns how many were delivered
    size_t pump();

    // Route a message to a window immediately
    MessageResult deliver(WindowHandle hwnd, MessageId msg, MessageWParam wparam = 0, MessageLParam lparam = 0);

    // Simulate a mouse event on the notification icon of a window
    void tray_event(WindowHandle hwnd, MessageId mouse_msg);

    // Broadcast TaskbarCreated, as explorer does after a restart
    void restart_taskbar();

    size_t count_notify(NotifyIconAction action) const;
    const NotifyCall* last_notify(NotifyIconAction action) const;
    MessageId message_id(const std::string& name) const;
    bool is_alive(WindowHandle hwnd) const;

    // NativeWindowSystem
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

    uint32_t last_error() const override { return last_error_; }

protected:
    bool register_window_class(const std::string& class_name) override;

private:
    std::uintptr_t next_handle();

    std::set<std::string> classes_;
    std::map<std::string, MessageId> messages_;
    MessageId next_message_ = 0xC000;
    std::uintptr_t next_handle_ = 0x1000;
    uint32_t last_error_ = 0;
};

} // namespace testing
} // namespace trayhost
