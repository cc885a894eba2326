#include "fake_window_system.h"
#include <trayhost/notify_icon.h>

namespace trayhost {
namespace testing {

namespace {
    // Win32 error codes reported by the fake
    constexpr uint32_t ERROR_ACCESS_DENIED = 5;
    constexpr uint32_t ERROR_NOT_ENOUGH_MEMORY = 8;
    constexpr uint32_t ERROR_INVALID_DATA = 13;
    constexpr uint32_t ERROR_INVALID_WINDOW_HANDLE = 1400;
    constexpr uint32_t ERROR_CANNOT_FIND_WND_CLASS = 1407;
}

std::uintptr_t FakeWindowSystem::next_handle() {
    next_handle_ += 4;
    return next_handle_;
}

size_t FakeWindowSystem::pump() {
    size_t delivered = 0;
    while (!queue.empty()) {
        Message message = queue.front();
        queue.pop_front();
        if (is_alive(message.hwnd)) {
            deliver(message.hwnd, message.msg, message.wparam, message.lparam);
        }
        delivered++;
    }
    return delivered;
}

MessageResult FakeWindowSystem::deliver(WindowHandle hwnd, MessageId msg, MessageWParam wparam, MessageLParam lparam) {
    auto it = windows.find(hwnd);
    if (it == windows.end() || !it->second.alive) {
        return 0;
    }

    if (it->second.subclassed) {
        return dispatch(hwnd, msg, wparam, lparam, it->second.key);
    }
    return class_window_proc(hwnd, msg, wparam, lparam);
}

void FakeWindowSystem::tray_event(WindowHandle hwnd, MessageId mouse_msg) {
    deliver(hwnd, Msg::APP_TRAYICON, NotifyIcon::DEFAULT_ID, static_cast<MessageLParam>(mouse_msg));
}

void FakeWindowSystem::restart_taskbar() {
    MessageId msg = register_window_message("TaskbarCreated");

    std::vector<WindowHandle> targets;
    for (const auto& it : windows) {
        if (it.second.alive) {
            targets.push_back(it.first);
        }
    }
    for (WindowHandle hwnd : targets) {
        deliver(hwnd, msg, 0, 0);
    }
}

size_t FakeWindowSystem::count_notify(NotifyIconAction action) const {
    size_t count = 0;
    for (const NotifyCall& call : notify_calls) {
        count += (call.action == action);
    }
    return count;
}

const FakeWindowSystem::NotifyCall* FakeWindowSystem::last_notify(NotifyIconAction action) const {
    for (auto it = notify_calls.rbegin(); it != notify_calls.rend(); ++it) {
        if (it->action == action) {
            return &*it;
        }
    }
    return nullptr;
}

MessageId FakeWindowSystem::message_id(const std::string& name) const {
    auto it = messages_.find(name);
    return it != messages_.end() ? it->second : 0;
}

bool FakeWindowSystem::is_alive(WindowHandle hwnd) const {
    auto it = windows.find(hwnd);
    return it != windows.end() && it->second.alive;
}

bool FakeWindowSystem::register_window_class(const std::string& class_name) {
    if (fail_register_class) {
        last_error_ = ERROR_ACCESS_DENIED;
        return false;
    }
    class_registrations++;
    classes_.insert(class_name);
    return true;
}

MessageId FakeWindowSystem::register_window_message(const std::string& name) {
    auto it = messages_.find(name);
    if (it != messages_.end()) {
        return it->second;
    }
    MessageId id = next_message_++;
    messages_[name] = id;
    return id;
}

WindowHandle FakeWindowSystem::create_window(const std::string& class_name, const std::string&,
                                             WindowHandle parent) {
    if (fail_create_window) {
        last_error_ = ERROR_NOT_ENOUGH_MEMORY;
        return 0;
    }
    if (!classes_.count(class_name)) {
        last_error_ = ERROR_CANNOT_FIND_WND_CLASS;
        return 0;
    }

    WindowHandle hwnd = next_handle();
    Window window;
    window.class_name = class_name;
    window.parent = parent;
    windows[hwnd] = window;

    // Sent synchronously by CreateWindowEx, before any subclass exists
    deliver(hwnd, Msg::CREATE, 0, 0);

    return hwnd;
}

bool FakeWindowSystem::attach_subclass(WindowHandle hwnd, RegistryKey key) {
    if (fail_subclass || !is_alive(hwnd)) {
        last_error_ = fail_subclass ? ERROR_ACCESS_DENIED : ERROR_INVALID_WINDOW_HANDLE;
        return false;
    }
    windows[hwnd].subclassed = true;
    windows[hwnd].key = key;
    return true;
}

void FakeWindowSystem::destroy_window(WindowHandle hwnd) {
    if (!is_alive(hwnd)) {
        return;
    }
    deliver(hwnd, Msg::DESTROY, 0, 0);
    deliver(hwnd, Msg::NCDESTROY, 0, 0);

    Window& window = windows[hwnd];
    window.alive = false;
    window.subclassed = false;
}

bool FakeWindowSystem::post_message(WindowHandle hwnd, MessageId msg, MessageWParam wparam, MessageLParam lparam) {
    if (!is_alive(hwnd)) {
        last_error_ = ERROR_INVALID_WINDOW_HANDLE;
        return false;
    }
    queue.push_back(Message{ hwnd, msg, wparam, lparam });
    return true;
}

MessageResult FakeWindowSystem::send_message(WindowHandle hwnd, MessageId msg, MessageWParam wparam, MessageLParam lparam) {
    if (msg == Msg::CLOSE) {
        close_requests++;
    }
    return deliver(hwnd, msg, wparam, lparam);
}

void FakeWindowSystem::post_quit_message(int exit_code) {
    quit_posts++;
    quit_code = exit_code;
}

MessageResult FakeWindowSystem::default_window_proc(WindowHandle hwnd, MessageId msg,
                                                    MessageWParam, MessageLParam) {
    default_proc_calls++;
    if (msg == Msg::CLOSE) {
        destroy_window(hwnd);
    }
    return 0;
}

MessageResult FakeWindowSystem::default_subclass_proc(WindowHandle hwnd, MessageId msg,
                                                      MessageWParam wparam, MessageLParam lparam) {
    // Next in the chain is the class procedure
    return class_window_proc(hwnd, msg, wparam, lparam);
}

int FakeWindowSystem::run_message_loop() {
    int quits = quit_posts;
    while (quit_posts == quits && !queue.empty()) {
        Message message = queue.front();
        queue.pop_front();
        deliver(message.hwnd, message.msg, message.wparam, message.lparam);
    }
    return quit_posts > quits ? quit_code : 0;
}

bool FakeWindowSystem::notify_icon(NotifyIconAction action, const NotifyIconData& data) {
    notify_calls.push_back(NotifyCall{ action, data });
    if (action == NotifyIconAction::ADD && fail_notify_add) {
        last_error_ = ERROR_ACCESS_DENIED;
        return false;
    }
    return true;
}

Point FakeWindowSystem::cursor_position() {
    return cursor;
}

void FakeWindowSystem::set_foreground_window(WindowHandle hwnd) {
    foreground_windows.push_back(hwnd);
}

Size FakeWindowSystem::small_icon_size() {
    return small_icon;
}

MenuHandle FakeWindowSystem::create_popup_menu() {
    if (fail_create_menu) {
        last_error_ = ERROR_NOT_ENOUGH_MEMORY;
        return 0;
    }
    MenuHandle menu = next_handle();
    menus[menu] = Menu();
    return menu;
}

bool FakeWindowSystem::append_menu_item(MenuHandle menu, const MenuItemSpec& item) {
    auto it = menus.find(menu);
    if (it == menus.end() || !it->second.alive) {
        last_error_ = ERROR_INVALID_DATA;
        return false;
    }
    it->second.items.push_back(item);
    return true;
}

bool FakeWindowSystem::set_menu_item_checked(MenuHandle menu, uint32_t id, bool checked) {
    auto it = menus.find(menu);
    if (it == menus.end()) {
        return false;
    }
    for (MenuItemSpec& item : it->second.items) {
        if (!item.separator && item.id == id) {
            item.checked = checked;
            return true;
        }
    }
    return false;
}

uint32_t FakeWindowSystem::menu_item_id(MenuHandle menu, int position) {
    auto it = menus.find(menu);
    if (it == menus.end() || position < 0 || static_cast<size_t>(position) >= it->second.items.size()) {
        return 0;
    }
    return it->second.items[position].id;
}

bool FakeWindowSystem::track_popup_menu(MenuHandle menu, WindowHandle owner, Point position) {
    tracked_menus.push_back(TrackCall{ menu, owner, position });
    return true;
}

void FakeWindowSystem::destroy_menu(MenuHandle menu) {
    auto it = menus.find(menu);
    if (it != menus.end()) {
        it->second.alive = false;
    }
}

IconHandle FakeWindowSystem::create_icon_from_resource(const uint8_t* data, size_t size, Size size_hint) {
    if (fail_create_icon) {
        last_error_ = ERROR_INVALID_DATA;
        return 0;
    }
    icon_requests.push_back(IconRequest{ std::vector<uint8_t>(data, data + size), size_hint });

    IconHandle icon = next_handle();
    live_icons.insert(icon);
    return icon;
}

void FakeWindowSystem::destroy_icon(IconHandle icon) {
    live_icons.erase(icon);
}

} // namespace testing
} // namespace trayhost
