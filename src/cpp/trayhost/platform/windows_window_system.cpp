#ifdef _WIN32

#include "trayhost/platform/windows_window_system.h"
#include "trayhost/utils/logging.h"

#pragma comment(lib, "comctl32.lib")
#pragma comment(lib, "shell32.lib")

namespace trayhost {

namespace {
    // Helper function to convert UTF-8 string to wide string
    std::wstring utf8_to_wstring(const std::string& str) {
        if (str.empty()) return std::wstring();
        int size_needed = MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, nullptr, 0);
        std::wstring result(size_needed, 0);
        MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, &result[0], size_needed);
        // Remove null terminator
        if (!result.empty() && result.back() == L'\0') {
            result.pop_back();
        }
        return result;
    }

    HWND to_hwnd(WindowHandle handle) { return reinterpret_cast<HWND>(handle); }
    HMENU to_hmenu(MenuHandle handle) { return reinterpret_cast<HMENU>(handle); }
    HICON to_hicon(IconHandle handle) { return reinterpret_cast<HICON>(handle); }

    WindowHandle from_hwnd(HWND hwnd) { return reinterpret_cast<WindowHandle>(hwnd); }

    // Arbitrary, one subclass per window
    constexpr UINT_PTR SUBCLASS_ID = 1;
}

std::shared_ptr<WindowsWindowSystem> WindowsWindowSystem::instance() {
    static std::shared_ptr<WindowsWindowSystem> system(new WindowsWindowSystem());
    return system;
}

WindowsWindowSystem::WindowsWindowSystem()
    : hinst_(GetModuleHandleW(nullptr))
    , last_error_(0)
{
}

bool WindowsWindowSystem::register_window_class(const std::string& class_name) {
    std::wstring name = utf8_to_wstring(class_name);

    WNDCLASSEXW wc = {};
    wc.cbSize = sizeof(WNDCLASSEXW);
    wc.lpfnWndProc = window_proc_static;
    wc.hInstance = hinst_;
    wc.lpszClassName = name.c_str();
    wc.hCursor = LoadCursor(nullptr, IDC_ARROW);

    if (!RegisterClassExW(&wc)) {
        DWORD error = GetLastError();
        if (error != ERROR_CLASS_ALREADY_EXISTS) {
            last_error_ = error;
            return false;
        }
    }

    return true;
}

MessageId WindowsWindowSystem::register_window_message(const std::string& name) {
    UINT msg = RegisterWindowMessageW(utf8_to_wstring(name).c_str());
    if (!msg) {
        last_error_ = GetLastError();
    }
    return msg;
}

WindowHandle WindowsWindowSystem::create_window(const std::string& class_name, const std::string& title,
                                                WindowHandle parent) {
    HWND hwnd = CreateWindowExW(
        0,
        utf8_to_wstring(class_name).c_str(),
        utf8_to_wstring(title).c_str(),
        WS_OVERLAPPEDWINDOW,
        CW_USEDEFAULT, CW_USEDEFAULT,
        CW_USEDEFAULT, CW_USEDEFAULT,
        to_hwnd(parent),
        nullptr,
        hinst_,
        nullptr
    );

    if (!hwnd) {
        last_error_ = GetLastError();
        TRAYHOST_LOG_ERROR("CreateWindowExW failed with error: " << last_error_);
        return 0;
    }

    return from_hwnd(hwnd);
}

bool WindowsWindowSystem::attach_subclass(WindowHandle hwnd, RegistryKey key) {
    // The reference data is the registry key, never a pointer
    if (!SetWindowSubclass(to_hwnd(hwnd), subclass_proc_static, SUBCLASS_ID, key.to_bits())) {
        last_error_ = GetLastError();
        return false;
    }
    return true;
}

void WindowsWindowSystem::destroy_window(WindowHandle hwnd) {
    DestroyWindow(to_hwnd(hwnd));
}

bool WindowsWindowSystem::post_message(WindowHandle hwnd, MessageId msg, MessageWParam wparam, MessageLParam lparam) {
    if (!PostMessageW(to_hwnd(hwnd), msg, wparam, lparam)) {
        last_error_ = GetLastError();
        return false;
    }
    return true;
}

MessageResult WindowsWindowSystem::send_message(WindowHandle hwnd, MessageId msg, MessageWParam wparam, MessageLParam lparam) {
    return SendMessageW(to_hwnd(hwnd), msg, wparam, lparam);
}

void WindowsWindowSystem::post_quit_message(int exit_code) {
    PostQuitMessage(exit_code);
}

MessageResult WindowsWindowSystem::default_window_proc(WindowHandle hwnd, MessageId msg,
                                                       MessageWParam wparam, MessageLParam lparam) {
    return DefWindowProcW(to_hwnd(hwnd), msg, wparam, lparam);
}

MessageResult WindowsWindowSystem::default_subclass_proc(WindowHandle hwnd, MessageId msg,
                                                         MessageWParam wparam, MessageLParam lparam) {
    return DefSubclassProc(to_hwnd(hwnd), msg, wparam, lparam);
}

int WindowsWindowSystem::run_message_loop() {
    MSG msg;
    BOOL ret;
    while ((ret = GetMessageW(&msg, nullptr, 0, 0)) != 0) {
        if (ret == -1) {
            last_error_ = GetLastError();
            TRAYHOST_LOG_ERROR("GetMessageW failed with error: " << last_error_);
            return 1;
        }
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }
    return static_cast<int>(msg.wParam);
}

bool WindowsWindowSystem::notify_icon(NotifyIconAction action, const NotifyIconData& data) {
    NOTIFYICONDATAW nid = {};
    nid.cbSize = sizeof(NOTIFYICONDATAW);
    nid.hWnd = to_hwnd(data.window);
    nid.uID = data.id;
    nid.uFlags = NIF_ICON | NIF_MESSAGE | NIF_TIP | NIF_SHOWTIP;
    nid.uCallbackMessage = data.callback_message;
    nid.hIcon = to_hicon(data.icon);

    std::wstring tooltip_wide = utf8_to_wstring(data.tooltip);
    wcsncpy_s(nid.szTip, tooltip_wide.c_str(), _TRUNCATE);

    DWORD message = NIM_ADD;
    switch (action) {
        case NotifyIconAction::ADD: message = NIM_ADD; break;
        case NotifyIconAction::MODIFY: message = NIM_MODIFY; break;
        case NotifyIconAction::REMOVE: message = NIM_DELETE; break;
    }

    if (!Shell_NotifyIconW(message, &nid)) {
        last_error_ = GetLastError();
        return false;
    }

    if (action == NotifyIconAction::ADD) {
        // Mouse events arrive in LOWORD(lParam)
        nid.uVersion = NOTIFYICON_VERSION_4;
        Shell_NotifyIconW(NIM_SETVERSION, &nid);
    }

    return true;
}

Point WindowsWindowSystem::cursor_position() {
    POINT pos = {};
    if (!GetCursorPos(&pos)) {
        last_error_ = GetLastError();
    }
    return Point{ pos.x, pos.y };
}

void WindowsWindowSystem::set_foreground_window(WindowHandle hwnd) {
    SetForegroundWindow(to_hwnd(hwnd));
}

Size WindowsWindowSystem::small_icon_size() {
    return Size{ GetSystemMetrics(SM_CXSMICON), GetSystemMetrics(SM_CYSMICON) };
}

MenuHandle WindowsWindowSystem::create_popup_menu() {
    HMENU menu = CreatePopupMenu();
    if (!menu) {
        last_error_ = GetLastError();
    }
    return reinterpret_cast<MenuHandle>(menu);
}

bool WindowsWindowSystem::append_menu_item(MenuHandle menu, const MenuItemSpec& item) {
    BOOL ok;
    if (item.separator) {
        ok = AppendMenuW(to_hmenu(menu), MF_SEPARATOR, 0, nullptr);
    } else {
        std::wstring text_wide = utf8_to_wstring(item.label);

        UINT flags = MF_STRING;
        if (!item.enabled) flags |= MF_GRAYED;
        if (item.checked) flags |= MF_CHECKED;

        ok = AppendMenuW(to_hmenu(menu), flags, item.id, text_wide.c_str());
    }

    if (!ok) {
        last_error_ = GetLastError();
        return false;
    }
    return true;
}

bool WindowsWindowSystem::set_menu_item_checked(MenuHandle menu, uint32_t id, bool checked) {
    DWORD previous = CheckMenuItem(to_hmenu(menu), id, MF_BYCOMMAND | (checked ? MF_CHECKED : MF_UNCHECKED));
    return previous != static_cast<DWORD>(-1);
}

uint32_t WindowsWindowSystem::menu_item_id(MenuHandle menu, int position) {
    UINT id = GetMenuItemID(to_hmenu(menu), position);
    return id == static_cast<UINT>(-1) ? 0 : id;
}

bool WindowsWindowSystem::track_popup_menu(MenuHandle menu, WindowHandle owner, Point position) {
    UINT align = GetSystemMetrics(SM_MENUDROPALIGNMENT) ? TPM_RIGHTALIGN : TPM_LEFTALIGN;

    // The selection comes back as WM_COMMAND to the owner window
    BOOL result = TrackPopupMenu(
        to_hmenu(menu),
        align | TPM_BOTTOMALIGN | TPM_RIGHTBUTTON,
        position.x,
        position.y,
        0,
        to_hwnd(owner),
        nullptr
    );

    if (!result) {
        last_error_ = GetLastError();
        return false;
    }
    return true;
}

void WindowsWindowSystem::destroy_menu(MenuHandle menu) {
    DestroyMenu(to_hmenu(menu));
}

IconHandle WindowsWindowSystem::create_icon_from_resource(const uint8_t* data, size_t size, Size size_hint) {
    // 0x00030000 is the only version CreateIconFromResourceEx accepts
    HICON icon = CreateIconFromResourceEx(
        const_cast<PBYTE>(data),
        static_cast<DWORD>(size),
        TRUE,
        0x00030000,
        size_hint.width,
        size_hint.height,
        LR_DEFAULTCOLOR
    );

    if (!icon) {
        last_error_ = GetLastError();
        return 0;
    }
    return reinterpret_cast<IconHandle>(icon);
}

void WindowsWindowSystem::destroy_icon(IconHandle icon) {
    DestroyIcon(to_hicon(icon));
}

uint32_t WindowsWindowSystem::last_error() const {
    return last_error_;
}

LRESULT CALLBACK WindowsWindowSystem::window_proc_static(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam) {
    return instance()->class_window_proc(from_hwnd(hwnd), msg, wparam, lparam);
}

LRESULT CALLBACK WindowsWindowSystem::subclass_proc_static(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam,
                                                           UINT_PTR subclass_id, DWORD_PTR ref_data) {
    LRESULT result = instance()->dispatch(from_hwnd(hwnd), msg, wparam, lparam,
                                          RegistryKey::from_bits(static_cast<std::uintptr_t>(ref_data)));

    if (msg == WM_NCDESTROY) {
        RemoveWindowSubclass(hwnd, subclass_proc_static, subclass_id);
    }

    return result;
}

} // namespace trayhost

#endif // _WIN32
