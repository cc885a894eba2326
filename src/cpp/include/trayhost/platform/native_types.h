#pragma once

#include <cstdint>
#include <string>

namespace trayhost {

// Opaque native handles (HWND, HMENU, HICON on Windows)
using WindowHandle = std::uintptr_t;
using MenuHandle = std::uintptr_t;
using IconHandle = std::uintptr_t;

using MessageId = uint32_t;
using MessageWParam = std::uintptr_t;
using MessageLParam = std::intptr_t;
using MessageResult = std::intptr_t;

struct Point {
    int x = 0;
    int y = 0;
};

struct Size {
    int width = 0;
    int height = 0;
};

// Window message numbers, identical to the Win32 values
namespace Msg {
    constexpr MessageId NULL_MESSAGE = 0x0000;
    constexpr MessageId CREATE = 0x0001;
    constexpr MessageId DESTROY = 0x0002;
    constexpr MessageId CLOSE = 0x0010;
    constexpr MessageId NCDESTROY = 0x0082;
    constexpr MessageId COMMAND = 0x0111;
    constexpr MessageId CONTEXTMENU = 0x007B;
    constexpr MessageId MENUCOMMAND = 0x0126;
    constexpr MessageId MOUSEMOVE = 0x0200;
    constexpr MessageId LBUTTONDOWN = 0x0201;
    constexpr MessageId LBUTTONUP = 0x0202;
    constexpr MessageId LBUTTONDBLCLK = 0x0203;
    constexpr MessageId RBUTTONDOWN = 0x0204;
    constexpr MessageId RBUTTONUP = 0x0205;
    constexpr MessageId USER = 0x0400;
    // NIN_SELECT with the keyboard flag
    constexpr MessageId KEYSELECT = USER + 1;
    constexpr MessageId APP = 0x8000;

    // Private messages of the tray window
    constexpr MessageId APP_CREATE = APP + 1;
    constexpr MessageId APP_TRAYICON = APP + 2;
}

inline uint32_t low_word(std::uintptr_t value) {
    return static_cast<uint32_t>(value & 0xFFFF);
}

inline uint32_t high_word(std::uintptr_t value) {
    return static_cast<uint32_t>((value >> 16) & 0xFFFF);
}

enum class NotifyIconAction {
    ADD,
    MODIFY,
    REMOVE
};

// Notification area registration, mirrors the NOTIFYICONDATA fields we use
struct NotifyIconData {
    WindowHandle window = 0;
    uint32_t id = 0;
    MessageId callback_message = Msg::APP_TRAYICON;
    IconHandle icon = 0;
    std::string tooltip;
};

struct MenuItemSpec {
    uint32_t id = 0;
    std::string label;
    bool separator = false;
    bool enabled = true;
    bool checkable = false;
    bool checked = false;
};

} // namespace trayhost
