#pragma once

#include "trayhost/event_channel.h"
#include "trayhost/notify_icon.h"
#include "trayhost/popup_menu.h"
#include "trayhost/utils/logging.h"
#include "trayhost/window_registry.h"
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace trayhost {

class NativeWindowSystem;

enum class TrayWindowState {
    UNINITIALIZED,
    RUNNING,
    DESTROYED
};

enum class TrayInteraction {
    CLICK,
    DOUBLE_CLICK,
    RIGHT_CLICK,
    MENU_ITEM
};

/**
 * Hidden window hosting a notification area icon.
 *
 * Translates native messages into tray interactions. The mapping from an
 * interaction to an application event lives in TrayWindow<T>.
 */
class TrayWindowCore : public MessageHandler {
public:
    static constexpr const char* WINDOW_CLASS = "TrayHostWindowClass";
    static constexpr const char* WINDOW_TITLE = "TrayHost";
    static constexpr const char* TASKBAR_CREATED = "TaskbarCreated";

    TrayWindowCore(std::shared_ptr<NativeWindowSystem> system, NativeIcon icon,
                   std::unique_ptr<PopupMenu> menu, const std::string& tooltip);
    ~TrayWindowCore() override;

    TrayWindowCore(const TrayWindowCore&) = delete;
    TrayWindowCore& operator=(const TrayWindowCore&) = delete;

    /**
     * Create the native window of a tray window and register it.
     * @return key under which the window system holds the tray window
     * @throws OsErrorException if the class, window or subclass cannot be set up
     */
    static RegistryKey open(std::shared_ptr<TrayWindowCore> window, WindowHandle parent);

    // Request the window to close (once) and release the registry slot
    void close(RegistryKey key);

    MessageResult handle_message(WindowHandle hwnd, MessageId msg,
                                 MessageWParam wparam, MessageLParam lparam) override;

    /**
     * Replace the displayed icon.
     * @throws IconLoadingException, the current icon stays in place
     */
    void set_icon_from_buffer(std::vector<uint8_t> buffer,
                              std::optional<uint32_t> width = std::nullopt,
                              std::optional<uint32_t> height = std::nullopt);
    void set_tooltip(const std::string& tooltip);
    void set_menu(std::unique_ptr<PopupMenu> menu);

    // Show the context menu at the cursor, false without a menu
    bool show_menu();

    WindowHandle window() const { return hwnd_; }
    TrayWindowState state() const { return state_; }
    MessageId taskbar_created_message() const { return taskbar_created_; }
    const NotifyIcon& notify_icon() const { return notify_icon_; }
    bool has_menu() const { return menu_ != nullptr; }

protected:
    virtual void on_interaction(TrayInteraction interaction, uint32_t menu_id) = 0;

private:
    // Message handlers
    void on_create(WindowHandle hwnd);
    void on_taskbar_created(WindowHandle hwnd);
    void on_tray_icon(MessageLParam lparam);
    void on_destroy();

    std::shared_ptr<NativeWindowSystem> system_;
    NotifyIcon notify_icon_;
    std::unique_ptr<PopupMenu> menu_;
    WindowHandle hwnd_ = 0;
    MessageId taskbar_created_ = 0;
    MessageId last_tray_message_ = 0;
    std::atomic<TrayWindowState> state_{TrayWindowState::UNINITIALIZED};
};

template<typename T, typename = void>
struct is_equality_comparable : std::false_type {};

template<typename T>
struct is_equality_comparable<T, std::void_t<decltype(std::declval<const T&>() == std::declval<const T&>())>>
    : std::true_type {};

// Application events emitted for each kind of interaction
template<typename T>
struct TrayEvents {
    std::optional<T> click;
    std::optional<T> double_click;
    std::optional<T> right_click;
    std::map<uint32_t, T> menu;
};

template<typename T>
class TrayWindow : public TrayWindowCore {
    static_assert(std::is_copy_constructible<T>::value, "Tray events must be copyable");
    static_assert(is_equality_comparable<T>::value, "Tray events must be equality comparable");

public:
    TrayWindow(std::shared_ptr<NativeWindowSystem> system, Sender<T> sender, TrayEvents<T> events,
               NativeIcon icon, std::unique_ptr<PopupMenu> menu, const std::string& tooltip)
        : TrayWindowCore(std::move(system), std::move(icon), std::move(menu), tooltip)
        , sender_(std::move(sender))
        , events_(std::move(events))
    {
    }

    void set_menu(std::unique_ptr<PopupMenu> menu, std::map<uint32_t, T> menu_events) {
        TrayWindowCore::set_menu(std::move(menu));
        events_.menu = std::move(menu_events);
    }

    const TrayEvents<T>& events() const { return events_; }
    size_t dropped_events() const { return dropped_events_; }

protected:
    void on_interaction(TrayInteraction interaction, uint32_t menu_id) override {
        const T* event = nullptr;

        switch (interaction) {
            case TrayInteraction::CLICK:
                event = events_.click ? &*events_.click : nullptr;
                break;
            case TrayInteraction::DOUBLE_CLICK:
                event = events_.double_click ? &*events_.double_click : nullptr;
                break;
            case TrayInteraction::RIGHT_CLICK:
                event = events_.right_click ? &*events_.right_click : nullptr;
                break;
            case TrayInteraction::MENU_ITEM: {
                auto it = events_.menu.find(menu_id);
                if (it != events_.menu.end()) {
                    event = &it->second;
                }
            } break;
        }

        if (event) {
            emit(*event);
        }
    }

private:
    void emit(const T& event) {
        if (sender_.send(event)) {
            return;
        }

        // The receiver is gone and there is no way to tell the application, drop the event
        if (dropped_events_++ == 0) {
            TRAYHOST_LOG_WARNING("Tray event receiver disconnected, dropping events");
        } else {
            TRAYHOST_LOG_DEBUG("Dropped tray event (" << dropped_events_ << " so far)");
        }
    }

    Sender<T> sender_;
    TrayEvents<T> events_;
    size_t dropped_events_ = 0;
};

} // namespace trayhost
