#include "trayhost/platform/native_window_system.h"
#include "trayhost/utils/logging.h"

namespace trayhost {

bool NativeWindowSystem::ensure_window_class(const std::string& class_name) {
    std::lock_guard<std::mutex> lock(classes_mutex_);

    if (registered_classes_.count(class_name)) {
        return true;
    }

    TRAYHOST_LOG_DEBUG("Registering window class " << class_name);
    if (!register_window_class(class_name)) {
        TRAYHOST_LOG_ERROR("Failed to register window class '" << class_name << "': " << last_error());
        return false;
    }

    // The class is local to the process, Windows cleans it up on exit
    registered_classes_.insert(class_name);
    return true;
}

MessageResult NativeWindowSystem::dispatch(WindowHandle hwnd, MessageId msg, MessageWParam wparam,
                                           MessageLParam lparam, RegistryKey key) {
    std::shared_ptr<MessageHandler> handler = registry_.find(key);
    if (!handler) {
        return default_subclass_proc(hwnd, msg, wparam, lparam);
    }

    return handler->handle_message(hwnd, msg, wparam, lparam);
}

MessageResult NativeWindowSystem::class_window_proc(WindowHandle hwnd, MessageId msg,
                                                    MessageWParam wparam, MessageLParam lparam) {
    // The subclass is attached after creation returns, so it never sees the create
    // message itself. Repost it as a private message that reaches the subclass.
    // The CREATESTRUCT in lparam dies with this call and is not forwarded.
    if (msg == Msg::CREATE) {
        post_message(hwnd, Msg::APP_CREATE, 0, 0);
        return 0;
    }

    return default_window_proc(hwnd, msg, wparam, lparam);
}

} // namespace trayhost
