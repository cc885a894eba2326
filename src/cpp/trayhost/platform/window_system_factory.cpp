#include "trayhost/platform/native_window_system.h"
#include "trayhost/error_types.h"

#ifdef _WIN32
#include "trayhost/platform/windows_window_system.h"
#endif

namespace trayhost {

std::shared_ptr<NativeWindowSystem> create_native_window_system() {
#ifdef _WIN32
    return WindowsWindowSystem::instance();
#elif defined(__APPLE__)
    throw UnsupportedOperationException("Notification area icons", "macOS");
#else
    // No notification area without a Win32 shell, headless like the Linux tray
    throw UnsupportedOperationException("Notification area icons", "this platform");
#endif
}

} // namespace trayhost
