#include <trayhost_demo/demo_app.h>
#include <trayhost/error_types.h>
#include <trayhost/platform/native_window_system.h>
#include <trayhost/tray_icon.h>
#include <trayhost/utils/logging.h>
#include <atomic>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace trayhost_demo {

using namespace trayhost;

namespace {
    constexpr const char* DEFAULT_TOOLTIP = "trayhost";

    // Window closed by the console handler
    std::atomic<WindowHandle> g_tray_window{0};

#ifdef _WIN32
    // Windows Ctrl+C handler
    BOOL WINAPI console_ctrl_handler(DWORD ctrl_type) {
        if (ctrl_type == CTRL_C_EVENT || ctrl_type == CTRL_CLOSE_EVENT || ctrl_type == CTRL_BREAK_EVENT) {
            WindowHandle hwnd = g_tray_window.load();
            if (hwnd) {
                std::cout << "\nReceived interrupt signal, shutting down gracefully..." << std::endl;
                PostMessageW(reinterpret_cast<HWND>(hwnd), WM_CLOSE, 0, 0);
                return TRUE;
            }
        }
        return FALSE;
    }
#endif
}

DemoApp::DemoApp(const DemoConfig& config)
    : config_(config)
{
}

TrayConfig DemoApp::resolve_tray_config() const {
    TrayConfig tray_config;
    if (!config_.config_file.empty()) {
        tray_config = TrayConfig::load(config_.config_file);
    }

    if (!config_.icon_path.empty()) {
        tray_config.icon_path = config_.icon_path;
    }
    if (!config_.tooltip.empty()) {
        tray_config.tooltip = config_.tooltip;
    }
    if (tray_config.tooltip.empty()) {
        tray_config.tooltip = DEFAULT_TOOLTIP;
    }
    if (tray_config.icon_path.empty()) {
        throw InvalidConfigException("no icon, use --icon or the 'icon' key of the configuration");
    }

    // Without a menu there would be no way to quit from the tray
    if (tray_config.menu.empty()) {
        TrayMenuItemConfig quit;
        quit.id = 1;
        quit.label = "Quit";
        quit.event = QUIT_EVENT;
        tray_config.menu.push_back(quit);
    }

    return tray_config;
}

int DemoApp::run() {
    trayhost::log::set_level(config_.log_level);

    TrayConfig tray_config = resolve_tray_config();
    TRAYHOST_LOG_DEBUG("Tray configuration: " << tray_config.to_json().dump());

    std::shared_ptr<NativeWindowSystem> system = create_native_window_system();

    auto channel = make_channel<std::string>();
    Receiver<std::string> receiver = std::move(channel.second);

    TrayMenu menu = build_menu(system, tray_config);

    TrayIconBuilder<std::string> builder;
    builder.sender(std::move(channel.first))
        .icon_from_buffer(read_file_bytes(tray_config.icon_path), tray_config.icon_width, tray_config.icon_height)
        .tooltip(tray_config.tooltip)
        .menu(std::move(menu.menu))
        .menu_events(std::move(menu.events));
    if (tray_config.click_event) builder.on_click(*tray_config.click_event);
    if (tray_config.double_click_event) builder.on_double_click(*tray_config.double_click_event);
    if (tray_config.right_click_event) builder.on_right_click(*tray_config.right_click_event);

    std::unique_ptr<TrayIcon<std::string>> tray = builder.build(system);
    WindowHandle hwnd = tray->window();
    g_tray_window = hwnd;

#ifdef _WIN32
    SetConsoleCtrlHandler(console_ctrl_handler, TRUE);
#endif

    // Events are consumed away from the message loop thread
    std::thread consumer([&receiver, system, hwnd]() {
        while (std::optional<std::string> event = receiver.recv()) {
            TRAYHOST_LOG_INFO("Event: " << *event);
            if (*event == QUIT_EVENT) {
                system->post_message(hwnd, Msg::CLOSE, 0, 0);
            }
        }
    });

    TRAYHOST_LOG_INFO("Tray icon ready, pick Quit from its menu to exit");
    int exit_code = system->run_message_loop();

    g_tray_window = 0;
#ifdef _WIN32
    SetConsoleCtrlHandler(console_ctrl_handler, FALSE);
#endif

    // Dropping the icon drops the sender, which ends the consumer
    tray.reset();
    consumer.join();

    return exit_code;
}

} // namespace trayhost_demo
