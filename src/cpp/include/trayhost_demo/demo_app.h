#pragma once

#include "cli_parser.h"
#include <trayhost/tray_config.h>
#include <string>

namespace trayhost_demo {

// Event that closes the demo when the tray emits it
constexpr const char* QUIT_EVENT = "quit";

class DemoApp {
public:
    explicit DemoApp(const DemoConfig& config);

    // Runs the message loop until the tray window is closed
    int run();

    // Configuration after command line overrides and defaults
    trayhost::TrayConfig resolve_tray_config() const;

private:
    DemoConfig config_;
};

} // namespace trayhost_demo
