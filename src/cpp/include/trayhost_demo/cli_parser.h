#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace trayhost_demo {

struct DemoConfig {
    std::string config_file;
    std::string icon_path;
    std::string tooltip;
    std::string log_level = "info";
};

class CLIParser {
public:
    CLIParser();

    // Parse command line arguments
    // Returns: 0 if should continue, exit code (may be 0) if should exit
    int parse(int argc, char** argv);

    DemoConfig get_config() const { return config_; }

    // Check if we should continue (false means exit cleanly, e.g., after --help)
    bool should_continue() const { return should_continue_; }

    // Get exit code (only valid if should_continue() is false)
    int get_exit_code() const { return exit_code_; }

    bool should_show_version() const { return show_version_; }

private:
    CLI::App app_;
    DemoConfig config_;
    bool show_version_ = false;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace trayhost_demo
