#include <trayhost_demo/cli_parser.h>

namespace trayhost_demo {

CLIParser::CLIParser()
    : app_("trayhost-demo - Notification area icon that prints its events") {

    // Add version flag (help is automatically added by CLI11)
    app_.add_flag("-v,--version", show_version_, "Show version number");

    app_.add_option("-c,--config", config_.config_file, "JSON file describing the icon, its events and menu")
        ->check(CLI::ExistingFile);

    app_.add_option("--icon", config_.icon_path, "Icon file (.ico), overrides the configuration")
        ->check(CLI::ExistingFile);

    app_.add_option("--tooltip", config_.tooltip, "Tooltip text, overrides the configuration");

    app_.add_option("--log-level", config_.log_level, "Log level")
        ->check(CLI::IsMember({"critical", "error", "warning", "info", "debug", "trace"}))
        ->default_val("info");
}

int CLIParser::parse(int argc, char** argv) {
    try {
        app_.parse(argc, argv);

        should_continue_ = true;
        exit_code_ = 0;
        return 0;  // Success, continue
    } catch (const CLI::ParseError& e) {
        // Help/version requested or parse error occurred
        // Let CLI11 handle printing and get the exit code
        exit_code_ = app_.exit(e);
        should_continue_ = false;
        return exit_code_;
    }
}

} // namespace trayhost_demo
