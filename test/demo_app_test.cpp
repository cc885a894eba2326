#include <gtest/gtest.h>
#include <trayhost_demo/cli_parser.h>
#include <trayhost_demo/demo_app.h>
#include <trayhost/error_types.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace trayhost_demo;
namespace fs = std::filesystem;

namespace {

class DemoAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("trayhost_demo_test_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        fs::path file = dir_ / name;
        std::ofstream out(file);
        out << content;
        return file.string();
    }

    // Runs the parser over a command line, argv[0] included
    int parse(CLIParser& parser, std::vector<std::string> args) {
        args.insert(args.begin(), "trayhost-demo");
        std::vector<char*> argv;
        for (std::string& arg : args) {
            argv.push_back(&arg[0]);
        }
        return parser.parse(static_cast<int>(argv.size()), argv.data());
    }

    fs::path dir_;
};

TEST_F(DemoAppTest, RequiresAnIcon) {
    DemoApp app(DemoConfig{});

    EXPECT_THROW(app.resolve_tray_config(), trayhost::InvalidConfigException);
}

TEST_F(DemoAppTest, AddsDefaultTooltipAndQuitItem) {
    DemoConfig config;
    config.icon_path = "app.ico";

    trayhost::TrayConfig tray = DemoApp(config).resolve_tray_config();

    EXPECT_EQ(tray.icon_path, "app.ico");
    EXPECT_EQ(tray.tooltip, "trayhost");
    ASSERT_EQ(tray.menu.size(), 1u);
    EXPECT_EQ(tray.menu[0].id, 1u);
    EXPECT_EQ(tray.menu[0].label, "Quit");
    EXPECT_EQ(tray.menu[0].event, QUIT_EVENT);
}

TEST_F(DemoAppTest, CommandLineOverridesConfigurationFile) {
    DemoConfig config;
    config.config_file = write("tray.json", R"({
        "tooltip": "From file",
        "icon": "file.ico",
        "click": "open",
        "menu": [ { "id": 7, "label": "Exit", "event": "quit" } ]
    })");
    config.tooltip = "From command line";

    trayhost::TrayConfig tray = DemoApp(config).resolve_tray_config();

    EXPECT_EQ(tray.tooltip, "From command line");
    EXPECT_EQ(fs::path(tray.icon_path), dir_ / "file.ico");
    EXPECT_EQ(tray.click_event, std::string("open"));
    ASSERT_EQ(tray.menu.size(), 1u);
    EXPECT_EQ(tray.menu[0].id, 7u);

    config.icon_path = "other.ico";
    EXPECT_EQ(DemoApp(config).resolve_tray_config().icon_path, "other.ico");
}

TEST_F(DemoAppTest, ParsesCommandLine) {
    std::string icon = write("app.ico", "");
    std::string tray_config = write("tray.json", "{}");

    CLIParser parser;
    int code = parse(parser, { "--icon", icon, "-c", tray_config, "--tooltip", "Hello", "--log-level", "debug" });

    EXPECT_EQ(code, 0);
    EXPECT_TRUE(parser.should_continue());
    EXPECT_FALSE(parser.should_show_version());
    DemoConfig config = parser.get_config();
    EXPECT_EQ(config.icon_path, icon);
    EXPECT_EQ(config.config_file, tray_config);
    EXPECT_EQ(config.tooltip, "Hello");
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(DemoAppTest, DefaultsToInfoLogging) {
    CLIParser parser;
    parse(parser, {});

    EXPECT_TRUE(parser.should_continue());
    EXPECT_EQ(parser.get_config().log_level, "info");
}

TEST_F(DemoAppTest, VersionFlag) {
    CLIParser parser;
    parse(parser, { "--version" });

    EXPECT_TRUE(parser.should_continue());
    EXPECT_TRUE(parser.should_show_version());
}

TEST_F(DemoAppTest, RejectsInvalidArguments) {
    CLIParser bad_level;
    EXPECT_NE(parse(bad_level, { "--log-level", "verbose" }), 0);
    EXPECT_FALSE(bad_level.should_continue());

    CLIParser missing_icon;
    EXPECT_NE(parse(missing_icon, { "--icon", (dir_ / "missing.ico").string() }), 0);
    EXPECT_FALSE(missing_icon.should_continue());
}

TEST_F(DemoAppTest, HelpExitsCleanly) {
    CLIParser parser;

    EXPECT_EQ(parse(parser, { "--help" }), 0);
    EXPECT_FALSE(parser.should_continue());
    EXPECT_EQ(parser.get_exit_code(), 0);
}

} // namespace
