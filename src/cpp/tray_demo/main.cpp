#include <trayhost_demo/cli_parser.h>
#include <trayhost_demo/demo_app.h>
#include <trayhost/error_types.h>
#include <trayhost/version.h>
#include <iostream>
#include <exception>

int main(int argc, char* argv[]) {
    trayhost_demo::CLIParser parser;

    parser.parse(argc, argv);
    if (!parser.should_continue()) {
        return parser.get_exit_code();
    }

    if (parser.should_show_version()) {
        std::cout << "trayhost-demo version " << TRAYHOST_VERSION_STRING << std::endl;
        return 0;
    }

    try {
        trayhost_demo::DemoApp app(parser.get_config());
        return app.run();
    } catch (const trayhost::TrayException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
