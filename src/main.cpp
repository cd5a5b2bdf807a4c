/*
 * warden C++17 - Multi-project security isolation daemon
 *
 * Usage:
 *   ./wardend [--config config.json] [--report]
 *
 * All configuration is read from the JSON config file.
 */
#include <warden/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = warden::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version/--report or fatal errors
        int status = app.is_running() ? 1 : 0;
        app.shutdown();
        return status;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
