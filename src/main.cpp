/*
 * dailies C++17 - gptel org-mode conversation converter
 *
 * Usage:
 *   ./dailies-org [--config config.json] <parse|build|import> [args]
 *
 * Settings not given in config.json fall back to built-in defaults.
 */
#include <dailies/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = dailies::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
