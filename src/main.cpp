/*
 * sandforge - Sandboxes for generated code
 *
 * Usage:
 *   ./sandforge [--config config.json] exec "npm --version"
 *   ./sandforge [--config config.json] serve
 */
#include <sandforge/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = sandforge::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        int code = app.is_running() ? 1 : 0;
        app.shutdown();
        return code;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
