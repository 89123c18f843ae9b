/*
 * HiveMem C++ - Shared memory node for agent swarms
 *
 * Usage:
 *   ./hivemem [--config hivemem.json]
 *
 * Serves newline-delimited JSON tool requests on stdin.
 */
#include <hivemem/app/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = hivemem::Application::instance();

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
