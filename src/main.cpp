/*
 * ScriptCell C++ - Sandboxed Python Script Execution
 *
 * Usage:
 *   ./scriptcell [--config config.json] -c 'print("hello")'
 *   ./scriptcell --file script.py
 *   ./scriptcell --serve < requests.ndjson
 */
#include <scriptcell/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = scriptcell::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
