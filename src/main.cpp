/*
 * noclaw C++ - Sandboxed task execution
 *
 * Runs one agent request inside a docker/podman container and prints the
 * result document.
 *
 * Usage:
 *   ./noclaw --user alice --prompt "What is 2+2?"
 *   echo "What is 2+2?" | ./noclaw --config noclaw.json --user alice
 */
#include <noclaw/core/application.hpp>

int main(int argc, char* argv[]) {
    noclaw::Application app;

    if (!app.init(argc, argv)) {
        // --help/--version or a startup failure
        return app.exit_code();
    }

    return app.run();
}
