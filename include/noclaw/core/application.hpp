/*
 * noclaw C++ - Application
 *
 * Command line front end: parses arguments, loads configuration, builds
 * the execution engine and runs one request.
 */
#ifndef noclaw_CORE_APPLICATION_HPP
#define noclaw_CORE_APPLICATION_HPP

#include <noclaw/core/config.hpp>
#include <noclaw/core/engine.hpp>
#include <noclaw/core/types.hpp>
#include <string>
#include <map>

namespace noclaw {

struct AppInfo {
    static constexpr const char* NAME = "noclaw";
    static constexpr const char* VERSION = "0.3.0";
};

void print_usage(const char* prog);
void print_version();

// Exit codes
enum ExitCode {
    EXIT_OK = 0,
    EXIT_STARTUP_FAILURE = 1,
    EXIT_RESULT_ERROR = 2
};

class Application {
public:
    Application();

    // Returns false when the process should exit right away; exit_code()
    // then tells with which status (--help/--version exit 0).
    bool init(int argc, char* argv[]);

    // Execute the request, print the result document, return the exit code
    int run();

    int exit_code() const { return exit_code_; }

    // Request assembled from the command line (exposed for tests)
    const ExecutionContext& context() const { return context_; }

private:
    bool parse_args(int argc, char* argv[]);
    bool read_prompt();
    void setup_logging();

    Config config_;
    ExecutionEngine engine_;
    ExecutionContext context_;

    std::string config_file_;
    bool force_local_;
    bool explain_;
    int exit_code_;
};

} // namespace noclaw

#endif // noclaw_CORE_APPLICATION_HPP
