/*
 * noclaw-worker - sandbox image entrypoint
 *
 * Reads the request from /input.json (stdin if it is absent), runs the
 * worker against /workspace (NOCLAW_WORKSPACE overrides it) and prints the
 * response document on stdout. Logs go to stderr.
 *
 * Environment:
 *   NOCLAW_WORKSPACE  workspace directory
 *   NOCLAW_CONFIG     optional JSON config with worker.* keys
 *   LOG_LEVEL         debug|info|warn|error
 */
#include <noclaw/worker/worker.hpp>
#include <noclaw/worker/backend.hpp>
#include <noclaw/sandbox/command_builder.hpp>
#include <noclaw/core/config.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

#include <iostream>
#include <sstream>
#include <cstdlib>

using namespace noclaw;

namespace {

bool read_request(std::string& text, std::string& source) {
    if (file_exists(REQUEST_MOUNT_POINT)) {
        source = REQUEST_MOUNT_POINT;
        return read_file(REQUEST_MOUNT_POINT, text);
    }
    source = "stdin";
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    text = ss.str();
    return true;
}

int fail(const std::string& message) {
    LOG_ERROR("[Worker] Worker failed: %s", message.c_str());
    Json doc = Json::object();
    doc["response"] = "Worker error: " + message;
    doc["error"] = message;
    doc["success"] = false;
    std::cout << doc.dump() << std::endl;
    return 1;
}

} // anonymous namespace

int main() {
    Config config;
    const char* config_path = getenv("NOCLAW_CONFIG");
    if (config_path && config_path[0] != '\0' && !config.load_file(config_path)) {
        LOG_WARN("[Worker] Cannot load %s, using defaults", config_path);
    }
    config.apply_env_overrides();

    LogLevel level = LogLevel::INFO;
    if (parse_log_level(config.get_string("log_level", "info"), level)) {
        Logger::instance().set_level(level);
    }

    std::string workspace = WORKSPACE_MOUNT_POINT;
    const char* ws_env = getenv("NOCLAW_WORKSPACE");
    if (ws_env && ws_env[0] != '\0') {
        workspace = ws_env;
    }

    std::string text;
    std::string source;
    if (!read_request(text, source)) {
        return fail("cannot read " + source);
    }
    LOG_INFO("[Worker] Read input from %s", source.c_str());

    Json request = Json::parse(text, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        return fail("request from " + source + " is not a JSON object");
    }

    std::unique_ptr<CommandBackend> backend = CommandBackend::from_config(config);
    Worker worker(workspace, *backend);
    Json response = worker.run(request);

    std::cout << response.dump(2) << std::endl;
    return 0;
}
