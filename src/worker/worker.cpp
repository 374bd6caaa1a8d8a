#include <noclaw/worker/worker.hpp>
#include <noclaw/sandbox/output.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/types.hpp>
#include <noclaw/core/utils.hpp>

namespace noclaw {

const char* const INSTRUCTIONS_FILE = "CLAUDE.md";
const char* const MEMORY_FILE = "memory.md";

namespace {

std::string string_field(const Json& obj, const char* key, const std::string& def = "") {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return def;
}

// Context values are usually strings; anything else is shown as JSON
std::string context_value(const Json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

} // anonymous namespace

Worker::Worker(const std::string& workspace, CompletionBackend& backend)
    : workspace_(workspace)
    , backend_(backend)
{}

std::string Worker::load_system_prompt() const {
    std::string system_prompt;
    if (read_file(join_path(workspace_, INSTRUCTIONS_FILE), system_prompt)) {
        LOG_INFO("[Worker] Loaded %s", INSTRUCTIONS_FILE);
    }

    std::string memory;
    if (read_file(join_path(workspace_, MEMORY_FILE), memory)) {
        memory = trim(memory);
        if (!memory.empty()) {
            system_prompt += "\n\n## Remembered Facts\n" + memory;
            LOG_INFO("[Worker] Loaded %s", MEMORY_FILE);
        }
    }
    return system_prompt;
}

std::string Worker::enhance_prompt(const std::string& prompt,
                                   const Json& context,
                                   const std::string& user,
                                   const Json& history) {
    std::vector<std::string> parts;

    if (!user.empty() && user != "unknown") {
        parts.push_back("[User: " + user + "]");
    }

    if (history.is_array() && !history.empty()) {
        parts.push_back("Recent conversation:");
        for (const auto& entry : history) {
            parts.push_back("  User: " + string_field(entry, "message"));
            std::string response = string_field(entry, "response");
            if (!response.empty()) {
                parts.push_back("  Assistant: " + truncate_safe(response, 200));
            }
        }
        parts.push_back("");
    }

    parts.push_back(prompt);

    if (context.is_object() && !context.empty()) {
        std::vector<std::string> lines;
        for (auto it = context.begin(); it != context.end(); ++it) {
            lines.push_back(it.key() + ": " + context_value(it.value()));
        }
        parts.push_back("\nContext:\n" + join(lines, "\n"));
    }

    return join(parts, "\n");
}

Json Worker::extract_scheduled_tasks(const std::string& response) {
    static const std::string marker = "SCHEDULE:";
    Json tasks = Json::array();

    std::vector<std::string> lines = split(response, '\n');
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (!starts_with(line, marker)) continue;

        std::string rest = trim(line.substr(marker.size()));
        size_t space = rest.find(' ');
        if (space == std::string::npos) continue;

        std::string cron = rest.substr(0, space);
        std::string prompt = rest.substr(space + 1);
        if (prompt.empty()) continue;

        Json task = Json::object();
        task["cron"] = cron;
        task["prompt"] = prompt;
        task["description"] = truncate_safe(prompt, 50);
        tasks.push_back(task);
    }

    std::string lower = to_lower(response);
    bool asks = lower.find("remind") != std::string::npos ||
                lower.find("schedule") != std::string::npos;
    bool daily = lower.find("daily") != std::string::npos ||
                 lower.find("every day") != std::string::npos;
    bool nine = lower.find("9am") != std::string::npos ||
                lower.find("9 am") != std::string::npos;
    if (asks && daily && nine) {
        Json task = Json::object();
        task["cron"] = "0 9 * * *";
        task["prompt"] = "Daily reminder task";
        task["description"] = "Daily 9am reminder";
        tasks.push_back(task);
    }

    return tasks;
}

Json Worker::error_document(const std::string& message, const std::string& user) {
    Json doc = Json::object();
    doc["response"] = "Error executing request: " + message;
    doc["error"] = message;
    doc["user"] = user;
    doc["success"] = false;
    return doc;
}

void Worker::write_sidecar(const Json& tasks) const {
    Json sidecar = Json::object();
    sidecar["scheduled_tasks"] = tasks;
    std::string path = sidecar_path(workspace_);
    if (!write_file(path, sidecar.dump())) {
        // The stdout document still carries the tasks
        LOG_WARN("[Worker] Cannot write sidecar %s", path.c_str());
    }
}

Json Worker::run(const Json& request) {
    if (!request.is_object()) {
        return error_document("request is not a JSON object", "unknown");
    }

    std::string prompt = string_field(request, "prompt");
    std::string user = string_field(request, "user", "unknown");
    if (user.empty()) user = "unknown";

    Json context = request.contains("context") ? request["context"] : Json::object();
    Json history = request.contains("history") ? request["history"] : Json::array();

    CompletionOptions opts;
    std::string hint = string_field(request, "model_hint");
    if (!hint.empty() && !parse_model_hint(hint, opts.model_hint)) {
        LOG_WARN("[Worker] Ignoring unknown model hint '%s'", hint.c_str());
    }

    LOG_INFO("[Worker] Processing request for user: %s", user.c_str());

    opts.system_prompt = load_system_prompt();
    std::string enhanced = enhance_prompt(prompt, context, user, history);

    CompletionResult completion = backend_.complete(enhanced, opts);
    if (!completion.success) {
        LOG_ERROR("[Worker] Execution failed: %s", completion.error.c_str());
        return error_document(completion.error, user);
    }

    std::string response = completion.content;
    if (response.empty()) {
        response = "No response received from agent";
    }

    Json tasks = extract_scheduled_tasks(response);
    write_sidecar(tasks);

    Json doc = Json::object();
    doc["response"] = response;
    doc["scheduled_tasks"] = tasks;
    doc["model_used"] = completion.model;
    doc["tokens_used"] = completion.tokens_used >= 0 ? Json(completion.tokens_used) : Json(nullptr);
    doc["user"] = user;
    doc["success"] = true;
    return doc;
}

} // namespace noclaw
