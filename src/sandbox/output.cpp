#include <noclaw/sandbox/output.hpp>
#include <noclaw/sandbox/scoped_file.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

namespace noclaw {

const char* const SIDECAR_FILE = ".noclaw_output.json";

namespace {

// Append entries of `tasks` not already present in `into`
void merge_tasks(Json& into, const Json& tasks) {
    if (!tasks.is_array()) return;
    for (const auto& task : tasks) {
        bool seen = false;
        for (const auto& existing : into) {
            if (existing == task) { seen = true; break; }
        }
        if (!seen) into.push_back(task);
    }
}

std::string preview(const std::string& s) {
    return truncate_safe(s, 200);
}

} // anonymous namespace

std::string sidecar_path(const std::string& workspace) {
    return join_path(workspace, SIDECAR_FILE);
}

Json consume_sidecar(const std::string& workspace) {
    ScopedFile guard(sidecar_path(workspace));
    Json tasks;

    std::string text;
    if (!read_file(guard.path(), text)) {
        return tasks;
    }

    Json doc = Json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        LOG_WARN("[Output] Sidecar %s is unreadable, ignoring it", guard.path().c_str());
        return tasks;
    }
    if (doc.contains("scheduled_tasks")) {
        if (doc["scheduled_tasks"].is_array()) {
            tasks = doc["scheduled_tasks"];
        } else {
            LOG_WARN("[Output] Sidecar scheduled_tasks is not an array, ignoring it");
        }
    }
    if (tasks.is_array()) {
        LOG_DEBUG("[Output] Sidecar carried %zu scheduled task(s)", tasks.size());
    }
    return tasks;
}

ExecutionResult interpret_document(const Json& doc, const std::string& raw,
                                   const std::string& workspace) {
    // Whatever happens below, the sidecar must not survive this call
    Json sidecar_tasks = consume_sidecar(workspace);

    if (!doc.is_object() || !doc.contains("response") || !doc["response"].is_string()) {
        LOG_WARN("[Output] Malformed output: %s", preview(raw).c_str());
        ExecutionResult r = ExecutionResult::fail(ErrorKind::MALFORMED_OUTPUT,
            "sandbox output is not a JSON object with a string \"response\"");
        r.raw_output = raw;
        return r;
    }

    if (doc.contains("success") && doc["success"].is_boolean() && !doc["success"].get<bool>()) {
        std::string message;
        if (doc.contains("error") && doc["error"].is_string()) {
            message = doc["error"].get<std::string>();
        } else {
            message = doc["response"].get<std::string>();
        }
        LOG_WARN("[Output] Task reported failure: %s", preview(message).c_str());
        ExecutionResult r = ExecutionResult::fail(ErrorKind::TASK_FAILED, message);
        r.raw_output = raw;
        return r;
    }

    ExecutionResult r = ExecutionResult::success(doc["response"].get<std::string>());
    if (doc.contains("model_used") && doc["model_used"].is_string()) {
        r.model_used = doc["model_used"].get<std::string>();
    }
    if (doc.contains("tokens_used") && doc["tokens_used"].is_number_integer()) {
        int64_t tokens = doc["tokens_used"].get<int64_t>();
        if (tokens >= 0) r.tokens_used = tokens;
    }
    // A task list in the sidecar supersedes the one on stdout
    if (sidecar_tasks.is_array()) {
        merge_tasks(r.side_effects, sidecar_tasks);
    } else if (doc.contains("scheduled_tasks")) {
        merge_tasks(r.side_effects, doc["scheduled_tasks"]);
    }
    r.raw_output = raw;
    return r;
}

ExecutionResult interpret(const ProcessResult& proc, const std::string& workspace) {
    ExecutionResult r;

    if (proc.timed_out()) {
        consume_sidecar(workspace);
        r = ExecutionResult::fail(ErrorKind::TIMEOUT,
            proc.force_killed ? "execution timed out (killed after grace period)"
                              : "execution timed out");
        r.stderr_output = proc.err;
    } else if (proc.spawn_failed) {
        consume_sidecar(workspace);
        r = ExecutionResult::fail(ErrorKind::EXECUTION_FAILED,
                                  "cannot launch sandbox: " + proc.spawn_error);
    } else if (proc.exit_code != 0) {
        consume_sidecar(workspace);
        std::string message = "sandbox exited with code " + std::to_string(proc.exit_code);
        std::string tail = trim(proc.err);
        if (!tail.empty()) {
            message += ": " + preview(tail);
        }
        r = ExecutionResult::fail(ErrorKind::NON_ZERO_EXIT, message);
        r.raw_output = proc.out;
        r.stderr_output = proc.err;
        r.exit_code = proc.exit_code;
    } else {
        Json doc = Json::parse(proc.out, nullptr, false);
        if (doc.is_discarded()) {
            doc = Json();
        }
        r = interpret_document(doc, proc.out, workspace);
        r.stderr_output = proc.err;
        r.exit_code = proc.exit_code;
    }

    r.elapsed_ms = proc.elapsed_ms;
    return r;
}

} // namespace noclaw
