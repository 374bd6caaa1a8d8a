#include <noclaw/core/types.hpp>
#include <noclaw/core/utils.hpp>

namespace noclaw {

const char* model_hint_to_string(ModelHint hint) {
    switch (hint) {
        case ModelHint::LOW: return "low";
        case ModelHint::MID: return "mid";
        case ModelHint::HIGH: return "high";
        default: return "";
    }
}

bool parse_model_hint(const std::string& name, ModelHint& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "low" || lower == "haiku") { out = ModelHint::LOW; return true; }
    if (lower == "mid" || lower == "sonnet") { out = ModelHint::MID; return true; }
    if (lower == "high" || lower == "opus") { out = ModelHint::HIGH; return true; }
    return false;
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::PATH_REJECTED: return "path_rejected";
        case ErrorKind::RUNTIME_UNAVAILABLE: return "runtime_unavailable";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::NON_ZERO_EXIT: return "non_zero_exit";
        case ErrorKind::MALFORMED_OUTPUT: return "malformed_output";
        case ErrorKind::TASK_FAILED: return "task_failed";
        case ErrorKind::EXECUTION_FAILED: return "execution_failed";
        default: return "unknown";
    }
}

Json ExecutionContext::to_request() const {
    Json request = Json::object();
    request["prompt"] = prompt;
    request["user"] = user;

    Json context = Json::object();
    for (const auto& kv : extra_context) {
        context[kv.first] = kv.second;
    }
    request["context"] = context;

    Json history = Json::array();
    for (size_t i = 0; i < recent_history.size(); ++i) {
        Json entry = Json::object();
        entry["message"] = recent_history[i].message;
        entry["response"] = recent_history[i].response;
        history.push_back(entry);
    }
    request["history"] = history;

    if (model_hint != ModelHint::NONE) {
        request["model_hint"] = model_hint_to_string(model_hint);
    }
    return request;
}

Json ExecutionResult::to_json() const {
    Json out = Json::object();
    out["success"] = ok();
    if (ok()) {
        out["response"] = response_text;
        out["model_used"] = model_used;
        out["tokens_used"] = has_tokens_used() ? Json(tokens_used) : Json(nullptr);
        out["side_effects"] = side_effects;
    } else {
        out["error_kind"] = error_kind_to_string(error_kind);
        out["error"] = error_message;
        if (exit_code >= 0) {
            out["exit_code"] = exit_code;
        }
        if (!raw_output.empty()) {
            out["raw_output"] = raw_output;
        }
        if (!stderr_output.empty()) {
            out["stderr"] = stderr_output;
        }
    }
    out["elapsed_ms"] = elapsed_ms;
    return out;
}

} // namespace noclaw
