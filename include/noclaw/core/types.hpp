/*
 * noclaw C++ - Execution types
 *
 * ExecutionContext is what a caller hands to a runner; ExecutionResult is
 * what it always gets back. Errors travel inside the result, never as
 * exceptions.
 */
#ifndef noclaw_CORE_TYPES_HPP
#define noclaw_CORE_TYPES_HPP

#include <noclaw/core/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace noclaw {

// ============================================================================
// Enumerations
// ============================================================================

enum class ModelHint {
    NONE = 0,
    LOW,
    MID,
    HIGH
};

const char* model_hint_to_string(ModelHint hint);

// Accepts "low"/"mid"/"high" and the family names "haiku"/"sonnet"/"opus".
// Returns false for anything else.
bool parse_model_hint(const std::string& name, ModelHint& out);

enum class ErrorKind {
    NONE = 0,
    PATH_REJECTED,          // workspace or mount failed the path policy
    RUNTIME_UNAVAILABLE,    // no isolation runtime (startup only)
    TIMEOUT,                // child exceeded the deadline and was killed
    NON_ZERO_EXIT,          // child finished with a failure status
    MALFORMED_OUTPUT,       // stdout was not a response document
    TASK_FAILED,            // child reported {"success": false}
    EXECUTION_FAILED        // host-side failure before or while launching
};

const char* error_kind_to_string(ErrorKind kind);

// ============================================================================
// Execution Context
// ============================================================================

struct HistoryEntry {
    std::string message;
    std::string response;

    HistoryEntry() {}
    HistoryEntry(const std::string& m, const std::string& r) : message(m), response(r) {}
};

struct ExecutionContext {
    std::string prompt;
    std::string user;
    std::string workspace_path;
    std::vector<HistoryEntry> recent_history;       // oldest first
    std::map<std::string, std::string> extra_context;
    ModelHint model_hint;
    std::string instructions;                       // written to CLAUDE.md when set

    ExecutionContext() : model_hint(ModelHint::NONE) {}

    // Request document mounted at /input.json
    Json to_request() const;
};

// ============================================================================
// Execution Result
// ============================================================================

struct ExecutionResult {
    ErrorKind error_kind;
    std::string response_text;
    std::string model_used;
    int64_t tokens_used;            // -1 when unknown
    Json side_effects;              // array of opaque task records
    std::string error_message;

    // Diagnostics
    std::string raw_output;         // stdout as produced by the sandbox
    std::string stderr_output;
    int exit_code;                  // -1 when the process never completed
    int64_t elapsed_ms;

    ExecutionResult()
        : error_kind(ErrorKind::NONE)
        , tokens_used(-1)
        , side_effects(Json::array())
        , exit_code(-1)
        , elapsed_ms(0) {}

    bool ok() const { return error_kind == ErrorKind::NONE; }
    bool has_tokens_used() const { return tokens_used >= 0; }

    static ExecutionResult success(const std::string& response, const std::string& model = "") {
        ExecutionResult r;
        r.response_text = response;
        r.model_used = model;
        return r;
    }

    static ExecutionResult fail(ErrorKind kind, const std::string& message) {
        ExecutionResult r;
        r.error_kind = kind;
        r.error_message = message;
        return r;
    }

    Json to_json() const;
};

} // namespace noclaw

#endif // noclaw_CORE_TYPES_HPP
