/*
 * noclaw C++ - Worker
 *
 * Task logic that runs inside the sandbox (or in-process for the local
 * runner). Reads a request document, asks the completion backend and
 * produces the response document printed on stdout:
 *
 *   {response, scheduled_tasks, model_used, tokens_used, user, success}
 *
 * Workspace files used:
 *   CLAUDE.md            - system prompt
 *   memory.md            - appended to the system prompt as remembered facts
 *   .noclaw_output.json  - sidecar written with the scheduled tasks
 */
#ifndef noclaw_WORKER_WORKER_HPP
#define noclaw_WORKER_WORKER_HPP

#include <noclaw/core/json.hpp>
#include <noclaw/worker/backend.hpp>
#include <string>

namespace noclaw {

extern const char* const INSTRUCTIONS_FILE;   // "CLAUDE.md"
extern const char* const MEMORY_FILE;         // "memory.md"

class Worker {
public:
    Worker(const std::string& workspace, CompletionBackend& backend);

    // Never throws; failures come back as {"success": false, ...}
    Json run(const Json& request);

    // CLAUDE.md plus memory.md, empty when neither exists
    std::string load_system_prompt() const;

    static std::string enhance_prompt(const std::string& prompt,
                                      const Json& context,
                                      const std::string& user,
                                      const Json& history);

    // "SCHEDULE: <cron> <prompt>" lines and the daily 9am reminder phrasing
    static Json extract_scheduled_tasks(const std::string& response);

    static Json error_document(const std::string& message, const std::string& user);

    const std::string& workspace() const { return workspace_; }

private:
    void write_sidecar(const Json& tasks) const;

    std::string workspace_;
    CompletionBackend& backend_;
};

} // namespace noclaw

#endif // noclaw_WORKER_WORKER_HPP
