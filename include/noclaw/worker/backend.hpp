/*
 * noclaw C++ - Completion backends
 *
 * The worker does not reason on its own; it hands the enhanced prompt to a
 * backend. CommandBackend drives an agent CLI through the process runner:
 *
 *   <agent_command...> [<system_prompt_flag> <system prompt>] [<model_flag> <model>]
 *
 * with the prompt written to stdin and the reply read from stdout.
 *
 * Config:
 *   worker.agent_command      - argv, default ["claude", "--print"]
 *   worker.agent_timeout      - seconds, default 110
 *   worker.system_prompt_flag - default "--append-system-prompt", "" disables
 *   worker.model_flag         - default "--model", "" disables
 *   worker.models.low/mid/high
 */
#ifndef noclaw_WORKER_BACKEND_HPP
#define noclaw_WORKER_BACKEND_HPP

#include <noclaw/core/types.hpp>
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace noclaw {

class Config;

struct CompletionOptions {
    std::string system_prompt;
    ModelHint model_hint;

    CompletionOptions() : model_hint(ModelHint::NONE) {}
};

struct CompletionResult {
    bool success;
    std::string content;
    std::string model;
    int64_t tokens_used;      // -1 when the backend does not report it
    std::string error;

    CompletionResult() : success(false), tokens_used(-1) {}

    static CompletionResult ok(const std::string& content, const std::string& model = "") {
        CompletionResult r;
        r.success = true;
        r.content = content;
        r.model = model;
        return r;
    }

    static CompletionResult fail(const std::string& err) {
        CompletionResult r;
        r.error = err;
        return r;
    }
};

class CompletionBackend {
public:
    virtual ~CompletionBackend() {}

    virtual const char* name() const = 0;

    virtual CompletionResult complete(const std::string& prompt,
                                      const CompletionOptions& opts = CompletionOptions()) = 0;
};

class CommandBackend : public CompletionBackend {
public:
    CommandBackend(const std::vector<std::string>& command, int timeout_seconds);

    static std::unique_ptr<CommandBackend> from_config(const Config& cfg);

    const char* name() const { return "command"; }
    int timeout_seconds() const { return timeout_seconds_; }

    CompletionResult complete(const std::string& prompt,
                              const CompletionOptions& opts = CompletionOptions());

    void set_system_prompt_flag(const std::string& flag) { system_prompt_flag_ = flag; }
    void set_model_flag(const std::string& flag) { model_flag_ = flag; }
    void set_model(ModelHint hint, const std::string& model);

    // Model name for a hint, empty for NONE
    std::string model_for(ModelHint hint) const;

    // Full argv for one call (exposed for tests)
    std::vector<std::string> build_argv(const CompletionOptions& opts) const;

private:
    std::vector<std::string> command_;
    int timeout_seconds_;
    std::string system_prompt_flag_;
    std::string model_flag_;
    std::string model_low_;
    std::string model_mid_;
    std::string model_high_;
};

} // namespace noclaw

#endif // noclaw_WORKER_BACKEND_HPP
