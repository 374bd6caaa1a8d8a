#include <noclaw/worker/backend.hpp>
#include <noclaw/sandbox/process.hpp>
#include <noclaw/core/config.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

namespace noclaw {

CommandBackend::CommandBackend(const std::vector<std::string>& command, int timeout_seconds)
    : command_(command)
    , timeout_seconds_(timeout_seconds > MAX_TIMEOUT_SECONDS ? MAX_TIMEOUT_SECONDS : timeout_seconds)
    , system_prompt_flag_("--append-system-prompt")
    , model_flag_("--model")
    , model_low_("haiku")
    , model_mid_("sonnet")
    , model_high_("opus")
{}

std::unique_ptr<CommandBackend> CommandBackend::from_config(const Config& cfg) {
    std::vector<std::string> default_command;
    default_command.push_back("claude");
    default_command.push_back("--print");

    int64_t timeout = cfg.get_int("worker.agent_timeout", 110);
    if (timeout > MAX_TIMEOUT_SECONDS) {
        LOG_WARN("[Backend] worker.agent_timeout %lld is too large, using %ds",
                 static_cast<long long>(timeout), MAX_TIMEOUT_SECONDS);
        timeout = MAX_TIMEOUT_SECONDS;
    }

    std::unique_ptr<CommandBackend> backend(new CommandBackend(
        cfg.get_string_list("worker.agent_command", default_command),
        static_cast<int>(timeout)));

    backend->system_prompt_flag_ = cfg.get_string("worker.system_prompt_flag", backend->system_prompt_flag_);
    backend->model_flag_ = cfg.get_string("worker.model_flag", backend->model_flag_);
    backend->model_low_ = cfg.get_string("worker.models.low", backend->model_low_);
    backend->model_mid_ = cfg.get_string("worker.models.mid", backend->model_mid_);
    backend->model_high_ = cfg.get_string("worker.models.high", backend->model_high_);
    return backend;
}

void CommandBackend::set_model(ModelHint hint, const std::string& model) {
    switch (hint) {
        case ModelHint::LOW: model_low_ = model; break;
        case ModelHint::MID: model_mid_ = model; break;
        case ModelHint::HIGH: model_high_ = model; break;
        default: break;
    }
}

std::string CommandBackend::model_for(ModelHint hint) const {
    switch (hint) {
        case ModelHint::LOW: return model_low_;
        case ModelHint::MID: return model_mid_;
        case ModelHint::HIGH: return model_high_;
        default: return "";
    }
}

std::vector<std::string> CommandBackend::build_argv(const CompletionOptions& opts) const {
    std::vector<std::string> argv = command_;
    if (!system_prompt_flag_.empty() && !opts.system_prompt.empty()) {
        argv.push_back(system_prompt_flag_);
        argv.push_back(opts.system_prompt);
    }
    std::string model = model_for(opts.model_hint);
    if (!model_flag_.empty() && !model.empty()) {
        argv.push_back(model_flag_);
        argv.push_back(model);
    }
    return argv;
}

CompletionResult CommandBackend::complete(const std::string& prompt, const CompletionOptions& opts) {
    if (command_.empty()) {
        return CompletionResult::fail("no agent command configured");
    }

    ProcessOptions popts;
    popts.stdin_data = prompt;
    popts.timeout_ms = timeout_seconds_ > 0 ? timeout_seconds_ * 1000 : 0;

    LOG_DEBUG("[Backend] Running %s (%zu prompt bytes)", command_[0].c_str(), prompt.size());
    ProcessResult proc = run_process(build_argv(opts), popts);

    if (proc.spawn_failed) {
        return CompletionResult::fail("cannot run " + command_[0] + ": " + proc.spawn_error);
    }
    if (proc.timed_out()) {
        return CompletionResult::fail(command_[0] + " timed out after " +
                                      std::to_string(timeout_seconds_) + "s");
    }
    if (proc.exit_code != 0) {
        std::string msg = command_[0] + " exited with code " + std::to_string(proc.exit_code);
        std::string detail = trim(proc.err);
        if (!detail.empty()) {
            msg += ": " + truncate_safe(detail, 500);
        }
        return CompletionResult::fail(msg);
    }

    // The CLI does not report the model it settled on; echo what was asked for
    std::string model = model_for(opts.model_hint);
    return CompletionResult::ok(trim(proc.out), model.empty() ? "auto" : model);
}

} // namespace noclaw
