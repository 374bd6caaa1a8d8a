#include <noclaw/core/engine.hpp>
#include <noclaw/core/config.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>
#include <noclaw/sandbox/runtime.hpp>
#include <noclaw/worker/backend.hpp>

namespace noclaw {

ExecutionEngine::ExecutionEngine()
    : policy_(new PathPolicy(PathPolicy::from_config(Config())))
{}

bool ExecutionEngine::init(const Config& cfg, bool force_local) {
    runner_.reset();
    runtime_.clear();
    init_error_.clear();

    policy_.reset(new PathPolicy(PathPolicy::from_config(cfg)));
    LOG_INFO("[Engine] Workspace root: %s", policy_->workspace_root().c_str());

    if (!force_local) {
        RuntimeDetector detector = RuntimeDetector::from_config(cfg);
        runtime_ = detector.detect();
    }

    if (!runtime_.empty()) {
        ContainerSettings settings = ContainerSettings::from_config(cfg);
        runner_.reset(new ContainerRunner(*policy_, runtime_, settings,
                                          Credentials::from_environment()));
        LOG_INFO("[Engine] Using %s with image %s (timeout %ds, memory %s, cpus %s)",
                 runtime_.c_str(), settings.image.c_str(), settings.limits.timeout_seconds,
                 settings.limits.memory.c_str(), settings.limits.cpus.c_str());
        return true;
    }

    if (force_local || cfg.get_bool("sandbox.allow_local_fallback", false)) {
        runner_.reset(new LocalRunner(*policy_, CommandBackend::from_config(cfg)));
        LOG_INFO("[Engine] Using local runner%s", force_local ? " (requested)" : " (fallback)");
        return true;
    }

    init_error_ = "no container runtime found (install docker or podman, "
                  "or set sandbox.allow_local_fallback to run without isolation)";
    LOG_ERROR("[Engine] %s: %s", error_kind_to_string(ErrorKind::RUNTIME_UNAVAILABLE),
              init_error_.c_str());
    return false;
}

std::string ExecutionEngine::default_workspace(const std::string& user) const {
    return join_path(policy_->workspace_root(), user);
}

ExecutionResult ExecutionEngine::run(const ExecutionContext& ctx) {
    if (!runner_) {
        return ExecutionResult::fail(ErrorKind::RUNTIME_UNAVAILABLE,
            init_error_.empty() ? "engine not initialized" : init_error_);
    }
    if (ctx.workspace_path.empty() && !ctx.user.empty()) {
        ExecutionContext with_workspace = ctx;
        with_workspace.workspace_path = default_workspace(ctx.user);
        return runner_->run(with_workspace);
    }
    return runner_->run(ctx);
}

std::future<ExecutionResult> ExecutionEngine::run_async(const ExecutionContext& ctx) {
    return std::async(std::launch::async, [this, ctx]() { return run(ctx); });
}

} // namespace noclaw
