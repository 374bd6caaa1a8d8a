#include <noclaw/sandbox/runner.hpp>
#include <noclaw/sandbox/mounts.hpp>
#include <noclaw/sandbox/output.hpp>
#include <noclaw/sandbox/process.hpp>
#include <noclaw/sandbox/scoped_file.hpp>
#include <noclaw/worker/worker.hpp>
#include <noclaw/core/config.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

#include <exception>
#include <utility>

namespace noclaw {

// ============================================================================
// Shared preparation
// ============================================================================

ExecutionResult prepare_workspace(const ExecutionContext& ctx, const PathPolicy& policy,
                                  std::string& workspace) {
    if (ctx.workspace_path.empty()) {
        return ExecutionResult::fail(ErrorKind::PATH_REJECTED, "no workspace given");
    }
    if (!policy.validate_workspace(ctx.workspace_path)) {
        return ExecutionResult::fail(ErrorKind::PATH_REJECTED,
                                     "workspace rejected by path policy: " + ctx.workspace_path);
    }
    if (!PathPolicy::canonicalize(ctx.workspace_path, workspace)) {
        return ExecutionResult::fail(ErrorKind::PATH_REJECTED,
                                     "cannot resolve workspace: " + ctx.workspace_path);
    }
    if (!is_mount_syntax_safe(workspace)) {
        return ExecutionResult::fail(ErrorKind::PATH_REJECTED,
                                     "workspace path contains ':': " + workspace);
    }
    if (!ensure_directory(workspace)) {
        return ExecutionResult::fail(ErrorKind::EXECUTION_FAILED,
                                     "cannot create workspace: " + workspace);
    }

    if (!ctx.instructions.empty()) {
        std::string path = join_path(workspace, INSTRUCTIONS_FILE);
        if (!write_file(path, ctx.instructions)) {
            return ExecutionResult::fail(ErrorKind::EXECUTION_FAILED, "cannot write " + path);
        }
        LOG_DEBUG("[Runner] Wrote %s", path.c_str());
    }

    // A sidecar left over from an earlier run must not leak into this one
    ScopedFile stale(sidecar_path(workspace));
    return ExecutionResult();
}

// ============================================================================
// ContainerRunner
// ============================================================================

ContainerSettings ContainerSettings::from_config(const Config& cfg) {
    ContainerSettings s;
    s.image = cfg.get_string("sandbox.image", s.image);
    s.entrypoint = cfg.get_string_list("sandbox.entrypoint", s.entrypoint);
    s.limits = ResourceLimits::from_config(cfg);
    s.grace_ms = static_cast<int>(cfg.get_int("sandbox.grace_period_ms", s.grace_ms));
    int64_t max_output = cfg.get_int("sandbox.max_output_bytes", static_cast<int64_t>(s.max_output_bytes));
    if (max_output > 0) {
        s.max_output_bytes = static_cast<size_t>(max_output);
    }
    s.temp_dir = cfg.get_string("sandbox.temp_dir", temp_directory());
    return s;
}

ContainerRunner::ContainerRunner(const PathPolicy& policy,
                                 const std::string& runtime,
                                 const ContainerSettings& settings,
                                 const Credentials& credentials)
    : policy_(policy)
    , settings_(settings)
    , credentials_(credentials)
    , builder_(runtime, settings.image, settings.entrypoint)
{
    if (settings_.temp_dir.empty()) {
        settings_.temp_dir = temp_directory();
    }
}

ExecutionResult ContainerRunner::run(const ExecutionContext& ctx) {
    int64_t start = monotonic_ms();
    ExecutionResult result;
    try {
        result = run_checked(ctx);
    } catch (const std::exception& e) {
        LOG_ERROR("[Runner] Execution failed: %s", e.what());
        result = ExecutionResult::fail(ErrorKind::EXECUTION_FAILED, e.what());
    }
    if (result.elapsed_ms == 0) {
        result.elapsed_ms = monotonic_ms() - start;
    }
    return result;
}

ExecutionResult ContainerRunner::run_checked(const ExecutionContext& ctx) {
    LOG_INFO("[Runner] Running in %s for user %s", builder_.runtime().c_str(),
             ctx.user.empty() ? "unknown" : ctx.user.c_str());

    std::string workspace;
    ExecutionResult prepared = prepare_workspace(ctx, policy_, workspace);
    if (!prepared.ok()) {
        LOG_WARN("[Runner] %s", prepared.error_message.c_str());
        return prepared;
    }

    std::string error;
    ScopedFile request = ScopedFile::create_temp(settings_.temp_dir, "noclaw-input-", ".json",
                                                 ctx.to_request().dump(), error);
    if (request.empty()) {
        LOG_ERROR("[Runner] %s", error.c_str());
        return ExecutionResult::fail(ErrorKind::EXECUTION_FAILED, "cannot write request file: " + error);
    }

    // Removed on every path out of this function
    ScopedFile sidecar(sidecar_path(workspace));

    std::vector<MountSpec> mounts = load_mounts(workspace, policy_);
    SandboxInvocation inv = builder_.build(workspace, mounts, settings_.limits,
                                           credentials_, request.path());
    LOG_DEBUG("[Runner] %s", inv.display().c_str());

    ProcessOptions opts;
    opts.timeout_ms = settings_.limits.timeout_seconds * 1000;
    opts.grace_ms = settings_.grace_ms;
    opts.max_output_bytes = settings_.max_output_bytes;

    ProcessResult proc = run_process(inv.argv, opts);

    if (proc.timed_out()) {
        LOG_WARN("[Runner] %s timed out after %ds", inv.container_name.c_str(),
                 settings_.limits.timeout_seconds);
        remove_container(inv);
    }
    if (proc.output_truncated) {
        LOG_WARN("[Runner] Output of %s exceeded %zu bytes and was truncated",
                 inv.container_name.c_str(), settings_.max_output_bytes);
    }

    ExecutionResult result = interpret(proc, workspace);
    if (result.ok()) {
        LOG_INFO("[Runner] %s completed in %lldms", inv.container_name.c_str(),
                 static_cast<long long>(result.elapsed_ms));
    } else {
        LOG_WARN("[Runner] %s failed (%s): %s", inv.container_name.c_str(),
                 error_kind_to_string(result.error_kind), result.error_message.c_str());
    }
    return result;
}

void ContainerRunner::remove_container(const SandboxInvocation& inv) const {
    ProcessOptions opts;
    opts.timeout_ms = 10000;
    opts.grace_ms = 1000;

    ProcessResult proc = run_process(inv.cleanup_argv, opts);
    if (proc.spawn_failed || proc.timed_out() || proc.exit_code != 0) {
        LOG_WARN("[Runner] Could not remove container %s: %s", inv.container_name.c_str(),
                 proc.spawn_failed ? proc.spawn_error.c_str() : trim(proc.err).c_str());
    } else {
        LOG_INFO("[Runner] Removed container %s", inv.container_name.c_str());
    }
}

// ============================================================================
// LocalRunner
// ============================================================================

LocalRunner::LocalRunner(const PathPolicy& policy, std::unique_ptr<CompletionBackend> backend)
    : policy_(policy)
    , backend_(std::move(backend))
{
    LOG_WARN("[Runner] Local execution enabled: tasks run WITHOUT isolation");
}

ExecutionResult LocalRunner::run(const ExecutionContext& ctx) {
    int64_t start = monotonic_ms();
    ExecutionResult result;
    try {
        result = run_checked(ctx);
    } catch (const std::exception& e) {
        LOG_ERROR("[Runner] Local execution failed: %s", e.what());
        result = ExecutionResult::fail(ErrorKind::EXECUTION_FAILED, e.what());
    }
    result.elapsed_ms = monotonic_ms() - start;
    return result;
}

ExecutionResult LocalRunner::run_checked(const ExecutionContext& ctx) {
    LOG_INFO("[Runner] Running locally for user %s", ctx.user.empty() ? "unknown" : ctx.user.c_str());

    std::string workspace;
    ExecutionResult prepared = prepare_workspace(ctx, policy_, workspace);
    if (!prepared.ok()) {
        LOG_WARN("[Runner] %s", prepared.error_message.c_str());
        return prepared;
    }

    ScopedFile sidecar(sidecar_path(workspace));

    Worker worker(workspace, *backend_);
    Json doc = worker.run(ctx.to_request());
    return interpret_document(doc, doc.dump(), workspace);
}

} // namespace noclaw
