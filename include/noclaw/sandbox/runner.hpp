/*
 * noclaw C++ - Runners
 *
 * A Runner executes one ExecutionContext and always returns an
 * ExecutionResult; nothing is thrown out of run(). Two variants exist:
 *
 *   ContainerRunner - validates paths, writes the request file, launches
 *                     the container runtime and interprets its output
 *   LocalRunner     - same validation and interpretation, but calls the
 *                     worker in-process (no isolation)
 *
 * Runners hold only immutable state and may be used from many threads.
 */
#ifndef noclaw_SANDBOX_RUNNER_HPP
#define noclaw_SANDBOX_RUNNER_HPP

#include <noclaw/core/types.hpp>
#include <noclaw/sandbox/command_builder.hpp>
#include <noclaw/sandbox/path_policy.hpp>
#include <noclaw/worker/backend.hpp>
#include <string>
#include <vector>
#include <memory>

namespace noclaw {

class Config;

class Runner {
public:
    virtual ~Runner() {}

    virtual const char* name() const = 0;

    virtual ExecutionResult run(const ExecutionContext& ctx) = 0;
};

// Validate ctx.workspace_path, create it and write CLAUDE.md from
// ctx.instructions. On success `workspace` holds the canonical path.
// Returns a failed result on error, a success otherwise.
ExecutionResult prepare_workspace(const ExecutionContext& ctx, const PathPolicy& policy,
                                  std::string& workspace);

struct ContainerSettings {
    std::string image;
    std::vector<std::string> entrypoint;
    ResourceLimits limits;
    int grace_ms;
    size_t max_output_bytes;
    std::string temp_dir;       // where request files are written

    ContainerSettings()
        : image("noclaw-worker:latest")
        , entrypoint(1, "noclaw-worker")
        , grace_ms(5000)
        , max_output_bytes(8 * 1024 * 1024) {}

    // sandbox.image, sandbox.entrypoint, sandbox.cpus/memory/timeout,
    // sandbox.grace_period_ms, sandbox.max_output_bytes
    static ContainerSettings from_config(const Config& cfg);
};

class ContainerRunner : public Runner {
public:
    ContainerRunner(const PathPolicy& policy,
                    const std::string& runtime,
                    const ContainerSettings& settings,
                    const Credentials& credentials);

    const char* name() const { return "container"; }

    ExecutionResult run(const ExecutionContext& ctx);

    const std::string& runtime() const { return builder_.runtime(); }
    const ContainerSettings& settings() const { return settings_; }

private:
    ExecutionResult run_checked(const ExecutionContext& ctx);
    void remove_container(const SandboxInvocation& inv) const;

    const PathPolicy& policy_;
    ContainerSettings settings_;
    Credentials credentials_;
    CommandBuilder builder_;
};

class LocalRunner : public Runner {
public:
    LocalRunner(const PathPolicy& policy, std::unique_ptr<CompletionBackend> backend);

    const char* name() const { return "local"; }

    ExecutionResult run(const ExecutionContext& ctx);

private:
    ExecutionResult run_checked(const ExecutionContext& ctx);

    const PathPolicy& policy_;
    std::unique_ptr<CompletionBackend> backend_;
};

} // namespace noclaw

#endif // noclaw_SANDBOX_RUNNER_HPP
