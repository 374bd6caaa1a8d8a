/*
 * noclaw C++ - Execution Engine
 *
 * Built once at startup and passed around by reference. init() builds the
 * path policy, detects the container runtime and picks the runner:
 *
 *   runtime found                          -> ContainerRunner
 *   force_local                            -> LocalRunner
 *   no runtime, sandbox.allow_local_fallback -> LocalRunner
 *   no runtime otherwise                   -> init() fails (RUNTIME_UNAVAILABLE)
 *
 * After init() the engine is read-only; run() and run_async() may be called
 * from any number of threads.
 */
#ifndef noclaw_CORE_ENGINE_HPP
#define noclaw_CORE_ENGINE_HPP

#include <noclaw/core/types.hpp>
#include <noclaw/sandbox/path_policy.hpp>
#include <noclaw/sandbox/runner.hpp>
#include <string>
#include <memory>
#include <future>

namespace noclaw {

class Config;

class ExecutionEngine {
public:
    ExecutionEngine();

    bool init(const Config& cfg, bool force_local = false);

    bool is_initialized() const { return runner_ != nullptr; }

    // Runs ctx on the selected runner. An empty workspace_path is replaced
    // by default_workspace(ctx.user).
    ExecutionResult run(const ExecutionContext& ctx);

    // Same as run(), on its own thread
    std::future<ExecutionResult> run_async(const ExecutionContext& ctx);

    // Detected runtime ("docker", "podman", ...), empty for local execution
    const std::string& runtime() const { return runtime_; }
    bool is_sandboxed() const { return !runtime_.empty(); }

    const PathPolicy& policy() const { return *policy_; }

    // <workspace_root>/<user>
    std::string default_workspace(const std::string& user) const;

    // Why init() failed, empty otherwise
    const std::string& init_error() const { return init_error_; }

private:
    ExecutionEngine(const ExecutionEngine&);
    ExecutionEngine& operator=(const ExecutionEngine&);

    std::unique_ptr<PathPolicy> policy_;
    std::unique_ptr<Runner> runner_;
    std::string runtime_;
    std::string init_error_;
};

} // namespace noclaw

#endif // noclaw_CORE_ENGINE_HPP
