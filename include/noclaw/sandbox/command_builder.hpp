/*
 * noclaw C++ - Sandbox Command Builder
 *
 * Produces the exact container runtime invocation for one execution:
 *
 *   <runtime> run --rm --name noclaw-<id>
 *       --memory <mem> --cpus <cpus> --security-opt no-new-privileges
 *       -v <workspace>:/workspace:rw -v <request>:/input.json:ro
 *       [-v <host>:<container>:ro|rw ...]
 *       [-e CLAUDE_CODE_OAUTH_TOKEN=... | -e ANTHROPIC_API_KEY=...]
 *       <image> <entrypoint...>
 *
 * The entrypoint comes from process configuration only; callers cannot
 * supply a command.
 */
#ifndef noclaw_SANDBOX_COMMAND_BUILDER_HPP
#define noclaw_SANDBOX_COMMAND_BUILDER_HPP

#include <noclaw/sandbox/mounts.hpp>
#include <string>
#include <vector>

namespace noclaw {

class Config;

extern const char* const WORKSPACE_MOUNT_POINT;   // "/workspace"
extern const char* const REQUEST_MOUNT_POINT;     // "/input.json"

struct ResourceLimits {
    std::string cpus;       // --cpus, e.g. "1.0"
    std::string memory;     // --memory, e.g. "1g"
    int timeout_seconds;

    ResourceLimits() : cpus("1.0"), memory("1g"), timeout_seconds(120) {}

    static ResourceLimits from_config(const Config& cfg);
};

// Agent credentials forwarded into the sandbox. A session token wins over
// an API key; at most one of them is ever passed.
struct Credentials {
    std::string session_token;    // CLAUDE_CODE_OAUTH_TOKEN
    std::string api_key;          // ANTHROPIC_API_KEY

    static Credentials from_environment();

    // Name/value of the credential to forward. Returns false if none.
    bool select(std::string& name, std::string& value) const;
};

struct SandboxInvocation {
    std::vector<std::string> argv;
    std::string container_name;
    std::vector<std::string> cleanup_argv;    // removes the container after a forced kill

    // argv joined for logs, credential values replaced by "***"
    std::string display() const;

private:
    friend class CommandBuilder;
    std::vector<std::string> secrets_;
};

class CommandBuilder {
public:
    CommandBuilder(const std::string& runtime,
                   const std::string& image,
                   const std::vector<std::string>& entrypoint);

    SandboxInvocation build(const std::string& workspace,
                            const std::vector<MountSpec>& mounts,
                            const ResourceLimits& limits,
                            const Credentials& credentials,
                            const std::string& request_file) const;

    const std::string& runtime() const { return runtime_; }
    const std::string& image() const { return image_; }
    const std::vector<std::string>& entrypoint() const { return entrypoint_; }

private:
    std::string runtime_;
    std::string image_;
    std::vector<std::string> entrypoint_;
};

} // namespace noclaw

#endif // noclaw_SANDBOX_COMMAND_BUILDER_HPP
