#include <noclaw/sandbox/command_builder.hpp>
#include <noclaw/sandbox/process.hpp>
#include <noclaw/core/config.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

#include <cstdlib>

namespace noclaw {

const char* const WORKSPACE_MOUNT_POINT = "/workspace";
const char* const REQUEST_MOUNT_POINT = "/input.json";

ResourceLimits ResourceLimits::from_config(const Config& cfg) {
    ResourceLimits limits;
    limits.cpus = cfg.get_string("sandbox.cpus", limits.cpus);
    limits.memory = cfg.get_string("sandbox.memory", limits.memory);
    int64_t timeout = cfg.get_int("sandbox.timeout", limits.timeout_seconds);
    if (timeout <= 0) {
        LOG_WARN("[Sandbox] sandbox.timeout must be positive, using 120s");
        timeout = 120;
    } else if (timeout > MAX_TIMEOUT_SECONDS) {
        LOG_WARN("[Sandbox] sandbox.timeout %lld is too large, using %ds",
                 static_cast<long long>(timeout), MAX_TIMEOUT_SECONDS);
        timeout = MAX_TIMEOUT_SECONDS;
    }
    limits.timeout_seconds = static_cast<int>(timeout);
    return limits;
}

Credentials Credentials::from_environment() {
    Credentials c;
    const char* token = getenv("CLAUDE_CODE_OAUTH_TOKEN");
    const char* key = getenv("ANTHROPIC_API_KEY");
    if (token) c.session_token = token;
    if (key) c.api_key = key;
    return c;
}

bool Credentials::select(std::string& name, std::string& value) const {
    if (!session_token.empty()) {
        name = "CLAUDE_CODE_OAUTH_TOKEN";
        value = session_token;
        return true;
    }
    if (!api_key.empty()) {
        name = "ANTHROPIC_API_KEY";
        value = api_key;
        return true;
    }
    return false;
}

std::string SandboxInvocation::display() const {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        std::string arg = argv[i];
        for (size_t s = 0; s < secrets_.size(); ++s) {
            size_t pos;
            while (!secrets_[s].empty() && (pos = arg.find(secrets_[s])) != std::string::npos) {
                arg.replace(pos, secrets_[s].size(), "***");
            }
        }
        if (i > 0) out += ' ';
        out += arg;
    }
    return out;
}

CommandBuilder::CommandBuilder(const std::string& runtime,
                               const std::string& image,
                               const std::vector<std::string>& entrypoint)
    : runtime_(runtime)
    , image_(image)
    , entrypoint_(entrypoint)
{}

SandboxInvocation CommandBuilder::build(const std::string& workspace,
                                        const std::vector<MountSpec>& mounts,
                                        const ResourceLimits& limits,
                                        const Credentials& credentials,
                                        const std::string& request_file) const {
    SandboxInvocation inv;
    inv.container_name = "noclaw-" + generate_uuid();

    std::vector<std::string>& args = inv.argv;
    args.push_back(runtime_);
    args.push_back("run");
    args.push_back("--rm");
    args.push_back("--name");
    args.push_back(inv.container_name);
    args.push_back("--memory");
    args.push_back(limits.memory);
    args.push_back("--cpus");
    args.push_back(limits.cpus);
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");

    args.push_back("-v");
    args.push_back(workspace + ":" + WORKSPACE_MOUNT_POINT + ":rw");
    args.push_back("-v");
    args.push_back(request_file + ":" + REQUEST_MOUNT_POINT + ":ro");

    for (size_t i = 0; i < mounts.size(); ++i) {
        const char* mode = mounts[i].read_only ? "ro" : "rw";
        args.push_back("-v");
        args.push_back(mounts[i].host_path + ":" + mounts[i].container_path + ":" + mode);
        LOG_INFO("[Sandbox] Additional mount: %s -> %s (%s)",
                 mounts[i].host_path.c_str(), mounts[i].container_path.c_str(), mode);
    }

    std::string cred_name;
    std::string cred_value;
    if (credentials.select(cred_name, cred_value)) {
        args.push_back("-e");
        args.push_back(cred_name + "=" + cred_value);
        inv.secrets_.push_back(cred_value);
    } else {
        LOG_WARN("[Sandbox] No agent credential configured (CLAUDE_CODE_OAUTH_TOKEN / ANTHROPIC_API_KEY)");
    }

    args.push_back(image_);
    args.insert(args.end(), entrypoint_.begin(), entrypoint_.end());

    inv.cleanup_argv.push_back(runtime_);
    inv.cleanup_argv.push_back("rm");
    inv.cleanup_argv.push_back("-f");
    inv.cleanup_argv.push_back(inv.container_name);

    return inv;
}

} // namespace noclaw
