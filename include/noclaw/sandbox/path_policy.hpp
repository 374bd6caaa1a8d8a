/*
 * noclaw C++ - Path Policy
 *
 * Decides which host paths may ever be exposed to a sandbox:
 *
 *   - a workspace must resolve to a directory strictly below the workspace
 *     root (DATA_DIR/workspaces by default);
 *   - no exposed path may contain a denied fragment (.ssh, .aws, .env, ...);
 *   - extra mounts may live anywhere but must exist and be readable.
 *
 * The denied-fragment check is a plain substring match on the canonical
 * path. It catches the common credential locations, it does not catch a
 * parent directory that merely contains them.
 *
 * Immutable after construction; shared by all executions without locking.
 */
#ifndef noclaw_SANDBOX_PATH_POLICY_HPP
#define noclaw_SANDBOX_PATH_POLICY_HPP

#include <string>
#include <vector>

namespace noclaw {

class Config;

class PathPolicy {
public:
    PathPolicy(const std::string& workspace_root,
               const std::vector<std::string>& denied_patterns);

    // data_dir (DATA_DIR, default "data") + "/workspaces",
    // security.blocked_patterns (default: default_denied_patterns())
    static PathPolicy from_config(const Config& cfg);

    static const std::vector<std::string>& default_denied_patterns();

    // True if `path` may be mounted read/write as a user workspace.
    // The path does not need to exist yet; any resolution error rejects.
    bool validate_workspace(const std::string& path) const;

    // True if `path` may be mounted as an additional (opt-in) mount.
    bool validate_mount(const std::string& path) const;

    // Canonical absolute form of `path`: symlinks resolved through the
    // nearest existing ancestor, the missing tail normalized lexically.
    // Returns false if the existing part cannot be resolved.
    static bool canonicalize(const std::string& path, std::string& out);

    // First denied pattern occurring in `path`, or empty string
    std::string find_denied_pattern(const std::string& path) const;

    const std::string& workspace_root() const { return workspace_root_; }
    const std::vector<std::string>& denied_patterns() const { return denied_patterns_; }

    // Human-readable description of the security model
    std::string explain() const;

private:
    bool is_under_root(const std::string& canonical) const;

    std::string workspace_root_;
    std::vector<std::string> denied_patterns_;
};

} // namespace noclaw

#endif // noclaw_SANDBOX_PATH_POLICY_HPP
