/*
 * noclaw C++ - Path Policy Implementation
 */
#include <noclaw/sandbox/path_policy.hpp>
#include <noclaw/core/config.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace noclaw {

const std::vector<std::string>& PathPolicy::default_denied_patterns() {
    static const std::vector<std::string> patterns = {
        ".ssh",           // SSH keys
        ".aws",           // AWS credentials
        ".env",           // Environment files
        ".git/config",    // Git credentials
        "credentials",
        "secrets",
        "node_modules",   // Dependency caches
        ".venv",
        "__pycache__",
    };
    return patterns;
}

PathPolicy::PathPolicy(const std::string& workspace_root,
                       const std::vector<std::string>& denied_patterns)
    : denied_patterns_(denied_patterns)
{
    std::string canonical;
    if (canonicalize(workspace_root, canonical)) {
        workspace_root_ = canonical;
    } else {
        workspace_root_ = absolute_path(workspace_root);
        LOG_WARN("[PathPolicy] Cannot resolve workspace root %s, using it as given",
                 workspace_root_.c_str());
    }
    LOG_INFO("[PathPolicy] workspace_root=%s (%zu denied patterns)",
             workspace_root_.c_str(), denied_patterns_.size());
}

PathPolicy PathPolicy::from_config(const Config& cfg) {
    std::string data_dir = expand_home(cfg.get_string("data_dir", "data"));
    return PathPolicy(join_path(absolute_path(data_dir), "workspaces"),
                      cfg.get_string_list("security.blocked_patterns", default_denied_patterns()));
}

bool PathPolicy::canonicalize(const std::string& path, std::string& out) {
    if (path.empty()) {
        return false;
    }

    std::string absolute = path[0] == '/' ? path : absolute_path(path);
    std::vector<std::string> parts = split(absolute, '/');

    // `current` is always fully resolved up to its first missing component;
    // anything after that is plain names, so ".." can pop them lexically.
    std::string current = "/";
    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string& part = parts[i];
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            size_t slash = current.rfind('/');
            current = slash == 0 ? "/" : current.substr(0, slash);
            continue;
        }

        std::string candidate = join_path(current, part);
        struct stat st;
        if (lstat(candidate.c_str(), &st) != 0) {
            if (errno != ENOENT) {
                // EACCES, ENOTDIR...: fail closed
                return false;
            }
            current = candidate;
            continue;
        }

        // Exists: resolve it so a symlink anywhere in the path is followed
        char resolved[PATH_MAX];
        if (realpath(candidate.c_str(), resolved) == NULL) {
            // dangling or looping symlink
            return false;
        }
        current = resolved;
    }

    out = current;
    return true;
}

std::string PathPolicy::find_denied_pattern(const std::string& path) const {
    for (size_t i = 0; i < denied_patterns_.size(); ++i) {
        if (!denied_patterns_[i].empty() && path.find(denied_patterns_[i]) != std::string::npos) {
            return denied_patterns_[i];
        }
    }
    return "";
}

bool PathPolicy::is_under_root(const std::string& canonical) const {
    if (workspace_root_ == "/") {
        return canonical.size() > 1 && canonical[0] == '/';
    }
    return canonical.size() > workspace_root_.size() + 1 &&
           canonical.compare(0, workspace_root_.size(), workspace_root_) == 0 &&
           canonical[workspace_root_.size()] == '/';
}

bool PathPolicy::validate_workspace(const std::string& path) const {
    std::string canonical;
    if (!canonicalize(path, canonical)) {
        LOG_WARN("[PathPolicy] Workspace rejected: cannot resolve %s (%s)",
                 path.c_str(), strerror(errno));
        return false;
    }

    if (!is_under_root(canonical)) {
        LOG_WARN("[PathPolicy] Workspace rejected: %s is outside the allowed root %s",
                 canonical.c_str(), workspace_root_.c_str());
        return false;
    }

    std::string pattern = find_denied_pattern(canonical);
    if (!pattern.empty()) {
        LOG_WARN("[PathPolicy] Workspace rejected: %s contains blocked pattern '%s'",
                 canonical.c_str(), pattern.c_str());
        return false;
    }

    LOG_DEBUG("[PathPolicy] Workspace validated: %s", canonical.c_str());
    return true;
}

bool PathPolicy::validate_mount(const std::string& path) const {
    std::string canonical;
    if (!canonicalize(path, canonical)) {
        LOG_WARN("[PathPolicy] Mount rejected: cannot resolve %s (%s)",
                 path.c_str(), strerror(errno));
        return false;
    }

    std::string pattern = find_denied_pattern(canonical);
    if (!pattern.empty()) {
        LOG_WARN("[PathPolicy] Mount rejected: %s contains blocked pattern '%s'",
                 canonical.c_str(), pattern.c_str());
        return false;
    }

    struct stat st;
    if (stat(canonical.c_str(), &st) != 0) {
        LOG_WARN("[PathPolicy] Mount rejected: %s does not exist", canonical.c_str());
        return false;
    }

    if (access(canonical.c_str(), R_OK) != 0) {
        LOG_WARN("[PathPolicy] Mount rejected: %s is not readable", canonical.c_str());
        return false;
    }

    LOG_INFO("[PathPolicy] Additional mount validated: %s", canonical.c_str());
    return true;
}

std::string PathPolicy::explain() const {
    std::ostringstream ss;
    ss << "noclaw sandbox security model\n"
       << "\n"
       << "Always mounted:\n"
       << "  " << workspace_root_ << "/<user>  ->  /workspace  (read/write)\n"
       << "  request file                ->  /input.json (read-only)\n"
       << "\n"
       << "Never mounted:\n"
       << "  anything outside " << workspace_root_ << " unless declared below\n"
       << "  other users' workspaces\n"
       << "  paths containing: " << join(denied_patterns_, ", ") << "\n"
       << "\n"
       << "Opt-in mounts (<workspace>/config.json, \"additional_mounts\"):\n"
       << "  each entry must exist, be readable and avoid the patterns above;\n"
       << "  entries are read-only unless \"readonly\": false is given.\n";
    return ss.str();
}

} // namespace noclaw
