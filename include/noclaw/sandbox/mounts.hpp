/*
 * noclaw C++ - Mount Resolution
 *
 * Optional per-workspace mount declaration, <workspace>/config.json:
 *
 *   {
 *     "additional_mounts": [
 *       {"host": "~/projects/myapp", "container": "/projects/myapp", "readonly": true}
 *     ]
 *   }
 *
 * Re-read on every execution. Each entry is validated on its own; a bad
 * entry is dropped with a warning and the others still apply.
 */
#ifndef noclaw_SANDBOX_MOUNTS_HPP
#define noclaw_SANDBOX_MOUNTS_HPP

#include <noclaw/core/json.hpp>
#include <string>
#include <vector>

namespace noclaw {

class PathPolicy;

struct MountSpec {
    std::string host_path;        // absolute
    std::string container_path;   // absolute, inside the sandbox
    bool read_only;

    MountSpec() : read_only(true) {}
    MountSpec(const std::string& h, const std::string& c, bool ro)
        : host_path(h), container_path(c), read_only(ro) {}

    bool operator==(const MountSpec& other) const {
        return host_path == other.host_path &&
               container_path == other.container_path &&
               read_only == other.read_only;
    }
};

// File name of the declaration inside a workspace
extern const char* const MOUNT_DECLARATION_FILE;

// Load and validate <workspace>/config.json. Missing or unreadable file
// yields an empty list.
std::vector<MountSpec> load_mounts(const std::string& workspace, const PathPolicy& policy);

// Paths end up in "-v host:container:mode"; a ':' on either side would
// change the meaning of the flag.
bool is_mount_syntax_safe(const std::string& path);

// Validate an already-parsed "additional_mounts" array
std::vector<MountSpec> resolve_mounts(const Json& declared, const PathPolicy& policy);

} // namespace noclaw

#endif // noclaw_SANDBOX_MOUNTS_HPP
