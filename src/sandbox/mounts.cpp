#include <noclaw/sandbox/mounts.hpp>
#include <noclaw/sandbox/path_policy.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

namespace noclaw {

const char* const MOUNT_DECLARATION_FILE = "config.json";

bool is_mount_syntax_safe(const std::string& s) {
    return s.find(':') == std::string::npos;
}

std::vector<MountSpec> resolve_mounts(const Json& declared, const PathPolicy& policy) {
    std::vector<MountSpec> mounts;
    if (!declared.is_array()) {
        if (!declared.is_null()) {
            LOG_WARN("[Mounts] additional_mounts must be an array, ignoring");
        }
        return mounts;
    }

    for (size_t i = 0; i < declared.size(); ++i) {
        const Json& entry = declared[i];
        if (!entry.is_object() ||
            !entry.contains("host") || !entry["host"].is_string() ||
            !entry.contains("container") || !entry["container"].is_string()) {
            LOG_WARN("[Mounts] Skipping entry %zu: needs string \"host\" and \"container\"", i);
            continue;
        }

        std::string host = expand_home(entry["host"].get<std::string>());
        std::string container = entry["container"].get<std::string>();

        bool read_only = true;
        if (entry.contains("readonly")) {
            if (entry["readonly"].is_boolean()) {
                read_only = entry["readonly"].get<bool>();
            } else {
                LOG_WARN("[Mounts] Entry %zu: \"readonly\" is not a boolean, mounting read-only", i);
            }
        }

        if (container.empty() || container[0] != '/' || !is_mount_syntax_safe(container)) {
            LOG_WARN("[Mounts] Skipping invalid additional mount: %s (bad container path '%s')",
                     host.c_str(), container.c_str());
            continue;
        }

        if (!policy.validate_mount(host)) {
            LOG_WARN("[Mounts] Skipping invalid additional mount: %s", host.c_str());
            continue;
        }

        std::string host_abs;
        if (!PathPolicy::canonicalize(host, host_abs) || !is_mount_syntax_safe(host_abs)) {
            LOG_WARN("[Mounts] Skipping invalid additional mount: %s (unusable host path)", host.c_str());
            continue;
        }

        mounts.push_back(MountSpec(host_abs, normalize_path(container), read_only));
    }

    return mounts;
}

std::vector<MountSpec> load_mounts(const std::string& workspace, const PathPolicy& policy) {
    std::string config_path = join_path(workspace, MOUNT_DECLARATION_FILE);
    if (!file_exists(config_path)) {
        return std::vector<MountSpec>();
    }

    std::string text;
    if (!read_file(config_path, text)) {
        LOG_ERROR("[Mounts] Cannot read %s", config_path.c_str());
        return std::vector<MountSpec>();
    }

    Json config = Json::parse(text, nullptr, false);
    if (config.is_discarded() || !config.is_object()) {
        LOG_ERROR("[Mounts] Error loading additional mounts from %s: not a JSON object",
                  config_path.c_str());
        return std::vector<MountSpec>();
    }

    if (!config.contains("additional_mounts")) {
        return std::vector<MountSpec>();
    }

    std::vector<MountSpec> mounts = resolve_mounts(config["additional_mounts"], policy);
    if (!mounts.empty()) {
        LOG_INFO("[Mounts] Loaded %zu additional mounts from %s",
                 mounts.size(), config_path.c_str());
    }
    return mounts;
}

} // namespace noclaw
