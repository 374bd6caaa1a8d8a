/*
 * noclaw C++ - Configuration
 *
 * JSON config file with dotted-key access ("sandbox.timeout") and a fixed
 * set of environment overrides kept compatible with existing deployments:
 *
 *   DATA_DIR               -> data_dir
 *   WORKER_IMAGE           -> sandbox.image
 *   CONTAINER_TIMEOUT      -> sandbox.timeout
 *   CONTAINER_MEMORY_LIMIT -> sandbox.memory
 *   CONTAINER_CPU_LIMIT    -> sandbox.cpus
 *   LOG_LEVEL              -> log_level
 */
#ifndef noclaw_CORE_CONFIG_HPP
#define noclaw_CORE_CONFIG_HPP

#include <noclaw/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace noclaw {

class Config {
public:
    Config();

    // Load a JSON object from disk. Returns false (and keeps the current
    // values) if the file is missing, unreadable or not a JSON object.
    bool load_file(const std::string& path);

    // Replace the whole document (used by tests and embedders)
    bool load_string(const std::string& text);

    // Apply the environment overrides listed above
    void apply_env_overrides();

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    double get_double(const std::string& key, double def = 0.0) const;
    std::vector<std::string> get_string_list(const std::string& key,
                                             const std::vector<std::string>& def) const;

    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& data() const { return data_; }

private:
    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);

    Json data_;
};

} // namespace noclaw

#endif // noclaw_CORE_CONFIG_HPP
