/*
 * noclaw C++ - Configuration Implementation
 */
#include <noclaw/core/config.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

#include <cstdlib>

namespace noclaw {

namespace {

struct EnvOverride {
    const char* env;
    const char* key;
    bool numeric;
};

const EnvOverride ENV_OVERRIDES[] = {
    {"DATA_DIR",               "data_dir",       false},
    {"WORKER_IMAGE",           "sandbox.image",  false},
    {"CONTAINER_TIMEOUT",      "sandbox.timeout", true},
    {"CONTAINER_MEMORY_LIMIT", "sandbox.memory", false},
    {"CONTAINER_CPU_LIMIT",    "sandbox.cpus",   false},
    {"LOG_LEVEL",              "log_level",      false},
};

} // anonymous namespace

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::string text;
    if (!read_file(path, text)) {
        LOG_WARN("[Config] Cannot open %s", path.c_str());
        return false;
    }
    if (!load_string(text)) {
        LOG_ERROR("[Config] %s is not a valid JSON object", path.c_str());
        return false;
    }
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }
    data_ = parsed;
    return true;
}

void Config::apply_env_overrides() {
    for (size_t i = 0; i < sizeof(ENV_OVERRIDES) / sizeof(ENV_OVERRIDES[0]); ++i) {
        const EnvOverride& o = ENV_OVERRIDES[i];
        const char* value = getenv(o.env);
        if (!value || value[0] == '\0') {
            continue;
        }
        if (o.numeric) {
            char* end = NULL;
            long long n = strtoll(value, &end, 10);
            if (end == value || *end != '\0') {
                LOG_WARN("[Config] Ignoring %s=%s (not an integer)", o.env, value);
                continue;
            }
            set_int(o.key, n);
        } else {
            set_string(o.key, value);
        }
        LOG_DEBUG("[Config] %s overridden by %s", o.key, o.env);
    }
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(parts[i]);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    const Json* v = find(key);
    return v != nullptr && !v->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (!v) return def;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number_integer()) return std::to_string(v->get<int64_t>());
    if (v->is_number()) return v->dump();
    if (v->is_boolean()) return v->get<bool>() ? "true" : "false";
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (!v) return def;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number()) return static_cast<int64_t>(v->get<double>());
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        char* end = NULL;
        long long n = strtoll(s.c_str(), &end, 10);
        if (end != s.c_str() && *end == '\0') return n;
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (!v) return def;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number_integer()) return v->get<int64_t>() != 0;
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "yes" || s == "1" || s == "on") return true;
        if (s == "false" || s == "no" || s == "0" || s == "off") return false;
    }
    return def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json* v = find(key);
    if (!v) return def;
    if (v->is_number()) return v->get<double>();
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        char* end = NULL;
        double d = strtod(s.c_str(), &end);
        if (end != s.c_str() && *end == '\0') return d;
    }
    return def;
}

std::vector<std::string> Config::get_string_list(const std::string& key,
                                                 const std::vector<std::string>& def) const {
    const Json* v = find(key);
    if (!v || !v->is_array()) return def;
    std::vector<std::string> out;
    for (const auto& item : *v) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

} // namespace noclaw
