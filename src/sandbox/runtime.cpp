#include <noclaw/sandbox/runtime.hpp>
#include <noclaw/sandbox/process.hpp>
#include <noclaw/core/config.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

namespace noclaw {

const std::vector<std::string>& RuntimeDetector::default_candidates() {
    static const std::vector<std::string> candidates = {"docker", "podman"};
    return candidates;
}

RuntimeDetector::RuntimeDetector(const std::vector<std::string>& candidates, int probe_timeout_ms)
    : candidates_(candidates)
    , probe_timeout_ms_(probe_timeout_ms)
{}

RuntimeDetector RuntimeDetector::from_config(const Config& cfg) {
    return RuntimeDetector(cfg.get_string_list("sandbox.runtimes", default_candidates()));
}

bool RuntimeDetector::probe(const std::string& runtime, int timeout_ms) {
    std::vector<std::string> argv;
    argv.push_back(runtime);
    argv.push_back("--version");

    ProcessOptions opts;
    opts.timeout_ms = timeout_ms;
    opts.grace_ms = 1000;
    opts.max_output_bytes = 64 * 1024;

    ProcessResult proc = run_process(argv, opts);
    if (proc.spawn_failed) {
        LOG_DEBUG("[Runtime] %s not found: %s", runtime.c_str(), proc.spawn_error.c_str());
        return false;
    }
    if (proc.timed_out()) {
        LOG_WARN("[Runtime] %s --version did not answer within %dms", runtime.c_str(), timeout_ms);
        return false;
    }
    if (proc.exit_code != 0) {
        LOG_DEBUG("[Runtime] %s --version exited with code %d", runtime.c_str(), proc.exit_code);
        return false;
    }
    LOG_INFO("[Runtime] Found %s: %s", runtime.c_str(), trim(proc.out).c_str());
    return true;
}

std::string RuntimeDetector::detect() {
    std::call_once(once_, [this]() {
        for (size_t i = 0; i < candidates_.size(); ++i) {
            if (probe(candidates_[i], probe_timeout_ms_)) {
                detected_ = candidates_[i];
                return;
            }
        }
        LOG_WARN("[Runtime] No container runtime available (tried: %s)",
                 join(candidates_, ", ").c_str());
    });
    return detected_;
}

} // namespace noclaw
