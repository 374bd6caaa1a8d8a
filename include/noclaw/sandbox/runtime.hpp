/*
 * noclaw C++ - Runtime Detector
 *
 * Finds a usable container runtime by running "<candidate> --version" for
 * each candidate in order (docker, then podman by default). The answer is
 * computed once per detector and cached.
 */
#ifndef noclaw_SANDBOX_RUNTIME_HPP
#define noclaw_SANDBOX_RUNTIME_HPP

#include <string>
#include <vector>
#include <mutex>

namespace noclaw {

class Config;

class RuntimeDetector {
public:
    explicit RuntimeDetector(const std::vector<std::string>& candidates = default_candidates(),
                             int probe_timeout_ms = 5000);

    // sandbox.runtimes
    static RuntimeDetector from_config(const Config& cfg);

    static const std::vector<std::string>& default_candidates();

    // First candidate that answers, or empty string if none does
    std::string detect();

    // Probe a single runtime, no caching
    static bool probe(const std::string& runtime, int timeout_ms);

    const std::vector<std::string>& candidates() const { return candidates_; }

private:
    std::vector<std::string> candidates_;
    int probe_timeout_ms_;

    std::once_flag once_;
    std::string detected_;
};

} // namespace noclaw

#endif // noclaw_SANDBOX_RUNTIME_HPP
