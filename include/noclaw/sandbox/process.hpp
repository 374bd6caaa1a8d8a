/*
 * noclaw C++ - Process Runner
 *
 * Spawns a child, feeds stdin, captures stdout/stderr and enforces a
 * wall-clock deadline:
 *
 *   SPAWNED -> RUNNING -> COMPLETED(exit code)
 *                      -> TIMED_OUT: SIGTERM to the process group,
 *                         SIGKILL once the grace period has elapsed
 *
 * A non-zero exit is data, not an error. Every call is self-contained, so
 * any number of calls may run in parallel on different threads.
 */
#ifndef noclaw_SANDBOX_PROCESS_HPP
#define noclaw_SANDBOX_PROCESS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <climits>

namespace noclaw {

enum class ProcessState {
    SPAWNED,
    RUNNING,
    COMPLETED,
    TIMED_OUT
};

const char* process_state_to_string(ProcessState state);

// Largest timeout, in seconds, that still fits ProcessOptions::timeout_ms
const int MAX_TIMEOUT_SECONDS = INT_MAX / 1000;

struct ProcessOptions {
    std::string stdin_data;
    int timeout_ms;                 // <= 0 disables the deadline
    int grace_ms;                   // SIGTERM -> SIGKILL delay
    size_t max_output_bytes;        // per stream; extra bytes are drained and dropped
    std::vector<std::string> env;   // "KEY=VALUE" added to (or replacing in) the inherited environment
    std::string working_dir;

    ProcessOptions()
        : timeout_ms(0)
        , grace_ms(5000)
        , max_output_bytes(8 * 1024 * 1024) {}
};

struct ProcessResult {
    ProcessState state;
    int exit_code;          // exit status, 128+signal if signalled, -1 if never ran
    int term_signal;        // signal that ended the child, 0 if it exited
    std::string out;
    std::string err;
    bool spawn_failed;      // pipe/fork/exec failed; see spawn_error
    std::string spawn_error;
    bool force_killed;      // SIGKILL was needed after the grace period
    bool output_truncated;
    int64_t elapsed_ms;

    ProcessResult()
        : state(ProcessState::SPAWNED)
        , exit_code(-1)
        , term_signal(0)
        , spawn_failed(false)
        , force_killed(false)
        , output_truncated(false)
        , elapsed_ms(0) {}

    bool timed_out() const { return state == ProcessState::TIMED_OUT; }
};

// Run argv[0] (looked up in PATH) with the given arguments.
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& opts);

} // namespace noclaw

#endif // noclaw_SANDBOX_PROCESS_HPP
