/*
 * noclaw C++ - Process Runner Implementation
 *
 * fork/exec with non-blocking pipes and a poll() loop. The child is placed
 * in its own process group so termination reaches anything it spawned.
 */
#include <noclaw/sandbox/process.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace noclaw {

namespace {

const int POLL_SLICE_MS = 50;

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() {
        // Writing to a child that closed stdin must yield EPIPE, not kill us
        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_IGN;
        sigaction(SIGPIPE, &sa, NULL);
    });
}

void set_nonblocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Drain what is available. Bytes past `limit` are read and dropped.
void read_available(int& fd, std::string& out, size_t limit, bool& truncated) {
    char buf[4096];
    while (fd >= 0) {
        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            const size_t count = static_cast<size_t>(n);
            if (out.size() < limit) {
                const size_t room = limit - out.size();
                out.append(buf, count <= room ? count : room);
                if (count > room) truncated = true;
            } else {
                truncated = true;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);  // EOF or hard error
    }
}

void write_available(int& fd, const std::string& data, size_t& offset) {
    while (fd >= 0 && offset < data.size()) {
        const ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);  // EPIPE: child stopped reading
        return;
    }
    if (offset >= data.size()) {
        close_fd(fd);
    }
}

std::vector<std::string> build_environment(const std::vector<std::string>& extra) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        bool replaced = false;
        for (size_t i = 0; i < extra.size(); ++i) {
            if (extra[i].compare(0, key.size() + 1, key + "=") == 0) {
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            env.push_back(entry);
        }
    }
    env.insert(env.end(), extra.begin(), extra.end());
    return env;
}

void signal_group(pid_t pid, int sig) {
    if (kill(-pid, sig) != 0) {
        (void)kill(pid, sig);
    }
}

} // anonymous namespace

const char* process_state_to_string(ProcessState state) {
    switch (state) {
        case ProcessState::SPAWNED: return "spawned";
        case ProcessState::RUNNING: return "running";
        case ProcessState::COMPLETED: return "completed";
        case ProcessState::TIMED_OUT: return "timed_out";
        default: return "unknown";
    }
}

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& opts) {
    ProcessResult result;
    if (argv.empty()) {
        result.spawn_failed = true;
        result.spawn_error = "empty command";
        return result;
    }

    ignore_sigpipe_once();

    // Everything the child needs is prepared before fork(): after fork only
    // async-signal-safe calls are allowed.
    std::vector<char*> c_argv;
    for (size_t i = 0; i < argv.size(); ++i) {
        c_argv.push_back(const_cast<char*>(argv[i].c_str()));
    }
    c_argv.push_back(NULL);

    std::vector<std::string> env = build_environment(opts.env);
    std::vector<char*> c_env;
    for (size_t i = 0; i < env.size(); ++i) {
        c_env.push_back(const_cast<char*>(env[i].c_str()));
    }
    c_env.push_back(NULL);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // child reports exec errno here

    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.spawn_failed = true;
        result.spawn_error = std::string("pipe failed: ") + strerror(errno);
        int* fds[] = {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1],
                      &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]};
        for (size_t i = 0; i < 8; ++i) close_fd(*fds[i]);
        LOG_ERROR("[Process] %s", result.spawn_error.c_str());
        return result;
    }

    const int64_t start = monotonic_ms();
    const pid_t pid = fork();
    if (pid < 0) {
        result.spawn_failed = true;
        result.spawn_error = std::string("fork failed: ") + strerror(errno);
        int* fds[] = {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1],
                      &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]};
        for (size_t i = 0; i < 8; ++i) close_fd(*fds[i]);
        LOG_ERROR("[Process] %s", result.spawn_error.c_str());
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);

        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &sa, NULL);

        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        if (!opts.working_dir.empty() && chdir(opts.working_dir.c_str()) != 0) {
            int e = errno;
            (void)!write(exec_pipe[1], &e, sizeof(e));
            _exit(127);
        }

        execvpe(c_argv[0], c_argv.data(), c_env.data());
        int e = errno;
        (void)!write(exec_pipe[1], &e, sizeof(e));
        _exit(127);
    }

    setpgid(pid, pid);
    result.state = ProcessState::RUNNING;

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe closes on successful exec (CLOEXEC) or carries errno
    {
        int child_errno = 0;
        ssize_t n;
        do {
            n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close_fd(exec_pipe[0]);
        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            result.spawn_failed = true;
            result.spawn_error = "cannot execute " + argv[0] + ": " + strerror(child_errno);
        }
    }

    int stdin_fd = in_pipe[1];
    int stdout_fd = out_pipe[0];
    int stderr_fd = err_pipe[0];
    set_nonblocking(stdin_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    size_t stdin_offset = 0;
    if (opts.stdin_data.empty()) {
        close_fd(stdin_fd);
    }

    const int64_t deadline = opts.timeout_ms > 0 ? start + opts.timeout_ms : 0;
    int64_t kill_deadline = 0;
    bool reaped = false;
    int status = 0;

    while (true) {
        if (!reaped) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                reaped = true;
            } else if (w < 0 && errno != EINTR) {
                LOG_ERROR("[Process] waitpid(%d) failed: %s", static_cast<int>(pid), strerror(errno));
                reaped = true;
                status = -1;
            }
        }

        if (reaped) {
            // Child is gone: collect what is still buffered, then stop even
            // if a grandchild keeps the pipes open.
            read_available(stdout_fd, result.out, opts.max_output_bytes, result.output_truncated);
            read_available(stderr_fd, result.err, opts.max_output_bytes, result.output_truncated);
            break;
        }

        const int64_t now = monotonic_ms();
        if (result.state == ProcessState::RUNNING && deadline > 0 && now >= deadline) {
            result.state = ProcessState::TIMED_OUT;
            kill_deadline = now + (opts.grace_ms > 0 ? opts.grace_ms : 0);
            LOG_WARN("[Process] %s exceeded %d ms, sending SIGTERM (grace %d ms)",
                     argv[0].c_str(), opts.timeout_ms, opts.grace_ms);
            signal_group(pid, SIGTERM);
            close_fd(stdin_fd);
        }
        if (result.state == ProcessState::TIMED_OUT && !result.force_killed && now >= kill_deadline) {
            LOG_WARN("[Process] %s still alive after grace period, sending SIGKILL", argv[0].c_str());
            signal_group(pid, SIGKILL);
            result.force_killed = true;
        }

        int wait_ms = POLL_SLICE_MS;
        if (result.state == ProcessState::RUNNING && deadline > 0) {
            int64_t left = deadline - now;
            if (left < wait_ms) wait_ms = static_cast<int>(left > 0 ? left : 0);
        } else if (result.state == ProcessState::TIMED_OUT && !result.force_killed) {
            int64_t left = kill_deadline - now;
            if (left < wait_ms) wait_ms = static_cast<int>(left > 0 ? left : 0);
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (stdout_fd >= 0) { fds[nfds].fd = stdout_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; ++nfds; }
        if (stderr_fd >= 0) { fds[nfds].fd = stderr_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; ++nfds; }
        if (stdin_fd >= 0)  { fds[nfds].fd = stdin_fd;  fds[nfds].events = POLLOUT; fds[nfds].revents = 0; ++nfds; }
        (void)poll(nfds > 0 ? fds : NULL, nfds, wait_ms);

        read_available(stdout_fd, result.out, opts.max_output_bytes, result.output_truncated);
        read_available(stderr_fd, result.err, opts.max_output_bytes, result.output_truncated);
        write_available(stdin_fd, opts.stdin_data, stdin_offset);
    }

    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);

    result.elapsed_ms = monotonic_ms() - start;
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (status != -1 && WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    if (result.state == ProcessState::RUNNING) {
        result.state = ProcessState::COMPLETED;
    }

    if (result.spawn_failed) {
        LOG_ERROR("[Process] %s", result.spawn_error.c_str());
    }
    LOG_INFO("[Process] %s finished after %.2fs with exit code %d (%s)",
             argv[0].c_str(), static_cast<double>(result.elapsed_ms) / 1000.0,
             result.exit_code, process_state_to_string(result.state));
    if (result.output_truncated) {
        LOG_WARN("[Process] Output of %s truncated at %zu bytes per stream",
                 argv[0].c_str(), opts.max_output_bytes);
    }

    return result;
}

} // namespace noclaw
