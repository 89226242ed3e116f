#include <kmsg_mcp/process/process_runner.hpp>

#include <kmsg_mcp/core/log.hpp>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kmsg_mcp {

namespace {

constexpr std::string_view kComponent = "process";

// Upper bound on a single poll() wait, so the deadline is re-checked often.
constexpr int kPollIntervalMs = 50;

// After SIGKILL, how long to keep draining pipes that a grandchild may still
// hold open before giving up on them.
constexpr std::chrono::milliseconds kKillDrainGrace{200};

using Clock = std::chrono::steady_clock;

std::int64_t ElapsedMs(Clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               Clock::now() - started)
        .count();
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void SetNonBlocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void SetCloseOnExec(int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

// Read everything currently available. Closes `fd` (and sets it to -1) on
// EOF or on a hard read error.
void DrainPipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            CloseFd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        CloseFd(fd);
        return;
    }
}

// Blocking reap that survives signal interruptions.
// The child leads its own process group; killing the group also takes down
// anything it started.
void KillProcessGroup(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

bool ReapChild(pid_t pid, int& status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

std::string StartFailure(int err, const std::string& program) {
    return "[Errno " + std::to_string(err) + "] " + std::strerror(err) +
           ": '" + program + "'";
}

ExecutionResult NotStarted(std::string description, std::int64_t latency_ms) {
    LogWarn(kComponent, "could not start process: " + description);
    ExecutionResult result;
    result.exit_code = kExitNotStarted;
    result.stderr_text = SanitizeUtf8(description);
    result.latency_ms = latency_ms;
    return result;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// PosixProcessRunner::Run
// ---------------------------------------------------------------------------
ExecutionResult PosixProcessRunner::Run(const std::vector<std::string>& argv,
                                        std::chrono::milliseconds timeout) {
    const auto started = Clock::now();
    if (argv.empty() || argv.front().empty()) {
        return NotStarted("empty command line", 0);
    }

    // Build the C argv before forking; the child must not allocate.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // child reports execvp errno here
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe(exec_pipe) != 0) {
        const int saved = errno;
        for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        return NotStarted(StartFailure(saved, argv.front()), ElapsedMs(started));
    }
    SetCloseOnExec(exec_pipe[1]);

    const pid_t pid = fork();
    if (pid < 0) {
        const int saved = errno;
        for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        return NotStarted(StartFailure(saved, argv.front()), ElapsedMs(started));
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        const int dev_null = open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            static_cast<void>(dup2(dev_null, STDIN_FILENO));
            static_cast<void>(close(dev_null));
        }
        static_cast<void>(dup2(out_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(err_pipe[1], STDERR_FILENO));
        static_cast<void>(close(out_pipe[0]));
        static_cast<void>(close(out_pipe[1]));
        static_cast<void>(close(err_pipe[0]));
        static_cast<void>(close(err_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        execvp(c_argv[0], c_argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(kExitNotStarted);
    }

    // Also set from the parent so the group exists before any kill.
    static_cast<void>(setpgid(pid, pid));
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(exec_pipe[1]);

    // EOF means execvp succeeded (close-on-exec); a full int is its errno.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        static_cast<void>(ReapChild(pid, status));
        CloseFd(out_pipe[0]);
        CloseFd(err_pipe[0]);
        return NotStarted(StartFailure(exec_errno, argv.front()),
                          ElapsedMs(started));
    }

    LogDebug(kComponent, "started pid " + std::to_string(pid) + ": " +
                             argv.front() + " (timeout " +
                             std::to_string(timeout.count()) + "ms)");

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    SetNonBlocking(out_fd);
    SetNonBlocking(err_fd);

    std::string raw_out;
    std::string raw_err;
    const auto deadline = started + timeout;
    std::optional<Clock::time_point> drain_deadline;
    bool timed_out = false;
    bool child_exited = false;
    int status = 0;

    while (out_fd >= 0 || err_fd >= 0 || !child_exited) {
        const auto now = Clock::now();
        if (!drain_deadline && now >= deadline) {
            // Descendants may still hold the pipes after the child exits.
            KillProcessGroup(pid);
            if (!child_exited) {
                timed_out = true;
                LogWarn(kComponent, "pid " + std::to_string(pid) +
                                        " exceeded " +
                                        std::to_string(timeout.count()) +
                                        "ms, killed");
            }
            drain_deadline = now + kKillDrainGrace;
        }
        if (drain_deadline && now >= *drain_deadline) {
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_fd >= 0) {
            fds[nfds].fd = out_fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (err_fd >= 0) {
            fds[nfds].fd = err_fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        // With nfds == 0 this is a plain sleep while waiting for the exit.
        static_cast<void>(poll(fds, nfds, kPollIntervalMs));

        DrainPipe(out_fd, raw_out);
        DrainPipe(err_fd, raw_err);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            } else if (waited < 0 && errno != EINTR) {
                child_exited = true;
            }
        }
    }

    CloseFd(out_fd);
    CloseFd(err_fd);
    if (!child_exited) {
        KillProcessGroup(pid);
        static_cast<void>(ReapChild(pid, status));
    }

    ExecutionResult result;
    result.stdout_text = SanitizeUtf8(raw_out);
    result.stderr_text = SanitizeUtf8(raw_err);
    result.timed_out = timed_out;
    if (timed_out) {
        result.exit_code = kExitTimedOut;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    result.latency_ms = ElapsedMs(started);

    LogDebug(kComponent, "pid " + std::to_string(pid) + " finished with exit " +
                             std::to_string(result.exit_code) + " in " +
                             std::to_string(result.latency_ms) + "ms");
    return result;
}

// ---------------------------------------------------------------------------
// SanitizeUtf8
// ---------------------------------------------------------------------------
std::string SanitizeUtf8(std::string_view bytes) {
    constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out.push_back(bytes[i]);
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((lead & 0xE0) == 0xC0) {
            len = 2;
            cp = lead & 0x1F;
            min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
            cp = lead & 0x0F;
            min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
            cp = lead & 0x07;
            min_cp = 0x10000;
        } else {
            out.append(kReplacement);
            ++i;
            continue;
        }

        bool valid = i + len <= bytes.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            const auto cont = static_cast<unsigned char>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cont & 0x3F);
            }
        }
        // Overlong forms, surrogates and values past U+10FFFF are invalid.
        if (valid && (cp < min_cp || cp > 0x10FFFF ||
                      (cp >= 0xD800 && cp <= 0xDFFF))) {
            valid = false;
        }

        if (!valid) {
            out.append(kReplacement);
            ++i;
            continue;
        }
        out.append(bytes.substr(i, len));
        i += len;
    }
    return out;
}

} // namespace kmsg_mcp
