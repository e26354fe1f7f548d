#include "exec/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace cmdtrust::exec {

using core::errors::ErrorCategory;
using core::errors::TrustError;

namespace {

constexpr int kPollIntervalMs = 50;
constexpr std::int64_t kKillGraceMs = 1000;

// Keeps the first and last halves of a stream once it outgrows the limit.
class BoundedOutput {
public:
    explicit BoundedOutput(std::size_t limit)
        : head_limit_(limit / 2), tail_limit_(limit - limit / 2), unbounded_(limit == 0) {}

    void append(const char* data, std::size_t size) {
        if (unbounded_ || head_.size() < head_limit_) {
            const std::size_t room = unbounded_ ? size : std::min(size, head_limit_ - head_.size());
            head_.append(data, room);
            data += room;
            size -= room;
        }
        if (size == 0) {
            return;
        }
        tail_.append(data, size);
        if (tail_.size() > 2 * tail_limit_) {
            trim_tail();
        }
    }

    bool truncated() const { return dropped_ > 0 || tail_.size() > tail_limit_; }

    std::string take() {
        trim_tail();
        if (dropped_ == 0) {
            return head_ + tail_;
        }
        return head_ + "\n[... " + std::to_string(dropped_) + " bytes omitted ...]\n" + tail_;
    }

private:
    void trim_tail() {
        if (tail_.size() > tail_limit_) {
            const std::size_t excess = tail_.size() - tail_limit_;
            tail_.erase(0, excess);
            dropped_ += excess;
        }
    }

    std::size_t head_limit_;
    std::size_t tail_limit_;
    bool unbounded_;
    std::string head_;
    std::string tail_;
    std::size_t dropped_ = 0;
};

// Read end of a pipe owned by the parent.
struct PipeReader {
    int fd = -1;
    bool open = false;

    void close_fd() {
        if (fd >= 0) {
            static_cast<void>(close(fd));
        }
        fd = -1;
        open = false;
    }

    // Reads everything currently available without blocking.
    void drain(BoundedOutput& out) {
        if (!open) {
            return;
        }
        char buffer[4096];
        while (true) {
            const ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                out.append(buffer, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            close_fd();
            return;
        }
    }
};

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void kill_group(const pid_t pid) {
    if (kill(-pid, SIGKILL) != 0) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

core::errors::Result<ProcessCapture> ShellProcessRunner::run(
    const ProcessRequest& request) const {
    if (request.command.empty()) {
        return TrustError{ErrorCategory::Input, "Command cannot be empty.",
                          "empty_command"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(request.working_directory, ec) || ec) {
        return TrustError{ErrorCategory::Execution,
                          "Working directory is not a directory: " +
                              request.working_directory.string(),
                          "invalid_working_directory"};
    }

    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        return TrustError{ErrorCategory::Execution, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    LOG_DEBUG("ShellProcessRunner: exec '" + request.command + "' in " +
              request.working_directory.string());

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        return TrustError{ErrorCategory::Execution, "Failed to fork process.",
                          "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(request.working_directory.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(out_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(err_pipe[1], STDERR_FILENO));
        close_pair(out_pipe);
        close_pair(err_pipe);
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        execl("/bin/sh", "sh", "-c", request.command.c_str(),
              static_cast<char*>(nullptr));
        _exit(127);
    }

    // Both sides call setpgid so the group exists before any kill.
    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(out_pipe[1]));
    static_cast<void>(close(err_pipe[1]));

    PipeReader out_reader{out_pipe[0], true};
    PipeReader err_reader{err_pipe[0], true};
    set_nonblocking(out_reader.fd);
    set_nonblocking(err_reader.fd);

    ProcessCapture capture;
    BoundedOutput stdout_buffer(request.max_output_bytes);
    BoundedOutput stderr_buffer(request.max_output_bytes);
    bool child_exited = false;
    bool wait_failed = false;
    bool killed = false;
    std::int64_t killed_at_ms = 0;
    int status = 0;

    while (out_reader.open || err_reader.open || !child_exited) {
        const std::int64_t elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started)
                .count();

        if (!killed && request.cancel_token && request.cancel_token->load()) {
            capture.cancelled = true;
            killed = true;
            killed_at_ms = elapsed;
            kill_group(pid);
        }

        if (!killed && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
            // Also covers a finished shell whose background children keep
            // the pipes open.
            capture.timed_out = !child_exited;
            killed = true;
            killed_at_ms = elapsed;
            kill_group(pid);
        }

        if (killed && elapsed - killed_at_ms > kKillGraceMs) {
            // Something outside the group still holds a pipe.
            out_reader.close_fd();
            err_reader.close_fd();
            if (!child_exited) {
                wait_failed = waitpid(pid, &status, 0) != pid;
                child_exited = true;
            }
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_reader.open) {
            fds[nfds].fd = out_reader.fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (err_reader.open) {
            fds[nfds].fd = err_reader.fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, kPollIntervalMs));
        } else {
            static_cast<void>(usleep(kPollIntervalMs * 1000));
        }

        out_reader.drain(stdout_buffer);
        err_reader.drain(stderr_buffer);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            } else if (waited < 0 && errno != EINTR) {
                child_exited = true;
                wait_failed = true;
            }
        }
    }

    out_reader.close_fd();
    err_reader.close_fd();

    capture.output_truncated = stdout_buffer.truncated() || stderr_buffer.truncated();
    if (capture.output_truncated) {
        LOG_DEBUG("ProcessRunner: output of '" + request.command + "' truncated to " +
                  std::to_string(request.max_output_bytes) + " bytes per stream");
    }
    capture.stdout_text = stdout_buffer.take();
    capture.stderr_text = stderr_buffer.take();
    capture.exit_code = wait_failed ? -1 : decode_status(status);
    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

}  // namespace cmdtrust::exec
