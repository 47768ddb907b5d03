#include "platform/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <limits>
#include <poll.h>
#include <pthread.h>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

using Clock = std::chrono::steady_clock;

class Pipe {
public:
    Pipe() = default;
    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool open() { return ::pipe2(fds_, O_CLOEXEC) == 0; }

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    void close_read() { close_fd(fds_[0]); }
    void close_write() { close_fd(fds_[1]); }

private:
    static void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    int fds_[2] = {-1, -1};
};

// Blocks SIGPIPE on the calling thread so a child that exits without reading
// its input turns our write() into EPIPE instead of terminating the process.
class SigpipeBlock {
public:
    SigpipeBlock() {
        sigemptyset(&set_);
        sigaddset(&set_, SIGPIPE);
        ::pthread_sigmask(SIG_BLOCK, &set_, &old_);
    }

    ~SigpipeBlock() {
        // Discard a SIGPIPE raised while blocked before the old mask returns.
        timespec zero{};
        while (::sigtimedwait(&set_, nullptr, &zero) > 0) {}
        ::pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }

    SigpipeBlock(const SigpipeBlock&) = delete;
    SigpipeBlock& operator=(const SigpipeBlock&) = delete;

private:
    sigset_t set_{};
    sigset_t old_{};
};

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void kill_and_reap(pid_t pid) {
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
}


void redirect_to_dev_null(int target, int flags) {
    int fd = ::open("/dev/null", flags);
    if (fd < 0) return;
    ::dup2(fd, target);
    ::close(fd);
}

} // namespace

int poll_timeout_ms(const std::optional<std::chrono::steady_clock::time_point>& deadline) {
    if (!deadline) return -1;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
    if (left <= 0) return 0;
    return static_cast<int>(std::min<decltype(left)>(left, std::numeric_limits<int>::max()));
}

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, const ProcessOptions& opts) {
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected("empty command");
    }

    Pipe in, out, exec_err;
    if ((opts.input && !in.open()) || (opts.capture_output && !out.open()) || !exec_err.open()) {
        return std::unexpected(std::string("pipe2() failed: ") + std::strerror(errno));
    }

    // Built before fork(); the child must not allocate.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        if (opts.input) {
            ::dup2(in.read_end(), STDIN_FILENO);
        } else {
            redirect_to_dev_null(STDIN_FILENO, O_RDONLY);
        }
        if (opts.capture_output) {
            ::dup2(out.write_end(), STDOUT_FILENO);
            ::dup2(out.write_end(), STDERR_FILENO);
        } else {
            redirect_to_dev_null(STDOUT_FILENO, O_WRONLY);
            redirect_to_dev_null(STDERR_FILENO, O_WRONLY);
        }
        ::execvp(cargv[0], cargv.data());
        // exec_err is close-on-exec, so the parent only reads this on failure.
        int err = errno;
        [[maybe_unused]] auto n = ::write(exec_err.write_end(), &err, sizeof(err));
        ::_exit(127);
    }

    in.close_read();
    out.close_write();
    exec_err.close_write();

    int exec_errno = 0;
    ssize_t n;
    while ((n = ::read(exec_err.read_end(), &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {}
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        return std::unexpected(std::format("failed to start {}: {}", argv.front(), std::strerror(exec_errno)));
    }

    SigpipeBlock sigpipe_block;

    std::optional<Clock::time_point> deadline;
    if (opts.timeout.count() > 0) {
        deadline = Clock::now() + opts.timeout;
    }

    ProcessResult result;
    std::string_view pending = opts.input ? std::string_view(*opts.input) : std::string_view{};
    if (opts.input) {
        ::fcntl(in.write_end(), F_SETFL, ::fcntl(in.write_end(), F_GETFL) | O_NONBLOCK);
        if (pending.empty()) in.close_write();
    }

    char buf[4096];
    while (in.write_end() >= 0 || out.read_end() >= 0) {
        pollfd fds[2];
        nfds_t nfds = 0;
        int out_idx = -1;
        int in_idx = -1;
        if (out.read_end() >= 0) {
            out_idx = static_cast<int>(nfds);
            fds[nfds++] = {out.read_end(), POLLIN, 0};
        }
        if (in.write_end() >= 0) {
            in_idx = static_cast<int>(nfds);
            fds[nfds++] = {in.write_end(), POLLOUT, 0};
        }

        int wait_ms = poll_timeout_ms(deadline);
        if (wait_ms == 0) {
            result.timed_out = true;
            break;
        }

        int rc = ::poll(fds, nfds, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            kill_and_reap(pid);
            return std::unexpected(std::string("poll() failed: ") + std::strerror(err));
        }
        if (rc == 0) continue;

        if (in_idx >= 0 && fds[in_idx].revents != 0) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                in.close_write();
            } else {
                ssize_t written = ::write(in.write_end(), pending.data(), pending.size());
                if (written >= 0) {
                    pending.remove_prefix(static_cast<size_t>(written));
                    if (pending.empty()) in.close_write();
                } else if (errno == EPIPE) {
                    in.close_write();
                } else if (errno != EINTR && errno != EAGAIN) {
                    int err = errno;
                    kill_and_reap(pid);
                    return std::unexpected(std::string("write() failed: ") + std::strerror(err));
                }
            }
        }

        if (out_idx >= 0 && fds[out_idx].revents != 0) {
            ssize_t got = ::read(out.read_end(), buf, sizeof(buf));
            if (got > 0) {
                result.output.append(buf, static_cast<size_t>(got));
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                out.close_read();
            }
        }
    }

    if (result.timed_out) {
        kill_and_reap(pid);
        return result;
    }

    int status = 0;
    while (true) {
        pid_t waited = deadline ? ::waitpid(pid, &status, WNOHANG) : ::waitpid(pid, &status, 0);
        if (waited == pid) break;
        if (waited < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
        }
        // Still running with a deadline pending.
        if (poll_timeout_ms(deadline) == 0) {
            result.timed_out = true;
            kill_and_reap(pid);
            return result;
        }
        ::poll(nullptr, 0, 10);
    }

    result.exit_code = decode_status(status);
    return result;
}

} // namespace platform
