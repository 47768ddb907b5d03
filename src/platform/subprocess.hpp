#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace platform {

struct ProcessResult {
    int exit_code = -1;      // 128 + signal number if the child was killed
    bool timed_out = false;
    std::string output;      // combined stdout and stderr

    bool ok() const { return !timed_out && exit_code == 0; }
};

struct ProcessOptions {
    // Written to the child's stdin, which is then closed. Without it the
    // child reads from /dev/null.
    std::optional<std::string> input;

    // When false, stdout and stderr go to /dev/null. Tools that fork a
    // long-lived helper (clipboard owners) would otherwise hold the pipe open.
    bool capture_output = true;

    // Zero waits indefinitely. On expiry the child gets SIGKILL.
    std::chrono::milliseconds timeout{0};
};

// Spawn argv[0] (searched for in $PATH) directly, without a shell, and wait
// for it to exit. Fails only if the process could not be started or reaped;
// a non-zero exit status is reported through ProcessResult.
std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, const ProcessOptions& opts = {});

// Timeout argument for poll() while waiting on `deadline`: -1 without one,
// 0 once it has passed, otherwise the milliseconds left, clamped to INT_MAX
// (a far deadline is simply polled again).
int poll_timeout_ms(const std::optional<std::chrono::steady_clock::time_point>& deadline);

} // namespace platform
