// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include <sys/types.h>

namespace reel::engine {

enum class ReadStatus : std::uint8_t {
    line,
    timeout,
    eof
};

// Child process in its own process group with stdout and stderr merged
// into one pipe. The destructor kills and reaps a child that is still running.
class Subprocess {
public:
    Subprocess() = default;
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    Subprocess(Subprocess&&) = delete;
    Subprocess& operator=(Subprocess&&) = delete;

    // `program` is looked up on $PATH when it has no slash.
    // Errors: SessionErrc::tool_missing when it does not exist, errno otherwise.
    [[nodiscard]] std::error_code start(const std::filesystem::path& program,
                                        const std::vector<std::string>& args) noexcept;

    // Next output line without its terminator. Returns timeout when no full
    // line arrived within `timeout`; eof once the pipe is closed and drained.
    [[nodiscard]] ReadStatus read_line(std::string& line, std::chrono::milliseconds timeout) noexcept;

    // SIGSTOP / SIGCONT to the whole group
    void suspend() noexcept;
    void resume() noexcept;

    // SIGTERM to the group, SIGKILL after `grace`, then reap
    void terminate(std::chrono::milliseconds grace) noexcept;

    // Blocks until the child exits. Death by signal N reports 128 + N.
    [[nodiscard]] std::expected<int, std::error_code> wait() noexcept;

    [[nodiscard]] bool running() const noexcept { return pid_ > 0; }
    [[nodiscard]] bool suspended() const noexcept { return suspended_; }
    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    void close_pipe() noexcept;
    [[nodiscard]] std::optional<int> reap(bool block) noexcept;

    pid_t pid_{-1};
    int fd_{-1};
    std::string buffer_;
    bool eof_{false};
    bool suspended_{false};
    std::optional<int> exit_code_;
};

} // namespace reel::engine
