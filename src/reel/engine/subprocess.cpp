// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/engine/subprocess.hpp>
#include <reel/core/error.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace reel::engine {

namespace {

constexpr std::chrono::milliseconds REAP_POLL{50};

// Owns a posix_spawn attribute/action pair for the duration of one spawn
struct SpawnSetup {
    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    bool actions_ready{false};
    bool attr_ready{false};

    ~SpawnSetup() {
        if (actions_ready) posix_spawn_file_actions_destroy(&actions);
        if (attr_ready) posix_spawnattr_destroy(&attr);
    }
};

} // namespace

Subprocess::~Subprocess() {
    if (pid_ > 0) {
        ::kill(-pid_, SIGCONT);
        ::kill(-pid_, SIGKILL);
        (void)reap(true);
    }
    close_pipe();
}

std::error_code Subprocess::start(const std::filesystem::path& program,
                                  const std::vector<std::string>& args) noexcept {
    if (pid_ > 0) {
        return std::make_error_code(std::errc::device_or_resource_busy);
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return {errno, std::system_category()};
    }

    SpawnSetup setup;
    int rc = posix_spawn_file_actions_init(&setup.actions);
    setup.actions_ready = rc == 0;
    if (rc == 0) rc = posix_spawnattr_init(&setup.attr);
    setup.attr_ready = setup.actions_ready && rc == 0;

    if (rc == 0) rc = posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (rc == 0) rc = posix_spawn_file_actions_adddup2(&setup.actions, fds[1], STDOUT_FILENO);
    if (rc == 0) rc = posix_spawn_file_actions_adddup2(&setup.actions, fds[1], STDERR_FILENO);

    // Own process group so the whole tree (yt-dlp and its ffmpeg) can be signalled
    sigset_t defaults;
    sigset_t empty;
    sigemptyset(&defaults);
    sigemptyset(&empty);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGTERM);
    sigaddset(&defaults, SIGPIPE);
    sigaddset(&defaults, SIGUSR1);
    if (rc == 0) rc = posix_spawnattr_setpgroup(&setup.attr, 0);
    if (rc == 0) rc = posix_spawnattr_setsigdefault(&setup.attr, &defaults);
    if (rc == 0) rc = posix_spawnattr_setsigmask(&setup.attr, &empty);
    if (rc == 0) {
        rc = posix_spawnattr_setflags(&setup.attr,
            POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
    }

    std::vector<std::string> storage;
    std::vector<char*> argv;
    if (rc == 0) {
        try {
            storage.reserve(args.size() + 1);
            storage.push_back(program.string());
            storage.insert(storage.end(), args.begin(), args.end());
            argv.reserve(storage.size() + 1);
            for (auto& arg : storage) {
                argv.push_back(arg.data());
            }
            argv.push_back(nullptr);
        } catch (const std::bad_alloc&) {
            rc = ENOMEM;
        }
    }

    pid_t pid = -1;
    if (rc == 0) {
        rc = posix_spawnp(&pid, argv.front(), &setup.actions, &setup.attr, argv.data(), environ);
    }

    ::close(fds[1]);
    if (rc != 0) {
        ::close(fds[0]);
        if (rc == ENOENT || rc == EACCES) {
            spdlog::error("Cannot run {}: {}", program.string(), std::strerror(rc));
            return core::make_error_code(core::SessionErrc::tool_missing);
        }
        return {rc, std::system_category()};
    }

    pid_ = pid;
    fd_ = fds[0];
    buffer_.clear();
    eof_ = false;
    suspended_ = false;
    exit_code_.reset();
    spdlog::debug("Spawned {} (pid {})", program.string(), pid_);
    return {};
}

ReadStatus Subprocess::read_line(std::string& line, std::chrono::milliseconds timeout) noexcept {
    for (;;) {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            line.assign(buffer_, 0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return ReadStatus::line;
        }

        if (eof_ || fd_ < 0) {
            if (!buffer_.empty()) {
                line = std::move(buffer_);
                buffer_.clear();
                return ReadStatus::line;
            }
            return ReadStatus::eof;
        }

        pollfd pfd{fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready == 0) {
            return ReadStatus::timeout;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                return ReadStatus::timeout;
            }
            eof_ = true;
            continue;
        }

        char chunk[4096];
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof_ = true;
        }
    }
}

void Subprocess::suspend() noexcept {
    if (pid_ > 0 && !suspended_) {
        ::kill(-pid_, SIGSTOP);
        suspended_ = true;
    }
}

void Subprocess::resume() noexcept {
    if (pid_ > 0 && suspended_) {
        ::kill(-pid_, SIGCONT);
        suspended_ = false;
    }
}

void Subprocess::terminate(std::chrono::milliseconds grace) noexcept {
    if (pid_ <= 0) {
        return;
    }

    // A stopped group only acts on SIGTERM once continued
    ::kill(-pid_, SIGCONT);
    ::kill(-pid_, SIGTERM);
    suspended_ = false;

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) {
            spdlog::debug("Child exited after SIGTERM");
            close_pipe();
            return;
        }
        std::this_thread::sleep_for(REAP_POLL);
    }

    spdlog::warn("Child {} ignored SIGTERM, killing", pid_);
    ::kill(-pid_, SIGKILL);
    (void)reap(true);
    close_pipe();
}

std::expected<int, std::error_code> Subprocess::wait() noexcept {
    if (exit_code_) {
        return *exit_code_;
    }
    if (pid_ <= 0) {
        return std::unexpected(std::make_error_code(std::errc::no_child_process));
    }

    auto code = reap(true);
    close_pipe();
    if (!code) {
        return std::unexpected(std::make_error_code(std::errc::no_child_process));
    }
    return *code;
}

void Subprocess::close_pipe() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::optional<int> Subprocess::reap(bool block) noexcept {
    if (pid_ <= 0) {
        return exit_code_;
    }

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == 0) {
        return std::nullopt;
    }
    if (r < 0) {
        spdlog::error("waitpid({}) failed: {}", pid_, std::strerror(errno));
        pid_ = -1;
        return std::nullopt;
    }

    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
    pid_ = -1;
    return exit_code_;
}

} // namespace reel::engine
