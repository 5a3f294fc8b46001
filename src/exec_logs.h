//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "fmt/core.h"
#include "fmt/format.h"

#define SNIPEXEC_FMT_COMPILE 0

#if SNIPEXEC_FMT_COMPILE
#include "fmt/compile.h"
#define SNIPEXEC_FMT FMT_COMPILE
#else
#define SNIPEXEC_FMT FMT_STRING
#endif

namespace snipexec::jl {

enum class log_level_t : std::int8_t { _debug = 0, _info = 1, _warn = 2, _error = 3, _off = 4 };

inline std::string_view log_level_to_str(log_level_t lv) {
    switch (lv) {
        case log_level_t::_debug: return "debug";
        case log_level_t::_info: return "info";
        case log_level_t::_warn: return "warn";
        case log_level_t::_error: return "error";
        case log_level_t::_off: return "off";
        default: return "undefined";
    }
}

// throws std::invalid_argument on an unknown name
inline log_level_t to_log_level(std::string_view s) {
    if (s == "debug") return log_level_t::_debug;
    if (s == "info") return log_level_t::_info;
    if (s == "warn") return log_level_t::_warn;
    if (s == "error") return log_level_t::_error;
    if (s == "off") return log_level_t::_off;
    throw std::invalid_argument("unknown log level `" + std::string(s) + "`");
}

class FileLock {
  public:
    explicit FileLock(int fd) : fd_(fd) {
        if (flock(fd_, LOCK_EX) == -1) {
            throw std::runtime_error(std::string{"failed to get lock "} + strerror(errno));
        }
    }
    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;
    ~FileLock() { flock(fd_, LOCK_UN); }
    auto get_fd() const -> int { return fd_; }

  private:
    const int fd_;
};

// Log lines go to stderr, stdout belongs to the result message. When a log file is open every
// line is appended to it too, under an exclusive flock so that concurrent runs don't interleave.
class Logger {
  public:
    Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    ~Logger() { close_file(); }

    void set_level(log_level_t lv) {
        const std::lock_guard guard(lock_);
        level_ = lv;
    }
    log_level_t level() const {
        const std::lock_guard guard(lock_);
        return level_;
    }
    bool enabled(log_level_t lv) const { return lv != log_level_t::_off && lv >= level(); }

    void open_file(const std::filesystem::path &file) {
        const std::lock_guard guard(lock_);
        int fd = openat(AT_FDCWD, file.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (fd == -1) {
            throw std::runtime_error("failed to open log file " + file.string() + ": " +
                                     strerror(errno));
        }
        if (log_file_fd_ != -1) ::close(log_file_fd_);
        log_file_fd_ = fd;
    }
    void close_file() {
        const std::lock_guard guard(lock_);
        if (log_file_fd_ != -1) ::close(log_file_fd_);
        log_file_fd_ = -1;
    }

    // Never throws: a line that can't be written is replaced by a short notice on stderr.
    template <typename... Args>
    auto println(log_level_t lv, fmt::format_string<Args...> f, Args &&...args) noexcept -> void {
        try {
            if (!enabled(lv)) return;
            write_line(lv, fmt::format(f, std::forward<Args>(args)...));
        } catch (std::exception &) {
            write_fully(STDERR_FILENO, "[snipexec] error: failed to write a log line\n");
        }
    }

    template <typename... Args>
    auto debug(fmt::format_string<Args...> f, Args &&...args) noexcept -> void {
        println(log_level_t::_debug, f, std::forward<Args>(args)...);
    }
    template <typename... Args>
    auto info(fmt::format_string<Args...> f, Args &&...args) noexcept -> void {
        println(log_level_t::_info, f, std::forward<Args>(args)...);
    }
    template <typename... Args>
    auto warn(fmt::format_string<Args...> f, Args &&...args) noexcept -> void {
        println(log_level_t::_warn, f, std::forward<Args>(args)...);
    }
    template <typename... Args>
    auto error(fmt::format_string<Args...> f, Args &&...args) noexcept -> void {
        println(log_level_t::_error, f, std::forward<Args>(args)...);
    }

  private:
    mutable std::mutex lock_;
    log_level_t level_{log_level_t::_warn};
    int log_file_fd_{-1};

    auto write_line(log_level_t lv, std::string_view msg) -> void {
        std::string line = fmt::format(SNIPEXEC_FMT("[snipexec {}] {}: {}\n"), getpid(),
                                       log_level_to_str(lv), msg);
        const std::lock_guard guard(lock_);
        write_fully(STDERR_FILENO, line);
        if (log_file_fd_ == -1) return;
        FileLock f_lock(log_file_fd_);
        write_fully(log_file_fd_, line);
    }

    // short writes are retried, errors are dropped
    static auto write_fully(int fd, std::string_view s) noexcept -> void {
        while (!s.empty()) {
            ::ssize_t t = ::write(fd, s.data(), s.size());
            if (t == -1 && errno == EINTR) continue;
            if (t <= 0) return;
            s.remove_prefix(static_cast<std::size_t>(t));
        }
    }
};

inline Logger logger;

}  // namespace snipexec::jl
