//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "config.h"  // IWYU pragma: export
#include "exec_config.h"
#include "multiprocess.h"

#ifndef __linux__
#error "only linux is supported"
#endif

#ifndef __GNUC__
#error "unsupported compiler"
#endif

namespace snipexec {

namespace mpc = multiproc;
namespace fs = std::filesystem;

enum class outcome_t : std::int8_t { _completed = 0, _timed_out = 1, _failed = 2 };

enum class exec_state_t : std::int8_t {
    _created,
    _running,
    _completed,
    _timed_out,
    _failed,
    _cleaned_up
};

std::string outcome_to_str(outcome_t oc);
std::string state_to_str(exec_state_t st);

// milliseconds
using tm_usage_t = double;

constexpr int _no_exit_code = -1;

struct exec_result_t {
    bool success = false;
    std::string out_data, err_data;
    int exit_code = _no_exit_code;
    tm_usage_t execution_time = 0;
    outcome_t outcome = outcome_t::_failed;

    static exec_result_t completed(int code, std::string out, std::string err, tm_usage_t tm);
    static exec_result_t timed_out(int timeout_seconds);
    static exec_result_t failed(std::string_view message);

    std::string to_str() const;
};

// Reads `fd` until EOF. Returns the number read, or -1
::ssize_t read_all(int fd, std::string &s);

class MyPipe {
  public:
    // Both ends are close-on-exec. Throws std::system_error.
    MyPipe();
    MyPipe(const MyPipe &) = delete;
    MyPipe &operator=(const MyPipe &) = delete;
    void close_read() {
        if (!closed_[0]) ::close(fd_[0]), closed_[0] = true;
    }
    void close_write() {
        if (!closed_[1]) ::close(fd_[1]), closed_[1] = true;
    }
    void close() {
        close_read();
        close_write();
    }
    ~MyPipe() { close(); }

    // Returns the number written, or -1
    ::ssize_t write(std::string_view s) const;
    // Returns the number read, or -1
    ::ssize_t read(std::string &s) const { return read_all(read_fd(), s); }
    // Like read(), but gives up once stop is requested and nothing is left in the pipe, for
    // writers that escaped the process group and keep the pipe open.
    ::ssize_t read_until(std::string &s, std::stop_token st) const;

    int read_fd() const { return fd_[0]; }
    int write_fd() const { return fd_[1]; }

    bool is_read_closed() const { return closed_[0]; }
    bool is_write_closed() const { return closed_[1]; }

  private:
    int fd_[2]{-1, -1};
    bool closed_[2]{false, false};
};

// A private directory for one execution, removed when the wrapper goes away.
class Workspace {
  public:
    static constexpr std::string_view _prefix = "execution_";

    // Creates a fresh directory under `root`. Throws std::system_error.
    explicit Workspace(const fs::path &root);
    Workspace(const Workspace &) = delete;
    Workspace &operator=(const Workspace &) = delete;
    ~Workspace() { release(); }

    const fs::path &getpath() const { return pth_; }

    // Writes `code` to `name` inside the workspace and returns its path. Throws.
    fs::path write_source(std::string_view name, std::string_view code) const;

    // Removes the directory and everything in it. Never throws, failures are logged. Returns
    // whether the directory is gone.
    bool release() noexcept;
    bool released() const { return released_; }

  private:
    fs::path pth_;
    bool released_{false};
};

// Runs one snippet per execute() call: CREATED -> RUNNING -> {COMPLETED | TIMED_OUT | FAILED}
// -> CLEANED_UP.
class Supervisor {
  public:
    explicit Supervisor(exec_conf_t conf);

    // Never throws, every fault is reported through the result.
    exec_result_t execute(std::string_view code);

    const exec_conf_t &config() const { return conf_; }
    exec_state_t state() const { return state_; }
    // Path of the workspace used by the last execute(), empty if none could be created.
    const fs::path &last_workspace() const { return last_workspace_; }

  private:
    exec_conf_t conf_;
    exec_state_t state_{exec_state_t::_cleaned_up};
    fs::path last_workspace_;

    void set_state(exec_state_t st);
    exec_result_t attempt(const Workspace &ws, std::string_view code);
    exec_result_t run_child(const fs::path &dir, const fs::path &source);
    std::vector<std::string> build_args(const fs::path &source) const;
    std::vector<std::string> build_env(const fs::path &dir) const;
};

}  // namespace snipexec
