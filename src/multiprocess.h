#pragma once

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <concepts>
#include <csignal>
#include <functional>
#include <thread>
#include <type_traits>
#include <utility>

namespace snipexec::multiproc {

// A forked child that leads its own process group. The child runs the given callable (which is
// expected to exec) and leaves with _exit(0) if it returns. A child that is still running when
// the handle dies gets its whole group killed and is reaped, so no process outlives its handle.
class Process {
  public:
    using clock = std::chrono::steady_clock;

    static constexpr auto _poll_interval = std::chrono::milliseconds(5);

    Process() = default;
    Process(Process &&o) noexcept
            : pid_(std::exchange(o.pid_, 0)),
              status_(std::exchange(o.status_, 0)),
              alive_(std::exchange(o.alive_, false)),
              fail_(std::exchange(o.fail_, false)),
              errno_(std::exchange(o.errno_, 0)) {}
    template <typename T, typename... Args>
        requires(!std::same_as<Process, std::remove_cvref_t<T>>) && std::invocable<T, Args...>
    explicit Process(T &&f, Args &&...args) {
        pid_t pid = fork();
        if (pid == -1) {
            fail_ = true;
            errno_ = errno;
            return;
        }
        if (pid == 0) {
            setpgid(0, 0);
            std::invoke(std::forward<T>(f), std::forward<Args>(args)...);
            _exit(0);
        }
        // both sides set the group, whichever runs first wins the race against kill_group()
        setpgid(pid, pid);
        pid_ = pid;
        alive_ = true;
    }
    Process(const Process &) = delete;
    Process &operator=(const Process &) = delete;
    Process &operator=(Process &&) = delete;
    ~Process() {
        if (!alive_) return;
        kill_group(SIGKILL);
        kill(SIGKILL);
        join();
    }

    // Blocks until the child is reaped.
    void join() {
        while (alive_) {
            int status;
            pid_t wid = waitpid(pid_, &status, 0);
            if (wid == pid_) {
                if (WIFEXITED(status) || WIFSIGNALED(status)) {
                    status_ = status;
                    alive_ = false;
                }
            } else if (wid == -1 && errno != EINTR) {
                alive_ = false;
            }
        }
    }
    // Returns true if the child has been reaped before `deadline`, false if it is still running.
    bool wait_for(clock::time_point deadline) {
        while (true) {
            check_alive();
            if (!alive_) return true;
            auto now = clock::now();
            if (now >= deadline) return false;
            std::this_thread::sleep_for(
                    std::min<clock::duration>(deadline - now, _poll_interval));
        }
    }
    bool is_alive() {
        check_alive();
        return alive_;
    }
    bool failed() const { return fail_; }
    // errno of the failed fork()
    int error() const { return errno_; }
    bool if_exited() {
        check_alive();
        return !alive_ && WIFEXITED(status_);
    }
    bool if_signaled() {
        check_alive();
        return !alive_ && WIFSIGNALED(status_);
    }
    int exit_status() {
        check_alive();
        assert(WIFEXITED(status_));
        return WEXITSTATUS(status_);
    }
    int term_sig() {
        check_alive();
        assert(WIFSIGNALED(status_));
        return WTERMSIG(status_);
    }

    int kill(int sig) const { return pid_ > 0 ? ::kill(pid_, sig) : -1; }
    // Signals every process in the child's group, including the ones left behind after the child
    // itself has been reaped.
    int kill_group(int sig) const { return pid_ > 0 ? ::kill(-pid_, sig) : -1; }
    pid_t pid() const { return pid_; }

  private:
    pid_t pid_{};
    int status_{};
    bool alive_{false}, fail_{false};
    int errno_{};

    void check_alive() {
        while (alive_) {
            int status;
            pid_t wid = waitpid(pid_, &status, WNOHANG);
            if (wid == pid_) {
                if (WIFEXITED(status) || WIFSIGNALED(status)) {
                    status_ = status;
                    alive_ = false;
                }
            } else if (wid == -1 && errno == EINTR) {
                continue;
            } else if (wid == -1) {
                alive_ = false;
            } else {
                break;
            }
        }
    }
};

}  // namespace snipexec::multiproc
