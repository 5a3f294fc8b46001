//
// Copyright (c) 2024-2025 JLGxy
//

#include "exec_core.h"

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "exec_logs.h"
#include "fmt/core.h"
#include "fmt/format.h"
#include "fmt/ranges.h"

extern char **environ;

namespace snipexec {

std::string outcome_to_str(outcome_t oc) {
    switch (oc) {
        case outcome_t::_completed: return "completed";
        case outcome_t::_timed_out: return "timed_out";
        case outcome_t::_failed: return "failed";
        default: return "undefined";
    }
}

std::string state_to_str(exec_state_t st) {
    switch (st) {
        case exec_state_t::_created: return "CREATED";
        case exec_state_t::_running: return "RUNNING";
        case exec_state_t::_completed: return "COMPLETED";
        case exec_state_t::_timed_out: return "TIMED_OUT";
        case exec_state_t::_failed: return "FAILED";
        case exec_state_t::_cleaned_up: return "CLEANED_UP";
        default: return "UNDEFINED";
    }
}

exec_result_t exec_result_t::completed(int code, std::string out, std::string err,
                                       tm_usage_t tm) {
    exec_result_t ret;
    ret.success = code == 0;
    ret.out_data = std::move(out);
    ret.err_data = std::move(err);
    ret.exit_code = code;
    ret.execution_time = tm;
    ret.outcome = outcome_t::_completed;
    return ret;
}

exec_result_t exec_result_t::timed_out(int timeout_seconds) {
    exec_result_t ret;
    ret.err_data =
            fmt::format(SNIPEXEC_FMT("Execution timed out after {} seconds"), timeout_seconds);
    ret.execution_time = static_cast<tm_usage_t>(timeout_seconds) * 1000;
    ret.outcome = outcome_t::_timed_out;
    return ret;
}

exec_result_t exec_result_t::failed(std::string_view message) {
    exec_result_t ret;
    ret.err_data = fmt::format(SNIPEXEC_FMT("Execution error: {}"), message);
    ret.outcome = outcome_t::_failed;
    return ret;
}

std::string exec_result_t::to_str() const {
    return "(" + outcome_to_str(outcome) + "," + std::to_string(exit_code) + "," +
           std::to_string(execution_time) + ")";
}

::ssize_t read_all(int fd, std::string &s) {
    std::vector<char> buf(1 << 16);
    ::ssize_t tot = 0;
    while (true) {
        ::ssize_t t = ::read(fd, buf.data(), buf.size());
        if (t == -1 && errno == EINTR) continue;
        if (t == -1) return -1;
        if (t == 0) break;
        s.append(buf.data(), static_cast<std::size_t>(t));
        tot += t;
    }
    return tot;
}

MyPipe::MyPipe() {
    if (pipe2(fd_, O_CLOEXEC) == -1) {
        closed_[0] = closed_[1] = true;
        throw std::system_error(errno, std::generic_category(), "failed to create pipe");
    }
}

::ssize_t MyPipe::write(std::string_view s) const {
    ::ssize_t tot = 0;
    while (!s.empty()) {
        ::ssize_t t = ::write(write_fd(), s.data(), s.size());
        if (t == -1 && errno == EINTR) continue;
        if (t == -1) return -1;
        s.remove_prefix(static_cast<std::size_t>(t));
        tot += t;
    }
    return tot;
}

::ssize_t MyPipe::read_until(std::string &s, std::stop_token st) const {
    constexpr int _poll_ms = 50;
    // drained at most after a stop request, a writer out of our reach may never stop
    constexpr ::ssize_t _drain_budget = 1 << 20;
    std::vector<char> buf(1 << 16);
    ::ssize_t tot = 0, drained = 0;
    while (true) {
        const bool stopping = st.stop_requested();
        if (stopping && drained >= _drain_budget) break;
        pollfd pfd{read_fd(), POLLIN, 0};
        int r = poll(&pfd, 1, stopping ? 0 : _poll_ms);
        if (r == -1 && errno == EINTR) continue;
        if (r == -1) return -1;
        if (r == 0) {
            if (stopping) break;
            continue;
        }
        ::ssize_t t = ::read(read_fd(), buf.data(), buf.size());
        if (t == -1 && errno == EINTR) continue;
        if (t == -1) return -1;
        if (t == 0) break;
        s.append(buf.data(), static_cast<std::size_t>(t));
        tot += t;
        if (stopping) drained += t;
    }
    return tot;
}

namespace {

// The snippet may take away our permissions on its own files, give them back before a retry.
void restore_permissions(const fs::path &root) noexcept {
    std::error_code ec;
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (fs::is_directory(it->symlink_status(sec))) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, sec);
        }
    }
}

}  // namespace

Workspace::Workspace(const fs::path &root) {
    std::string tmpl = (root / (std::string(_prefix) + "XXXXXX")).string();
    if (mkdtemp(tmpl.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(),
                                "failed to create workspace under " + root.string());
    }
    pth_ = tmpl;
    jl::logger.debug("workspace {} created", pth_.string());
}

fs::path Workspace::write_source(std::string_view name, std::string_view code) const {
    fs::path file = pth_ / name;
    std::ofstream fout(file, std::ios::binary | std::ios::trunc);
    if (!fout) throw std::runtime_error("failed to open " + file.string());
    fout.write(code.data(), static_cast<std::streamsize>(code.size()));
    fout.close();
    if (!fout) throw std::runtime_error("failed to write " + file.string());
    return file;
}

bool Workspace::release() noexcept {
    if (released_) return true;
    released_ = true;
    std::error_code ec;
    fs::remove_all(pth_, ec);
    if (ec) {
        restore_permissions(pth_);
        ec.clear();
        fs::remove_all(pth_, ec);
    }
    if (ec) {
        jl::logger.warn("failed to remove workspace {}: {}", pth_.string(), ec.message());
        return false;
    }
    jl::logger.debug("workspace {} removed", pth_.string());
    return true;
}

namespace {

enum class child_stage_t : int { _redirect, _chdir, _rlimit, _exec };

// Written by the child to the status pipe when it can't get to exec.
struct child_report_t {
    child_stage_t stage;
    int err;
};

// Everything the child needs, prepared before fork so the child itself doesn't allocate.
struct child_ctx_t {
    const char *dir;
    char *const *argv;
    char *const *envp;
    int out_fd, err_fd, status_fd;
    rlim_t mem_lim;  // 0 means unlimited
};

std::string stage_to_str(child_stage_t stage) {
    switch (stage) {
        case child_stage_t::_redirect: return "failed to redirect standard streams";
        case child_stage_t::_chdir: return "failed to enter workspace";
        case child_stage_t::_rlimit: return "failed to set memory limit";
        case child_stage_t::_exec: return "failed to execute";
        default: return "failed to start";
    }
}

[[noreturn]] void child_fail(int status_fd, child_stage_t stage) {
    child_report_t rep{stage, errno};
    [[maybe_unused]] ::ssize_t t = ::write(status_fd, &rep, sizeof(rep));
    _exit(127);
}

[[noreturn]] void child_main(const child_ctx_t &ctx) {
    // an ignored SIGPIPE would survive exec
    signal(SIGPIPE, SIG_DFL);

    int nfd = open("/dev/null", O_RDONLY);
    if (nfd == -1) child_fail(ctx.status_fd, child_stage_t::_redirect);
    if (dup2(nfd, STDIN_FILENO) == -1) child_fail(ctx.status_fd, child_stage_t::_redirect);
    if (dup2(ctx.out_fd, STDOUT_FILENO) == -1) child_fail(ctx.status_fd, child_stage_t::_redirect);
    if (dup2(ctx.err_fd, STDERR_FILENO) == -1) child_fail(ctx.status_fd, child_stage_t::_redirect);

    if (chdir(ctx.dir) == -1) child_fail(ctx.status_fd, child_stage_t::_chdir);

    if (ctx.mem_lim != 0) {
        rlimit rlim;
        rlim.rlim_cur = ctx.mem_lim;
        rlim.rlim_max = ctx.mem_lim;
        if (setrlimit(RLIMIT_AS, &rlim) == -1) child_fail(ctx.status_fd, child_stage_t::_rlimit);
    }

    execvpe(ctx.argv[0], ctx.argv, ctx.envp);
    child_fail(ctx.status_fd, child_stage_t::_exec);
}

std::vector<char *> to_argv(std::vector<std::string> &args) {
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (auto &arg : args) argv.emplace_back(arg.data());
    argv.emplace_back(nullptr);
    return argv;
}

}  // namespace

Supervisor::Supervisor(exec_conf_t conf) : conf_(std::move(conf)) {
    if (!conf_.enforce_memory_limit) {
        jl::logger.debug("memory limit {} is advisory and not applied", conf_.memory_limit);
    }
}

void Supervisor::set_state(exec_state_t st) {
    state_ = st;
    jl::logger.debug("state: {}", state_to_str(st));
}

exec_result_t Supervisor::execute(std::string_view code) {
    last_workspace_.clear();
    set_state(exec_state_t::_created);
    exec_result_t res;
    try {
        Workspace ws(conf_.workspace_root);
        last_workspace_ = ws.getpath();
        res = attempt(ws, code);
        switch (res.outcome) {
            case outcome_t::_completed: set_state(exec_state_t::_completed); break;
            case outcome_t::_timed_out: set_state(exec_state_t::_timed_out); break;
            default: set_state(exec_state_t::_failed); break;
        }
        ws.release();
    } catch (std::exception &e) {
        // no workspace could be created
        jl::logger.warn("{}", e.what());
        res = exec_result_t::failed(e.what());
        set_state(exec_state_t::_failed);
    }
    set_state(exec_state_t::_cleaned_up);
    jl::logger.info("finished {}", res.to_str());
    return res;
}

exec_result_t Supervisor::attempt(const Workspace &ws, std::string_view code) {
    try {
        fs::path source = ws.write_source(conf_.source_name, code);
        return run_child(ws.getpath(), source);
    } catch (std::exception &e) {
        jl::logger.warn("execution fault: {}", e.what());
        return exec_result_t::failed(e.what());
    }
}

std::vector<std::string> Supervisor::build_args(const fs::path &source) const {
    std::vector<std::string> args;
    args.emplace_back(conf_.interpreter);
    args.insert(args.end(), conf_.interpreter_args.begin(), conf_.interpreter_args.end());
    args.emplace_back(source.string());
    return args;
}

std::vector<std::string> Supervisor::build_env(const fs::path &dir) const {
    const std::string key = conf_.module_path_var + "=";
    std::vector<std::string> env;
    for (char **p = environ; p != nullptr && *p != nullptr; p++) {
        std::string_view cur(*p);
        if (cur.substr(0, key.size()) == key) continue;
        env.emplace_back(cur);
    }
    env.emplace_back(key + dir.string());
    return env;
}

exec_result_t Supervisor::run_child(const fs::path &dir, const fs::path &source) {
    auto args = build_args(source);
    auto env = build_env(dir);
    auto argv = to_argv(args);
    auto envp = to_argv(env);
    const std::string dir_str = dir.string();

    MyPipe out, err, status;
    const child_ctx_t ctx{
            dir_str.c_str(),
            argv.data(),
            envp.data(),
            out.write_fd(),
            err.write_fd(),
            status.write_fd(),
            conf_.enforce_memory_limit ? static_cast<rlim_t>(conf_.memory_limit_bytes) : 0,
    };

    set_state(exec_state_t::_running);
    const auto start = mpc::Process::clock::now();
    mpc::Process proc([&ctx] { child_main(ctx); });
    if (proc.failed()) {
        throw std::system_error(proc.error(), std::generic_category(), "failed to fork");
    }
    out.close_write();
    err.close_write();
    status.close_write();

    // EOF once exec succeeded, the status pipe is close-on-exec
    std::string report;
    if (status.read(report) == -1) {
        throw std::system_error(errno, std::generic_category(), "failed to read child status");
    }
    status.close_read();
    if (report.size() >= sizeof(child_report_t)) {
        child_report_t rep;
        std::memcpy(&rep, report.data(), sizeof(rep));
        proc.join();
        throw std::system_error(rep.err, std::generic_category(),
                                stage_to_str(rep.stage) + " `" + conf_.interpreter + "`");
    }
    jl::logger.debug("child {} started: {}", proc.pid(), fmt::join(args, " "));

    std::string out_data, err_data;
    ::ssize_t out_ret = 0, err_ret = 0;
    std::jthread read_out([&](std::stop_token st) { out_ret = out.read_until(out_data, st); });
    std::jthread read_err([&](std::stop_token st) { err_ret = err.read_until(err_data, st); });

    const auto deadline = start + std::chrono::seconds(conf_.timeout_seconds);
    const bool exited = proc.wait_for(deadline);
    const auto end = mpc::Process::clock::now();

    // on timeout this is the child itself, otherwise whatever it left running in the background
    proc.kill_group(SIGKILL);
    if (!exited) proc.join();

    read_out.request_stop();
    read_err.request_stop();
    read_out.join();
    read_err.join();

    if (!exited) {
        jl::logger.info("child {} killed after {} seconds", proc.pid(), conf_.timeout_seconds);
        return exec_result_t::timed_out(conf_.timeout_seconds);
    }
    if (out_ret == -1 || err_ret == -1) {
        throw std::runtime_error("failed to read output of the child process");
    }

    int code = _no_exit_code;
    if (proc.if_exited()) {
        code = proc.exit_status();
    } else if (proc.if_signaled()) {
        jl::logger.info("child {} killed by signal {}", proc.pid(), proc.term_sig());
        code = 128 + proc.term_sig();
    }
    const tm_usage_t tm = std::chrono::duration<tm_usage_t, std::milli>(end - start).count();
    return exec_result_t::completed(code, std::move(out_data), std::move(err_data), tm);
}

}  // namespace snipexec
