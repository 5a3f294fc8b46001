//
// Copyright (c) 2024-2025 JLGxy
//

#include "exec_cli.h"

#include <unistd.h>

#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "config.h"
#include "exec_core.h"
#include "exec_logs.h"
#include "exec_request.h"
#include "fmt/core.h"

namespace snipexec {

namespace cli {

void apply_logging(const exec_conf_t &conf) {
    jl::logger.set_level(conf.log_level);
    if (conf.log_file.empty()) return;
    try {
        jl::logger.open_file(conf.log_file);
    } catch (std::runtime_error &e) {
        jl::logger.warn("{}", e.what());
    }
}

std::string handle_request(std::string_view text, const conf_overrides_t &ov,
                           const env_lookup_t &env) {
    try {
        auto [req, err] = decode_request(text);
        if (!req) return dump_message(error_to_json(err));

        auto conf = load_conf(ov, env);
        apply_logging(conf);
        jl::logger.debug("timeout {}s, memory limit {}, interpreter `{}`", conf.timeout_seconds,
                         conf.memory_limit, conf.interpreter);

        Supervisor sv(std::move(conf));
        auto res = sv.execute(req->code);
        return dump_message(result_to_json(res));
    } catch (ConfigError &e) {
        jl::logger.error("bad configuration: {}", e.what());
        return dump_message(error_to_json(executor_error(e.what())));
    } catch (std::exception &e) {
        jl::logger.error("{}", e.what());
        return dump_message(error_to_json(executor_error(e.what())));
    }
}

conf_overrides_t get_overrides(po::Parser &p) {
    conf_overrides_t ov;
    if (auto v = p.get<std::optional<std::string>>("config")) ov.config_file = *v;
    ov.timeout = p.get<std::optional<std::string>>("timeout");
    ov.memory_limit = p.get<std::optional<std::string>>("memory");
    ov.interpreter = p.get<std::optional<std::string>>("interpreter");
    ov.workspace_root = p.get<std::optional<std::string>>("workspace-root");
    ov.log_level = p.get<std::optional<std::string>>("log-level");
    return ov;
}

namespace {

void add_conf_options(po::Parser &p) {
    p.add("config", 'c', "read configuration from a YAML file", true, 1, 1);
    p.add("timeout", 't', "wall-clock limit in seconds", true, 1, 1);
    p.add("memory", 'm', "memory limit, like 128m", true, 1, 1);
    p.add("interpreter", 'i', "program that runs the source file", true, 1, 1);
    p.add("workspace-root", 'w', "directory that holds the workspaces", true, 1, 1);
    p.add("log-level", 'l', "debug, info, warn, error or off", true, 1, 1);
}

class Run {
  public:
    constexpr static std::string_view _name = "run";
    constexpr static std::string_view _desc = "run one request from stdin";
    static po::Parser init_parser() {
        po::Parser p;
        add_conf_options(p);
        return p;
    }
    static int run(po::Parser &p) {
        // a closed stdout must not kill us before the workspace is gone
        std::signal(SIGPIPE, SIG_IGN);
        auto ov = get_overrides(p);
        std::string line;
        try {
            line = handle_request(read_request_text(STDIN_FILENO), ov);
        } catch (std::system_error &e) {
            jl::logger.error("{}", e.what());
            line = dump_message(error_to_json(executor_error(e.what())));
        }
        std::cout << line << std::endl;
        if (!std::cout) {
            jl::logger.error("failed to write the result");
            return 1;
        }
        return 0;
    }
};

class Config {
  public:
    constexpr static std::string_view _name = "config";
    constexpr static std::string_view _desc = "print the effective configuration";
    static po::Parser init_parser() {
        po::Parser p;
        add_conf_options(p);
        return p;
    }
    static int run(po::Parser &p) {
        auto conf = load_conf(get_overrides(p));
        std::cout << dump_conf(conf) << std::endl;
        return 0;
    }
};

class Version {
  public:
    constexpr static std::string_view _name = "version";
    constexpr static std::string_view _desc = "print version";
    static po::Parser init_parser() { return {}; }
    static int run(po::Parser &) {
        std::cout << fmt::format(SNIPEXEC_FMT("{} version {} build {}"), _prog_name,
                                 SNIPEXEC_VERSION, SNIPEXEC_VERSION_BUILD)
                  << std::endl;
        return 0;
    }
};

}  // namespace

CliHandler::CliHandler() {
    handler_.set_name(_prog_name);
    add<Run>();
    add<Config>();
    add<Version>();
}

int CliHandler::run(int argc, char **argv) {
    try {
        auto [name, ret] = handler_.parse(argc, argv);
        return ret;
    } catch (po::UsageError &e) {
        std::cerr << _prog_name << ": " << e.what() << std::endl;
        handler_.show_usage(std::cerr);
        return 2;
    } catch (std::exception &e) {
        std::cerr << _prog_name << ": " << e.what() << std::endl;
        return 1;
    }
}

}  // namespace cli

}  // namespace snipexec
