//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "exec_logs.h"

namespace snipexec {

namespace fs = std::filesystem;

constexpr int _default_timeout_seconds = 30;
constexpr std::string_view _default_memory_limit = "128m";
constexpr std::string_view _default_interpreter = "python3";
constexpr std::string_view _default_source_name = "main.py";
constexpr std::string_view _default_module_path_var = "PYTHONPATH";

class ConfigError : public std::exception {
  public:
    explicit ConfigError(const std::string_view what_arg) : what_str_(what_arg) {}
    const char *what() const noexcept override { return what_str_.c_str(); }

  private:
    std::string what_str_;
};

// Configuration of the execution primitive. Built once per invocation and passed down, nothing
// below the CLI reads the environment on its own.
struct exec_conf_t {
    int timeout_seconds = _default_timeout_seconds;
    // Advisory unless `enforce_memory_limit` is set, see child_main in exec_core.cpp. An
    // advisory token may be any text, `memory_limit_bytes` is 0 when it isn't a size.
    std::string memory_limit{_default_memory_limit};
    std::uint64_t memory_limit_bytes = 128ULL << 20;
    bool enforce_memory_limit = false;

    std::string interpreter{_default_interpreter};
    std::vector<std::string> interpreter_args;
    std::string source_name{_default_source_name};
    std::string module_path_var{_default_module_path_var};
    fs::path workspace_root;

    jl::log_level_t log_level = jl::log_level_t::_warn;
    fs::path log_file;

    // throws ConfigError
    void validate() const;
};

// Values given on the command line, they take precedence over everything else.
struct conf_overrides_t {
    std::optional<fs::path> config_file;
    std::optional<std::string> timeout, memory_limit, interpreter, workspace_root, log_level;
};

using env_lookup_t = std::function<std::optional<std::string>(const std::string &)>;

std::optional<std::string> process_env(const std::string &name);

// All parsers throw ConfigError.
int parse_timeout(std::string_view s);
std::uint64_t parse_memory_limit(std::string_view s);
bool parse_bool(std::string_view s);

void apply_conf_text(exec_conf_t &conf, const std::string &yaml_text);
void apply_conf_file(exec_conf_t &conf, const fs::path &file);
void apply_env(exec_conf_t &conf, const env_lookup_t &env);
void apply_overrides(exec_conf_t &conf, const conf_overrides_t &ov);

// defaults < yaml file < environment < command line
exec_conf_t load_conf(const conf_overrides_t &ov, const env_lookup_t &env = process_env);

std::string dump_conf(const exec_conf_t &conf);

}  // namespace snipexec
