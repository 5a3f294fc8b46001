//
// Copyright (c) 2024-2025 JLGxy
//

#include "exec_config.h"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "fmt/core.h"
#include "fmt/format.h"
#include "yaml-cpp/yaml.h"  // IWYU pragma: keep

namespace snipexec {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string ret(s);
    for (auto &c : ret) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ret;
}

// The token is kept as given, it only has to be a size when it is enforced.
void set_memory_limit(exec_conf_t &conf, std::string_view token) {
    conf.memory_limit = std::string(trim(token));
}

void resolve_memory_limit(exec_conf_t &conf) {
    if (conf.enforce_memory_limit) {
        conf.memory_limit_bytes = parse_memory_limit(conf.memory_limit);
        return;
    }
    try {
        conf.memory_limit_bytes = parse_memory_limit(conf.memory_limit);
    } catch (ConfigError &e) {
        jl::logger.debug("advisory memory limit `{}` is not a size: {}", conf.memory_limit,
                         e.what());
        conf.memory_limit_bytes = 0;
    }
}

void set_log_level(exec_conf_t &conf, std::string_view name) {
    try {
        conf.log_level = jl::to_log_level(to_lower(trim(name)));
    } catch (std::invalid_argument &e) {
        throw ConfigError(e.what());
    }
}

}  // namespace

std::optional<std::string> process_env(const std::string &name) {
    const char *val = std::getenv(name.c_str());
    if (val == nullptr) return std::nullopt;
    return std::string(val);
}

int parse_timeout(std::string_view s) {
    auto t = trim(s);
    int ret = 0;
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), ret);
    if (t.empty() || ec != std::errc{} || ptr != t.data() + t.size()) {
        throw ConfigError(fmt::format(SNIPEXEC_FMT("invalid timeout `{}`, expect an integer"), s));
    }
    if (ret < 1) {
        throw ConfigError(fmt::format(SNIPEXEC_FMT("timeout must be positive, got {}"), ret));
    }
    return ret;
}

std::uint64_t parse_memory_limit(std::string_view s) {
    auto t = trim(s);
    std::uint64_t num = 0;
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), num);
    if (t.empty() || ec != std::errc{}) {
        throw ConfigError(fmt::format(SNIPEXEC_FMT("invalid memory limit `{}`"), s));
    }
    std::string_view suffix(ptr, static_cast<std::size_t>(t.data() + t.size() - ptr));
    std::uint64_t unit = 1;
    if (suffix.size() > 1) {
        throw ConfigError(fmt::format(SNIPEXEC_FMT("invalid memory limit `{}`"), s));
    }
    if (!suffix.empty()) {
        switch (std::tolower(static_cast<unsigned char>(suffix.front()))) {
            case 'b': unit = 1; break;
            case 'k': unit = 1ULL << 10; break;
            case 'm': unit = 1ULL << 20; break;
            case 'g': unit = 1ULL << 30; break;
            default:
                throw ConfigError(
                        fmt::format(SNIPEXEC_FMT("invalid memory limit unit in `{}`"), s));
        }
    }
    if (num == 0) throw ConfigError("memory limit must be positive");
    if (num > std::numeric_limits<std::uint64_t>::max() / unit) {
        throw ConfigError(fmt::format(SNIPEXEC_FMT("memory limit `{}` is too large"), s));
    }
    return num * unit;
}

bool parse_bool(std::string_view s) {
    auto t = to_lower(trim(s));
    if (t == "1" || t == "true" || t == "yes" || t == "on") return true;
    if (t == "0" || t == "false" || t == "no" || t == "off") return false;
    throw ConfigError(fmt::format(SNIPEXEC_FMT("invalid boolean `{}`"), s));
}

void exec_conf_t::validate() const {
    if (timeout_seconds < 1) {
        throw ConfigError(
                fmt::format(SNIPEXEC_FMT("timeout must be positive, got {}"), timeout_seconds));
    }
    if (enforce_memory_limit && parse_memory_limit(memory_limit) != memory_limit_bytes) {
        throw ConfigError("memory limit token and byte count disagree");
    }
    if (interpreter.empty()) throw ConfigError("interpreter can't be empty");
    if (source_name.empty() || source_name == "." || source_name == ".." ||
        source_name.find('/') != std::string::npos) {
        throw ConfigError(fmt::format(SNIPEXEC_FMT("source name `{}` is not a plain file name"),
                                      source_name));
    }
    if (module_path_var.empty() || module_path_var.find('=') != std::string::npos) {
        throw ConfigError(fmt::format(SNIPEXEC_FMT("invalid environment variable name `{}`"),
                                      module_path_var));
    }
    if (workspace_root.empty()) throw ConfigError("workspace root can't be empty");
}

void apply_conf_text(exec_conf_t &conf, const std::string &yaml_text) {
    try {
        YAML::Node node = YAML::Load(yaml_text);
        if (node.IsNull()) return;
        if (!node.IsMap()) throw ConfigError("configuration must be a mapping");

        for (const auto &it : node) {
            const auto key = it.first.as<std::string>();
            const auto &val = it.second;
            if (key == "timeout") {
                conf.timeout_seconds = parse_timeout(val.as<std::string>());
            } else if (key == "memory_limit") {
                set_memory_limit(conf, val.as<std::string>());
            } else if (key == "enforce_memory_limit") {
                conf.enforce_memory_limit = parse_bool(val.as<std::string>());
            } else if (key == "interpreter") {
                conf.interpreter = val.as<std::string>();
            } else if (key == "interpreter_args") {
                if (!val.IsSequence()) throw ConfigError("`interpreter_args` must be a list");
                conf.interpreter_args.clear();
                for (const auto &arg : val) {
                    conf.interpreter_args.emplace_back(arg.as<std::string>());
                }
            } else if (key == "source_name") {
                conf.source_name = val.as<std::string>();
            } else if (key == "module_path_var") {
                conf.module_path_var = val.as<std::string>();
            } else if (key == "workspace_root") {
                conf.workspace_root = val.as<std::string>();
            } else if (key == "log_level") {
                set_log_level(conf, val.as<std::string>());
            } else if (key == "log_file") {
                conf.log_file = val.as<std::string>();
            } else {
                throw ConfigError("unknown configuration key `" + key + "`");
            }
        }
    } catch (YAML::Exception &e) {
        throw ConfigError(e.what());
    }
}

void apply_conf_file(exec_conf_t &conf, const fs::path &file) {
    if (!fs::is_regular_file(file)) {
        throw ConfigError("can't find configuration file " + file.string());
    }
    std::ifstream fin(file);
    if (!fin) throw ConfigError("can't open configuration file " + file.string());
    std::stringstream ss;
    ss << fin.rdbuf();
    try {
        apply_conf_text(conf, ss.str());
    } catch (ConfigError &e) {
        throw ConfigError(file.string() + ": " + e.what());
    }
}

void apply_env(exec_conf_t &conf, const env_lookup_t &env) {
    if (auto v = env("EXECUTION_TIMEOUT")) conf.timeout_seconds = parse_timeout(*v);
    if (auto v = env("MAX_MEMORY")) set_memory_limit(conf, *v);
    if (auto v = env("EXECUTION_ENFORCE_MEMORY")) conf.enforce_memory_limit = parse_bool(*v);
    if (auto v = env("EXECUTION_INTERPRETER")) conf.interpreter = *v;
    if (auto v = env("EXECUTION_SOURCE_NAME")) conf.source_name = *v;
    if (auto v = env("EXECUTION_WORKSPACE_ROOT")) conf.workspace_root = *v;
    if (auto v = env("EXECUTION_LOG_LEVEL")) set_log_level(conf, *v);
    if (auto v = env("EXECUTION_LOG_FILE")) conf.log_file = *v;
}

void apply_overrides(exec_conf_t &conf, const conf_overrides_t &ov) {
    if (ov.timeout) conf.timeout_seconds = parse_timeout(*ov.timeout);
    if (ov.memory_limit) set_memory_limit(conf, *ov.memory_limit);
    if (ov.interpreter) conf.interpreter = *ov.interpreter;
    if (ov.workspace_root) conf.workspace_root = *ov.workspace_root;
    if (ov.log_level) set_log_level(conf, *ov.log_level);
}

exec_conf_t load_conf(const conf_overrides_t &ov, const env_lookup_t &env) {
    exec_conf_t conf;
    std::error_code ec;
    conf.workspace_root = fs::temp_directory_path(ec);
    if (ec) conf.workspace_root = "/tmp";

    std::optional<fs::path> conf_file = ov.config_file;
    if (!conf_file) {
        if (auto v = env("EXECUTION_CONFIG")) conf_file = *v;
    }
    if (conf_file) apply_conf_file(conf, *conf_file);
    apply_env(conf, env);
    apply_overrides(conf, ov);
    resolve_memory_limit(conf);
    conf.validate();
    return conf;
}

std::string dump_conf(const exec_conf_t &conf) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "timeout" << YAML::Value << conf.timeout_seconds;
    out << YAML::Key << "memory_limit" << YAML::Value << conf.memory_limit;
    out << YAML::Key << "enforce_memory_limit" << YAML::Value << conf.enforce_memory_limit;
    out << YAML::Key << "interpreter" << YAML::Value << conf.interpreter;
    out << YAML::Key << "interpreter_args" << YAML::Value << YAML::Flow << conf.interpreter_args;
    out << YAML::Key << "source_name" << YAML::Value << conf.source_name;
    out << YAML::Key << "module_path_var" << YAML::Value << conf.module_path_var;
    out << YAML::Key << "workspace_root" << YAML::Value << conf.workspace_root.string();
    out << YAML::Key << "log_level" << YAML::Value
        << std::string(jl::log_level_to_str(conf.log_level));
    if (!conf.log_file.empty()) {
        out << YAML::Key << "log_file" << YAML::Value << conf.log_file.string();
    }
    out << YAML::EndMap;
    return out.c_str();
}

}  // namespace snipexec
