//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <string>
#include <string_view>

#include "exec_config.h"
#include "prog_option.h"

namespace snipexec {

namespace cli {

constexpr std::string_view _prog_name = "snipexec";

// Decodes `text`, loads the configuration, runs the code once and returns the result message
// without the trailing newline. Never throws.
std::string handle_request(std::string_view text, const conf_overrides_t &ov,
                           const env_lookup_t &env = process_env);

// Applies the logging part of `conf` to jl::logger. A log file that can't be opened is reported
// and skipped.
void apply_logging(const exec_conf_t &conf);

conf_overrides_t get_overrides(po::Parser &p);

class CliHandler {
  public:
    CliHandler();
    // Returns the exit status, 2 on usage errors.
    int run(int argc, char **argv);

  private:
    po::CommandHandler handler_;

    template <typename T>
    void add() {
        handler_.add_command(T::_name, T::init_parser(), T::_desc, T::run);
    }
};

}  // namespace cli

}  // namespace snipexec
