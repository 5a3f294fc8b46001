//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "exec_core.h"
#include "nlohmann/json.hpp"

namespace snipexec {

// keeps the keys in the order they are written
using json = nlohmann::ordered_json;

constexpr std::string_view _no_code_error = "No code provided";
constexpr std::string_view _executor_error_prefix = "Executor error: ";

class RequestError : public std::exception {
  public:
    explicit RequestError(const std::string_view what_arg) : what_str_(what_arg) {}
    const char *what() const noexcept override { return what_str_.c_str(); }

  private:
    std::string what_str_;
};

// The request is well formed but `code` is missing or empty.
class NoCodeError : public RequestError {
  public:
    NoCodeError() : RequestError(_no_code_error) {}
};

struct exec_request_t {
    std::string code;
    // carried along, never interpreted here
    json test_cases = json::array();
};

// Reads the whole request from `fd`. A terminal yields an empty request instead of waiting for
// input. Throws std::system_error.
std::string read_request_text(int fd);

// Throws RequestError. An empty or blank text is the empty request, which has no code.
exec_request_t parse_request(std::string_view text);

// Returns the request, or the error message to report instead. Never throws on bad input.
std::pair<std::optional<exec_request_t>, std::string> decode_request(std::string_view text);

std::string executor_error(std::string_view what);

json result_to_json(const exec_result_t &res);
json error_to_json(std::string_view error);

// One line, invalid UTF-8 in captured output is replaced rather than rejected.
std::string dump_message(const json &msg);

}  // namespace snipexec
