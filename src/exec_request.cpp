//
// Copyright (c) 2024-2025 JLGxy
//

#include "exec_request.h"

#include <unistd.h>

#include <cerrno>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "exec_logs.h"
#include "fmt/core.h"

namespace snipexec {

namespace {

bool is_blank(std::string_view s) {
    return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

// false, 0, an empty array or object: no code rather than code of the wrong type
bool is_falsy(const json &v) {
    if (v.is_boolean()) return !v.get<bool>();
    if (v.is_number()) return v.get<double>() == 0;
    if (v.is_array() || v.is_object()) return v.empty();
    return false;
}

}  // namespace

std::string read_request_text(int fd) {
    if (isatty(fd)) {
        jl::logger.debug("input is a terminal, using an empty request");
        return "";
    }
    std::string text;
    if (read_all(fd, text) == -1) {
        throw std::system_error(errno, std::generic_category(), "failed to read request");
    }
    return text;
}

exec_request_t parse_request(std::string_view text) {
    json node = json::object();
    if (!is_blank(text)) {
        try {
            node = json::parse(text);
        } catch (json::parse_error &e) {
            throw RequestError(e.what());
        }
    }
    if (!node.is_object()) {
        throw RequestError(fmt::format(SNIPEXEC_FMT("request must be a JSON object, got {}"),
                                       node.type_name()));
    }

    exec_request_t req;
    if (auto it = node.find("code"); it != node.end() && !it->is_null()) {
        if (is_falsy(*it)) throw NoCodeError();
        if (!it->is_string()) {
            throw RequestError(fmt::format(SNIPEXEC_FMT("`code` must be a string, got {}"),
                                           it->type_name()));
        }
        req.code = it->get<std::string>();
    }
    if (req.code.empty()) throw NoCodeError();

    if (auto it = node.find("test_cases"); it != node.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw RequestError(fmt::format(SNIPEXEC_FMT("`test_cases` must be an array, got {}"),
                                           it->type_name()));
        }
        req.test_cases = std::move(*it);
    }
    return req;
}

std::pair<std::optional<exec_request_t>, std::string> decode_request(std::string_view text) {
    try {
        auto req = parse_request(text);
        jl::logger.debug("request: {} bytes of code, {} test cases", req.code.size(),
                         req.test_cases.size());
        return {std::move(req), ""};
    } catch (NoCodeError &e) {
        return {std::nullopt, e.what()};
    } catch (RequestError &e) {
        jl::logger.info("bad request: {}", e.what());
        return {std::nullopt, executor_error(e.what())};
    }
}

std::string executor_error(std::string_view what) {
    return std::string(_executor_error_prefix) + std::string(what);
}

json result_to_json(const exec_result_t &res) {
    json msg = json::object();
    msg["success"] = res.success;
    msg["stdout"] = res.out_data;
    msg["stderr"] = res.err_data;
    msg["exit_code"] = res.exit_code;
    msg["execution_time"] = res.execution_time;
    return msg;
}

json error_to_json(std::string_view error) {
    json msg = json::object();
    msg["success"] = false;
    msg["error"] = std::string(error);
    return msg;
}

std::string dump_message(const json &msg) {
    return msg.dump(-1, ' ', true, json::error_handler_t::replace);
}

}  // namespace snipexec
