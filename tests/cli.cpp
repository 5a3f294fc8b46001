#include <map>
#include <optional>
#include <string>
#include <utility>

#include "exec_cli.h"
#include "exec_request.h"
#include "gtest/gtest.h"

using snipexec::json;

namespace {

snipexec::env_lookup_t fake_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string &name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

snipexec::env_lookup_t sh_env() {
    return fake_env({{"EXECUTION_INTERPRETER", "/bin/sh"},
                     {"EXECUTION_SOURCE_NAME", "main.sh"},
                     {"EXECUTION_TIMEOUT", "5"}});
}

}  // namespace

TEST(handleRequest, emptyInput) {
    EXPECT_EQ(snipexec::cli::handle_request("", {}, sh_env()),
              R"({"success":false,"error":"No code provided"})");
}
TEST(handleRequest, emptyCode) {
    EXPECT_EQ(snipexec::cli::handle_request(R"({"code": ""})", {}, sh_env()),
              R"({"success":false,"error":"No code provided"})");
}
TEST(handleRequest, malformed) {
    auto msg = json::parse(snipexec::cli::handle_request("{oops", {}, sh_env()));
    EXPECT_EQ(msg["success"], false);
    EXPECT_EQ(msg["error"].get<std::string>().rfind("Executor error: ", 0), 0U);
    EXPECT_FALSE(msg.contains("stdout"));
}
TEST(handleRequest, badConfiguration) {
    auto env = fake_env({{"EXECUTION_TIMEOUT", "abc"}});
    auto msg = json::parse(snipexec::cli::handle_request(R"({"code": "echo hi"})", {}, env));
    EXPECT_EQ(msg["success"], false);
    EXPECT_EQ(msg["error"].get<std::string>().rfind("Executor error: ", 0), 0U);
    EXPECT_EQ(snipexec::cli::handle_request("", {}, env),
              R"({"success":false,"error":"No code provided"})");
}
TEST(handleRequest, runs) {
    auto line = snipexec::cli::handle_request(
            R"({"code": "echo hi\nexit 3\n", "test_cases": [1]})", {}, sh_env());
    EXPECT_EQ(line.find('\n'), std::string::npos);
    auto msg = json::parse(line);
    EXPECT_EQ(msg["success"], false);
    EXPECT_EQ(msg["stdout"], "hi\n");
    EXPECT_EQ(msg["stderr"], "");
    EXPECT_EQ(msg["exit_code"], 3);
    EXPECT_TRUE(msg["execution_time"].is_number());
    EXPECT_FALSE(msg.contains("error"));
}
TEST(handleRequest, advisoryMemoryLimitRuns) {
    auto env = fake_env({{"EXECUTION_INTERPRETER", "/bin/sh"},
                         {"EXECUTION_SOURCE_NAME", "main.sh"},
                         {"MAX_MEMORY", "128mb"}});
    auto msg = json::parse(snipexec::cli::handle_request(R"({"code": "echo hi"})", {}, env));
    EXPECT_EQ(msg["success"], true);
    EXPECT_EQ(msg["stdout"], "hi\n");
}
TEST(handleRequest, enforcedMemoryLimitRejected) {
    auto env = fake_env({{"EXECUTION_INTERPRETER", "/bin/sh"},
                         {"EXECUTION_SOURCE_NAME", "main.sh"},
                         {"EXECUTION_ENFORCE_MEMORY", "true"},
                         {"MAX_MEMORY", "128mb"}});
    auto msg = json::parse(snipexec::cli::handle_request(R"({"code": "echo hi"})", {}, env));
    EXPECT_EQ(msg["success"], false);
    EXPECT_EQ(msg["error"].get<std::string>().rfind("Executor error: ", 0), 0U);
}
TEST(handleRequest, overridesApplied) {
    snipexec::conf_overrides_t ov;
    ov.timeout = "1";
    auto msg = json::parse(
            snipexec::cli::handle_request(R"({"code": "while :; do :; done"})", ov, sh_env()));
    EXPECT_EQ(msg["success"], false);
    EXPECT_EQ(msg["stderr"], "Execution timed out after 1 seconds");
    EXPECT_EQ(msg["exit_code"], -1);
}
