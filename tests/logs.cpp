#include "exec_logs.h"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "gtest/gtest.h"

namespace jl = snipexec::jl;

TEST(logLevel, names) {
    EXPECT_EQ(jl::to_log_level("debug"), jl::log_level_t::_debug);
    EXPECT_EQ(jl::to_log_level("off"), jl::log_level_t::_off);
    EXPECT_EQ(jl::log_level_to_str(jl::log_level_t::_warn), "warn");
    EXPECT_THROW(jl::to_log_level("loud"), std::invalid_argument);
}

TEST(logger, levelsAndFile) {
    auto file = std::filesystem::temp_directory_path() /
                ("snipexec_log_" + std::to_string(getpid()) + ".log");
    std::filesystem::remove(file);
    {
        jl::Logger log;
        log.set_level(jl::log_level_t::_info);
        EXPECT_FALSE(log.enabled(jl::log_level_t::_debug));
        EXPECT_TRUE(log.enabled(jl::log_level_t::_error));
        EXPECT_FALSE(log.enabled(jl::log_level_t::_off));
        log.open_file(file);
        log.debug("hidden {}", 0);
        log.info("shown {} of {}", 1, std::string("two"));
        log.println(jl::log_level_t::_warn, SNIPEXEC_FMT("formatted {:>3}"), 7);
    }
    std::ifstream fin(file);
    std::string text((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
    std::filesystem::remove(file);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("] info: shown 1 of two\n"), std::string::npos);
    EXPECT_NE(text.find("] warn: formatted   7\n"), std::string::npos);
}

TEST(logger, badFile) {
    jl::Logger log;
    EXPECT_THROW(log.open_file("/nonexistent/dir/snipexec.log"), std::runtime_error);
}
