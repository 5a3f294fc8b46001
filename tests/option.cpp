#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "prog_option.h"

namespace po = snipexec::po;

namespace {

// argv that owns its strings
class Args {
  public:
    Args(std::initializer_list<std::string> args) : strs_(args) {
        for (auto &s : strs_) ptrs_.emplace_back(s.data());
        ptrs_.emplace_back(nullptr);
    }
    int argc() const { return static_cast<int>(strs_.size()); }
    char **argv() { return ptrs_.data(); }

  private:
    std::vector<std::string> strs_;
    std::vector<char *> ptrs_;
};

po::Parser make_parser() {
    po::Parser p;
    p.add("timeout", 't', "seconds", true, 1, 1);
    p.add("verbose", 'v', "talk more", true, 0, 0);
    p.add("tag", 0, "tags", true, 0, po::_size_inf);
    return p;
}

}  // namespace

TEST(optionParser, longAndShort) {
    auto p = make_parser();
    Args a{"run", "--timeout=5", "-v"};
    EXPECT_TRUE(p.parse_check(a.argc(), a.argv()));
    EXPECT_EQ(p.get<int>("timeout"), 5);
    EXPECT_TRUE(p.get<bool>("verbose"));
    EXPECT_FALSE(p.get<bool>("tag"));
}
TEST(optionParser, separateValue) {
    auto p = make_parser();
    Args a{"run", "--timeout", "3"};
    EXPECT_TRUE(p.parse_check(a.argc(), a.argv()));
    EXPECT_EQ(p.get<std::string>("timeout"), "3");
    Args b{"run", "-t", "4"};
    EXPECT_TRUE(p.parse_check(b.argc(), b.argv()));
    EXPECT_EQ(p.get<int>("timeout"), 4);
    Args c{"run", "-t9"};
    EXPECT_TRUE(p.parse_check(c.argc(), c.argv()));
    EXPECT_EQ(p.get<int>("timeout"), 9);
}
TEST(optionParser, optionalString) {
    auto p = make_parser();
    Args a{"run"};
    EXPECT_TRUE(p.parse_check(a.argc(), a.argv()));
    EXPECT_FALSE(p.get<std::optional<std::string>>("timeout").has_value());
    EXPECT_EQ(p.get<std::string>("timeout", "30"), "30");
    EXPECT_THROW(p.get<std::string>("timeout"), po::ArgNotFound);
}
TEST(optionParser, repeated) {
    auto p = make_parser();
    Args a{"run", "--tag=a", "--tag=b"};
    EXPECT_TRUE(p.parse_check(a.argc(), a.argv()));
    EXPECT_EQ(p.get<po::strvec>("tag"), (po::strvec{"a", "b"}));
}
TEST(optionParser, errors) {
    auto p = make_parser();
    Args unknown{"run", "--nope"};
    EXPECT_THROW(p.parse_check(unknown.argc(), unknown.argv()), po::NotExist);
    Args stray{"run", "stray"};
    EXPECT_THROW(p.parse_check(stray.argc(), stray.argv()), po::InvalidArg);
    Args missing{"run", "--timeout"};
    EXPECT_THROW(p.parse_check(missing.argc(), missing.argv()), po::InvalidArg);
    Args twice{"run", "-t", "1", "-t", "2"};
    EXPECT_THROW(p.parse_check(twice.argc(), twice.argv()), po::InvalidArg);
    Args nan{"run", "-t", "x"};
    EXPECT_TRUE(p.parse_check(nan.argc(), nan.argv()));
    EXPECT_THROW(p.get<int>("timeout"), po::InvalidArg);
}
TEST(optionParser, help) {
    auto p = make_parser();
    Args a{"run", "--nope", "--help"};
    EXPECT_FALSE(p.parse_check(a.argc(), a.argv()));
}
TEST(optionParser, required) {
    po::Parser p;
    p.add("input", 'i', "input file", false, 1, 1);
    Args a{"run"};
    EXPECT_THROW(p.parse_check(a.argc(), a.argv()), po::ArgNotFound);
}

TEST(commandHandler, dispatch) {
    po::CommandHandler h;
    h.set_name("snipexec");
    int seen = 0;
    h.add_command("one", make_parser(), "first", [&](po::Parser &p) {
        seen = p.get<int>("timeout");
        return 4;
    });
    Args a{"snipexec", "one", "-t", "6"};
    auto [name, ret] = h.parse(a.argc(), a.argv());
    EXPECT_EQ(name, "one");
    EXPECT_EQ(ret, 4);
    EXPECT_EQ(seen, 6);
}
TEST(commandHandler, unknownCommand) {
    po::CommandHandler h;
    h.set_name("snipexec");
    Args a{"snipexec", "two"};
    EXPECT_THROW(h.parse(a.argc(), a.argv()), po::NotExist);
    Args none{"snipexec"};
    EXPECT_THROW(h.parse(none.argc(), none.argv()), po::UsageError);
}
