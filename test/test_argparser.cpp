#include "argparser.hpp"
#include "exception.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace fsutils;

class ArgparserTest : public ::testing::Test {
 protected:
  void SetUp() override {
    args.add_bool_option("--help");
    args.add_option_alias("--help", "/h");
    args.add_bool_option("--basename");
    args.add_option_alias("--basename", "/b");
    args.add_option("--limit");
    args.add_option_alias("--limit", "/l");
  }

  argparser args;
};

TEST_F(ArgparserTest, EmptyArgumentListIsUsageError) {
  try {
    args.parse(std::vector<std::string>{"locate"});
    FAIL() << "expected usage_error";
  }
  catch (const usage_error& e) {
    EXPECT_STREQ("", e.what());
  }
  EXPECT_EQ("locate", args.command());
}

TEST_F(ArgparserTest, CommandIsExecutableStem) {
  args.parse(std::vector<std::string>{"/usr/local/bin/locate.exe", "x"});
  EXPECT_EQ("locate", args.command());
}

TEST_F(ArgparserTest, FirstFlagAndAlias) {
  args.parse(std::vector<std::string>{"locate", "/b", "foo"});
  EXPECT_TRUE(args.has_option("--basename"));
  EXPECT_TRUE(args.has_option("/b"));
  EXPECT_FALSE(args.has_option("--limit"));
  EXPECT_EQ("/b", args.flag_spelling());
  EXPECT_EQ(1u, args.size());
  EXPECT_EQ(std::vector<std::string>({"foo"}), args.values());
}

TEST_F(ArgparserTest, LongFlag) {
  args.parse(std::vector<std::string>{"locate", "--basename", "foo"});
  EXPECT_TRUE(args.has_option("--basename"));
  EXPECT_EQ("--basename", args.flag_spelling());
}

TEST_F(ArgparserTest, OnlyFirstArgumentIsInspected) {
  args.parse(std::vector<std::string>{"locate", "foo", "/b"});
  EXPECT_FALSE(args.has_option("--basename"));
  EXPECT_EQ(std::vector<std::string>({"foo", "/b"}), args.values());

  args.parse(std::vector<std::string>{"locate", "/b", "/l", "3", "foo"});
  EXPECT_TRUE(args.has_option("--basename"));
  EXPECT_FALSE(args.has_option("--limit"));
  EXPECT_EQ(std::vector<std::string>({"/l", "3", "foo"}), args.values());
}

TEST_F(ArgparserTest, ValueOption) {
  args.parse(std::vector<std::string>{"locate", "/l", "5", "foo"});
  EXPECT_TRUE(args.has_option("--limit"));
  EXPECT_EQ("5", args.get_option("--limit"));
  EXPECT_EQ("", args.get_option("--basename"));
  EXPECT_EQ(std::vector<std::string>({"foo"}), args.values());
  EXPECT_EQ(std::vector<std::string>({"/l", "5", "foo"}), args.arguments());
}

TEST_F(ArgparserTest, MissingValue) {
  try {
    args.parse(std::vector<std::string>{"locate", "--limit"});
    FAIL() << "expected usage_error";
  }
  catch (const usage_error& e) {
    EXPECT_EQ(std::string("Missing value for '--limit'"), e.what());
  }
}

TEST_F(ArgparserTest, UnknownFirstArgumentIsPositional) {
  args.parse(std::vector<std::string>{"locate", "--bogus", "foo"});
  EXPECT_TRUE(args.flag_spelling().empty());
  EXPECT_EQ(std::vector<std::string>({"--bogus", "foo"}), args.values());
}

TEST_F(ArgparserTest, OptionLookup) {
  EXPECT_TRUE(args.is_option("/h"));
  EXPECT_FALSE(args.is_option("/x"));
  EXPECT_EQ("--limit", args.canonical("/l"));
  EXPECT_TRUE(args.takes_value("/l"));
  EXPECT_FALSE(args.takes_value("--help"));
  EXPECT_THROW(args.canonical("/x"), std::invalid_argument);
  EXPECT_THROW(args.has_option("--nope"), std::invalid_argument);
  EXPECT_THROW(args.add_option_alias("--nope", "/n"), std::invalid_argument);
}
