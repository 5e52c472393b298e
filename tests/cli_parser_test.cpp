/**
 * @file cli_parser_test.cpp
 * @brief Unit tests for CliParser options and positional arguments
 */

#include "cli/cli_parser.hpp"
#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace uf2pack;

namespace {

// Owns argv storage for a parse() call.
class Argv {
 public:
  Argv(std::initializer_list<std::string> args) : args_(args) {
    for (auto& a : args_) ptrs_.push_back(a.data());
  }
  int argc() const { return static_cast<int>(ptrs_.size()); }
  char** argv() { return ptrs_.data(); }

 private:
  std::vector<std::string> args_;
  std::vector<char*> ptrs_;
};

}  // namespace

TEST(CliParserTest, PositionalPathsKeepOrder) {
  Argv a{"bin2uf2", "in.bin", "out.uf2"};
  CliParser cli;
  cli.parse(a.argc(), a.argv());
  ASSERT_EQ(2u, cli.positional().size());
  EXPECT_EQ("in.bin", cli.get_or_positional("in", 0));
  EXPECT_EQ("out.uf2", cli.get_or_positional("out", 1));
}

TEST(CliParserTest, NamedOptionsTakeValues) {
  Argv a{"bin2uf2", "--in", "fw.bin", "--out", "fw.uf2", "--base", "0x20000000", "--family", "rp2040"};
  CliParser cli;
  cli.parse(a.argc(), a.argv());
  EXPECT_TRUE(cli.positional().empty());
  EXPECT_EQ("fw.bin", cli.get_or_positional("in", 0));
  EXPECT_EQ("fw.uf2", cli.get("out"));
  EXPECT_EQ("0x20000000", cli.get("base"));
  EXPECT_EQ("rp2040", cli.get("family"));
}

TEST(CliParserTest, OptionsMixWithPositionals) {
  Argv a{"bin2uf2", "--family", "data", "in.bin", "out.uf2"};
  CliParser cli;
  cli.parse(a.argc(), a.argv());
  EXPECT_EQ("data", cli.get("family"));
  EXPECT_EQ((std::vector<std::string>{"in.bin", "out.uf2"}), cli.positional());
}

TEST(CliParserTest, BareFlagIsTrue) {
  Argv a{"bin2uf2", "--help"};
  CliParser cli;
  cli.parse(a.argc(), a.argv());
  EXPECT_TRUE(cli.has("help"));
  EXPECT_EQ("true", cli.get("help"));
}

TEST(CliParserTest, FlagFollowedByOptionStaysBare) {
  Argv a{"bin2uf2", "--help", "--base", "16"};
  CliParser cli;
  cli.parse(a.argc(), a.argv());
  EXPECT_EQ("true", cli.get("help"));
  EXPECT_EQ("16", cli.get("base"));
}

TEST(CliParserTest, MissingKeysFallBackToDefault) {
  Argv a{"bin2uf2"};
  CliParser cli;
  cli.parse(a.argc(), a.argv());
  EXPECT_FALSE(cli.has("in"));
  EXPECT_EQ("", cli.get("in"));
  EXPECT_EQ("dflt", cli.get("in", "dflt"));
  EXPECT_EQ("", cli.get_or_positional("out", 1));
}

TEST(CliParserTest, ReparseClearsPreviousState) {
  CliParser cli;
  Argv first{"bin2uf2", "--base", "1", "x.bin"};
  cli.parse(first.argc(), first.argv());
  Argv second{"bin2uf2"};
  cli.parse(second.argc(), second.argv());
  EXPECT_FALSE(cli.has("base"));
  EXPECT_TRUE(cli.positional().empty());
}
