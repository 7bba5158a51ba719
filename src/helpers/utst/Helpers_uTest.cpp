/**
 * @file Helpers_uTest.cpp
 * @brief Unit tests for netstate::helpers string, format and argument utilities.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using netstate::helpers::args::ArgMap;
using netstate::helpers::args::parseArgs;
using netstate::helpers::args::ParsedArgs;
using netstate::helpers::format::jsonString;
using netstate::helpers::format::jsonStringArray;
using netstate::helpers::strings::join;
using netstate::helpers::strings::splitOn;
using netstate::helpers::strings::toUpper;

/* ----------------------------- Strings ----------------------------- */

/** @test Only ASCII letters change case. */
TEST(StringsTest, ToUpper) { EXPECT_EQ(toUpper("aa:bb:0f"), "AA:BB:0F"); }

/** @test Splits keep empty edge parts. */
TEST(StringsTest, SplitOn) {
  EXPECT_EQ(splitOn("ens2f0np0", "np"), (std::vector<std::string>{"ens2f0", "0"}));
  EXPECT_EQ(splitOn("np", "np"), (std::vector<std::string>{"", ""}));
  EXPECT_EQ(splitOn("eth0", "np"), std::vector<std::string>{"eth0"});
  EXPECT_EQ(splitOn("eth0", ""), std::vector<std::string>{"eth0"});
}

/** @test Join places the separator between parts only. */
TEST(StringsTest, Join) {
  EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
  EXPECT_EQ(join({}, ", "), "");
}

/* ----------------------------- Format ----------------------------- */

/** @test JSON strings escape quotes, backslashes and control characters. */
TEST(FormatTest, JsonString) {
  EXPECT_EQ(jsonString("eth0"), "\"eth0\"");
  EXPECT_EQ(jsonString("a\"b\\c"), "\"a\\\"b\\\\c\"");
  EXPECT_EQ(jsonString("x\ny"), "\"x\\ny\"");
  EXPECT_EQ(jsonString(std::string(1, '\x01')), "\"\\u0001\"");
}

/** @test JSON arrays of strings. */
TEST(FormatTest, JsonStringArray) {
  EXPECT_EQ(jsonStringArray({}), "[]");
  EXPECT_EQ(jsonStringArray({"eth0v2", "eth0v3"}), "[\"eth0v2\", \"eth0v3\"]");
}

/* ----------------------------- Args ----------------------------- */

namespace {

ArgMap testMap() {
  ArgMap map;
  map[0] = {"--help", 0, false, "Help"};
  map[1] = {"--desired", 1, true, "Desired file"};
  map[2] = {"--json", 0, false, "JSON"};
  return map;
}

} // namespace

/** @test Flags and their values are collected. */
TEST(ArgsTest, ParsesFlags) {
  char prog[] = "tool";
  char desired[] = "--desired";
  char file[] = "state.yml";
  char json[] = "--json";
  char* argv[] = {prog, desired, file, json};

  ParsedArgs pargs;
  std::string error;
  ASSERT_TRUE(parseArgs(4, argv, testMap(), pargs, error)) << error;
  EXPECT_EQ(pargs.value(1), "state.yml");
  EXPECT_TRUE(pargs.has(2));
  EXPECT_FALSE(pargs.has(0));
}

/** @test Missing values, unknown tokens and missing required flags are errors. */
TEST(ArgsTest, Errors) {
  char prog[] = "tool";
  char desired[] = "--desired";
  char bogus[] = "--bogus";
  char json[] = "--json";

  ParsedArgs pargs;
  std::string error;

  char* missingValue[] = {prog, desired};
  EXPECT_FALSE(parseArgs(2, missingValue, testMap(), pargs, error));
  EXPECT_EQ(error, "Flag '--desired' expects 1 value(s)");

  char* unknown[] = {prog, bogus};
  EXPECT_FALSE(parseArgs(2, unknown, testMap(), pargs, error));
  EXPECT_EQ(error, "Unknown argument '--bogus'");

  ParsedArgs fresh;
  char* missingRequired[] = {prog, json};
  EXPECT_FALSE(parseArgs(2, missingRequired, testMap(), fresh, error));
  EXPECT_EQ(error, "Missing required argument '--desired'");
  EXPECT_TRUE(fresh.has(2));
}
