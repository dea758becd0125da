/**
 * @file Args_uTest.cpp
 * @brief Unit tests for gpuprobe::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace args = gpuprobe::helpers::args;

namespace {

enum Key : std::uint8_t { KEY_DEVICE = 0, KEY_LIST = 1, KEY_VERBOSE = 2, KEY_HIDDEN = 3 };

args::ArgMap testMap() {
  args::ArgMap map;
  map[KEY_DEVICE] = {"-di", "--device-id", 1, true, "Device"};
  map[KEY_LIST] = {"-s", "--sensors", 1, false, "Sensors"};
  map[KEY_VERBOSE] = {"-v", "--verbose", 0, false, "Verbose"};
  map[KEY_HIDDEN] = {"-vv", "", 0, false};
  return map;
}

bool parse(std::vector<std::string_view> argv, args::ParsedArgs& out, std::string& error) {
  return args::parseArgs(argv, testMap(), out, error);
}

} // namespace

/** @test Flag and alias both populate the same key. */
TEST(ArgsTest, FlagAndAlias) {
  args::ParsedArgs out;
  std::string error;
  ASSERT_TRUE(parse({"--device-id", "2"}, out, error)) << error;
  ASSERT_EQ(out[KEY_DEVICE].size(), 1U);
  EXPECT_EQ(out[KEY_DEVICE][0], "2");
}

/** @test Repeated flags append values in order. */
TEST(ArgsTest, RepeatedValuesAppend) {
  args::ParsedArgs out;
  std::string error;
  ASSERT_TRUE(parse({"-di", "0", "-s", "a,b", "--sensors", "c"}, out, error)) << error;
  ASSERT_EQ(out[KEY_LIST].size(), 2U);
  EXPECT_EQ(out[KEY_LIST][0], "a,b");
  EXPECT_EQ(out[KEY_LIST][1], "c");
}

/** @test Zero-arity flags record one entry per occurrence. */
TEST(ArgsTest, CountedFlags) {
  args::ParsedArgs out;
  std::string error;
  ASSERT_TRUE(parse({"-v", "-di", "0", "-v", "-vv"}, out, error)) << error;
  EXPECT_EQ(out[KEY_VERBOSE].size(), 2U);
  EXPECT_EQ(out[KEY_HIDDEN].size(), 1U);
}

/** @test Unknown tokens are rejected with the token in the message. */
TEST(ArgsTest, UnknownRejected) {
  args::ParsedArgs out;
  std::string error;
  EXPECT_FALSE(parse({"-di", "0", "extra"}, out, error));
  EXPECT_NE(error.find("'extra'"), std::string::npos);
}

/** @test Missing value is an error. */
TEST(ArgsTest, MissingValue) {
  args::ParsedArgs out;
  std::string error;
  EXPECT_FALSE(parse({"-di"}, out, error));
  EXPECT_FALSE(error.empty());
}

/** @test Required flag must be present. */
TEST(ArgsTest, RequiredMissing) {
  args::ParsedArgs out;
  std::string error;
  EXPECT_FALSE(parse({"-v"}, out, error));
  EXPECT_NE(error.find("-di"), std::string::npos);
}

/** @test Empty argument list is an error. */
TEST(ArgsTest, NoArguments) {
  args::ParsedArgs out;
  std::string error;
  EXPECT_FALSE(parse({}, out, error));
  EXPECT_FALSE(error.empty());
}
