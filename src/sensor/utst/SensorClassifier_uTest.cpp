/**
 * @file SensorClassifier_uTest.cpp
 * @brief Unit tests for gpuprobe::sensor performance-record extraction.
 */

#include "src/sensor/inc/SensorClassifier.hpp"
#include "src/sensor/inc/SensorNames.hpp"

#include <cstdint> // std::int64_t
#include <limits>  // std::numeric_limits
#include <variant> // std::holds_alternative

#include <gtest/gtest.h>

namespace sensor = gpuprobe::sensor;

using sensor::buildPerfRecord;
using sensor::findSensor;
using sensor::isExcluded;
using sensor::numericValue;
using sensor::PerfRecord;
using sensor::PerfValue;
using sensor::SensorMap;
using sensor::SensorValue;
using sensor::Unavailable;

namespace {

SensorMap makeSnapshot() {
  SensorMap clocks;
  clocks.set("graphicsClock", std::int64_t{705});
  clocks.set("smClock", std::int64_t{705});
  clocks.set("videoClock", Unavailable{});

  SensorMap snap;
  snap.set("deviceIndex", std::int64_t{0});
  snap.set("productName", std::string("Tesla K20c"));
  snap.set("pciBusId", std::string("0000:03:00.0"));
  snap.set("GPUTemperature", std::int64_t{42});
  snap.set("usedMemory", 12.3456);
  snap.set("fanSpeed", Unavailable{});
  snap.set("persistenceMode", std::string("enabled"));
  snap.set("PWRUsage", std::string("48.126"));
  snap.set("memoryUsed", std::string("231"));
  snap.set("clocks", clocks);
  return snap;
}

} // namespace

/* ----------------------------- Exclusion Tests ----------------------------- */

/** @test Identity keys are excluded, sensors are not. */
TEST(SensorClassifierTest, ExclusionSet) {
  EXPECT_TRUE(isExcluded("deviceIndex"));
  EXPECT_TRUE(isExcluded("productName"));
  EXPECT_TRUE(isExcluded("pciBusId"));
  EXPECT_FALSE(isExcluded("GPUTemperature"));
  EXPECT_FALSE(isExcluded(""));
}

/* ----------------------------- numericValue Tests ----------------------------- */

/** @test Integers are preserved exactly. */
TEST(SensorClassifierTest, NumericInteger) {
  const auto VAL = numericValue(SensorValue{std::int64_t{123456789012}});
  ASSERT_TRUE(VAL.has_value());
  EXPECT_EQ(std::get<std::int64_t>(*VAL), 123456789012);
}

/** @test Floating values are rounded to two decimals. */
TEST(SensorClassifierTest, NumericFloatRounded) {
  const auto VAL = numericValue(SensorValue{99.456});
  ASSERT_TRUE(VAL.has_value());
  EXPECT_DOUBLE_EQ(std::get<double>(*VAL), 99.46);
}

/** @test Integer-looking text becomes an integer. */
TEST(SensorClassifierTest, NumericIntegerText) {
  const auto VAL = numericValue(SensorValue{std::string("-7")});
  ASSERT_TRUE(VAL.has_value());
  EXPECT_EQ(std::get<std::int64_t>(*VAL), -7);
}

/** @test Integer text beyond int64 becomes a double instead of saturating. */
TEST(SensorClassifierTest, NumericIntegerTextOutOfRange) {
  const auto BIG = numericValue(SensorValue{std::string("99999999999999999999")});
  ASSERT_TRUE(BIG.has_value());
  ASSERT_TRUE(std::holds_alternative<double>(*BIG));
  EXPECT_DOUBLE_EQ(std::get<double>(*BIG), 1e20);

  const auto NEG = numericValue(SensorValue{std::string("-99999999999999999999")});
  ASSERT_TRUE(NEG.has_value());
  EXPECT_DOUBLE_EQ(std::get<double>(*NEG), -1e20);

  const auto MAX = numericValue(SensorValue{std::string("9223372036854775807")});
  ASSERT_TRUE(MAX.has_value());
  EXPECT_EQ(std::get<std::int64_t>(*MAX), std::numeric_limits<std::int64_t>::max());

  const auto PLUS = numericValue(SensorValue{std::string("+42")});
  ASSERT_TRUE(PLUS.has_value());
  EXPECT_EQ(std::get<std::int64_t>(*PLUS), 42);
}

/** @test Decimal-looking text becomes a rounded double. */
TEST(SensorClassifierTest, NumericDecimalText) {
  const auto VAL = numericValue(SensorValue{std::string("3.14159")});
  ASSERT_TRUE(VAL.has_value());
  EXPECT_DOUBLE_EQ(std::get<double>(*VAL), 3.14);
}

/** @test Non-numeric values are not performance data. */
TEST(SensorClassifierTest, NumericRejects) {
  EXPECT_FALSE(numericValue(SensorValue{Unavailable{}}).has_value());
  EXPECT_FALSE(numericValue(SensorValue{std::string("N/A")}).has_value());
  EXPECT_FALSE(numericValue(SensorValue{std::string("enabled")}).has_value());
  EXPECT_FALSE(numericValue(SensorValue{std::string("12.")}).has_value());
  EXPECT_FALSE(numericValue(SensorValue{std::string("")}).has_value());
  EXPECT_FALSE(numericValue(SensorValue{SensorMap{}}).has_value());
}

/* ----------------------------- buildPerfRecord Tests ----------------------------- */

/** @test Unfiltered record flattens nested maps and drops non-numeric values. */
TEST(SensorClassifierTest, FlattenUnfiltered) {
  const PerfRecord REC = buildPerfRecord(makeSnapshot());

  EXPECT_EQ(REC.size(), 6U);
  EXPECT_EQ(std::get<std::int64_t>(REC.at("GPUTemperature")), 42);
  EXPECT_DOUBLE_EQ(std::get<double>(REC.at("usedMemory")), 12.35);
  EXPECT_DOUBLE_EQ(std::get<double>(REC.at("PWRUsage")), 48.13);
  EXPECT_EQ(std::get<std::int64_t>(REC.at("memoryUsed")), 231);
  EXPECT_EQ(std::get<std::int64_t>(REC.at("graphicsClock")), 705);
  EXPECT_EQ(std::get<std::int64_t>(REC.at("smClock")), 705);
}

/** @test N/A sensors never enter the record. */
TEST(SensorClassifierTest, UnavailableNotRecorded) {
  const PerfRecord REC = buildPerfRecord(makeSnapshot());
  EXPECT_EQ(REC.count("fanSpeed"), 0U);
  EXPECT_EQ(REC.count("videoClock"), 0U);
}

/** @test Excluded identity keys never enter the record. */
TEST(SensorClassifierTest, ExcludedNotRecorded) {
  const PerfRecord REC = buildPerfRecord(makeSnapshot());
  EXPECT_EQ(REC.count("deviceIndex"), 0U);
  EXPECT_EQ(REC.count("productName"), 0U);
}

/** @test Filter selects top-level keys only. */
TEST(SensorClassifierTest, FilterTopLevel) {
  const PerfRecord REC = buildPerfRecord(makeSnapshot(), {"GPUTemperature"});
  ASSERT_EQ(REC.size(), 1U);
  EXPECT_EQ(REC.count("GPUTemperature"), 1U);
}

/** @test Filtering on a nested parent includes all its children. */
TEST(SensorClassifierTest, FilterNestedParent) {
  const PerfRecord REC = buildPerfRecord(makeSnapshot(), {"clocks"});
  EXPECT_EQ(REC.size(), 2U);
  EXPECT_EQ(REC.count("graphicsClock"), 1U);
  EXPECT_EQ(REC.count("smClock"), 1U);
}

/** @test Filter names are not matched against nested keys. */
TEST(SensorClassifierTest, FilterIgnoresNestedNames) {
  const PerfRecord REC = buildPerfRecord(makeSnapshot(), {"smClock"});
  EXPECT_TRUE(REC.empty());
}

/** @test All-N/A snapshot yields an empty record. */
TEST(SensorClassifierTest, AllUnavailableEmpty) {
  SensorMap snap;
  snap.set("GPUTemperature", Unavailable{});
  snap.set("fanSpeed", Unavailable{});
  EXPECT_TRUE(buildPerfRecord(snap).empty());
}

/* ----------------------------- findSensor Tests ----------------------------- */

/** @test findSensor searches nested maps. */
TEST(SensorClassifierTest, FindNested) {
  const SensorMap SNAP = makeSnapshot();
  const SensorValue* v = findSensor(SNAP, "smClock");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(std::get<std::int64_t>(*v), 705);
  EXPECT_EQ(findSensor(SNAP, "missing"), nullptr);
}

/** @test forEachLeaf visits leaves only and skips excluded keys. */
TEST(SensorClassifierTest, ForEachLeaf) {
  std::vector<std::string> names;
  sensor::forEachLeaf(makeSnapshot(),
                      [&](const std::string& name, const SensorValue&) { names.push_back(name); });
  EXPECT_EQ(names.size(), 9U);
  for (const auto& NAME : names) {
    EXPECT_FALSE(isExcluded(NAME));
    EXPECT_NE(NAME, "clocks");
  }
}

/* ----------------------------- PerfValue Tests ----------------------------- */

/** @test PerfValue formatting keeps integers exact and pads decimals. */
TEST(PerfValueTest, ToString) {
  EXPECT_EQ(sensor::toString(PerfValue{std::int64_t{16}}), "16");
  EXPECT_EQ(sensor::toString(PerfValue{48.1}), "48.10");
  EXPECT_DOUBLE_EQ(sensor::toDouble(PerfValue{std::int64_t{3}}), 3.0);
}
