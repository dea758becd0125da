/**
 * @file Evaluator_uTest.cpp
 * @brief Unit tests for continuous, discrete, and aggregate evaluation.
 */

#include "src/eval/inc/Evaluator.hpp"

#include <gtest/gtest.h>

namespace eval = gpuprobe::eval;
namespace sensor = gpuprobe::sensor;

using eval::EvaluationResult;
using eval::Severity;
using gpuprobe::threshold::ThresholdTable;
using sensor::PerfRecord;
using sensor::SensorMap;
using sensor::Unavailable;

namespace {

SensorMap throttleFlags(bool hwSlowdown, bool unknown, bool idle) {
  SensorMap flags;
  flags.set("gpuIdle", std::string(idle ? "active" : "inactive"));
  flags.set("swPowerCap", std::string("inactive"));
  flags.set("hwSlowdown", std::string(hwSlowdown ? "active" : "inactive"));
  flags.set("unknown", std::string(unknown ? "active" : "inactive"));
  return flags;
}

/// Snapshot with every sensor within its default limits.
SensorMap nominalSnapshot() {
  SensorMap ecc;
  for (const char* name : {"ECCMemAggSgl", "ECCL1AggSgl", "ECCL2AggSgl", "ECCRegAggSgl",
                           "ECCTexAggSgl", "ECCMemAggDbl", "ECCL1AggDbl", "ECCL2AggDbl",
                           "ECCRegAggDbl", "ECCTexAggDbl"}) {
    ecc.set(name, std::int64_t{0});
  }

  SensorMap pcie;
  pcie.set("PCIeLinkGen", std::int64_t{2});
  pcie.set("PCIeLinkWidth", std::int64_t{16});

  SensorMap snap;
  snap.set("productName", std::string("Tesla K20c"));
  snap.set("GPUTemperature", std::int64_t{40});
  snap.set("usedMemory", 10.5);
  snap.set("fanSpeed", std::int64_t{30});
  snap.set("PWRUsage", 50.25);
  snap.set("persistenceMode", std::string("enabled"));
  snap.set("inforomValid", std::string("valid"));
  snap.set("eccErrors", ecc);
  snap.set("pcieLink", pcie);
  snap.set("clocksThrottleReasons", throttleFlags(false, false, true));
  return snap;
}

EvaluationResult run(const SensorMap& snap, const ThresholdTable& table) {
  return eval::evaluate(snap, sensor::buildPerfRecord(snap), table);
}

EvaluationResult run(const SensorMap& snap) { return run(snap, ThresholdTable::defaults()); }

/// Replace a child inside a nested group.
void setNested(SensorMap& snap, const char* group, const char* name, sensor::SensorValue value) {
  SensorMap inner = std::get<SensorMap>(snap.find(group)->value);
  inner.set(name, std::move(value));
  snap.set(group, std::move(inner));
}

} // namespace

/* ----------------------------- Continuous Tests ----------------------------- */

/** @test Nominal snapshot evaluates OK. */
TEST(EvaluatorTest, NominalOk) {
  const EvaluationResult R = run(nominalSnapshot());
  EXPECT_EQ(R.severity, Severity::Ok);
  EXPECT_TRUE(R.warnings.empty());
  EXPECT_TRUE(R.criticals.empty());
}

/** @test Temperature 90 with defaults is Warning only. */
TEST(EvaluatorTest, TemperatureWarning) {
  SensorMap snap = nominalSnapshot();
  snap.set("GPUTemperature", std::int64_t{90});
  const EvaluationResult R = run(snap);
  EXPECT_EQ(R.severity, Severity::Warning);
  EXPECT_TRUE(R.isWarning("GPUTemperature"));
  EXPECT_FALSE(R.isCritical("GPUTemperature"));
  EXPECT_EQ(R.warnings.at("GPUTemperature"), "90");
}

/** @test Temperature 101 is Critical only. */
TEST(EvaluatorTest, TemperatureCritical) {
  SensorMap snap = nominalSnapshot();
  snap.set("GPUTemperature", std::int64_t{101});
  const EvaluationResult R = run(snap);
  EXPECT_EQ(R.severity, Severity::Critical);
  EXPECT_TRUE(R.isCritical("GPUTemperature"));
  EXPECT_FALSE(R.isWarning("GPUTemperature"));
}

/** @test Range boundaries: below w, at w, just below c, at c. */
TEST(EvaluatorTest, RangeBoundaries) {
  ThresholdTable table;
  table.setRange("x", 10, 20);

  struct Case {
    double value;
    bool warn;
    bool crit;
  };
  for (const Case C : {Case{9.99, false, false}, Case{10, true, false}, Case{19.99, true, false},
                       Case{20, false, true}, Case{35, false, true}}) {
    PerfRecord rec{{"x", C.value}};
    EvaluationResult r;
    eval::evaluatePerf(rec, table, r);
    EXPECT_EQ(r.isWarning("x"), C.warn) << C.value;
    EXPECT_EQ(r.isCritical("x"), C.crit) << C.value;
  }
}

/** @test Sensors without a threshold are never flagged. */
TEST(EvaluatorTest, NoThresholdNotEvaluated) {
  PerfRecord rec{{"smClock", std::int64_t{100000}}};
  EvaluationResult r;
  eval::evaluatePerf(rec, ThresholdTable::defaults(), r);
  EXPECT_EQ(r.severity, Severity::Ok);
}

/** @test Equality thresholds are not range-compared in the continuous stage. */
TEST(EvaluatorTest, EqualityNotRangeCompared) {
  PerfRecord rec{{"PCIeLinkWidth", std::int64_t{32}}};
  EvaluationResult r;
  eval::evaluatePerf(rec, ThresholdTable::defaults(), r);
  EXPECT_EQ(r.severity, Severity::Ok);
}

/** @test Single-bit ECC counters use their range thresholds. */
TEST(EvaluatorTest, SingleBitEccRange) {
  SensorMap snap = nominalSnapshot();
  setNested(snap, "eccErrors", "ECCL2AggSgl", sensor::SensorValue{std::int64_t{1}});
  setNested(snap, "eccErrors", "ECCMemAggSgl", sensor::SensorValue{std::int64_t{5}});
  const EvaluationResult R = run(snap);
  EXPECT_TRUE(R.isWarning("ECCL2AggSgl"));
  EXPECT_TRUE(R.isCritical("ECCMemAggSgl"));
  EXPECT_EQ(R.severity, Severity::Critical);
}

/* ----------------------------- Discrete Tests ----------------------------- */

/** @test Double-bit ECC count 3 is Critical regardless of thresholds. */
TEST(EvaluatorTest, DoubleBitEccCritical) {
  SensorMap snap = nominalSnapshot();
  setNested(snap, "eccErrors", "ECCTexAggDbl", sensor::SensorValue{std::int64_t{3}});
  const EvaluationResult R = run(snap, ThresholdTable{});
  EXPECT_EQ(R.severity, Severity::Critical);
  EXPECT_TRUE(R.isCritical("ECCTexAggDbl"));
  EXPECT_EQ(R.criticals.at("ECCTexAggDbl"), "3");
}

/** @test Unavailable or error-text double-bit counters are skipped. */
TEST(EvaluatorTest, DoubleBitEccUnavailableSkipped) {
  SensorMap snap = nominalSnapshot();
  setNested(snap, "eccErrors", "ECCMemAggDbl", sensor::SensorValue{Unavailable{}});
  setNested(snap, "eccErrors", "ECCL1AggDbl", sensor::SensorValue{std::string("Unknown Error")});
  EXPECT_EQ(run(snap).severity, Severity::Ok);
}

/** @test Disabled persistence mode is Warning, not Critical. */
TEST(EvaluatorTest, PersistenceDisabledWarning) {
  SensorMap snap = nominalSnapshot();
  snap.set("persistenceMode", std::string("disabled"));
  const EvaluationResult R = run(snap);
  EXPECT_EQ(R.severity, Severity::Warning);
  EXPECT_TRUE(R.isWarning("persistenceMode"));
  EXPECT_EQ(R.warnings.at("persistenceMode"), "disabled");
}

/** @test Disabled persistence never downgrades an existing Critical. */
TEST(EvaluatorTest, PersistenceDoesNotDowngrade) {
  SensorMap snap = nominalSnapshot();
  snap.set("persistenceMode", std::string("disabled"));
  snap.set("GPUTemperature", std::int64_t{120});
  const EvaluationResult R = run(snap);
  EXPECT_EQ(R.severity, Severity::Critical);
  EXPECT_TRUE(R.isWarning("persistenceMode"));
  EXPECT_TRUE(R.isCritical("GPUTemperature"));
}

/** @test Invalid inforom is Critical. */
TEST(EvaluatorTest, InforomInvalidCritical) {
  SensorMap snap = nominalSnapshot();
  snap.set("inforomValid", std::string("invalid"));
  const EvaluationResult R = run(snap);
  EXPECT_EQ(R.severity, Severity::Critical);
  EXPECT_TRUE(R.isCritical("inforomValid"));
}

/** @test Hardware slowdown throttling is Critical; idle is not. */
TEST(EvaluatorTest, ThrottleHwSlowdownCritical) {
  SensorMap snap = nominalSnapshot();
  snap.set("clocksThrottleReasons", throttleFlags(true, false, true));
  const EvaluationResult R = run(snap);
  EXPECT_EQ(R.severity, Severity::Critical);
  EXPECT_EQ(R.criticals.at("clocksThrottleReasons"), "hwSlowdown");
}

/** @test Unknown throttle reason is Critical; both reasons listed. */
TEST(EvaluatorTest, ThrottleUnknownCritical) {
  SensorMap snap = nominalSnapshot();
  snap.set("clocksThrottleReasons", throttleFlags(true, true, false));
  const EvaluationResult R = run(snap);
  EXPECT_EQ(R.criticals.at("clocksThrottleReasons"), "hwSlowdown,unknown");
}

/** @test Unavailable throttle reasons are skipped. */
TEST(EvaluatorTest, ThrottleUnavailableSkipped) {
  SensorMap snap = nominalSnapshot();
  snap.set("clocksThrottleReasons", Unavailable{});
  EXPECT_EQ(run(snap).severity, Severity::Ok);
}

/** @test PCIe generation 1 against expected 2 is Critical. */
TEST(EvaluatorTest, PcieGenMismatchCritical) {
  SensorMap snap = nominalSnapshot();
  setNested(snap, "pcieLink", "PCIeLinkGen", sensor::SensorValue{std::int64_t{1}});
  const EvaluationResult R = run(snap);
  EXPECT_EQ(R.severity, Severity::Critical);
  EXPECT_TRUE(R.isCritical("PCIeLinkGen"));
}

/** @test PCIe link above expected is also a mismatch. */
TEST(EvaluatorTest, PcieWidthAboveExpectedCritical) {
  SensorMap snap = nominalSnapshot();
  ThresholdTable table = ThresholdTable::defaults();
  table.setEquality("PCIeLinkWidth", 8);
  const EvaluationResult R = run(snap, table);
  EXPECT_TRUE(R.isCritical("PCIeLinkWidth"));
}

/** @test PCIe error text is a mismatch; N/A is skipped. */
TEST(EvaluatorTest, PcieNonNumeric) {
  SensorMap snap = nominalSnapshot();
  setNested(snap, "pcieLink", "PCIeLinkGen", sensor::SensorValue{std::string("Unknown Error")});
  setNested(snap, "pcieLink", "PCIeLinkWidth", sensor::SensorValue{Unavailable{}});
  const EvaluationResult R = run(snap);
  EXPECT_TRUE(R.isCritical("PCIeLinkGen"));
  EXPECT_FALSE(R.isCritical("PCIeLinkWidth"));
}

/* ----------------------------- Aggregate Tests ----------------------------- */

/** @test All-N/A snapshot: OK and empty record. */
TEST(EvaluatorTest, AllUnavailableOk) {
  SensorMap snap;
  snap.set("productName", std::string("Tesla K20c"));
  for (const char* name : {"GPUTemperature", "fanSpeed", "usedMemory", "persistenceMode",
                           "inforomValid", "clocksThrottleReasons", "PCIeLinkGen"}) {
    snap.set(name, Unavailable{});
  }
  EXPECT_TRUE(sensor::buildPerfRecord(snap).empty());
  const EvaluationResult R = run(snap);
  EXPECT_EQ(R.severity, Severity::Ok);
  EXPECT_TRUE(R.warnings.empty());
  EXPECT_TRUE(R.criticals.empty());
}

/** @test Severity is the max across stages; sets stay disjoint. */
TEST(EvaluatorTest, MaxSeverityAndDisjoint) {
  SensorMap snap = nominalSnapshot();
  snap.set("fanSpeed", std::int64_t{85});
  snap.set("persistenceMode", std::string("disabled"));
  snap.set("usedMemory", 99.5);
  snap.set("inforomValid", std::string("invalid"));
  const EvaluationResult R = run(snap);

  EXPECT_EQ(R.severity, Severity::Critical);
  EXPECT_EQ(R.warnings.size(), 2U);
  EXPECT_EQ(R.criticals.size(), 2U);
  for (const auto& [NAME, VALUE] : R.criticals) {
    EXPECT_EQ(R.warnings.count(NAME), 0U) << NAME;
  }
}

/** @test Evaluating twice yields identical results. */
TEST(EvaluatorTest, Idempotent) {
  SensorMap snap = nominalSnapshot();
  snap.set("GPUTemperature", std::int64_t{95});
  snap.set("persistenceMode", std::string("disabled"));
  EXPECT_EQ(run(snap), run(snap));
}
