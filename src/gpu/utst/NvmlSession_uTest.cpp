/**
 * @file NvmlSession_uTest.cpp
 * @brief Unit tests for gpuprobe::gpu::NvmlSession.
 *
 * Notes:
 *  - Tests verify structural invariants, not specific hardware values.
 *  - Tests pass even when no GPU or NVML is present (graceful degradation).
 */

#include "src/gpu/inc/NvmlSession.hpp"

#include <gtest/gtest.h>

using gpuprobe::gpu::NvmlSession;

/** @test A session is either valid with no error or invalid with an error. */
TEST(NvmlSessionTest, ValidXorError) {
  NvmlSession session;
  EXPECT_NE(session.valid(), !session.error().empty());
}

/** @test Explicit shutdown releases the session. */
TEST(NvmlSessionTest, ShutdownReleases) {
  NvmlSession session;
  std::string error;
  const bool OK = session.shutdown(error);
  EXPECT_FALSE(session.valid());
  if (OK) {
    EXPECT_TRUE(error.empty());
  } else {
    EXPECT_FALSE(error.empty());
  }
}

/** @test Second shutdown is a no-op. */
TEST(NvmlSessionTest, ShutdownIdempotent) {
  NvmlSession session;
  std::string error;
  (void)session.shutdown(error);
  error.clear();
  EXPECT_TRUE(session.shutdown(error));
  EXPECT_TRUE(error.empty());
}

/** @test Sessions can be opened again after release. */
TEST(NvmlSessionTest, Reopen) {
  bool firstValid = false;
  {
    NvmlSession first;
    firstValid = first.valid();
  }
  NvmlSession second;
  EXPECT_EQ(second.valid(), firstValid);
}
