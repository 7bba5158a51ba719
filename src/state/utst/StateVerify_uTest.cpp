/**
 * @file StateVerify_uTest.cpp
 * @brief Unit tests for netstate::state document verification.
 */

#include "src/state/inc/StateVerify.hpp"

#include <gtest/gtest.h>

#include <string>

using netstate::state::loadStateDocument;
using netstate::state::StateDocument;
using netstate::state::verifyState;
using netstate::state::VerifyReport;

namespace {

StateDocument load(const char* text) {
  StateDocument doc{};
  std::string error;
  EXPECT_TRUE(loadStateDocument(text, doc, error)) << error;
  return doc;
}

constexpr const char* CURRENT = R"(
interfaces:
  - name: eth1
    type: ethernet
    state: up
    ethernet:
      auto-negotiation: false
      speed: 10000
      duplex: full
      sr-iov:
        total-vfs: 2
        vfs:
          - id: 0
            mac-address: AA:BB:CC:DD:EE:00
            trust: true
          - id: 1
  - name: eth1v0
    type: ethernet
    state: up
  - name: eth1v1
    type: ethernet
    state: down
  - name: eth2
    type: ethernet
    state: down
)";

} // namespace

/** @test Matching state passes, including generated VFs in any state. */
TEST(StateVerifyTest, MatchingStatePasses) {
  const VerifyReport REPORT = verifyState(load(R"(
interfaces:
  - name: eth1
    type: ethernet
    state: up
    ethernet:
      speed: 10000
      sr-iov:
        total-vfs: 2
        vfs:
          - id: 0
            mac-address: aa:bb:cc:dd:ee:00
)"),
                                          load(CURRENT));

  EXPECT_TRUE(REPORT.passed());
  ASSERT_EQ(REPORT.results.size(), 3U);
  EXPECT_EQ(REPORT.results[0].iface, "eth1");
  EXPECT_FALSE(REPORT.results[0].generatedVf);
  EXPECT_EQ(REPORT.results[1].iface, "eth1v0");
  EXPECT_TRUE(REPORT.results[1].generatedVf);
  EXPECT_EQ(REPORT.results[2].toString(), "eth1v1 (generated vf): OK");
}

/** @test Field mismatches are reported per interface. */
TEST(StateVerifyTest, MismatchReported) {
  const VerifyReport REPORT = verifyState(load(R"(
interfaces:
  - name: eth1
    ethernet:
      duplex: half
)"),
                                          load(CURRENT));

  EXPECT_FALSE(REPORT.passed());
  EXPECT_EQ(REPORT.failureCount(), 1U);
  ASSERT_EQ(REPORT.results.size(), 1U);
  EXPECT_EQ(REPORT.results[0].toString(), "eth1: FAIL duplex: desired half, current full");
}

/** @test Generated VFs must exist in current state. */
TEST(StateVerifyTest, MissingGeneratedVf) {
  const VerifyReport REPORT = verifyState(load(R"(
interfaces:
  - name: eth1
    ethernet:
      sr-iov:
        total-vfs: 3
)"),
                                          load(CURRENT));

  EXPECT_EQ(REPORT.failureCount(), 2U);
  ASSERT_EQ(REPORT.results.size(), 4U);
  EXPECT_EQ(REPORT.results[0].error->field, "sr-iov.total-vfs");
  EXPECT_EQ(REPORT.results[3].iface, "eth1v2");
  EXPECT_EQ(REPORT.results[3].error->field, "name");
}

/** @test Absent interfaces pass when missing or down, fail when up. */
TEST(StateVerifyTest, AbsentInterfaces) {
  const VerifyReport REPORT = verifyState(load(R"(
interfaces:
  - name: eth2
    state: absent
  - name: eth9
    state: absent
  - name: eth1v0
    state: absent
)"),
                                          load(CURRENT));

  ASSERT_EQ(REPORT.results.size(), 3U);
  EXPECT_TRUE(REPORT.results[0].passed());
  EXPECT_TRUE(REPORT.results[1].passed());
  ASSERT_FALSE(REPORT.results[2].passed());
  EXPECT_EQ(REPORT.results[2].error->reason, "desired absent, current up");
}

/** @test Desired interfaces missing from current state fail. */
TEST(StateVerifyTest, MissingInterface) {
  const VerifyReport REPORT =
      verifyState(load("interfaces:\n  - name: eth7\n    state: up\n"), load(CURRENT));
  ASSERT_EQ(REPORT.results.size(), 1U);
  EXPECT_EQ(REPORT.results[0].toString(),
            "eth7: FAIL name: interface not found in current state");
}

/** @test Descriptors beyond total-vfs are not verified. */
TEST(StateVerifyTest, TrimsDescriptorsBeforeVerify) {
  const VerifyReport REPORT = verifyState(load(R"(
interfaces:
  - name: eth1
    ethernet:
      sr-iov:
        total-vfs: 2
        vfs:
          - id: 0
          - id: 1
          - id: 5
            trust: true
)"),
                                          load(CURRENT));
  EXPECT_TRUE(REPORT.passed());
}
