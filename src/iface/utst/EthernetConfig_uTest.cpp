/**
 * @file EthernetConfig_uTest.cpp
 * @brief Unit tests for netstate::iface::EthernetConfig transformations.
 */

#include "src/iface/inc/EthernetConfig.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using netstate::iface::canonicalize;
using netstate::iface::EthernetConfig;
using netstate::iface::normalizeVfMacs;
using netstate::iface::SriovConfig;
using netstate::iface::totalVfsMatchesList;
using netstate::iface::trimVfDescriptors;
using netstate::iface::VfDescriptor;

namespace {

std::vector<VfDescriptor> makeVfs(std::int64_t count) {
  std::vector<VfDescriptor> vfs;
  for (std::int64_t i = 0; i < count; ++i) {
    VfDescriptor vf{};
    vf.id = i;
    vf.maxTxRate = 100 * (i + 1);
    vfs.push_back(vf);
  }
  return vfs;
}

EthernetConfig sriovConfig(std::int64_t totalVfs, std::int64_t descriptors) {
  EthernetConfig cfg{};
  cfg.sriov = SriovConfig{totalVfs, makeVfs(descriptors)};
  return cfg;
}

} // namespace

/* ----------------------------- canonicalize ----------------------------- */

/** @test Auto-negotiation on drops explicit speed and duplex. */
TEST(CanonicalizeTest, AutoNegRemovesSpeedDuplex) {
  EthernetConfig cfg{};
  cfg.autoNegotiation = true;
  cfg.speed = 1000;
  cfg.duplex = "full";

  canonicalize(cfg);

  EXPECT_EQ(cfg.autoNegotiation, true);
  EXPECT_FALSE(cfg.speed.has_value());
  EXPECT_FALSE(cfg.duplex.has_value());
}

/** @test Speed and duplex survive when auto-negotiation is off or unset. */
TEST(CanonicalizeTest, KeepsExplicitLinkWithoutAutoNeg) {
  EthernetConfig off{};
  off.autoNegotiation = false;
  off.speed = 100;
  off.duplex = "half";
  canonicalize(off);
  EXPECT_EQ(off.speed, 100);
  EXPECT_EQ(off.duplex, "half");

  EthernetConfig unset{};
  unset.speed = 10;
  canonicalize(unset);
  EXPECT_EQ(unset.speed, 10);
}

/** @test Applying canonicalize twice equals applying it once. */
TEST(CanonicalizeTest, Idempotent) {
  for (const bool AUTONEG : {true, false}) {
    EthernetConfig cfg{};
    cfg.autoNegotiation = AUTONEG;
    cfg.speed = 25000;
    cfg.duplex = "full";

    canonicalize(cfg);
    const EthernetConfig ONCE = cfg;
    canonicalize(cfg);
    EXPECT_EQ(cfg, ONCE);
  }
}

/* ----------------------------- normalizeVfMacs ----------------------------- */

/** @test VF MACs are upper-cased, absent MACs stay absent. */
TEST(NormalizeVfMacsTest, UpperCases) {
  EthernetConfig cfg = sriovConfig(2, 2);
  (*cfg.sriov->vfs)[0].macAddress = "aa:bb:cc:dd:ee:ff";

  normalizeVfMacs(cfg);

  EXPECT_EQ((*cfg.sriov->vfs)[0].macAddress, "AA:BB:CC:DD:EE:FF");
  EXPECT_FALSE((*cfg.sriov->vfs)[1].macAddress.has_value());
}

/** @test Configs without sr-iov are left untouched. */
TEST(NormalizeVfMacsTest, NoSriovNoop) {
  EthernetConfig cfg{};
  cfg.speed = 1000;
  const EthernetConfig BEFORE = cfg;
  normalizeVfMacs(cfg);
  EXPECT_EQ(cfg, BEFORE);
}

/* ----------------------------- trimVfDescriptors ----------------------------- */

/** @test Five descriptors with total-vfs 2 keep the first two in order. */
TEST(TrimVfDescriptorsTest, DropsTrailingEntries) {
  EthernetConfig cfg = sriovConfig(2, 5);
  const std::vector<VfDescriptor> ORIGINAL = *cfg.sriov->vfs;

  EXPECT_EQ(trimVfDescriptors(cfg), 3U);

  ASSERT_EQ(cfg.sriov->vfs->size(), 2U);
  EXPECT_EQ((*cfg.sriov->vfs)[0], ORIGINAL[0]);
  EXPECT_EQ((*cfg.sriov->vfs)[1], ORIGINAL[1]);
}

/** @test Lists within bounds are not modified. */
TEST(TrimVfDescriptorsTest, WithinBoundsNoop) {
  EthernetConfig cfg = sriovConfig(4, 2);
  EXPECT_EQ(trimVfDescriptors(cfg), 0U);
  EXPECT_EQ(cfg.sriov->vfs->size(), 2U);

  EthernetConfig none{};
  EXPECT_EQ(trimVfDescriptors(none), 0U);
}

/** @test Unset total-vfs counts as zero. */
TEST(TrimVfDescriptorsTest, UnsetTotalClearsList) {
  EthernetConfig cfg{};
  cfg.sriov = SriovConfig{std::nullopt, makeVfs(3)};
  EXPECT_EQ(trimVfDescriptors(cfg), 3U);
  EXPECT_TRUE(cfg.sriov->vfs->empty());
}

/* ----------------------------- totalVfsMatchesList ----------------------------- */

/** @test Only an exact count matches. */
TEST(TotalVfsMatchesListTest, ExactCount) {
  EXPECT_TRUE(totalVfsMatchesList(3, makeVfs(3)));
  EXPECT_FALSE(totalVfsMatchesList(3, makeVfs(1)));
  EXPECT_TRUE(totalVfsMatchesList(0, {}));
}

/* ----------------------------- merge ----------------------------- */

/** @test Set fields override, unset fields keep the current value. */
TEST(EthernetConfigMergeTest, OverlaysSetFields) {
  EthernetConfig current{};
  current.speed = 1000;
  current.duplex = "full";
  current.sriov = SriovConfig{4, makeVfs(4)};

  EthernetConfig desired{};
  desired.duplex = "half";
  desired.sriov = SriovConfig{2, std::nullopt};

  current.merge(desired);

  EXPECT_EQ(current.speed, 1000);
  EXPECT_EQ(current.duplex, "half");
  EXPECT_EQ(current.sriov->totalVfs, 2);
  EXPECT_EQ(current.sriov->vfCount(), 4U);
}

/** @test A desired vfs list replaces the current list whole. */
TEST(EthernetConfigMergeTest, VfListReplaced) {
  EthernetConfig current = sriovConfig(4, 4);
  EthernetConfig desired{};
  desired.sriov = SriovConfig{std::nullopt, makeVfs(1)};

  current.merge(desired);

  EXPECT_EQ(current.sriov->totalVfs, 4);
  EXPECT_EQ(current.sriov->vfCount(), 1U);
}
