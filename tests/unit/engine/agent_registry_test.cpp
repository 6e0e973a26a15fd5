// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <sortie/engine/agent.h>

#include "engine_fixtures.h"

using namespace sortie;
using namespace sortie::engine;
using namespace std::chrono_literals;
using sortie::test::at;
using sortie::test::t0;

TEST(AgentLivenessTest, CountsWholeMissedWindows) {
    auto a = test::agent("a1");
    a.beaconInterval = 10s;
    a.jitter = 5s;
    EXPECT_EQ(missedBeaconWindows(a, at(14s)), 0u);
    EXPECT_EQ(missedBeaconWindows(a, at(15s)), 1u);
    EXPECT_EQ(missedBeaconWindows(a, at(44s)), 2u);
    EXPECT_EQ(missedBeaconWindows(a, t0() - 5s), 0u);
}

TEST(AgentLivenessTest, ActiveStaleDead) {
    auto a = test::agent("a1");
    a.beaconInterval = 10s;
    EXPECT_EQ(evaluateLiveness(a, at(9s), 3), AgentState::Active);
    EXPECT_EQ(evaluateLiveness(a, at(10s), 3), AgentState::Stale);
    EXPECT_EQ(evaluateLiveness(a, at(29s), 3), AgentState::Stale);
    EXPECT_EQ(evaluateLiveness(a, at(30s), 3), AgentState::Dead);
}

TEST(AgentLivenessTest, ZeroIntervalDoesNotKillImmediately) {
    auto a = test::agent("a1");
    a.beaconInterval = 0s;
    a.jitter = 0s;
    EXPECT_EQ(evaluateLiveness(a, t0(), 3), AgentState::Active);
}

TEST(AgentRegistryTest, FirstBeaconRegistersWithDefaults) {
    AgentRegistry registry(60s, 5s);
    BeaconInfo beacon;
    beacon.agentId = "a1";
    beacon.platform = "linux";
    beacon.executors = {"sh"};
    auto r = registry.checkIn(beacon, t0());
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().beaconInterval, 60s);
    EXPECT_EQ(r.value().jitter, 5s);
    EXPECT_EQ(r.value().firstSeen, t0());
    EXPECT_EQ(registry.size(), 1u);
}

TEST(AgentRegistryTest, FirstBeaconNeedsPlatform) {
    AgentRegistry registry(60s, 0s);
    BeaconInfo beacon;
    beacon.agentId = "a1";
    auto r = registry.checkIn(beacon, t0());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(AgentRegistryTest, GeneratesIdWhenAbsent) {
    AgentRegistry registry(60s, 0s);
    BeaconInfo beacon;
    beacon.platform = "windows";
    auto r = registry.checkIn(beacon, t0());
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().id.size(), 36u);
    EXPECT_TRUE(registry.find(r.value().id).has_value());
}

TEST(AgentRegistryTest, LaterBeaconRefreshesOnlyTiming) {
    AgentRegistry registry(60s, 0s);
    BeaconInfo first;
    first.agentId = "a1";
    first.platform = "linux";
    first.hostname = "web01";
    ASSERT_TRUE(registry.checkIn(first, t0()));

    BeaconInfo later;
    later.agentId = "a1";
    later.platform = "windows";
    later.hostname = "other";
    later.beaconInterval = 5s;
    auto r = registry.checkIn(later, at(30s));
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().platform, "linux");
    EXPECT_EQ(r.value().hostname, "web01");
    EXPECT_EQ(r.value().beaconInterval, 5s);
    EXPECT_EQ(r.value().lastSeen, at(30s));

    // Out-of-order timestamps never move lastSeen backwards.
    auto stale = registry.checkIn(later, at(10s));
    ASSERT_TRUE(stale);
    EXPECT_EQ(stale.value().lastSeen, at(30s));
}

TEST(AgentRegistryTest, RestoreKeepsPersistedLastSeen) {
    AgentRegistry registry(60s, 0s);
    auto a = test::agent("a1");
    a.lastSeen = at(100s);
    registry.restore(a);
    auto found = registry.find("a1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->lastSeen, at(100s));
    EXPECT_EQ(registry.all().size(), 1u);
}
