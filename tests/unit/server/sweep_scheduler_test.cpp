// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <sortie/engine/operation_manager.h>
#include <sortie/server/sweep_scheduler.h>

#include "engine_fixtures.h"

#include <boost/asio/io_context.hpp>

#include <thread>

using namespace sortie;
using namespace sortie::server;
using namespace std::chrono_literals;

TEST(SweepSchedulerTest, RejectsNonPositiveInterval) {
    boost::asio::io_context io;
    test::FlakyJournal journal;
    engine::OperationManager manager(test::makeCatalog({}), {}, journal);
    SweepScheduler scheduler(io.get_executor(), manager, 0ms);
    auto r = scheduler.start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(SweepSchedulerTest, SweepsUntilStopped) {
    boost::asio::io_context io;
    test::FlakyJournal journal;
    engine::OperationManager manager(
        test::makeCatalog({test::makeAbility("A", "whoami")}),
        {test::profile("p", {test::phase("main", {"A"})})}, journal);

    engine::BeaconInfo beacon;
    beacon.agentId = "a1";
    beacon.platform = "linux";
    beacon.beaconInterval = 10s;
    ASSERT_TRUE(manager.beacon(beacon, test::t0()));
    engine::CreateOperationRequest req;
    req.profileId = "p";
    auto opId = manager.create(req, test::t0());
    ASSERT_TRUE(opId);
    ASSERT_TRUE(manager.beacon(beacon, test::t0()));

    // The clock jumps far past the dead threshold so the first sweep settles liveness.
    SweepScheduler scheduler(io.get_executor(), manager, 5ms,
                             [] { return test::at(std::chrono::seconds(3600)); });
    ASSERT_TRUE(scheduler.start());
    EXPECT_FALSE(scheduler.start());

    std::thread runner([&io] { io.run_for(2s); });
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (scheduler.sweepCount() < 3 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);
    scheduler.stop();
    EXPECT_FALSE(scheduler.isRunning());
    io.stop();
    runner.join();

    EXPECT_GE(scheduler.sweepCount(), 3u);
    auto status = manager.status(opId.value());
    ASSERT_TRUE(status);
    ASSERT_EQ(status.value()->agents.size(), 1u);
    EXPECT_EQ(status.value()->agents[0].state, engine::AgentState::Dead);
}
