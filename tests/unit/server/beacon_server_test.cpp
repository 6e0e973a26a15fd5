// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <sortie/engine/operation_manager.h>
#include <sortie/ipc/client.h>
#include <sortie/server/beacon_server.h>
#include <sortie/server/request_dispatcher.h>
#include <sortie/server/server_lifecycle_fsm.h>

#include "engine_fixtures.h"

#include <algorithm>
#include <atomic>
#include <thread>

using namespace sortie;
using namespace sortie::server;
using namespace std::chrono_literals;
using sortie::test::makeAbility;

namespace {

class BeaconServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto catalog = test::makeCatalog({makeAbility("A", "whoami", {test::kvRule("user")})});
        manager_ = std::make_unique<engine::OperationManager>(
            catalog,
            std::vector<engine::AdversaryProfile>{test::profile("p", {test::phase("main", {"A"})})},
            journal_);
        dispatcher_ = std::make_unique<RequestDispatcher>(*manager_, &lifecycle_);
    }

    void TearDown() override {
        if (server_ && server_->isRunning())
            ASSERT_TRUE(server_->stop());
    }

    void startServer(BeaconServer::Config config = {}) {
        config.port = 0;
        config.workerThreads = std::max<size_t>(config.workerThreads, 2);
        server_ = std::make_unique<BeaconServer>(config, *dispatcher_, &lifecycle_);
        auto r = server_->start();
        ASSERT_TRUE(r) << r.error().message;
        ASSERT_NE(server_->port(), 0);
    }

    ipc::ClientConfig clientConfig() const {
        ipc::ClientConfig cfg;
        cfg.port = server_->port();
        cfg.requestTimeout = 5s;
        return cfg;
    }

    test::FlakyJournal journal_;
    std::unique_ptr<engine::OperationManager> manager_;
    ServerLifecycleFsm lifecycle_;
    std::unique_ptr<RequestDispatcher> dispatcher_;
    std::unique_ptr<BeaconServer> server_;
};

} // namespace

TEST_F(BeaconServerTest, StartMarksLifecycleReadyAndStopMarksStopped) {
    startServer();
    EXPECT_TRUE(lifecycle_.isReady());
    EXPECT_TRUE(server_->isRunning());
    EXPECT_FALSE(server_->start());

    ASSERT_TRUE(server_->stop());
    EXPECT_EQ(lifecycle_.snapshot().state, LifecycleState::Stopped);
    EXPECT_FALSE(server_->stop());
}

TEST_F(BeaconServerTest, ClientRoundTripsOverOneConnection) {
    startServer();
    ipc::SortieClient client(clientConfig());

    auto pong = client.call(ipc::PingRequest{std::chrono::steady_clock::now()});
    ASSERT_TRUE(pong) << pong.error().message;
    EXPECT_FALSE(pong.value().serverVersion.empty());
    EXPECT_TRUE(client.isConnected());

    ipc::BeaconRequest checkIn;
    checkIn.platform = "linux";
    checkIn.hostname = "web-01";
    auto first = client.call(checkIn);
    ASSERT_TRUE(first) << first.error().message;
    const auto agentId = first.value().agentId;

    ipc::StartOperationRequest start;
    start.profileId = "p";
    start.seedFacts = {{"domain", "corp"}};
    auto started = client.call(start);
    ASSERT_TRUE(started) << started.error().message;

    checkIn.agentId = agentId;
    auto work = client.call(checkIn);
    ASSERT_TRUE(work);
    ASSERT_EQ(work.value().instructions.size(), 1u);

    auto ack = client.call(
        ipc::ResultReport{agentId, work.value().instructions[0].linkId, "user=root", true, 0});
    ASSERT_TRUE(ack);
    EXPECT_EQ(ack.value().disposition, ipc::Disposition::Accepted);

    auto status = client.call(ipc::OperationStatusRequest{started.value().operationId});
    ASSERT_TRUE(status);
    EXPECT_EQ(status.value().operation.factCount, 2u);
    EXPECT_EQ(server_->totalConnections(), 1u);
}

TEST_F(BeaconServerTest, ErrorResponsesBecomeTypedErrors) {
    startServer();
    ipc::SortieClient client(clientConfig());
    auto r = client.call(ipc::OperationStatusRequest{"op-missing"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);

    // The connection survives an error response.
    EXPECT_TRUE(client.call(ipc::ListOperationsRequest{}));
}

TEST_F(BeaconServerTest, ConnectToClosedPortFails) {
    startServer();
    auto cfg = clientConfig();
    ASSERT_TRUE(server_->stop());

    ipc::SortieClient client(cfg);
    auto r = client.connect();
    ASSERT_FALSE(r);
    EXPECT_FALSE(client.isConnected());
}

TEST_F(BeaconServerTest, ConnectionLimitIsEnforced) {
    BeaconServer::Config config;
    config.maxConnections = 1;
    startServer(config);

    ipc::SortieClient first(clientConfig());
    ASSERT_TRUE(first.call(ipc::ListOperationsRequest{}));

    ipc::SortieClient second(clientConfig());
    auto r = second.call(ipc::ListOperationsRequest{});
    ASSERT_FALSE(r);
    // The refusal may be read, or the reset may arrive first.
    EXPECT_TRUE(r.error().code == ErrorCode::ResourceExhausted ||
                r.error().code == ErrorCode::NetworkError)
        << r.error().message;
    EXPECT_GE(server_->rejectedConnections(), 1u);

    first.disconnect();
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (server_->activeConnections() > 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(10ms);

    ipc::SortieClient third(clientConfig());
    EXPECT_TRUE(third.call(ipc::ListOperationsRequest{}));
}

TEST_F(BeaconServerTest, IdleTimeoutsRaceActiveTrafficAcrossWorkers) {
    BeaconServer::Config config;
    config.workerThreads = 4;
    config.idleTimeout = 30ms;
    startServer(config);

    constexpr int kClients = 4;
    constexpr int kRounds = 12;
    std::atomic<int> answered{0};
    std::vector<std::thread> clients;
    for (int c = 0; c < kClients; ++c) {
        clients.emplace_back([&, c]() {
            ipc::SortieClient client(clientConfig());
            for (int round = 0; round < kRounds; ++round) {
                // Let some connections hit the idle timer between requests.
                if ((round + c) % 3 == 0)
                    std::this_thread::sleep_for(40ms);
                auto r = client.call(ipc::ListOperationsRequest{});
                if (!r)
                    r = client.call(ipc::ListOperationsRequest{});
                if (r)
                    answered.fetch_add(1);
            }
        });
    }
    for (auto& t : clients)
        t.join();

    EXPECT_EQ(answered.load(), kClients * kRounds);
    EXPECT_GT(server_->totalConnections(), static_cast<uint64_t>(kClients));
    EXPECT_TRUE(server_->isRunning());
}
