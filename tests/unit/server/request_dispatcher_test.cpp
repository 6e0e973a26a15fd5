// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <sortie/core/uuid.h>
#include <sortie/engine/operation_manager.h>
#include <sortie/server/request_dispatcher.h>
#include <sortie/server/server_lifecycle_fsm.h>
#include <sortie/version.h>

#include "engine_fixtures.h"

using namespace sortie;
using namespace sortie::server;
using namespace std::chrono_literals;
using sortie::test::makeAbility;

namespace {

class RequestDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto catalog = test::makeCatalog({makeAbility("A", "whoami", {test::kvRule("user")}),
                                          makeAbility("B", "ls /home/#{user}")});
        manager_ = std::make_unique<engine::OperationManager>(
            catalog,
            std::vector<engine::AdversaryProfile>{
                test::profile("chain", {test::phase("main", {"A", "B"})})},
            journal_);
        lifecycle_.dispatch(StartRequestedEvent{});
        lifecycle_.dispatch(ListeningEvent{});
        dispatcher_ = std::make_unique<RequestDispatcher>(*manager_, &lifecycle_,
                                                          [this] { return now_; });
    }

    template <typename T> T expect(const ipc::Response& res) {
        if (auto* err = std::get_if<ipc::ErrorResponse>(&res))
            ADD_FAILURE() << "error response: " << err->message;
        EXPECT_TRUE(std::holds_alternative<T>(res)) << ipc::getResponseName(res);
        return std::holds_alternative<T>(res) ? std::get<T>(res) : T{};
    }

    static ipc::ErrorResponse expectError(const ipc::Response& res) {
        EXPECT_TRUE(std::holds_alternative<ipc::ErrorResponse>(res)) << ipc::getResponseName(res);
        return std::holds_alternative<ipc::ErrorResponse>(res) ? std::get<ipc::ErrorResponse>(res)
                                                               : ipc::ErrorResponse{};
    }

    std::string startChain() {
        ipc::StartOperationRequest req;
        req.name = "chain run";
        req.profileId = "chain";
        return expect<ipc::StartOperationResponse>(dispatcher_->dispatch(req)).operationId;
    }

    ipc::BeaconResponse beacon(const std::string& agentId) {
        ipc::BeaconRequest req;
        req.agentId = agentId;
        req.platform = "linux";
        req.hostname = "web-01";
        req.executors = {"sh"};
        req.beaconIntervalSeconds = 5;
        return expect<ipc::BeaconResponse>(dispatcher_->dispatch(req));
    }

    TimePoint now_{test::t0()};
    test::FlakyJournal journal_;
    std::unique_ptr<engine::OperationManager> manager_;
    ServerLifecycleFsm lifecycle_;
    std::unique_ptr<RequestDispatcher> dispatcher_;
};

} // namespace

TEST_F(RequestDispatcherTest, PingBypassesReadiness) {
    lifecycle_.dispatch(ShutdownRequestedEvent{});
    auto pong = expect<ipc::PongResponse>(dispatcher_->dispatch(ipc::PingRequest{}));
    EXPECT_EQ(pong.serverVersion, SORTIE_VERSION_STRING);

    auto err = expectError(dispatcher_->dispatch(ipc::ListOperationsRequest{}));
    EXPECT_EQ(err.code, ErrorCode::InvalidState);
    EXPECT_NE(err.message.find("stopping"), std::string::npos);
}

TEST_F(RequestDispatcherTest, AgentLoopThroughTheWireTypes) {
    auto first = beacon("");
    ASSERT_FALSE(first.agentId.empty());
    EXPECT_EQ(first.sleepSeconds, 5u);
    auto agentId = first.agentId;

    auto opId = startChain();
    now_ += 1s;
    auto work = beacon(agentId);
    ASSERT_EQ(work.instructions.size(), 1u);
    EXPECT_EQ(work.instructions[0].operationId, opId);
    EXPECT_EQ(work.instructions[0].executor, "sh");
    EXPECT_EQ(work.instructions[0].timeoutSeconds, 300u);

    ipc::ResultReport report{agentId, work.instructions[0].linkId, "user=svc", true, 0};
    auto ack = expect<ipc::ResultAck>(dispatcher_->dispatch(report));
    EXPECT_EQ(ack.disposition, ipc::Disposition::Accepted);
    ack = expect<ipc::ResultAck>(dispatcher_->dispatch(report));
    EXPECT_EQ(ack.disposition, ipc::Disposition::Duplicate);

    now_ += 1s;
    work = beacon(agentId);
    ASSERT_EQ(work.instructions.size(), 1u);
    EXPECT_EQ(work.instructions[0].command, "ls /home/svc");
}

TEST_F(RequestDispatcherTest, StartValidatesInput) {
    ipc::StartOperationRequest req;
    req.profileId = "chain";
    req.linkTimeoutSeconds = 0;
    EXPECT_EQ(expectError(dispatcher_->dispatch(req)).code, ErrorCode::InvalidArgument);

    req.linkTimeoutSeconds.reset();
    req.profileId = "missing";
    EXPECT_EQ(expectError(dispatcher_->dispatch(req)).code, ErrorCode::NotFound);
}

TEST_F(RequestDispatcherTest, StatusListCancelArchive) {
    beacon("a1");
    auto opId = startChain();
    now_ += 1s;
    beacon("a1");

    auto status = expect<ipc::OperationStatusResponse>(
                      dispatcher_->dispatch(ipc::OperationStatusRequest{opId}))
                      .operation;
    EXPECT_EQ(status.name, "chain run");
    EXPECT_EQ(status.state, "RUNNING");
    EXPECT_EQ(status.linkCounts.at("DISPATCHED"), 1u);
    ASSERT_EQ(status.agents.size(), 1u);
    EXPECT_EQ(status.agents[0].agentId, "a1");
    EXPECT_EQ(status.agents[0].state, "ACTIVE");
    ASSERT_EQ(status.blocked.size(), 1u);
    EXPECT_EQ(status.blocked[0].abilityId, "B");
    EXPECT_EQ(status.createdMs, core::toEpochMillis(test::t0()));

    auto listed = expect<ipc::ListOperationsResponse>(dispatcher_->dispatch(ipc::ListOperationsRequest{}));
    ASSERT_EQ(listed.operations.size(), 1u);

    EXPECT_EQ(expectError(dispatcher_->dispatch(ipc::ArchiveOperationRequest{opId})).code,
              ErrorCode::InvalidState);
    expect<ipc::SuccessResponse>(dispatcher_->dispatch(ipc::CancelOperationRequest{opId}));
    EXPECT_EQ(expectError(dispatcher_->dispatch(ipc::CancelOperationRequest{opId})).code,
              ErrorCode::InvalidState);
    EXPECT_EQ(expectError(dispatcher_->dispatch(ipc::ResumeOperationRequest{opId})).code,
              ErrorCode::InvalidState);

    status = expect<ipc::OperationStatusResponse>(
                 dispatcher_->dispatch(ipc::OperationStatusRequest{opId}))
                 .operation;
    EXPECT_EQ(status.state, "CANCELLED");
    EXPECT_TRUE(status.finishedMs.has_value());
    EXPECT_EQ(status.linkCounts.at("DISCARDED"), 1u);

    expect<ipc::SuccessResponse>(dispatcher_->dispatch(ipc::ArchiveOperationRequest{opId}));
    EXPECT_EQ(expectError(dispatcher_->dispatch(ipc::OperationStatusRequest{opId})).code,
              ErrorCode::NotFound);
}

TEST_F(RequestDispatcherTest, UnknownLinkIsRejectedNotErrored) {
    beacon("a1");
    auto ack = expect<ipc::ResultAck>(
        dispatcher_->dispatch(ipc::ResultReport{"a1", "link-nope", "", true, {}}));
    EXPECT_EQ(ack.disposition, ipc::Disposition::Rejected);
    EXPECT_EQ(ack.reason, "unknown link");
}

TEST_F(RequestDispatcherTest, FirstBeaconWithoutPlatformIsInvalid) {
    ipc::BeaconRequest req;
    req.agentId = "a9";
    EXPECT_EQ(expectError(dispatcher_->dispatch(req)).code, ErrorCode::InvalidArgument);
}
