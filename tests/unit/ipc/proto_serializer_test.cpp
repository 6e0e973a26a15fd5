// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <sortie/ipc/proto_serializer.h>
#include <sortie/ipc/response_of.h>

#include <type_traits>

using namespace sortie;
using namespace sortie::ipc;

namespace {

template <typename T> T decodeRequest(const T& in, uint64_t requestId = 1) {
    Message m;
    m.requestId = requestId;
    m.payload = Request{in};
    auto bytes = ProtoSerializer::encode_payload(m);
    EXPECT_TRUE(bytes) << bytes.error().message;
    auto decoded = ProtoSerializer::decode_payload(bytes.value());
    EXPECT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value().requestId, requestId);
    return std::get<T>(std::get<Request>(decoded.value().payload));
}

template <typename T> T decodeResponse(const T& in) {
    Message m;
    m.payload = Response{in};
    auto bytes = ProtoSerializer::encode_payload(m);
    EXPECT_TRUE(bytes) << bytes.error().message;
    auto decoded = ProtoSerializer::decode_payload(bytes.value());
    EXPECT_TRUE(decoded) << decoded.error().message;
    return std::get<T>(std::get<Response>(decoded.value().payload));
}

} // namespace

TEST(ProtoSerializerTest, BeaconKeepsOptionalTiming) {
    BeaconRequest first;
    first.platform = "linux";
    first.hostname = "web-01";
    first.executors = {"sh", "bash"};
    auto out = decodeRequest(first, 11);
    EXPECT_TRUE(out.agentId.empty());
    EXPECT_EQ(out.executors, first.executors);
    EXPECT_FALSE(out.beaconIntervalSeconds.has_value());
    EXPECT_FALSE(out.jitterSeconds.has_value());

    first.agentId = "a1";
    first.beaconIntervalSeconds = 0;
    first.jitterSeconds = 5;
    out = decodeRequest(first);
    EXPECT_EQ(out.agentId, "a1");
    ASSERT_TRUE(out.beaconIntervalSeconds.has_value());
    EXPECT_EQ(*out.beaconIntervalSeconds, 0u);
    EXPECT_EQ(out.jitterSeconds.value(), 5u);
}

TEST(ProtoSerializerTest, ResultReportDistinguishesMissingExitCode) {
    ResultReport report{"a1", "link-1", std::string("line1\nline2\0tail", 16), false, {}};
    auto out = decodeRequest(report);
    EXPECT_EQ(out.output, report.output);
    EXPECT_FALSE(out.success);
    EXPECT_FALSE(out.exitCode.has_value());

    report.exitCode = 0;
    EXPECT_EQ(decodeRequest(report).exitCode.value(), 0);
}

TEST(ProtoSerializerTest, StartOperationKeepsSeedOrder) {
    StartOperationRequest req;
    req.name = "night run";
    req.profileId = "apt";
    req.seedFacts = {{"host", "10.0.0.5"}, {"host", "10.0.0.6"}, {"domain", "corp"}};
    req.linkTimeoutSeconds = 90;
    auto out = decodeRequest(req);
    EXPECT_EQ(out.seedFacts, req.seedFacts);
    EXPECT_EQ(out.linkTimeoutSeconds.value(), 90u);
}

TEST(ProtoSerializerTest, StatusSummaryCarriesBlockedPairs) {
    OperationSummary s;
    s.id = "op-1";
    s.state = "running";
    s.createdMs = 1700000000000;
    s.linkCounts = {{"success", 3}, {"queued", 1}};
    s.agents.push_back(AgentEntry{"a1", "stale", 1700000005000, {{"success", 3}}});
    s.blocked.push_back(BlockedEntry{"token", "a1", {"token"}, ""});
    s.blocked.push_back(BlockedEntry{"exfil", "a1", {}, "recon"});
    s.frontierSize = 2;
    s.factCount = 4;

    auto out = decodeResponse(OperationStatusResponse{s}).operation;
    EXPECT_EQ(out.createdMs, s.createdMs);
    EXPECT_FALSE(out.finishedMs.has_value());
    EXPECT_EQ(out.linkCounts, s.linkCounts);
    ASSERT_EQ(out.agents.size(), 1u);
    EXPECT_EQ(out.agents[0].state, "stale");
    EXPECT_EQ(out.agents[0].links.at("success"), 3u);
    ASSERT_EQ(out.blocked.size(), 2u);
    EXPECT_EQ(out.blocked[0].missingFacts, std::vector<std::string>{"token"});
    EXPECT_EQ(out.blocked[1].waitingOnPhase, "recon");
    EXPECT_EQ(out.frontierSize, 2u);
}

TEST(ProtoSerializerTest, AckAndErrorResponses) {
    auto ack = decodeResponse(ResultAck{Disposition::Duplicate, ""});
    EXPECT_EQ(ack.disposition, Disposition::Duplicate);

    auto rejected = decodeResponse(ResultAck{Disposition::Rejected, "unknown link"});
    EXPECT_EQ(rejected.disposition, Disposition::Rejected);
    EXPECT_EQ(rejected.reason, "unknown link");

    auto err = decodeResponse(ErrorResponse{ErrorCode::InvalidState, "not ready"});
    EXPECT_EQ(err.code, ErrorCode::InvalidState);
    EXPECT_EQ(err.message, "not ready");
}

TEST(ProtoSerializerTest, BeaconResponseInstructions) {
    BeaconResponse res;
    res.agentId = "a1";
    res.sleepSeconds = 30;
    res.instructions.push_back(Instruction{"link-1", "op-1", "whoami", "sh", 60});
    auto out = decodeResponse(res);
    EXPECT_EQ(out.sleepSeconds, 30u);
    ASSERT_EQ(out.instructions.size(), 1u);
    EXPECT_EQ(out.instructions[0].command, "whoami");
    EXPECT_EQ(out.instructions[0].timeoutSeconds, 60u);
}

TEST(ProtoSerializerTest, GarbageAndEmptyEnvelopesFail) {
    std::vector<uint8_t> garbage{0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_FALSE(ProtoSerializer::decode_payload(garbage));
    EXPECT_FALSE(ProtoSerializer::decode_payload(std::vector<uint8_t>{}));
}

TEST(ProtoSerializerTest, EncodeIntoPreservesPrefix) {
    Message m;
    m.payload = Request{ListOperationsRequest{}};
    std::vector<uint8_t> buffer(4, 0x11);
    ASSERT_TRUE(ProtoSerializer::encode_payload_into(m, buffer));
    ASSERT_GT(buffer.size(), 4u);
    auto decoded = ProtoSerializer::decode_payload(buffer.data() + 4, buffer.size() - 4);
    ASSERT_TRUE(decoded);
    EXPECT_TRUE(std::holds_alternative<ListOperationsRequest>(
        std::get<Request>(decoded.value().payload)));
}

TEST(ResponseOfTest, MapsRequestsToResponses) {
    static_assert(std::is_same_v<ResponseOfT<BeaconRequest>, BeaconResponse>);
    static_assert(std::is_same_v<ResponseOfT<ResultReport>, ResultAck>);
    static_assert(std::is_same_v<ResponseOfT<StartOperationRequest>, StartOperationResponse>);
    static_assert(std::is_same_v<ResponseOfT<CancelOperationRequest>, SuccessResponse>);
    static_assert(std::is_same_v<ResponseOfT<ListOperationsRequest>, ListOperationsResponse>);
    static_assert(std::is_same_v<ResponseOfT<PingRequest>, PongResponse>);
    EXPECT_STREQ(dispositionName(Disposition::Duplicate), "duplicate");
    EXPECT_EQ(getRequestName(Request{PingRequest{}}), "Ping");
}
