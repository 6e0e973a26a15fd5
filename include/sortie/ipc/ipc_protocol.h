// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sortie::ipc {

// ============================================================================
// Agent requests
// ============================================================================

struct BeaconRequest {
    std::string agentId; // empty on first contact
    std::string platform;
    std::string hostname;
    std::string group;
    std::vector<std::string> executors;
    std::optional<uint32_t> beaconIntervalSeconds;
    std::optional<uint32_t> jitterSeconds;
};

struct ResultReport {
    std::string agentId;
    std::string linkId;
    std::string output;
    bool success{false};
    std::optional<int32_t> exitCode;
};

// ============================================================================
// Operator requests
// ============================================================================

struct StartOperationRequest {
    std::string name;
    std::string profileId;
    std::string group;
    // Ordered; a key may repeat to seed several values.
    std::vector<std::pair<std::string, std::string>> seedFacts;
    std::optional<uint32_t> linkTimeoutSeconds;
};

struct CancelOperationRequest {
    std::string operationId;
};

struct ResumeOperationRequest {
    std::string operationId;
};

struct ArchiveOperationRequest {
    std::string operationId;
};

struct OperationStatusRequest {
    std::string operationId;
};

struct ListOperationsRequest {};

struct PingRequest {
    std::chrono::steady_clock::time_point timestamp;
};

using Request = std::variant<BeaconRequest, ResultReport, StartOperationRequest,
                             CancelOperationRequest, ResumeOperationRequest,
                             OperationStatusRequest, ListOperationsRequest,
                             ArchiveOperationRequest, PingRequest>;

// ============================================================================
// Responses
// ============================================================================

struct Instruction {
    std::string linkId;
    std::string operationId;
    std::string command;
    std::string executor;
    uint32_t timeoutSeconds{0};
};

struct BeaconResponse {
    std::string agentId;
    std::vector<Instruction> instructions;
    uint32_t sleepSeconds{0};
};

enum class Disposition : uint8_t { Accepted, Duplicate, Rejected };

struct ResultAck {
    Disposition disposition{Disposition::Accepted};
    std::string reason;
};

struct StartOperationResponse {
    std::string operationId;
};

struct BlockedEntry {
    std::string abilityId;
    std::string agentId;
    std::vector<std::string> missingFacts;
    std::string waitingOnPhase;
};

struct AgentEntry {
    std::string agentId;
    std::string state;
    int64_t lastSeenMs{0};
    std::map<std::string, uint64_t> links;
};

// Wire projection of an operation's status; states and link statuses travel as names.
struct OperationSummary {
    std::string id;
    std::string name;
    std::string profileId;
    std::string group;
    std::string state;
    std::string stateReason;
    int64_t createdMs{0};
    std::optional<int64_t> finishedMs;
    std::map<std::string, uint64_t> linkCounts;
    std::vector<AgentEntry> agents;
    std::vector<BlockedEntry> blocked;
    uint64_t frontierSize{0};
    uint64_t factCount{0};
};

struct OperationStatusResponse {
    OperationSummary operation;
};

struct ListOperationsResponse {
    std::vector<OperationSummary> operations;
};

struct SuccessResponse {
    std::string message;
};

struct PongResponse {
    std::chrono::steady_clock::time_point serverTime;
    std::string serverVersion;
};

struct ErrorResponse {
    ErrorCode code{ErrorCode::Unknown};
    std::string message;
};

using Response = std::variant<BeaconResponse, ResultAck, StartOperationResponse,
                              OperationStatusResponse, ListOperationsResponse, SuccessResponse,
                              PongResponse, ErrorResponse>;

// ============================================================================
// Message envelope
// ============================================================================

struct Message {
    uint32_t version = 1;
    uint64_t requestId{0};
    std::chrono::steady_clock::time_point timestamp;

    std::variant<Request, Response> payload;
};

constexpr uint32_t PROTOCOL_VERSION = 1;
constexpr size_t MAX_MESSAGE_SIZE =
    static_cast<size_t>(16) * static_cast<size_t>(1024) * static_cast<size_t>(1024); // 16MB

const char* dispositionName(Disposition disposition) noexcept;
std::string getRequestName(const Request& req);
std::string getResponseName(const Response& res);

} // namespace sortie::ipc
