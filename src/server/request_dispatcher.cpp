// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/core/uuid.h>
#include <sortie/server/request_dispatcher.h>
#include <sortie/server/server_lifecycle_fsm.h>
#include <sortie/version.h>

#include <spdlog/spdlog.h>

#include <type_traits>

namespace sortie::server {

namespace {

ipc::ErrorResponse makeErrorResponse(const Error& err) {
    return ipc::ErrorResponse{err.code, err.message};
}

ipc::ErrorResponse makeErrorResponse(ErrorCode code, std::string message) {
    return ipc::ErrorResponse{code, std::move(message)};
}

std::map<std::string, uint64_t> countsByName(const std::map<engine::LinkStatus, std::size_t>& in) {
    std::map<std::string, uint64_t> out;
    for (const auto& [status, count] : in)
        out[engine::linkStatusName(status)] = count;
    return out;
}

ipc::Disposition toWire(engine::ResultDisposition disposition) {
    switch (disposition) {
        case engine::ResultDisposition::Accepted:
            return ipc::Disposition::Accepted;
        case engine::ResultDisposition::Duplicate:
            return ipc::Disposition::Duplicate;
        case engine::ResultDisposition::Rejected:
            return ipc::Disposition::Rejected;
    }
    return ipc::Disposition::Rejected;
}

} // namespace

RequestDispatcher::RequestDispatcher(engine::OperationManager& manager,
                                     ServerLifecycleFsm* lifecycle, Clock clock)
    : manager_(manager), lifecycle_(lifecycle), clock_(std::move(clock)) {}

ipc::Response RequestDispatcher::dispatch(const ipc::Request& req) {
    if (std::holds_alternative<ipc::PingRequest>(req))
        return handlePing(std::get<ipc::PingRequest>(req));

    if (lifecycle_ && !lifecycle_->isReady()) {
        auto snap = lifecycle_->snapshot();
        return makeErrorResponse(ErrorCode::InvalidState,
                                 std::string("Server not ready (") +
                                     lifecycleStateName(snap.state) + ")");
    }
    if (req.valueless_by_exception()) {
        spdlog::warn("[RequestDispatcher] received valueless request variant");
        return makeErrorResponse(ErrorCode::InvalidData, "Malformed request");
    }

    try {
        return std::visit(
            [this](const auto& r) -> ipc::Response {
                using T = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<T, ipc::BeaconRequest>)
                    return handleBeacon(r);
                else if constexpr (std::is_same_v<T, ipc::ResultReport>)
                    return handleResult(r);
                else if constexpr (std::is_same_v<T, ipc::StartOperationRequest>)
                    return handleStart(r);
                else if constexpr (std::is_same_v<T, ipc::CancelOperationRequest>)
                    return handleCancel(r);
                else if constexpr (std::is_same_v<T, ipc::ResumeOperationRequest>)
                    return handleResume(r);
                else if constexpr (std::is_same_v<T, ipc::OperationStatusRequest>)
                    return handleStatus(r);
                else if constexpr (std::is_same_v<T, ipc::ListOperationsRequest>)
                    return handleList(r);
                else if constexpr (std::is_same_v<T, ipc::ArchiveOperationRequest>)
                    return handleArchive(r);
                else
                    return handlePing(r);
            },
            req);
    } catch (const std::exception& e) {
        spdlog::error("[RequestDispatcher] {} failed: {}", ipc::getRequestName(req), e.what());
        return makeErrorResponse(ErrorCode::InternalError,
                                 std::string("Failed to process request: ") + e.what());
    }
}

ipc::Response RequestDispatcher::handleBeacon(const ipc::BeaconRequest& req) {
    engine::BeaconInfo beacon;
    beacon.agentId = req.agentId;
    beacon.platform = req.platform;
    beacon.hostname = req.hostname;
    beacon.group = req.group;
    beacon.executors.insert(req.executors.begin(), req.executors.end());
    if (req.beaconIntervalSeconds)
        beacon.beaconInterval = std::chrono::seconds{*req.beaconIntervalSeconds};
    if (req.jitterSeconds)
        beacon.jitter = std::chrono::seconds{*req.jitterSeconds};

    auto reply = manager_.beacon(beacon, now());
    if (!reply)
        return makeErrorResponse(reply.error());

    ipc::BeaconResponse out;
    out.agentId = reply.value().agentId;
    out.sleepSeconds = static_cast<uint32_t>(reply.value().sleep.count());
    out.instructions.reserve(reply.value().instructions.size());
    for (const auto& in : reply.value().instructions) {
        ipc::Instruction wire;
        wire.linkId = in.linkId;
        wire.operationId = in.operationId;
        wire.command = in.command;
        wire.executor = in.executor;
        wire.timeoutSeconds = static_cast<uint32_t>(in.timeout.count());
        out.instructions.push_back(std::move(wire));
    }
    return out;
}

ipc::Response RequestDispatcher::handleResult(const ipc::ResultReport& req) {
    std::optional<int> exitCode;
    if (req.exitCode)
        exitCode = *req.exitCode;
    auto ack = manager_.report(req.agentId, req.linkId, req.output, req.success, exitCode, now());
    return ipc::ResultAck{toWire(ack.disposition), ack.reason};
}

ipc::Response RequestDispatcher::handleStart(const ipc::StartOperationRequest& req) {
    engine::CreateOperationRequest create;
    create.name = req.name;
    create.profileId = req.profileId;
    create.group = req.group;
    create.seeds = req.seedFacts;
    if (req.linkTimeoutSeconds) {
        if (*req.linkTimeoutSeconds == 0)
            return makeErrorResponse(ErrorCode::InvalidArgument, "link timeout must be positive");
        create.linkTimeout = std::chrono::seconds{*req.linkTimeoutSeconds};
    }

    auto id = manager_.create(create, now());
    if (!id)
        return makeErrorResponse(id.error());
    return ipc::StartOperationResponse{id.value()};
}

ipc::Response RequestDispatcher::handleCancel(const ipc::CancelOperationRequest& req) {
    if (auto r = manager_.cancel(req.operationId, now()); !r)
        return makeErrorResponse(r.error());
    return ipc::SuccessResponse{"operation " + req.operationId + " cancelled"};
}

ipc::Response RequestDispatcher::handleResume(const ipc::ResumeOperationRequest& req) {
    if (auto r = manager_.resume(req.operationId, now()); !r)
        return makeErrorResponse(r.error());
    return ipc::SuccessResponse{"operation " + req.operationId + " resumed"};
}

ipc::Response RequestDispatcher::handleStatus(const ipc::OperationStatusRequest& req) {
    auto status = manager_.status(req.operationId);
    if (!status)
        return makeErrorResponse(status.error());
    return ipc::OperationStatusResponse{toSummary(*status.value())};
}

ipc::Response RequestDispatcher::handleList(const ipc::ListOperationsRequest&) {
    ipc::ListOperationsResponse out;
    for (const auto& status : manager_.list())
        out.operations.push_back(toSummary(*status));
    return out;
}

ipc::Response RequestDispatcher::handleArchive(const ipc::ArchiveOperationRequest& req) {
    if (auto r = manager_.archive(req.operationId); !r)
        return makeErrorResponse(r.error());
    return ipc::SuccessResponse{"operation " + req.operationId + " archived"};
}

ipc::Response RequestDispatcher::handlePing(const ipc::PingRequest&) {
    return ipc::PongResponse{std::chrono::steady_clock::now(), SORTIE_VERSION_STRING};
}

ipc::OperationSummary RequestDispatcher::toSummary(const engine::OperationStatus& status) {
    ipc::OperationSummary out;
    out.id = status.id;
    out.name = status.name;
    out.profileId = status.profileId;
    out.group = status.group;
    out.state = engine::operationStateName(status.state);
    out.stateReason = status.stateReason;
    out.createdMs = core::toEpochMillis(status.created);
    if (status.finished)
        out.finishedMs = core::toEpochMillis(*status.finished);
    out.linkCounts = countsByName(status.linkCounts);
    for (const auto& agent : status.agents) {
        ipc::AgentEntry entry;
        entry.agentId = agent.agentId;
        entry.state = engine::agentStateName(agent.state);
        entry.lastSeenMs = core::toEpochMillis(agent.lastSeen);
        entry.links = countsByName(agent.links);
        out.agents.push_back(std::move(entry));
    }
    for (const auto& blocked : status.blocked) {
        out.blocked.push_back(ipc::BlockedEntry{blocked.abilityId, blocked.agentId,
                                                blocked.missingFacts, blocked.waitingOnPhase});
    }
    out.frontierSize = status.frontierSize;
    out.factCount = status.factCount;
    return out;
}

} // namespace sortie::server
