// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/operation_manager.h>
#include <sortie/engine/operation_status.h>
#include <sortie/ipc/ipc_protocol.h>

#include <functional>
#include <string>

namespace sortie::server {

class ServerLifecycleFsm;

/**
 * @brief Maps decoded wire requests onto OperationManager calls.
 *
 * Stateless apart from its collaborators; safe to call from every connection coroutine at once.
 * Engine calls are synchronous and bounded by per-operation locks, so dispatch does not yield.
 */
class RequestDispatcher {
public:
    using Clock = std::function<TimePoint()>;

    RequestDispatcher(engine::OperationManager& manager, ServerLifecycleFsm* lifecycle = nullptr,
                      Clock clock = {});

    ipc::Response dispatch(const ipc::Request& req);

    static ipc::OperationSummary toSummary(const engine::OperationStatus& status);

private:
    ipc::Response handleBeacon(const ipc::BeaconRequest& req);
    ipc::Response handleResult(const ipc::ResultReport& req);
    ipc::Response handleStart(const ipc::StartOperationRequest& req);
    ipc::Response handleCancel(const ipc::CancelOperationRequest& req);
    ipc::Response handleResume(const ipc::ResumeOperationRequest& req);
    ipc::Response handleStatus(const ipc::OperationStatusRequest& req);
    ipc::Response handleList(const ipc::ListOperationsRequest& req);
    ipc::Response handleArchive(const ipc::ArchiveOperationRequest& req);
    ipc::Response handlePing(const ipc::PingRequest& req);

    TimePoint now() const { return clock_ ? clock_() : std::chrono::system_clock::now(); }

    engine::OperationManager& manager_;
    ServerLifecycleFsm* lifecycle_;
    Clock clock_;
};

} // namespace sortie::server
