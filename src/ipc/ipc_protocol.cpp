// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/ipc/ipc_protocol.h>

#include <type_traits>

namespace sortie::ipc {

const char* dispositionName(Disposition disposition) noexcept {
    switch (disposition) {
        case Disposition::Accepted:
            return "accepted";
        case Disposition::Duplicate:
            return "duplicate";
        case Disposition::Rejected:
            return "rejected";
    }
    return "unknown";
}

std::string getRequestName(const Request& req) {
    return std::visit(
        [](auto&& r) -> std::string {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, BeaconRequest>) {
                return "Beacon";
            } else if constexpr (std::is_same_v<T, ResultReport>) {
                return "ResultReport";
            } else if constexpr (std::is_same_v<T, StartOperationRequest>) {
                return "StartOperation";
            } else if constexpr (std::is_same_v<T, CancelOperationRequest>) {
                return "CancelOperation";
            } else if constexpr (std::is_same_v<T, ResumeOperationRequest>) {
                return "ResumeOperation";
            } else if constexpr (std::is_same_v<T, OperationStatusRequest>) {
                return "OperationStatus";
            } else if constexpr (std::is_same_v<T, ListOperationsRequest>) {
                return "ListOperations";
            } else if constexpr (std::is_same_v<T, ArchiveOperationRequest>) {
                return "ArchiveOperation";
            } else if constexpr (std::is_same_v<T, PingRequest>) {
                return "Ping";
            }
            return "Unknown";
        },
        req);
}

std::string getResponseName(const Response& res) {
    return std::visit(
        [](auto&& r) -> std::string {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, BeaconResponse>) {
                return "Beacon";
            } else if constexpr (std::is_same_v<T, ResultAck>) {
                return "ResultAck";
            } else if constexpr (std::is_same_v<T, StartOperationResponse>) {
                return "StartOperation";
            } else if constexpr (std::is_same_v<T, OperationStatusResponse>) {
                return "OperationStatus";
            } else if constexpr (std::is_same_v<T, ListOperationsResponse>) {
                return "ListOperations";
            } else if constexpr (std::is_same_v<T, SuccessResponse>) {
                return "Success";
            } else if constexpr (std::is_same_v<T, PongResponse>) {
                return "Pong";
            } else if constexpr (std::is_same_v<T, ErrorResponse>) {
                return "Error";
            }
            return "Unknown";
        },
        res);
}

} // namespace sortie::ipc
