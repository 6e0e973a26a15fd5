// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

// Mapping from request types to the response type a successful call returns.
#pragma once

#include <sortie/ipc/ipc_protocol.h>

namespace sortie::ipc {

template <typename Req> struct ResponseOf;

template <> struct ResponseOf<BeaconRequest> {
    using type = BeaconResponse;
};
template <> struct ResponseOf<ResultReport> {
    using type = ResultAck;
};
template <> struct ResponseOf<StartOperationRequest> {
    using type = StartOperationResponse;
};
template <> struct ResponseOf<CancelOperationRequest> {
    using type = SuccessResponse;
};
template <> struct ResponseOf<ResumeOperationRequest> {
    using type = SuccessResponse;
};
template <> struct ResponseOf<ArchiveOperationRequest> {
    using type = SuccessResponse;
};
template <> struct ResponseOf<OperationStatusRequest> {
    using type = OperationStatusResponse;
};
template <> struct ResponseOf<ListOperationsRequest> {
    using type = ListOperationsResponse;
};
template <> struct ResponseOf<PingRequest> {
    using type = PongResponse;
};

template <typename Req> using ResponseOfT = typename ResponseOf<Req>::type;

} // namespace sortie::ipc
