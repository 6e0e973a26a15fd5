// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/server/server_lifecycle_fsm.h>

#include <spdlog/spdlog.h>

namespace sortie::server {

const char* lifecycleStateName(LifecycleState state) noexcept {
    switch (state) {
        case LifecycleState::Unknown:
            return "unknown";
        case LifecycleState::Starting:
            return "starting";
        case LifecycleState::Ready:
            return "ready";
        case LifecycleState::Failed:
            return "failed";
        case LifecycleState::Stopping:
            return "stopping";
        case LifecycleState::Stopped:
            return "stopped";
    }
    return "unknown";
}

template <typename... States>
void ServerLifecycleFsm::transitionFrom(LifecycleState next, std::optional<std::string> err,
                                        States... from) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto prev = snapshot_.state;
    if (!((prev == from) || ...))
        return;
    if (prev == next && (!err || snapshot_.lastError == *err))
        return;
    snapshot_.state = next;
    snapshot_.lastError = err.value_or("");
    snapshot_.lastTransition = std::chrono::steady_clock::now();
    spdlog::info("[Lifecycle] {} -> {}{}", lifecycleStateName(prev), lifecycleStateName(next),
                 snapshot_.lastError.empty() ? "" : (std::string{" error="} + snapshot_.lastError));
}

void ServerLifecycleFsm::dispatch(const StartRequestedEvent&) {
    transitionFrom(LifecycleState::Starting, std::nullopt, LifecycleState::Unknown,
                   LifecycleState::Stopped);
}

void ServerLifecycleFsm::dispatch(const ListeningEvent&) {
    transitionFrom(LifecycleState::Ready, std::nullopt, LifecycleState::Starting);
}

void ServerLifecycleFsm::dispatch(const FailureEvent& ev) {
    transitionFrom(LifecycleState::Failed, ev.error, LifecycleState::Unknown,
                   LifecycleState::Starting, LifecycleState::Ready);
}

void ServerLifecycleFsm::dispatch(const ShutdownRequestedEvent&) {
    transitionFrom(LifecycleState::Stopping, std::nullopt, LifecycleState::Unknown,
                   LifecycleState::Starting, LifecycleState::Ready, LifecycleState::Failed);
}

void ServerLifecycleFsm::dispatch(const StoppedEvent&) {
    transitionFrom(LifecycleState::Stopped, std::nullopt, LifecycleState::Stopping,
                   LifecycleState::Failed);
}

void ServerLifecycleFsm::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = LifecycleSnapshot{};
}

} // namespace sortie::server
