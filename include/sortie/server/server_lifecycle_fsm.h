// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace sortie::server {

// Server lifecycle state model; the source of truth for readiness.
enum class LifecycleState {
    Unknown = 0,
    Starting,
    Ready,
    Failed,
    Stopping,
    Stopped,
};

const char* lifecycleStateName(LifecycleState state) noexcept;

struct LifecycleSnapshot {
    LifecycleState state{LifecycleState::Unknown};
    std::string lastError; // empty when no error
    std::chrono::steady_clock::time_point lastTransition{};
};

// Events that can be dispatched to the FSM
struct StartRequestedEvent {};
struct ListeningEvent {};
struct FailureEvent {
    std::string error;
};
struct ShutdownRequestedEvent {};
struct StoppedEvent {};

class ServerLifecycleFsm {
public:
    LifecycleSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_;
    }

    bool isReady() const { return snapshot().state == LifecycleState::Ready; }

    void dispatch(const StartRequestedEvent&);
    void dispatch(const ListeningEvent&);
    void dispatch(const FailureEvent&);
    void dispatch(const ShutdownRequestedEvent&);
    void dispatch(const StoppedEvent&);

    void reset();

private:
    // Applies `next` only when the current state is one of `from`.
    template <typename... States>
    void transitionFrom(LifecycleState next, std::optional<std::string> err, States... from);

    LifecycleSnapshot snapshot_{};
    mutable std::mutex mutex_;
};

} // namespace sortie::server
