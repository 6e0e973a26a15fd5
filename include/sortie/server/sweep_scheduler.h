// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace sortie::engine {
class OperationManager;
}

namespace sortie::server {

// Periodically drives OperationManager::sweep (link timeouts, agent liveness) from a timer
// coroutine on the given executor.
class SweepScheduler {
public:
    using Clock = std::function<TimePoint()>;

    SweepScheduler(boost::asio::any_io_executor executor, engine::OperationManager& manager,
                   std::chrono::milliseconds interval, Clock clock = {});
    ~SweepScheduler();

    SweepScheduler(const SweepScheduler&) = delete;
    SweepScheduler& operator=(const SweepScheduler&) = delete;

    Result<void> start();
    void stop();

    bool isRunning() const { return running_.load(); }
    uint64_t sweepCount() const { return sweeps_->load(); }

private:
    boost::asio::any_io_executor executor_;
    engine::OperationManager& manager_;
    std::chrono::milliseconds interval_;
    Clock clock_;

    std::atomic<bool> running_{false};
    std::shared_ptr<std::atomic<bool>> stopRequested_;
    std::shared_ptr<std::atomic<uint64_t>> sweeps_;
};

} // namespace sortie::server
