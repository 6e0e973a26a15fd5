// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/engine/operation_manager.h>
#include <sortie/server/sweep_scheduler.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace sortie::server {

SweepScheduler::SweepScheduler(boost::asio::any_io_executor executor,
                               engine::OperationManager& manager,
                               std::chrono::milliseconds interval, Clock clock)
    : executor_(std::move(executor)), manager_(manager), interval_(interval),
      clock_(std::move(clock)), stopRequested_(std::make_shared<std::atomic<bool>>(false)),
      sweeps_(std::make_shared<std::atomic<uint64_t>>(0)) {}

SweepScheduler::~SweepScheduler() {
    stop();
}

Result<void> SweepScheduler::start() {
    if (interval_.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "sweep interval must be positive"};
    }
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Sweep scheduler already running"};
    }
    // A fresh flag per run; a coroutine from an earlier run keeps observing its own.
    stopRequested_ = std::make_shared<std::atomic<bool>>(false);

    auto stopFlag = stopRequested_;
    auto sweeps = sweeps_;
    auto* manager = &manager_;
    auto interval = interval_;
    auto clock = clock_;

    spdlog::debug("[SweepScheduler] launching sweep loop every {}ms", interval.count());
    boost::asio::co_spawn(
        executor_,
        [stopFlag, sweeps, manager, interval, clock]() -> boost::asio::awaitable<void> {
            auto executor = co_await boost::asio::this_coro::executor;
            boost::asio::steady_timer timer(executor);

            while (!stopFlag->load(std::memory_order_acquire)) {
                timer.expires_after(interval);
                try {
                    co_await timer.async_wait(boost::asio::use_awaitable);
                } catch (const boost::system::system_error& e) {
                    if (e.code() == boost::asio::error::operation_aborted)
                        break;
                    throw;
                }
                if (stopFlag->load(std::memory_order_acquire))
                    break;

                manager->sweep(clock ? clock() : std::chrono::system_clock::now());
                sweeps->fetch_add(1, std::memory_order_relaxed);
            }
            spdlog::debug("[SweepScheduler] sweep loop exited");
        },
        boost::asio::detached);
    return {};
}

void SweepScheduler::stop() {
    if (!running_.exchange(false))
        return;
    stopRequested_->store(true, std::memory_order_release);
    spdlog::debug("[SweepScheduler] stop requested after {} sweeps", sweeps_->load());
}

} // namespace sortie::server
