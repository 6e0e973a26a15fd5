// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <thread>
#include <vector>

namespace sortie::server {

class RequestDispatcher;
class ServerLifecycleFsm;

/**
 * TCP endpoint shared by agents and operators.
 *
 * One coroutine per connection reads SORT frames, hands each decoded request to the
 * RequestDispatcher and writes the framed response back; a connection carries any number of
 * round trips. Worker threads poll the io_context so stop() stays responsive.
 */
class BeaconServer {
public:
    struct Config {
        std::string listenAddress{"127.0.0.1"};
        uint16_t port = 8888; // 0 binds an ephemeral port
        size_t maxConnections = 256;
        size_t workerThreads = 2;
        // Idle connections are closed after this long without a complete frame.
        std::chrono::milliseconds idleTimeout{60000};
    };

    BeaconServer(const Config& config, RequestDispatcher& dispatcher,
                 ServerLifecycleFsm* lifecycle = nullptr);
    ~BeaconServer();

    BeaconServer(const BeaconServer&) = delete;
    BeaconServer& operator=(const BeaconServer&) = delete;

    Result<void> start();
    Result<void> stop();
    bool isRunning() const { return running_.load(); }

    // Port actually bound; differs from Config::port when that was 0.
    uint16_t port() const { return boundPort_.load(); }

    boost::asio::io_context& ioContext() noexcept { return io_context_; }

    size_t activeConnections() const { return activeConnections_.load(); }
    uint64_t totalConnections() const { return totalConnections_.load(); }
    uint64_t rejectedConnections() const { return rejectedConnections_.load(); }

private:
    using tcp = boost::asio::ip::tcp;

    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> handle_connection(std::shared_ptr<tcp::socket> socket);

    void register_socket(const std::shared_ptr<tcp::socket>& socket);

    Config config_;
    RequestDispatcher& dispatcher_;
    ServerLifecycleFsm* lifecycle_;

    std::atomic<uint16_t> boundPort_{0};
    std::atomic<size_t> activeConnections_{0};
    std::atomic<uint64_t> totalConnections_{0};
    std::atomic<uint64_t> rejectedConnections_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::mutex activeSocketsMutex_;
    std::vector<std::weak_ptr<tcp::socket>> activeSockets_;

    std::unique_ptr<std::counting_semaphore<>> connectionSlots_;

    // Declared after the state above: destroying the context destroys suspended connection
    // coroutines, whose guards still touch the slot semaphore and counters.
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::vector<std::thread> workers_;
};

} // namespace sortie::server
