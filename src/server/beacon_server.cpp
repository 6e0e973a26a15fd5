// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/ipc/message_framing.h>
#include <sortie/server/beacon_server.h>
#include <sortie/server/request_dispatcher.h>
#include <sortie/server/server_lifecycle_fsm.h>

#include <spdlog/spdlog.h>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>

#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace {
void set_current_thread_name(const std::string& name) {
#ifdef __linux__
    prctl(PR_SET_NAME, name.c_str(), 0, 0, 0);
#endif
}
} // namespace

namespace sortie::server {

using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr size_t kReadChunk = 64 * 1024;

ipc::Message makeReply(uint64_t requestId, ipc::Response response) {
    ipc::Message msg;
    msg.version = ipc::PROTOCOL_VERSION;
    msg.requestId = requestId;
    msg.timestamp = std::chrono::steady_clock::now();
    msg.payload = std::move(response);
    return msg;
}

// Frames and writes one message; false when the peer is gone or framing failed.
awaitable<bool> writeMessage(tcp::socket& socket, ipc::MessageFramer& framer,
                             const ipc::Message& msg) {
    auto framed = framer.frame_message(msg);
    if (!framed) {
        spdlog::error("[BeaconServer] failed to frame response: {}", framed.error().message);
        co_return false;
    }
    boost::system::error_code ec;
    co_await boost::asio::async_write(socket, boost::asio::buffer(framed.value()),
                                      redirect_error(use_awaitable, ec));
    if (ec) {
        spdlog::debug("[BeaconServer] write failed: {}", ec.message());
        co_return false;
    }
    co_return true;
}

} // namespace

BeaconServer::BeaconServer(const Config& config, RequestDispatcher& dispatcher,
                           ServerLifecycleFsm* lifecycle)
    : config_(config), dispatcher_(dispatcher), lifecycle_(lifecycle) {}

BeaconServer::~BeaconServer() {
    if (running_.load())
        (void)stop();
}

Result<void> BeaconServer::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Beacon server already running"};
    }
    stopping_.store(false, std::memory_order_relaxed);
    if (lifecycle_)
        lifecycle_->dispatch(StartRequestedEvent{});

    try {
        if (config_.workerThreads == 0) {
            config_.workerThreads = 1;
            spdlog::warn("[BeaconServer] workerThreads was 0; coercing to 1");
        }
        if (config_.maxConnections == 0) {
            config_.maxConnections = 1;
            spdlog::warn("[BeaconServer] maxConnections was 0; coercing to 1");
        }

        io_context_.restart();
        work_guard_.emplace(io_context_.get_executor());

        tcp::endpoint endpoint(boost::asio::ip::make_address(config_.listenAddress),
                               config_.port);
        acceptor_ = std::make_unique<tcp::acceptor>(boost::asio::make_strand(io_context_));
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(boost::asio::socket_base::max_listen_connections);
        boundPort_.store(acceptor_->local_endpoint().port());

        connectionSlots_ = std::make_unique<std::counting_semaphore<>>(
            static_cast<std::ptrdiff_t>(config_.maxConnections));

        co_spawn(
            acceptor_->get_executor(),
            [this]() -> awaitable<void> {
                co_await accept_loop();
                co_return;
            },
            detached);

        workers_.reserve(config_.workerThreads);
        for (size_t i = 0; i < config_.workerThreads; ++i) {
            workers_.emplace_back([this, i]() {
                set_current_thread_name("sortie-io-" + std::to_string(i));
                spdlog::debug("[BeaconServer] worker {} starting", i);
                try {
                    while (!io_context_.stopped() && running_.load(std::memory_order_relaxed)) {
                        std::size_t count = io_context_.poll();
                        if (count == 0) {
                            std::this_thread::sleep_for(std::chrono::milliseconds(10));
                        }
                    }
                } catch (const std::exception& e) {
                    spdlog::error("[BeaconServer] worker {} exception: {}", i, e.what());
                }
                spdlog::debug("[BeaconServer] worker {} exiting", i);
            });
        }

        if (lifecycle_)
            lifecycle_->dispatch(ListeningEvent{});
        spdlog::info("[BeaconServer] listening on {}:{} (max_conn={} workers={})",
                     config_.listenAddress, boundPort_.load(), config_.maxConnections,
                     config_.workerThreads);
        return {};
    } catch (const std::exception& e) {
        running_ = false;
        work_guard_.reset();
        io_context_.stop();
        for (auto& worker : workers_) {
            if (worker.joinable())
                worker.join();
        }
        workers_.clear();
        acceptor_.reset();
        spdlog::error("[BeaconServer] start failed: {}", e.what());
        if (lifecycle_)
            lifecycle_->dispatch(FailureEvent{e.what()});
        return Error{ErrorCode::NetworkError,
                     fmt::format("Failed to start beacon server on {}:{}: {}",
                                 config_.listenAddress, config_.port, e.what())};
    }
}

Result<void> BeaconServer::stop() {
    if (!running_.load()) {
        return Error{ErrorCode::InvalidState, "Beacon server not running"};
    }
    spdlog::info("[BeaconServer] stopping");
    stopping_.store(true, std::memory_order_relaxed);
    if (lifecycle_)
        lifecycle_->dispatch(ShutdownRequestedEvent{});

    // Each socket and the acceptor is closed on its own strand so no handler races the close.
    std::vector<std::shared_ptr<tcp::socket>> sockets;
    {
        std::lock_guard<std::mutex> lk(activeSocketsMutex_);
        for (auto& weak : activeSockets_) {
            if (auto sock = weak.lock())
                sockets.push_back(std::move(sock));
        }
        activeSockets_.clear();
    }
    for (const auto& sock : sockets) {
        boost::asio::post(sock->get_executor(), [sock]() {
            boost::system::error_code ec;
            if (sock->is_open())
                sock->close(ec);
        });
    }
    if (acceptor_) {
        boost::asio::post(acceptor_->get_executor(), [this]() {
            boost::system::error_code ec;
            if (acceptor_->is_open())
                acceptor_->close(ec);
        });
    }
    spdlog::debug("[BeaconServer] closing {} active connections", sockets.size());

    // Give the posted close a chance to run before the context stops.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (activeConnections_.load() > 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    running_.store(false);
    work_guard_.reset();
    io_context_.stop();

    for (size_t i = 0; i < workers_.size(); ++i) {
        if (workers_[i].joinable()) {
            try {
                workers_[i].join();
            } catch (const std::system_error& e) {
                spdlog::warn("[BeaconServer] worker {} join failed: {}", i, e.what());
            }
        }
    }
    workers_.clear();
    acceptor_.reset();

    if (lifecycle_)
        lifecycle_->dispatch(StoppedEvent{});
    spdlog::info("[BeaconServer] stopped (total_conn={} rejected={})", totalConnections_.load(),
                 rejectedConnections_.load());
    stopping_.store(false, std::memory_order_relaxed);
    return {};
}

awaitable<void> BeaconServer::accept_loop() {
    spdlog::debug("[BeaconServer] accept loop started");
    while (running_ && !stopping_) {
        // One strand per connection: the read loop and the idle timer never run concurrently.
        auto socket = std::make_shared<tcp::socket>(boost::asio::make_strand(io_context_));
        boost::system::error_code ec;
        co_await acceptor_->async_accept(*socket, redirect_error(use_awaitable, ec));

        if (ec) {
            if (!running_ || stopping_ || ec == boost::asio::error::operation_aborted)
                break;
            spdlog::warn("[BeaconServer] accept error: {} ({})", ec.message(), ec.value());
            boost::asio::steady_timer timer(acceptor_->get_executor());
            timer.expires_after(std::chrono::milliseconds(100));
            boost::system::error_code timer_ec;
            co_await timer.async_wait(redirect_error(use_awaitable, timer_ec));
            continue;
        }

        totalConnections_.fetch_add(1);
        if (!connectionSlots_->try_acquire()) {
            rejectedConnections_.fetch_add(1);
            spdlog::warn("[BeaconServer] connection limit ({}) reached; rejecting peer",
                         config_.maxConnections);
            co_spawn(
                socket->get_executor(),
                [socket]() -> awaitable<void> {
                    ipc::MessageFramer framer;
                    co_await writeMessage(
                        *socket, framer,
                        makeReply(0, ipc::ErrorResponse{ErrorCode::ResourceExhausted,
                                                        "Too many connections"}));
                    boost::system::error_code close_ec;
                    socket->close(close_ec);
                },
                detached);
            continue;
        }

        auto current = activeConnections_.fetch_add(1) + 1;
        spdlog::debug("[BeaconServer] accepted connection, active={}", current);

        co_spawn(
            socket->get_executor(),
            [this, socket]() -> awaitable<void> {
                struct SlotGuard {
                    BeaconServer* server;
                    ~SlotGuard() {
                        server->connectionSlots_->release();
                        server->activeConnections_.fetch_sub(1);
                    }
                } guard{this};
                co_await handle_connection(socket);
            },
            detached);
    }
    spdlog::debug("[BeaconServer] accept loop ended");
}

awaitable<void> BeaconServer::handle_connection(std::shared_ptr<tcp::socket> socket) {
    register_socket(socket);

    boost::system::error_code ec;
    const auto peer = socket->remote_endpoint(ec);
    const std::string peerName =
        ec ? std::string("unknown") : peer.address().to_string() + ":" + std::to_string(peer.port());

    // Closing the socket is the only way to abort a pending read.
    auto idle = std::make_shared<boost::asio::steady_timer>(socket->get_executor());
    auto armIdle = [idle, socket, this, peerName]() {
        idle->expires_after(config_.idleTimeout);
        idle->async_wait([socket, peerName](const boost::system::error_code& wait_ec) {
            if (wait_ec)
                return;
            spdlog::debug("[BeaconServer] closing idle connection from {}", peerName);
            boost::system::error_code close_ec;
            socket->close(close_ec);
        });
    };

    ipc::MessageFramer framer;
    ipc::FrameReader reader;
    std::array<uint8_t, kReadChunk> chunk{};

    armIdle();
    while (running_ && !stopping_ && socket->is_open()) {
        boost::system::error_code read_ec;
        std::size_t n = co_await socket->async_read_some(boost::asio::buffer(chunk),
                                                         redirect_error(use_awaitable, read_ec));
        if (read_ec) {
            if (read_ec != boost::asio::error::eof &&
                read_ec != boost::asio::error::operation_aborted) {
                spdlog::debug("[BeaconServer] read from {} failed: {}", peerName,
                              read_ec.message());
            }
            break;
        }

        std::size_t offset = 0;
        bool closeAfter = false;
        while (offset < n && !closeAfter) {
            auto fed = reader.feed(chunk.data() + offset, n - offset);
            offset += fed.consumed;

            if (fed.status == ipc::FrameReader::FrameStatus::InvalidFrame ||
                fed.status == ipc::FrameReader::FrameStatus::FrameTooLarge) {
                const bool tooLarge = fed.status == ipc::FrameReader::FrameStatus::FrameTooLarge;
                spdlog::warn("[BeaconServer] {} frame from {}; closing",
                             tooLarge ? "oversized" : "invalid", peerName);
                co_await writeMessage(
                    *socket, framer,
                    makeReply(0, ipc::ErrorResponse{tooLarge ? ErrorCode::ResourceExhausted
                                                             : ErrorCode::ProtocolViolation,
                                                    tooLarge ? "Frame too large"
                                                             : "Invalid frame header"}));
                closeAfter = true;
                break;
            }
            if (!reader.has_frame())
                continue;

            auto frame = reader.get_frame();
            if (!frame) {
                closeAfter = true;
                break;
            }
            armIdle();

            auto message = framer.parse_frame(frame.value());
            if (!message) {
                spdlog::warn("[BeaconServer] undecodable frame from {}: {}", peerName,
                             message.error().message);
                if (!co_await writeMessage(*socket, framer,
                                           makeReply(0, ipc::ErrorResponse{message.error().code,
                                                                           message.error().message})))
                    closeAfter = true;
                continue;
            }

            const auto& msg = message.value();
            ipc::Response response;
            if (msg.version != ipc::PROTOCOL_VERSION) {
                response = ipc::ErrorResponse{
                    ErrorCode::NotSupported,
                    fmt::format("Unsupported protocol version {}", msg.version)};
            } else if (const auto* req = std::get_if<ipc::Request>(&msg.payload)) {
                spdlog::trace("[BeaconServer] {} request {} from {}", ipc::getRequestName(*req),
                              msg.requestId, peerName);
                response = dispatcher_.dispatch(*req);
            } else {
                response = ipc::ErrorResponse{ErrorCode::ProtocolViolation,
                                              "Expected a request payload"};
            }

            if (!co_await writeMessage(*socket, framer,
                                       makeReply(msg.requestId, std::move(response))))
                closeAfter = true;
        }
        if (closeAfter)
            break;
    }

    idle->cancel();
    boost::system::error_code close_ec;
    socket->shutdown(tcp::socket::shutdown_both, close_ec);
    socket->close(close_ec);
    spdlog::debug("[BeaconServer] connection from {} closed", peerName);
}

void BeaconServer::register_socket(const std::shared_ptr<tcp::socket>& socket) {
    std::lock_guard<std::mutex> lk(activeSocketsMutex_);
    activeSockets_.erase(std::remove_if(activeSockets_.begin(), activeSockets_.end(),
                                        [](const auto& weak) { return weak.expired(); }),
                         activeSockets_.end());
    activeSockets_.push_back(socket);
}

} // namespace sortie::server
