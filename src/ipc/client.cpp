// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/ipc/client.h>

#include <spdlog/spdlog.h>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>
#include <optional>

namespace sortie::ipc {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using tcp = boost::asio::ip::tcp;

namespace {

// Runs `make()` to completion on `io`. When `timeout` expires first, `onTimeout` is invoked
// (it must cancel the pending I/O) and the coroutine is drained before returning.
template <typename T, typename Make, typename OnTimeout>
Result<T> runSync(boost::asio::io_context& io, Make make, std::chrono::milliseconds timeout,
                  OnTimeout onTimeout) {
    std::optional<Result<T>> out;
    boost::asio::co_spawn(
        io, [&]() -> awaitable<void> { out.emplace(co_await make()); }, boost::asio::detached);

    io.restart();
    if (timeout.count() > 0)
        io.run_for(timeout);
    else
        io.run();

    if (out)
        return std::move(*out);

    onTimeout();
    io.restart();
    io.run();
    return Error{ErrorCode::Timeout,
                 fmt::format("No reply within {}ms", static_cast<long long>(timeout.count()))};
}

} // namespace

SortieClient::SortieClient(ClientConfig config) : config_(std::move(config)) {}

SortieClient::~SortieClient() {
    disconnect();
}

bool SortieClient::isConnected() const {
    return socket_ && socket_->is_open();
}

void SortieClient::close_socket() {
    if (socket_) {
        boost::system::error_code ec;
        socket_->close(ec);
    }
}

void SortieClient::disconnect() {
    if (!socket_)
        return;
    boost::system::error_code ec;
    socket_->shutdown(tcp::socket::shutdown_both, ec);
    socket_->close(ec);
    socket_.reset();
}

Result<void> SortieClient::connect() {
    if (isConnected())
        return {};
    auto r = runSync<void>(
        io_, [this]() { return async_connect(); }, config_.connectTimeout,
        [this]() { close_socket(); });
    if (!r) {
        socket_.reset();
        return r.error();
    }
    return {};
}

awaitable<Result<void>> SortieClient::async_connect() {
    tcp::resolver resolver(io_);
    boost::system::error_code ec;
    auto endpoints = co_await resolver.async_resolve(config_.host, std::to_string(config_.port),
                                                     redirect_error(use_awaitable, ec));
    if (ec) {
        co_return Error{ErrorCode::NetworkError,
                        fmt::format("Cannot resolve {}: {}", config_.host, ec.message())};
    }

    socket_ = std::make_unique<tcp::socket>(io_);
    co_await boost::asio::async_connect(*socket_, endpoints, redirect_error(use_awaitable, ec));
    if (ec) {
        co_return Error{ErrorCode::NetworkError, fmt::format("Cannot connect to {}:{}: {}",
                                                             config_.host, config_.port,
                                                             ec.message())};
    }
    boost::system::error_code opt_ec;
    socket_->set_option(tcp::no_delay(true), opt_ec);
    spdlog::debug("[SortieClient] connected to {}:{}", config_.host, config_.port);
    co_return Result<void>();
}

Result<Response> SortieClient::sendRequest(const Request& req) {
    if (auto c = connect(); !c)
        return c.error();

    Message msg;
    msg.version = PROTOCOL_VERSION;
    msg.requestId = nextRequestId_++;
    msg.timestamp = std::chrono::steady_clock::now();
    msg.payload = req;

    auto framed = framer_.frame_message(msg);
    if (!framed)
        return framed.error();

    auto res = runSync<Response>(
        io_,
        [this, frame = std::move(framed).value(), id = msg.requestId]() mutable {
            return async_round_trip(std::move(frame), id);
        },
        config_.requestTimeout, [this]() { close_socket(); });
    if (!res) {
        // The stream position is unknown after a failed round trip.
        disconnect();
    }
    return res;
}

awaitable<Result<Response>> SortieClient::async_round_trip(std::vector<uint8_t> frame,
                                                           uint64_t requestId) {
    boost::system::error_code ec;
    co_await boost::asio::async_write(*socket_, boost::asio::buffer(frame),
                                      redirect_error(use_awaitable, ec));
    if (ec) {
        co_return Error{ErrorCode::NetworkError, "Write failed: " + ec.message()};
    }

    std::array<uint8_t, MessageFramer::HEADER_SIZE> header{};
    co_await boost::asio::async_read(*socket_, boost::asio::buffer(header),
                                     redirect_error(use_awaitable, ec));
    if (ec) {
        co_return Error{ErrorCode::NetworkError, "Read failed: " + ec.message()};
    }

    auto parsed = framer_.parse_header(header);
    if (!parsed)
        co_return parsed.error();
    const auto payloadSize = parsed.value().payload_size;
    if (payloadSize > MAX_MESSAGE_SIZE) {
        co_return Error{ErrorCode::ResourceExhausted,
                        fmt::format("Response of {} bytes exceeds limit", payloadSize)};
    }

    std::vector<uint8_t> full(MessageFramer::HEADER_SIZE + payloadSize);
    std::copy(header.begin(), header.end(), full.begin());
    if (payloadSize > 0) {
        co_await boost::asio::async_read(
            *socket_, boost::asio::buffer(full.data() + MessageFramer::HEADER_SIZE, payloadSize),
            redirect_error(use_awaitable, ec));
        if (ec) {
            co_return Error{ErrorCode::NetworkError, "Read failed: " + ec.message()};
        }
    }

    auto message = framer_.parse_frame(full);
    if (!message)
        co_return message.error();

    auto* response = std::get_if<Response>(&message.value().payload);
    if (!response) {
        co_return Error{ErrorCode::ProtocolViolation, "Server sent a request payload"};
    }
    // Connection-level errors (limit reached, bad frame) carry id 0.
    if (message.value().requestId != requestId && message.value().requestId != 0) {
        co_return Error{ErrorCode::ProtocolViolation,
                        fmt::format("Response id {} does not match request {}",
                                    message.value().requestId, requestId)};
    }
    co_return std::move(*response);
}

} // namespace sortie::ipc
