// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/ipc/ipc_protocol.h>
#include <sortie/ipc/message_framing.h>
#include <sortie/ipc/response_of.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>

namespace sortie::ipc {

struct ClientConfig {
    std::string host{"127.0.0.1"};
    uint16_t port = 8888;
    std::chrono::milliseconds connectTimeout{2000};
    std::chrono::milliseconds requestTimeout{10000};
};

/**
 * @brief Blocking client for the SORT wire protocol.
 *
 * Each call runs its coroutine to completion on a private io_context, so the client is usable
 * from plain synchronous code (sortie-ctl, tests). The connection is opened lazily and reused
 * across calls. Not thread-safe.
 */
class SortieClient {
public:
    explicit SortieClient(ClientConfig config = {});
    ~SortieClient();

    SortieClient(const SortieClient&) = delete;
    SortieClient& operator=(const SortieClient&) = delete;

    Result<void> connect();
    void disconnect();
    bool isConnected() const;

    // One round trip. An ErrorResponse from the server is returned as a Response, not an Error.
    Result<Response> sendRequest(const Request& req);

    // Typed round trip; an ErrorResponse becomes Error{code, message}.
    template <class Req> Result<ResponseOfT<Req>> call(const Req& req) {
        auto res = sendRequest(Request{req});
        if (!res)
            return res.error();
        auto& response = res.value();
        if (auto* err = std::get_if<ErrorResponse>(&response))
            return Error{err->code, err->message};
        if (auto* typed = std::get_if<ResponseOfT<Req>>(&response))
            return std::move(*typed);
        return Error{ErrorCode::ProtocolViolation,
                     "Unexpected response type: " + getResponseName(response)};
    }

    const ClientConfig& config() const noexcept { return config_; }

private:
    boost::asio::awaitable<Result<void>> async_connect();
    boost::asio::awaitable<Result<Response>> async_round_trip(std::vector<uint8_t> frame,
                                                             uint64_t requestId);

    void close_socket();

    ClientConfig config_;
    boost::asio::io_context io_;
    std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
    MessageFramer framer_;
    uint64_t nextRequestId_{1};
};

} // namespace sortie::ipc
