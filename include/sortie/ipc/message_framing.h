// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/ipc/ipc_protocol.h>

#include <bit>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace sortie::ipc {

// Message framing for reliable transport over a byte stream.
class MessageFramer {
public:
    static constexpr uint32_t MAGIC = 0x534F5254; // "SORT" in hex
    static constexpr uint32_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 20; // 5 * sizeof(uint32_t)

    struct FrameHeader {
        uint32_t magic = MAGIC;
        uint32_t version = VERSION;
        uint32_t payload_size = 0;
        uint32_t checksum = 0; // CRC32 of payload
        uint32_t flags = 0;

        static constexpr uint32_t FLAG_ERROR = 0x00000004; // Payload is an ErrorResponse

        void set_error(bool is_error = true) noexcept {
            if (is_error)
                flags |= FLAG_ERROR;
            else
                flags &= ~FLAG_ERROR;
        }

        bool is_error() const noexcept { return (flags & FLAG_ERROR) != 0; }

        // Convert to network byte order
        void to_network() noexcept {
            if constexpr (std::endian::native != std::endian::big) {
                magic = __builtin_bswap32(magic);
                version = __builtin_bswap32(version);
                payload_size = __builtin_bswap32(payload_size);
                checksum = __builtin_bswap32(checksum);
                flags = __builtin_bswap32(flags);
            }
        }

        // Convert from network byte order
        void from_network() noexcept {
            if constexpr (std::endian::native != std::endian::big) {
                magic = __builtin_bswap32(magic);
                version = __builtin_bswap32(version);
                payload_size = __builtin_bswap32(payload_size);
                checksum = __builtin_bswap32(checksum);
                flags = __builtin_bswap32(flags);
            }
        }

        [[nodiscard]] bool is_valid() const noexcept {
            return magic == MAGIC && version == VERSION;
        }
    };

    static_assert(HEADER_SIZE == sizeof(FrameHeader),
                  "HEADER_SIZE constant must match actual struct size");
    static_assert(std::is_trivially_copyable_v<FrameHeader>,
                  "FrameHeader must be trivially copyable for memcpy");

    explicit MessageFramer(size_t max_message_size = MAX_MESSAGE_SIZE)
        : max_message_size_(max_message_size) {}

    Result<std::vector<uint8_t>> frame_message(const Message& message);

    // Append framed bytes into the provided buffer, preserving existing contents.
    Result<void> frame_message_into(const Message& message, std::vector<uint8_t>& buffer);

    [[nodiscard]] Result<FrameHeader> parse_header(std::span<const uint8_t> data) const;

    // Validates header, size and checksum, then decodes the payload.
    Result<Message> parse_frame(std::span<const uint8_t> frame);

    [[nodiscard]] static uint32_t calculate_crc32(std::span<const uint8_t> data) noexcept;

private:
    size_t max_message_size_;
};

// Incremental frame reader for a stream socket.
class FrameReader {
public:
    explicit FrameReader(size_t max_frame_size = MAX_MESSAGE_SIZE + MessageFramer::HEADER_SIZE)
        : max_frame_size_(max_frame_size) {}

    FrameReader(const FrameReader&) = delete;
    FrameReader& operator=(const FrameReader&) = delete;

    enum class FrameStatus { NeedMoreData, FrameComplete, InvalidFrame, FrameTooLarge };

    struct FeedResult {
        size_t consumed;
        FrameStatus status;
    };

    // Consumes bytes up to the end of the current frame; the rest is left to the caller.
    FeedResult feed(const uint8_t* data, size_t size);
    bool has_frame() const { return state_ == State::FrameReady; }
    Result<std::vector<uint8_t>> get_frame();
    void reset();

private:
    enum class State { WaitingForHeader, ReadingBody, FrameReady };

    std::vector<uint8_t> buffer_;
    size_t max_frame_size_;
    State state_ = State::WaitingForHeader;
    size_t expected_size_ = sizeof(MessageFramer::FrameHeader);
};

} // namespace sortie::ipc
