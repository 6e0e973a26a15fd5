// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/ipc/message_framing.h>
#include <sortie/ipc/proto_serializer.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cstring>
#include <string>

namespace sortie::ipc {

namespace {

// CRC-32 polynomial 0xEDB88320 (reversed 0x04C11DB7), table built at compile time.
constexpr std::array<uint32_t, 256> generate_crc32_table() noexcept {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ ((crc & 1) ? 0xEDB88320 : 0);
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

uint32_t calculate_crc32_impl(const uint8_t* data, size_t size) noexcept {
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < size; ++i) {
        crc = CRC32_TABLE[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return ~crc;
}

bool is_error_response(const Message& message) {
    const auto* res = std::get_if<Response>(&message.payload);
    return res && std::holds_alternative<ErrorResponse>(*res);
}

} // namespace

uint32_t MessageFramer::calculate_crc32(std::span<const uint8_t> data) noexcept {
    return calculate_crc32_impl(data.data(), data.size());
}

Result<void> MessageFramer::frame_message_into(const Message& message,
                                               std::vector<uint8_t>& buffer) {
    const auto base = buffer.size();
    buffer.resize(base + sizeof(FrameHeader));
    const auto payload_offset = buffer.size();

    auto payload_result = ProtoSerializer::encode_payload_into(message, buffer);
    if (!payload_result) {
        buffer.resize(base);
        return payload_result.error();
    }

    const std::size_t payload_size = buffer.size() - payload_offset;
    if (payload_size > max_message_size_) {
        buffer.resize(base);
        return Error{ErrorCode::InvalidData, "Message size " + std::to_string(payload_size) +
                                                 " exceeds maximum " +
                                                 std::to_string(max_message_size_)};
    }

    FrameHeader header;
    header.payload_size = static_cast<uint32_t>(payload_size);
    header.checksum = calculate_crc32_impl(buffer.data() + payload_offset, payload_size);
    header.set_error(is_error_response(message));
    header.to_network();

    std::memcpy(buffer.data() + base, &header, sizeof(header));
    return Result<void>();
}

Result<std::vector<uint8_t>> MessageFramer::frame_message(const Message& message) {
    std::vector<uint8_t> frame;
    auto res = frame_message_into(message, frame);
    if (!res)
        return res.error();
    return frame;
}

Result<MessageFramer::FrameHeader>
MessageFramer::parse_header(std::span<const uint8_t> data) const {
    if (data.size() < HEADER_SIZE) {
        return Error{ErrorCode::InvalidData, "Insufficient data for frame header"};
    }

    FrameHeader header;
    std::memcpy(&header, data.data(), sizeof(header));
    header.from_network();

    if (!header.is_valid()) {
        return Error{ErrorCode::InvalidData, "Invalid frame magic or version"};
    }
    return header;
}

Result<Message> MessageFramer::parse_frame(std::span<const uint8_t> frame) {
    auto header_result = parse_header(frame);
    if (!header_result)
        return header_result.error();
    const auto& header = header_result.value();

    if (header.payload_size > max_message_size_) {
        return Error{ErrorCode::InvalidData, "Message size exceeds maximum"};
    }
    if (frame.size() != sizeof(FrameHeader) + header.payload_size) {
        return Error{ErrorCode::InvalidData, "Frame size mismatch"};
    }

    auto message_data = frame.subspan(sizeof(FrameHeader));
    uint32_t calculated_crc = calculate_crc32(message_data);
    if (calculated_crc != header.checksum) {
        return Error{ErrorCode::InvalidData, "Checksum mismatch: expected " +
                                                 std::to_string(header.checksum) + ", got " +
                                                 std::to_string(calculated_crc)};
    }

    try {
        return ProtoSerializer::decode_payload(message_data.data(), message_data.size());
    } catch (const std::exception& e) {
        return Error{ErrorCode::SerializationError,
                     std::string("Failed to deserialize message: ") + e.what()};
    }
}

void FrameReader::reset() {
    buffer_.clear();
    state_ = State::WaitingForHeader;
    expected_size_ = sizeof(MessageFramer::FrameHeader);
}

FrameReader::FeedResult FrameReader::feed(const uint8_t* data, size_t size) {
    size_t consumed = 0;

    while (consumed < size && state_ != State::FrameReady) {
        size_t to_copy = std::min(size - consumed, expected_size_ - buffer_.size());
        buffer_.insert(buffer_.end(), data + consumed, data + consumed + to_copy);
        consumed += to_copy;

        if (buffer_.size() != expected_size_)
            continue;

        if (state_ == State::WaitingForHeader) {
            MessageFramer::FrameHeader header;
            std::memcpy(&header, buffer_.data(), sizeof(MessageFramer::FrameHeader));
            header.from_network();

            if (!header.is_valid()) {
                reset();
                return {consumed, FrameStatus::InvalidFrame};
            }
            if (header.payload_size > max_frame_size_ - sizeof(MessageFramer::FrameHeader)) {
                reset();
                return {consumed, FrameStatus::FrameTooLarge};
            }

            expected_size_ = sizeof(MessageFramer::FrameHeader) + header.payload_size;
            if (header.payload_size == 0) {
                state_ = State::FrameReady;
            } else {
                state_ = State::ReadingBody;
                buffer_.reserve(expected_size_);
            }
        } else {
            state_ = State::FrameReady;
        }
    }

    if (state_ == State::FrameReady)
        return {consumed, FrameStatus::FrameComplete};
    return {consumed, FrameStatus::NeedMoreData};
}

Result<std::vector<uint8_t>> FrameReader::get_frame() {
    if (state_ != State::FrameReady) {
        return Error{ErrorCode::InvalidState, "No complete frame available"};
    }
    std::vector<uint8_t> frame;
    frame.swap(buffer_);
    reset();
    return frame;
}

} // namespace sortie::ipc
