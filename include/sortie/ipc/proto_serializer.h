// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/ipc/ipc_protocol.h>

#include <cstdint>
#include <vector>

namespace sortie::ipc {

// ProtoSerializer encodes/decodes Message.payload (Request/Response) using the protobuf Envelope.
// The transport header (magic, size, CRC) is handled by MessageFramer.
class ProtoSerializer {
public:
    static Result<std::vector<uint8_t>> encode_payload(const Message& msg);

    // Appends the serialized payload starting at buffer.size(), so callers can reserve room for
    // a frame header in front of it.
    static Result<void> encode_payload_into(const Message& msg, std::vector<uint8_t>& buffer);

    static Result<Message> decode_payload(const uint8_t* data, std::size_t size);
    static Result<Message> decode_payload(const std::vector<uint8_t>& bytes) {
        return decode_payload(bytes.data(), bytes.size());
    }
};

} // namespace sortie::ipc
