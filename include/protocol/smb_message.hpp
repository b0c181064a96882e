#pragma once

#include <array>
#include <cstdint>
#include "protocol/message_context.hpp"
#include "protocol/status.hpp"

namespace protocol {

constexpr uint8_t SMB_FLAGS_REPLY = 0x80;

// Fixed 32-byte SMB1 header
struct SmbHeader {
    uint8_t command = 0;
    uint32_t status = 0;
    uint8_t flags = 0;
    uint16_t flags2 = 0;
    uint16_t pid_high = 0;
    std::array<uint8_t, 8> security_features{};
    uint16_t tid = 0;
    uint16_t pid_low = 0;
    uint16_t uid = 0;
    uint16_t mid = 0;
};

std::array<uint8_t, SMB_HEADER_LENGTH> serialize_header(const SmbHeader& header);
SmbHeader deserialize_header(boost::asio::const_buffer buffer);

struct SmbMessage {
    SmbHeader header;
    MessageContext context;
};

// Splits a raw SMB1 message into header, parameter words and data bytes.
// Throws TruncatedInput if the declared word or byte count overruns raw.
SmbMessage decode_message(Bytes raw);

// Reply to request: same header with the reply flag set and status replaced,
// followed by params as parameter words and data as the byte block.
Bytes encode_response(const SmbHeader& request, uint32_t status,
                      const Bytes& params, const Bytes& data);

} // namespace protocol
