#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <boost/asio.hpp>
#include "protocol/wire.hpp"

namespace transfer {

// NetBIOS session service framing (RFC 1002): [type:u8][flags:u8][length:u16be]
// with the low flag bit extending the length to 17 bits.
constexpr uint8_t NBSS_SESSION_MESSAGE = 0x00;
constexpr uint8_t NBSS_KEEP_ALIVE = 0x85;
constexpr std::size_t NBSS_MAX_LENGTH = 0x1FFFF;

struct FrameHeader {
    uint8_t type;
    uint32_t length;
};

std::array<uint8_t, 4> serialize_frame_header(const FrameHeader& header);
FrameHeader deserialize_frame_header(const std::array<uint8_t, 4>& buffer);

class MessageSender {
public:
    // False if the socket failed or message is too long for one frame.
    static bool send_frame(boost::asio::ip::tcp::socket& socket, const protocol::Bytes& message);
};

class MessageReceiver {
public:
    // Next session message, skipping keep-alives. std::nullopt once the peer
    // has gone away or the stream can no longer be trusted.
    static std::optional<protocol::Bytes> receive_frame(boost::asio::ip::tcp::socket& socket);
};

} // namespace transfer
