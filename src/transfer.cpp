#include "transfer.hpp"
#include <iostream>
#include <vector>

namespace transfer {

std::array<uint8_t, 4> serialize_frame_header(const FrameHeader& header) {
    return {header.type,
            static_cast<uint8_t>((header.length >> 16) & 0x01),
            static_cast<uint8_t>((header.length >> 8) & 0xFF),
            static_cast<uint8_t>(header.length & 0xFF)};
}

FrameHeader deserialize_frame_header(const std::array<uint8_t, 4>& buffer) {
    FrameHeader header;
    header.type = buffer[0];
    header.length = (static_cast<uint32_t>(buffer[1] & 0x01) << 16) |
                    (static_cast<uint32_t>(buffer[2]) << 8) |
                    static_cast<uint32_t>(buffer[3]);
    return header;
}

bool MessageSender::send_frame(boost::asio::ip::tcp::socket& socket, const protocol::Bytes& message) {
    if (message.size() > NBSS_MAX_LENGTH) {
        std::cerr << "MessageSender: " << message.size() << " byte message does not fit in one frame\n";
        return false;
    }
    try {
        auto header = serialize_frame_header({NBSS_SESSION_MESSAGE, static_cast<uint32_t>(message.size())});
        std::array<boost::asio::const_buffer, 2> buffers = {boost::asio::buffer(header),
                                                            boost::asio::buffer(message)};
        boost::asio::write(socket, buffers);
        return true;
    } catch (std::exception& e) {
        std::cerr << "MessageSender Exception: " << e.what() << "\n";
        return false;
    }
}

std::optional<protocol::Bytes> MessageReceiver::receive_frame(boost::asio::ip::tcp::socket& socket) {
    try {
        while (true) {
            std::array<uint8_t, 4> buf;
            boost::asio::read(socket, boost::asio::buffer(buf));
            FrameHeader header = deserialize_frame_header(buf);

            std::vector<uint8_t> payload(header.length);
            boost::asio::read(socket, boost::asio::buffer(payload));

            if (header.type == NBSS_KEEP_ALIVE) {
                continue;
            }
            if (header.type != NBSS_SESSION_MESSAGE) {
                std::cerr << "MessageReceiver: unexpected session packet type 0x"
                          << std::hex << static_cast<int>(header.type) << std::dec << "\n";
                return std::nullopt;
            }
            return payload;
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() != boost::asio::error::eof &&
            e.code() != boost::asio::error::connection_reset &&
            e.code() != boost::asio::error::operation_aborted) {
            std::cerr << "MessageReceiver Exception: " << e.what() << "\n";
        }
        return std::nullopt;
    }
}

} // namespace transfer
