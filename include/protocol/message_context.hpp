#pragma once

#include <cstddef>
#include "protocol/wire.hpp"

namespace protocol {

// One inbound SMB message: the raw bytes plus where the command's parameter
// words and data bytes sit inside them. Immutable once constructed.
class MessageContext {
public:
    // Throws MalformedOffset if either block does not fit inside buffer.
    MessageContext(Bytes buffer,
                   std::size_t params_offset, std::size_t params_length,
                   std::size_t data_offset, std::size_t data_length);

    boost::asio::const_buffer buffer() const { return boost::asio::buffer(buffer_); }
    boost::asio::const_buffer command_params() const;
    boost::asio::const_buffer command_data() const;

    std::size_t command_params_offset() const { return params_offset_; }
    std::size_t command_data_offset() const { return data_offset_; }

private:
    Bytes buffer_;
    std::size_t params_offset_;
    std::size_t params_length_;
    std::size_t data_offset_;
    std::size_t data_length_;
};

// Bounds-checked view of [offset, offset + length) within message.
boost::asio::const_buffer slice(boost::asio::const_buffer message,
                                std::size_t offset, std::size_t length,
                                const char* what);

} // namespace protocol
