#include "protocol/message_context.hpp"
#include <string>

namespace protocol {

boost::asio::const_buffer slice(boost::asio::const_buffer message,
                                std::size_t offset, std::size_t length,
                                const char* what) {
    if (offset > message.size() || length > message.size() - offset) {
        throw MalformedOffset(std::string(what) + " [" + std::to_string(offset) + ", +" +
                              std::to_string(length) + ") exceeds message length " +
                              std::to_string(message.size()));
    }
    return boost::asio::const_buffer(static_cast<const uint8_t*>(message.data()) + offset, length);
}

MessageContext::MessageContext(Bytes buffer,
                               std::size_t params_offset, std::size_t params_length,
                               std::size_t data_offset, std::size_t data_length)
    : buffer_(std::move(buffer)),
      params_offset_(params_offset),
      params_length_(params_length),
      data_offset_(data_offset),
      data_length_(data_length) {
    // validate eagerly so the accessors never have to
    slice(this->buffer(), params_offset_, params_length_, "command parameters");
    slice(this->buffer(), data_offset_, data_length_, "command data");
}

boost::asio::const_buffer MessageContext::command_params() const {
    return slice(buffer(), params_offset_, params_length_, "command parameters");
}

boost::asio::const_buffer MessageContext::command_data() const {
    return slice(buffer(), data_offset_, data_length_, "command data");
}

} // namespace protocol
