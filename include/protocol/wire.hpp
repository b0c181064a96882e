#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio/buffer.hpp>

namespace protocol {

using Bytes = std::vector<uint8_t>;

// Input ended before a fixed-width field or declared block could be read.
class TruncatedInput : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A declared offset/length pair does not fit inside the message buffer.
class MalformedOffset : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Filler bytes needed so that offset + pad_length(offset) is a multiple of alignment.
constexpr std::size_t pad_length(std::size_t offset, std::size_t alignment = 4) {
    return (alignment - offset % alignment) % alignment;
}

// Little-endian cursor over a borrowed byte range. Every read is bounds
// checked and throws TruncatedInput instead of reading past the end.
class WireReader {
public:
    explicit WireReader(boost::asio::const_buffer buffer);

    uint8_t read_u8();
    uint16_t read_u16le();
    uint32_t read_u32le();
    void skip(std::size_t count);
    boost::asio::const_buffer read_bytes(std::size_t count);

    std::size_t position() const { return pos_; }
    std::size_t remaining() const { return size_ - pos_; }

private:
    void require(std::size_t count) const;

    const uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
};

// Growable little-endian output buffer.
class WireWriter {
public:
    WireWriter& u8(uint8_t value);
    WireWriter& u16le(uint16_t value);
    WireWriter& u32le(uint32_t value);
    WireWriter& pad(std::size_t count);
    WireWriter& put(boost::asio::const_buffer bytes);

    std::size_t size() const { return out_.size(); }
    const Bytes& bytes() const { return out_; }
    Bytes release() { return std::move(out_); }

private:
    Bytes out_;
};

Bytes to_bytes(boost::asio::const_buffer buffer);
std::string to_hex(boost::asio::const_buffer buffer);

} // namespace protocol
