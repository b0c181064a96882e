#include "protocol/wire.hpp"
#include <cstring>

namespace protocol {

WireReader::WireReader(boost::asio::const_buffer buffer)
    : data_(static_cast<const uint8_t*>(buffer.data())), size_(buffer.size()) {}

void WireReader::require(std::size_t count) const {
    if (count > size_ - pos_) {
        throw TruncatedInput("need " + std::to_string(count) + " bytes at offset " +
                             std::to_string(pos_) + ", only " +
                             std::to_string(size_ - pos_) + " remain");
    }
}

uint8_t WireReader::read_u8() {
    require(1);
    return data_[pos_++];
}

uint16_t WireReader::read_u16le() {
    require(2);
    uint16_t value = static_cast<uint16_t>(data_[pos_]) |
                     (static_cast<uint16_t>(data_[pos_ + 1]) << 8);
    pos_ += 2;
    return value;
}

uint32_t WireReader::read_u32le() {
    require(4);
    uint32_t value = static_cast<uint32_t>(data_[pos_]) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 3]) << 24);
    pos_ += 4;
    return value;
}

void WireReader::skip(std::size_t count) {
    require(count);
    pos_ += count;
}

boost::asio::const_buffer WireReader::read_bytes(std::size_t count) {
    require(count);
    boost::asio::const_buffer view(data_ + pos_, count);
    pos_ += count;
    return view;
}

WireWriter& WireWriter::u8(uint8_t value) {
    out_.push_back(value);
    return *this;
}

WireWriter& WireWriter::u16le(uint16_t value) {
    out_.push_back(static_cast<uint8_t>( value       & 0xFF));
    out_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    return *this;
}

WireWriter& WireWriter::u32le(uint32_t value) {
    out_.push_back(static_cast<uint8_t>( value        & 0xFF));
    out_.push_back(static_cast<uint8_t>((value >> 8)  & 0xFF));
    out_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    return *this;
}

WireWriter& WireWriter::pad(std::size_t count) {
    out_.insert(out_.end(), count, 0);
    return *this;
}

WireWriter& WireWriter::put(boost::asio::const_buffer bytes) {
    const auto* begin = static_cast<const uint8_t*>(bytes.data());
    out_.insert(out_.end(), begin, begin + bytes.size());
    return *this;
}

Bytes to_bytes(boost::asio::const_buffer buffer) {
    const auto* begin = static_cast<const uint8_t*>(buffer.data());
    return Bytes(begin, begin + buffer.size());
}

std::string to_hex(boost::asio::const_buffer buffer) {
    static const char digits[] = "0123456789abcdef";
    const auto* bytes = static_cast<const uint8_t*>(buffer.data());
    std::string out;
    out.reserve(buffer.size() * 2);
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0F];
    }
    return out;
}

} // namespace protocol
