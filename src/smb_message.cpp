#include "protocol/smb_message.hpp"
#include <cstring>
#include <stdexcept>
#include "protocol/status.hpp"

namespace protocol {

namespace {

const uint8_t SMB_PROTOCOL_ID[4] = {0xFF, 'S', 'M', 'B'};

} // namespace

std::array<uint8_t, SMB_HEADER_LENGTH> serialize_header(const SmbHeader& header) {
    WireWriter out;
    out.put(boost::asio::buffer(SMB_PROTOCOL_ID))
        .u8(header.command)
        .u32le(header.status)
        .u8(header.flags)
        .u16le(header.flags2)
        .u16le(header.pid_high)
        .put(boost::asio::buffer(header.security_features))
        .u16le(0) // reserved
        .u16le(header.tid)
        .u16le(header.pid_low)
        .u16le(header.uid)
        .u16le(header.mid);

    std::array<uint8_t, SMB_HEADER_LENGTH> buffer;
    std::memcpy(buffer.data(), out.bytes().data(), buffer.size());
    return buffer;
}

SmbHeader deserialize_header(boost::asio::const_buffer buffer) {
    WireReader in(buffer);
    boost::asio::const_buffer magic = in.read_bytes(sizeof(SMB_PROTOCOL_ID));
    if (std::memcmp(magic.data(), SMB_PROTOCOL_ID, sizeof(SMB_PROTOCOL_ID)) != 0) {
        throw std::runtime_error("not an SMB1 message (bad protocol id)");
    }

    SmbHeader header;
    header.command = in.read_u8();
    header.status = in.read_u32le();
    header.flags = in.read_u8();
    header.flags2 = in.read_u16le();
    header.pid_high = in.read_u16le();
    boost::asio::const_buffer security = in.read_bytes(header.security_features.size());
    std::memcpy(header.security_features.data(), security.data(), security.size());
    in.skip(2); // reserved
    header.tid = in.read_u16le();
    header.pid_low = in.read_u16le();
    header.uid = in.read_u16le();
    header.mid = in.read_u16le();
    return header;
}

SmbMessage decode_message(Bytes raw) {
    WireReader in(boost::asio::buffer(raw));
    SmbHeader header = deserialize_header(in.read_bytes(SMB_HEADER_LENGTH));

    std::size_t word_count = in.read_u8();
    std::size_t params_offset = in.position();
    in.skip(2 * word_count);

    std::size_t byte_count = in.read_u16le();
    std::size_t data_offset = in.position();
    in.skip(byte_count);

    std::size_t params_length = 2 * word_count;
    return SmbMessage{header,
                      MessageContext(std::move(raw), params_offset, params_length,
                                     data_offset, byte_count)};
}

Bytes encode_response(const SmbHeader& request, uint32_t status,
                      const Bytes& params, const Bytes& data) {
    if (params.size() % 2 != 0 || params.size() / 2 > 0xFF) {
        throw std::length_error("reply parameter block of " + std::to_string(params.size()) +
                                " bytes cannot be expressed as SMB words");
    }
    if (data.size() > 0xFFFF) {
        throw std::length_error("reply data block of " + std::to_string(data.size()) +
                                " bytes exceeds the SMB byte count");
    }

    SmbHeader reply = request;
    reply.status = status;
    reply.flags |= SMB_FLAGS_REPLY;

    WireWriter out;
    out.put(boost::asio::buffer(serialize_header(reply)))
        .u8(static_cast<uint8_t>(params.size() / 2))
        .put(boost::asio::buffer(params))
        .u16le(static_cast<uint16_t>(data.size()))
        .put(boost::asio::buffer(data));
    return out.release();
}

} // namespace protocol
