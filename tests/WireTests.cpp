#include <gtest/gtest.h>
#include "protocol/wire.hpp"

using namespace protocol;

TEST(PadLength, AlignsEveryOffsetToFourBytes) {
    for (std::size_t n = 0; n < 1024; ++n) {
        std::size_t pad = pad_length(n, 4);
        EXPECT_LT(pad, 4u) << "offset " << n;
        EXPECT_EQ(0u, (n + pad) % 4) << "offset " << n;
    }
}

TEST(PadLength, KnownValues) {
    EXPECT_EQ(0u, pad_length(0));
    EXPECT_EQ(3u, pad_length(1));
    EXPECT_EQ(2u, pad_length(2));
    EXPECT_EQ(1u, pad_length(71));
    EXPECT_EQ(0u, pad_length(72));
}

TEST(WireReader, ReadsLittleEndianFields) {
    const uint8_t bytes[] = {0xAB, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0xEE};
    WireReader in(boost::asio::buffer(bytes));

    EXPECT_EQ(0xABu, in.read_u8());
    EXPECT_EQ(0x1234u, in.read_u16le());
    EXPECT_EQ(0x12345678u, in.read_u32le());
    EXPECT_EQ(7u, in.position());
    EXPECT_EQ(1u, in.remaining());
}

TEST(WireReader, ThrowsTruncatedInputInsteadOfOverreading) {
    const uint8_t bytes[] = {0x01, 0x02, 0x03};
    WireReader in(boost::asio::buffer(bytes));

    EXPECT_THROW(in.read_u32le(), TruncatedInput);
    // a failed read leaves the cursor where it was
    EXPECT_EQ(0u, in.position());
    EXPECT_EQ(0x0201u, in.read_u16le());
    EXPECT_THROW(in.read_u16le(), TruncatedInput);
    EXPECT_THROW(in.skip(2), TruncatedInput);
    EXPECT_THROW(in.read_bytes(2), TruncatedInput);
    EXPECT_EQ(0x03u, in.read_u8());
    EXPECT_THROW(in.read_u8(), TruncatedInput);
}

TEST(WireReader, EmptyBuffer) {
    WireReader in{boost::asio::const_buffer()};
    EXPECT_EQ(0u, in.remaining());
    EXPECT_EQ(0u, in.read_bytes(0).size());
    EXPECT_THROW(in.read_u8(), TruncatedInput);
}

TEST(WireWriter, AppendsLittleEndianAndPadding) {
    const uint8_t tail[] = {0xCA, 0xFE};
    WireWriter out;
    out.u8(0x01).u16le(0x0302).u32le(0x07060504).pad(3).put(boost::asio::buffer(tail));

    const Bytes expected = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x00, 0x00, 0x00, 0xCA, 0xFE};
    EXPECT_EQ(expected, out.bytes());
}

TEST(WireHelpers, HexRendering) {
    const Bytes bytes = {0x00, 0x0F, 0xA0, 0xFF};
    EXPECT_EQ("000fa0ff", to_hex(boost::asio::buffer(bytes)));
    EXPECT_EQ("", to_hex(boost::asio::const_buffer()));
    EXPECT_EQ(bytes, to_bytes(boost::asio::buffer(bytes)));
}
