#include <gtest/gtest.h>
#include <algorithm>
#include "TestDataUtils.hpp"
#include "protocol/payload.hpp"

using namespace protocol;
using smbtx::tests::NtTransactRequestBuilder;
using smbtx::tests::Sequence;

TEST(PayloadLocator, SlicesTheDeclaredAbsoluteBlocks) {
    NtTransactRequestBuilder builder;
    builder.params = Sequence(6, 0x10);
    builder.data = Sequence(9, 0x80);
    const MessageContext message = builder.Context();
    const TransactionHeader header = decode_transaction_header(message.command_params());

    const PayloadLayout layout = locate_payload(message, header);

    EXPECT_EQ(builder.params, to_bytes(layout.params));
    EXPECT_EQ(builder.data, to_bytes(layout.data));
    EXPECT_EQ(builder.SubParamsOffset(), layout.params_offset);
    EXPECT_EQ(builder.SubDataOffset(), layout.data_offset);
    EXPECT_EQ(0u, layout.params_offset % 4);
    EXPECT_EQ(0u, layout.data_offset % 4);
}

TEST(PayloadLocator, LocalDataBlockIsPaddedRelativeToTheCommandData) {
    // Command data at 73: parameters at 76 either way, then the client pads
    // the data block to 84 on the message while the local walk pads 8 -> 8.
    NtTransactRequestBuilder builder;
    builder.params = Sequence(5);
    builder.data = Sequence(3, 0x40);
    ASSERT_EQ(73u, builder.CommandDataOffset());
    ASSERT_EQ(84u, builder.SubDataOffset());
    const MessageContext message = builder.Context();
    const TransactionHeader header = decode_transaction_header(message.command_params());

    const PayloadLayout layout = locate_payload(message, header);

    EXPECT_TRUE(layout.local_in_bounds);
    EXPECT_EQ(76u, layout.local_params_offset);
    EXPECT_EQ(layout.params_offset, layout.local_params_offset);
    EXPECT_EQ(to_bytes(layout.params), to_bytes(layout.local_params));
    EXPECT_EQ(81u, layout.local_data_offset);
    EXPECT_EQ(84u, layout.data_offset);
    EXPECT_FALSE(layout.consistent);

    const Bytes full = to_bytes(message.buffer());
    EXPECT_EQ(Bytes(full.begin() + 81, full.begin() + 84), to_bytes(layout.local_data));
    EXPECT_EQ(builder.data, to_bytes(layout.data));
}

TEST(PayloadLocator, ParameterOnlyRequestIsConsistent) {
    NtTransactRequestBuilder builder;
    builder.setup = {0x01, 0x00};
    builder.params = Sequence(5);
    const MessageContext message = builder.Context();
    const TransactionHeader header = decode_transaction_header(message.command_params());

    const PayloadLayout layout = locate_payload(message, header);

    EXPECT_TRUE(layout.local_in_bounds);
    EXPECT_TRUE(layout.consistent);
    EXPECT_EQ(layout.params_offset, layout.local_params_offset);
    EXPECT_EQ(to_bytes(layout.params), to_bytes(layout.local_params));
}

TEST(PayloadLocator, DisagreementIsReportedButTheAbsoluteSliceWins) {
    NtTransactRequestBuilder builder;
    builder.params = Sequence(8);
    builder.data = Sequence(8, 0x40);
    // point the declared parameters one word later than where the client put them
    builder.parameter_offset = static_cast<uint32_t>(builder.SubParamsOffset() + 2);
    const MessageContext message = builder.Context();
    const TransactionHeader header = decode_transaction_header(message.command_params());

    const PayloadLayout layout = locate_payload(message, header);

    EXPECT_FALSE(layout.consistent);
    const Bytes full = to_bytes(message.buffer());
    const Bytes expected(full.begin() + builder.SubParamsOffset() + 2,
                         full.begin() + builder.SubParamsOffset() + 2 + 8);
    EXPECT_EQ(expected, to_bytes(layout.params));
}

TEST(PayloadLocator, LocalLayoutOverrunningTheDataBlockIsNotFatal) {
    NtTransactRequestBuilder builder;
    builder.params = Sequence(4);
    Bytes raw = builder.Build();
    // Same message with the byte block cut short: header still points inside raw
    const std::size_t data_offset = builder.CommandDataOffset();
    const MessageContext message(raw, 33, builder.ParamsWordsLength(), data_offset, 1);
    const TransactionHeader header = decode_transaction_header(message.command_params());

    const PayloadLayout layout = locate_payload(message, header);

    EXPECT_FALSE(layout.local_in_bounds);
    EXPECT_FALSE(layout.consistent);
    EXPECT_EQ(builder.params, to_bytes(layout.params));
}

TEST(PayloadLocator, ParameterOffsetBeyondTheBufferIsMalformed) {
    // Header decodes from its own buffer; message bodies of every length 0..N
    NtTransactRequestBuilder builder;
    builder.params = Sequence(4);
    builder.parameter_offset = 96;
    const Bytes full = builder.Build();
    const MessageContext source = builder.Context();
    const TransactionHeader header = decode_transaction_header(source.command_params());

    for (std::size_t length = 0; length <= 96; ++length) {
        Bytes body(full.begin(), full.begin() + std::min(length, full.size()));
        body.resize(length, 0);
        const MessageContext message(body, 0, 0, 0, 0);
        EXPECT_THROW(locate_payload(message, header), MalformedOffset) << "buffer length " << length;
    }
}

TEST(PayloadLocator, BlockEndingPastTheBufferIsMalformed) {
    NtTransactRequestBuilder builder;
    builder.data = Sequence(4);
    builder.data_offset = static_cast<uint32_t>(builder.Build().size() - 2);
    const MessageContext message = builder.Context();
    const TransactionHeader header = decode_transaction_header(message.command_params());

    EXPECT_THROW(locate_payload(message, header), MalformedOffset);
}

TEST(PayloadLocator, EmptyBlockAtTheVeryEndIsAccepted) {
    NtTransactRequestBuilder builder;
    builder.params = Sequence(4);
    builder.data_offset = static_cast<uint32_t>(builder.Build().size());
    const MessageContext message = builder.Context();
    const TransactionHeader header = decode_transaction_header(message.command_params());

    const PayloadLayout layout = locate_payload(message, header);
    EXPECT_EQ(0u, layout.data.size());
    EXPECT_TRUE(layout.consistent);
}

TEST(MessageContext, RejectsBlocksOutsideTheBuffer) {
    const Bytes raw(40, 0);
    EXPECT_THROW(MessageContext(raw, 33, 10, 35, 0), MalformedOffset);
    EXPECT_THROW(MessageContext(raw, 33, 2, 41, 0), MalformedOffset);
    EXPECT_NO_THROW(MessageContext(raw, 33, 2, 40, 0));
}
