// SmbServerLoopbackTests.cpp - SmbServer over a real loopback socket

#include <gtest/gtest.h>
#include <memory>
#include <boost/asio.hpp>
#include "TestDataUtils.hpp"
#include "mocks/FakeSession.hpp"
#include "networking.hpp"
#include "transfer.hpp"

using namespace protocol;
using boost::asio::ip::tcp;
using smbtx::tests::FakeConnection;
using smbtx::tests::NtTransactRequestBuilder;
using smbtx::tests::Sequence;

namespace {

Bytes NegotiateRequest() {
    SmbHeader header;
    header.command = 0x72; // SMB_COM_NEGOTIATE
    header.mid = 3;
    WireWriter out;
    out.put(boost::asio::buffer(serialize_header(header))).u8(0).u16le(0);
    return out.release();
}

} // namespace

class SmbServerLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.listen_address = "127.0.0.1";
        settings_.port = 0;
        settings_.worker_threads = 1;

        nttrans::StaticHandlerSource source;
        source.add("create", [](const nttrans::SubcommandRequest& request, nttrans::SubcommandCompletion done) {
            SubcommandResult result;
            result.status = STATUS_SUCCESS;
            result.params = Bytes(request.params.size(), 0x11);
            done(std::move(result));
        });
        // one byte more than an SMB1 byte count can describe
        source.add("ioctl", [](const nttrans::SubcommandRequest&, nttrans::SubcommandCompletion done) {
            SubcommandResult result;
            result.status = STATUS_SUCCESS;
            result.data = Bytes(0x10000, 0x22);
            done(std::move(result));
        });
        registry_ = std::make_unique<nttrans::SubcommandRegistry>(source);
        server_ = std::make_unique<networking::SmbServer>(settings_, *registry_);
    }

    void TearDown() override {
        server_->stop();
    }

    Bytes RoundTrip(tcp::socket& socket, const Bytes& request) {
        EXPECT_TRUE(transfer::MessageSender::send_frame(socket, request));
        std::optional<Bytes> reply = transfer::MessageReceiver::receive_frame(socket);
        EXPECT_TRUE(reply.has_value());
        return reply.value_or(Bytes{});
    }

    settings::Settings settings_;
    std::unique_ptr<nttrans::SubcommandRegistry> registry_;
    std::unique_ptr<networking::SmbServer> server_;
};

TEST_F(SmbServerLoopbackTest, AnswersTransactionsAndRejectsOtherCommands) {
    server_->start();
    ASSERT_TRUE(server_->is_running());
    ASSERT_NE(0, server_->port());

    boost::asio::io_context io;
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), server_->port()));

    NtTransactRequestBuilder builder;
    builder.params = Sequence(4);
    builder.mid = 21;
    const Bytes reply_bytes = RoundTrip(socket, builder.Build());
    ASSERT_GT(reply_bytes.size(), SMB_MIN_LENGTH);

    const SmbMessage reply = decode_message(reply_bytes);
    EXPECT_EQ(SMB_COM_NT_TRANSACT, reply.header.command);
    EXPECT_EQ(STATUS_SUCCESS, reply.header.status);
    EXPECT_EQ(SMB_FLAGS_REPLY, reply.header.flags & SMB_FLAGS_REPLY);
    EXPECT_EQ(21, reply.header.mid);
    EXPECT_EQ(18, reply_bytes[SMB_HEADER_LENGTH]);

    const Bytes negotiate_bytes = RoundTrip(socket, NegotiateRequest());
    const SmbMessage negotiate = decode_message(negotiate_bytes);
    EXPECT_EQ(STATUS_SMB_BAD_COMMAND, negotiate.header.status);
    EXPECT_EQ(3, negotiate.header.mid);
    EXPECT_EQ(0u, negotiate.context.command_params().size());

    boost::system::error_code ec;
    socket.close(ec);
    server_->stop();
    EXPECT_FALSE(server_->is_running());
}

TEST_F(SmbServerLoopbackTest, OversizedHandlerResultIsAnsweredAndTheSessionSurvives) {
    server_->start();
    ASSERT_TRUE(server_->is_running());

    boost::asio::io_context io;
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), server_->port()));

    NtTransactRequestBuilder ioctl;
    ioctl.function = static_cast<uint16_t>(NtTransactFunction::IOCTL);
    ioctl.params = Sequence(4);
    ioctl.mid = 30;
    const Bytes failed_bytes = RoundTrip(socket, ioctl.Build());
    ASSERT_GE(failed_bytes.size(), SMB_MIN_LENGTH);
    const SmbMessage failed = decode_message(failed_bytes);
    EXPECT_EQ(STATUS_UNSUCCESSFUL, failed.header.status);
    EXPECT_EQ(30, failed.header.mid);

    NtTransactRequestBuilder create;
    create.params = Sequence(4);
    create.mid = 31;
    const Bytes ok_bytes = RoundTrip(socket, create.Build());
    ASSERT_GE(ok_bytes.size(), SMB_MIN_LENGTH);
    const SmbMessage ok = decode_message(ok_bytes);
    EXPECT_EQ(STATUS_SUCCESS, ok.header.status);
    EXPECT_EQ(31, ok.header.mid);

    boost::system::error_code ec;
    socket.close(ec);
}

TEST_F(SmbServerLoopbackTest, UnparseableMessageDropsTheConnection) {
    FakeConnection connection;
    EXPECT_FALSE(server_->handle_message(Bytes{0xFF, 'S', 'M'}, connection).has_value());
    EXPECT_FALSE(server_->handle_message(Bytes(40, 0x00), connection).has_value());
}

TEST_F(SmbServerLoopbackTest, UnknownSubcommandStillGetsAReply) {
    NtTransactRequestBuilder builder;
    builder.function = 0x00EE;
    FakeConnection connection;

    std::optional<Bytes> reply = server_->handle_message(builder.Build(), connection);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(STATUS_SMB_BAD_COMMAND, decode_message(*reply).header.status);
}
