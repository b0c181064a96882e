#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "dispatcher.hpp"
#include "protocol/wire.hpp"
#include "registry.hpp"
#include "settings.hpp"

namespace networking {

// Handle for the client connection a transaction arrived on
class Connection {
public:
    virtual ~Connection() = default;
    virtual uint64_t id() const = 0;
    virtual std::string remote_address() const = 0;
};

// Handle for the server instance servicing the transaction
class Server {
public:
    virtual ~Server() = default;
    virtual std::string name() const = 0;
};

// Minimal SMB1 host: NetBIOS-framed TCP, one thread per connection.
// SMB_COM_NT_TRANSACT goes through the transaction dispatcher; every other
// command is answered with STATUS_SMB_BAD_COMMAND.
class SmbServer : public Server {
public:
    SmbServer(const settings::Settings& settings, const nttrans::SubcommandRegistry& registry);
    ~SmbServer() override;

    void start();
    void stop();
    bool is_running() const { return running_; }
    unsigned short port() const;
    std::string name() const override;

    // Reply for one raw SMB message, or std::nullopt if it cannot be answered
    // and the connection should be dropped.
    std::optional<protocol::Bytes> handle_message(protocol::Bytes raw, Connection& connection);

private:
    class SmbConnection;

    struct Worker {
        std::shared_ptr<SmbConnection> connection;
        std::thread thread;
    };

    void accept_loop();
    void serve(std::shared_ptr<SmbConnection> connection);
    void reap_finished();

    settings::Settings settings_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::thread_pool completions_;
    nttrans::TransactionDispatcher dispatcher_;

    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::mutex mutex_;
    std::vector<Worker> workers_;
    std::atomic<uint64_t> next_connection_id_{1};
};

} // namespace networking
