#include "networking.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include "protocol/smb_message.hpp"
#include "protocol/status.hpp"
#include "transfer.hpp"

using boost::asio::ip::tcp;

namespace networking {

class SmbServer::SmbConnection : public Connection {
public:
    SmbConnection(uint64_t id, tcp::socket socket)
        : id_(id), socket_(std::move(socket)) {
        boost::system::error_code ec;
        auto endpoint = socket_.remote_endpoint(ec);
        remote_ = ec ? "unknown" : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    uint64_t id() const override { return id_; }
    std::string remote_address() const override { return remote_; }

    tcp::socket& socket() { return socket_; }

    // Wakes a thread blocked reading this socket
    void shutdown() {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
    }

    void close() {
        boost::system::error_code ec;
        socket_.close(ec);
    }

    std::atomic<bool> finished{false};

private:
    uint64_t id_;
    tcp::socket socket_;
    std::string remote_;
};

SmbServer::SmbServer(const settings::Settings& settings, const nttrans::SubcommandRegistry& registry)
    : settings_(settings),
      acceptor_(io_context_),
      completions_(settings.worker_threads),
      dispatcher_(completions_.get_executor(), registry, nttrans::DispatchOptions{settings.trace}) {}

SmbServer::~SmbServer() {
    stop();
    completions_.join();
}

void SmbServer::start() {
    if (running_) return;

    tcp::endpoint endpoint(boost::asio::ip::make_address(settings_.listen_address), settings_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    // Non-blocking so the accept loop can check running_ periodically
    acceptor_.non_blocking(true);

    std::cout << "Listening on " << settings_.listen_address << ":" << port() << std::endl;

    running_ = true;
    accept_thread_ = std::thread([this]() { accept_loop(); });
}

void SmbServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    boost::system::error_code ec;
    acceptor_.close(ec);

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& worker : workers_) {
            worker.connection->shutdown();
        }
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

unsigned short SmbServer::port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? settings_.port : endpoint.port();
}

std::string SmbServer::name() const {
    return "smbtx@" + settings_.listen_address + ":" + std::to_string(port());
}

void SmbServer::accept_loop() {
    while (running_) {
        tcp::socket socket(io_context_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);

        if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (ec) {
            std::cerr << "SmbServer: accept failed: " << ec.message() << "\n";
            continue;
        }

        // accepted sockets inherit non-blocking mode on some platforms
        socket.non_blocking(false, ec);

        auto connection = std::make_shared<SmbConnection>(next_connection_id_++, std::move(socket));
        std::cout << "Client connected from " << connection->remote_address()
                  << " (connection " << connection->id() << ")\n";

        reap_finished();
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.push_back(Worker{connection, std::thread([this, connection]() { serve(connection); })});
    }
}

void SmbServer::reap_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->connection->finished) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void SmbServer::serve(std::shared_ptr<SmbConnection> connection) {
    while (running_) {
        std::optional<protocol::Bytes> frame = transfer::MessageReceiver::receive_frame(connection->socket());
        if (!frame) {
            break;
        }
        std::optional<protocol::Bytes> reply = handle_message(std::move(*frame), *connection);
        if (!reply || !transfer::MessageSender::send_frame(connection->socket(), *reply)) {
            break;
        }
    }
    std::cout << "Client disconnected (connection " << connection->id() << ").\n";
    connection->close();
    connection->finished = true;
}

std::optional<protocol::Bytes> SmbServer::handle_message(protocol::Bytes raw, Connection& connection) {
    try {
        protocol::SmbMessage message = protocol::decode_message(std::move(raw));
        const protocol::SmbHeader header = message.header;

        if (header.command != protocol::SMB_COM_NT_TRANSACT) {
            std::cerr << "SmbServer: unsupported command 0x" << std::hex << std::setw(2)
                      << std::setfill('0') << static_cast<int>(header.command) << std::dec << "\n";
            return protocol::encode_response(header, protocol::STATUS_SMB_BAD_COMMAND, {}, {});
        }

        protocol::TransactionResult result =
            dispatcher_.dispatch_future(std::move(message.context), connection, *this).get();
        try {
            return protocol::encode_response(header, result.status, result.params, result.data);
        } catch (const std::length_error& e) {
            // bare status reply, the session stays up
            std::cerr << "SmbServer: reply does not fit an SMB message: " << e.what() << "\n";
            return protocol::encode_response(header, protocol::STATUS_UNSUCCESSFUL, {}, {});
        }
    } catch (std::exception& e) {
        std::cerr << "SmbServer Exception: " << e.what() << "\n";
        return std::nullopt;
    }
}

} // namespace networking
