#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/any_io_executor.hpp>
#include "protocol/message_context.hpp"
#include "protocol/response.hpp"

namespace networking {
class Connection;
class Server;
} // namespace networking

namespace nttrans {

// Single-fire continuation handed to a subcommand handler. Copies share one
// state: the first call delivers, any later call is logged and dropped.
class SubcommandCompletion {
public:
    using Function = std::function<void(protocol::SubcommandResult)>;

    SubcommandCompletion(std::string subcommand, Function fn);

    void operator()(protocol::SubcommandResult result) const;
    bool fired() const { return state_->fired.load(); }

private:
    struct State {
        std::atomic<bool> fired{false};
        std::string subcommand;
        Function fn;
    };
    std::shared_ptr<State> state_;
};

// Everything a handler gets for one invocation. The buffers borrow from the
// message and are only guaranteed valid until the completion is invoked.
struct SubcommandRequest {
    const protocol::MessageContext& message;
    uint16_t function;
    boost::asio::const_buffer params;
    boost::asio::const_buffer data;
    uint32_t params_offset;
    uint32_t data_offset;
    networking::Connection& connection;
    networking::Server& server;
    boost::asio::any_io_executor executor;
};

// Must invoke the completion exactly once, inline or later from any thread,
// and report failures as a status rather than by throwing.
using SubcommandHandler = std::function<void(const SubcommandRequest&, SubcommandCompletion)>;

} // namespace nttrans
