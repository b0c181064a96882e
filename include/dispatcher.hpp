#pragma once

#include <functional>
#include <future>
#include <boost/asio/any_io_executor.hpp>
#include "protocol/message_context.hpp"
#include "protocol/response.hpp"
#include "registry.hpp"

namespace nttrans {

using TransactionCallback = std::function<void(protocol::TransactionResult)>;

struct DispatchOptions {
    bool trace = false; // per-transaction counts and setup bytes on std::cout
};

// SMB_COM_NT_TRANSACT: decodes the transaction header, routes the function
// code to a registered subcommand handler and frames the handler's result
// as the reply.
//
// The callback runs exactly once per dispatch, always posted to the
// executor, never from inside dispatch() itself.
class TransactionDispatcher {
public:
    TransactionDispatcher(boost::asio::any_io_executor executor,
                          const SubcommandRegistry& registry,
                          DispatchOptions options = {});

    void dispatch(protocol::MessageContext message,
                  networking::Connection& connection,
                  networking::Server& server,
                  TransactionCallback callback);

    std::future<protocol::TransactionResult> dispatch_future(protocol::MessageContext message,
                                                             networking::Connection& connection,
                                                             networking::Server& server);

private:
    boost::asio::any_io_executor executor_;
    const SubcommandRegistry& registry_;
    DispatchOptions options_;
};

} // namespace nttrans
