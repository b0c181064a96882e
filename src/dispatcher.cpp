#include "dispatcher.hpp"
#include <atomic>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <boost/asio/post.hpp>
#include "protocol/nt_transact.hpp"
#include "protocol/payload.hpp"
#include "protocol/status.hpp"

namespace nttrans {

namespace {

std::string hex_code(uint16_t code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << code;
    return oss.str();
}

// Rejected transactions carry the request's own parameter and data blocks back.
protocol::TransactionResult echo_request(const protocol::MessageContext& message, uint32_t status,
                                         protocol::Disposition disposition) {
    protocol::TransactionResult result;
    result.status = status;
    result.params = protocol::to_bytes(message.command_params());
    result.data = protocol::to_bytes(message.command_data());
    result.disposition = disposition;
    return result;
}

// One in-flight transaction. Keeps the message alive while a handler may
// still be reading from it and guarantees the callback is settled once.
struct PendingTransaction {
    PendingTransaction(boost::asio::any_io_executor executor,
                       std::shared_ptr<const protocol::MessageContext> message,
                       TransactionCallback callback)
        : executor(std::move(executor)), message(std::move(message)), callback(std::move(callback)) {}

    bool settle(protocol::TransactionResult result) {
        if (settled.exchange(true)) {
            return false;
        }
        boost::asio::post(executor, [cb = std::move(callback), result = std::move(result)]() mutable {
            cb(std::move(result));
        });
        return true;
    }

    boost::asio::any_io_executor executor;
    std::shared_ptr<const protocol::MessageContext> message;
    TransactionCallback callback;
    std::atomic<bool> settled{false};
    bool layout_consistent = false;
};

} // namespace

TransactionDispatcher::TransactionDispatcher(boost::asio::any_io_executor executor,
                                             const SubcommandRegistry& registry,
                                             DispatchOptions options)
    : executor_(std::move(executor)), registry_(registry), options_(options) {}

void TransactionDispatcher::dispatch(protocol::MessageContext message,
                                     networking::Connection& connection,
                                     networking::Server& server,
                                     TransactionCallback callback) {
    auto pending = std::make_shared<PendingTransaction>(
        executor_, std::make_shared<const protocol::MessageContext>(std::move(message)),
        std::move(callback));
    const protocol::MessageContext& msg = *pending->message;

    protocol::TransactionHeader header;
    try {
        header = protocol::decode_transaction_header(msg.command_params());
    } catch (const protocol::TruncatedInput& e) {
        std::cerr << "NtTransact: malformed transaction parameters: " << e.what() << "\n";
        pending->settle(echo_request(msg, protocol::STATUS_INVALID_SMB,
                                     protocol::Disposition::TruncatedInput));
        return;
    }

    const char* name = protocol::subcommand_name(header.function);
    if (!name) {
        std::cerr << "NtTransact: encountered invalid subcommand " << hex_code(header.function) << "\n";
        pending->settle(echo_request(msg, protocol::STATUS_SMB_BAD_COMMAND,
                                     protocol::Disposition::UnknownSubcommand));
        return;
    }
    const std::string subcommand = name;

    if (options_.trace) {
        std::cout << "NtTransact: [" << protocol::to_upper(subcommand) << "]"
                  << " totalParameterCount: " << header.total_parameter_count
                  << ", parameterCount: " << header.parameter_count
                  << ", totalDataCount: " << header.total_data_count
                  << ", dataCount: " << header.data_count
                  << ", setup: 0x" << protocol::to_hex(header.setup) << "\n";
    }

    if (!header.is_complete()) {
        // TODO: reassemble from NT_TRANSACT_SECONDARY requests instead of rejecting
        std::cerr << "NtTransact: chunked nt_transact messages are not yet supported.\n";
        pending->settle(echo_request(msg, protocol::STATUS_NOT_IMPLEMENTED,
                                     protocol::Disposition::IncompleteTransaction));
        return;
    }

    const SubcommandHandler* handler = registry_.find(subcommand);
    if (!handler) {
        std::cerr << "NtTransact: encountered unsupported subcommand " << hex_code(header.function)
                  << " '" << protocol::to_upper(subcommand) << "'\n";
        pending->settle(echo_request(msg, protocol::STATUS_NOT_IMPLEMENTED,
                                     protocol::Disposition::UnhandledSubcommand));
        return;
    }

    protocol::PayloadLayout layout;
    try {
        layout = protocol::locate_payload(msg, header);
    } catch (const protocol::MalformedOffset& e) {
        std::cerr << "NtTransact: [" << protocol::to_upper(subcommand) << "] " << e.what() << "\n";
        pending->settle(echo_request(msg, protocol::STATUS_INVALID_SMB,
                                     protocol::Disposition::MalformedOffset));
        return;
    }
    pending->layout_consistent = layout.consistent;
    if (!layout.consistent && options_.trace) {
        std::cerr << "NtTransact: [" << protocol::to_upper(subcommand) << "] declared offsets "
                  << layout.params_offset << "/" << layout.data_offset
                  << " disagree with padded layout "
                  << layout.local_params_offset << "/" << layout.local_data_offset << "\n";
    }

    SubcommandCompletion completion(subcommand, [pending, subcommand](protocol::SubcommandResult result) {
        protocol::TransactionResult out;
        if (result.status != protocol::STATUS_SUCCESS) {
            out = echo_request(*pending->message, result.status,
                               protocol::Disposition::HandlerFailed);
        } else {
            try {
                out = protocol::assemble_response(result);
            } catch (const std::length_error& e) {
                std::cerr << "NtTransact: [" << protocol::to_upper(subcommand)
                          << "] unusable handler result: " << e.what() << "\n";
                out = echo_request(*pending->message, protocol::STATUS_UNSUCCESSFUL,
                                   protocol::Disposition::InvalidResult);
            }
        }
        out.layout_consistent = pending->layout_consistent;
        pending->settle(std::move(out));
    });

    SubcommandRequest request{msg,
                              header.function,
                              layout.params,
                              layout.data,
                              layout.params_offset,
                              layout.data_offset,
                              connection,
                              server,
                              executor_};
    try {
        (*handler)(request, completion);
    } catch (const std::exception& e) {
        std::cerr << "NtTransact: [" << protocol::to_upper(subcommand)
                  << "] handler threw: " << e.what() << "\n";
        protocol::TransactionResult failed =
            echo_request(msg, protocol::STATUS_UNSUCCESSFUL, protocol::Disposition::HandlerException);
        failed.layout_consistent = layout.consistent;
        if (!pending->settle(std::move(failed))) {
            std::cerr << "NtTransact: [" << protocol::to_upper(subcommand)
                      << "] handler had already completed, exception ignored\n";
        }
    }
}

std::future<protocol::TransactionResult> TransactionDispatcher::dispatch_future(
    protocol::MessageContext message,
    networking::Connection& connection,
    networking::Server& server) {
    auto promise = std::make_shared<std::promise<protocol::TransactionResult>>();
    std::future<protocol::TransactionResult> future = promise->get_future();
    dispatch(std::move(message), connection, server,
             [promise](protocol::TransactionResult result) { promise->set_value(std::move(result)); });
    return future;
}

} // namespace nttrans
