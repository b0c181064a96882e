#pragma once

#include <cstddef>
#include <cstdint>
#include "protocol/status.hpp"
#include "protocol/wire.hpp"

namespace protocol {

// NT_TRANSACT reply parameter words: 18 words before the setup bytes
constexpr std::size_t NT_TRANSACT_RESPONSE_PARAMS_LENGTH = 36;

// What a subcommand handler hands back
struct SubcommandResult {
    uint32_t status = STATUS_SUCCESS;
    Bytes params;
    Bytes data;
    Bytes setup;
};

// Which path a transaction took through the dispatcher
enum class Disposition {
    Completed,
    HandlerFailed,
    HandlerException,
    TruncatedInput,
    MalformedOffset,
    UnknownSubcommand,
    UnhandledSubcommand,
    IncompleteTransaction,
    InvalidResult
};

const char* to_string(Disposition disposition);

// What goes back to the connection layer: status plus the final
// wire-encoded parameter and data blocks of the reply.
struct TransactionResult {
    uint32_t status = STATUS_SUCCESS;
    Bytes params;
    Bytes data;
    Disposition disposition = Disposition::Completed;
    bool layout_consistent = false;
};

// Absolute positions of the reply blocks, all relative to the SMB header start
struct ResponseLayout {
    std::size_t params_length = 0;
    std::size_t data_offset = 0;
    std::size_t pad1 = 0;
    std::size_t sub_params_offset = 0;
    std::size_t pad2 = 0;
    std::size_t sub_data_offset = 0;
    std::size_t data_length = 0;
};

ResponseLayout compute_response_layout(std::size_t params_length, std::size_t data_length,
                                       std::size_t setup_length);

// Throws std::length_error if the result cannot be framed as one reply:
// setup longer than 255 bytes or not whole words, or a data area past the
// 16-bit SMB byte count.
TransactionResult assemble_response(const SubcommandResult& result);

} // namespace protocol
