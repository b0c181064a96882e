#pragma once

#include <cstddef>
#include "protocol/message_context.hpp"
#include "protocol/nt_transact.hpp"

namespace protocol {

// Where the subcommand's own parameter and data blocks sit.
//
// params/data are sliced from the full message at the header's declared
// absolute offsets; these are what a subcommand handler receives.
// local_params/local_data are found by walking the command data block: the
// parameters start 4-byte aligned within the message, the data block is
// re-padded relative to the start of the command data. A client that aligns
// both blocks on the message lands its data elsewhere; consistent says so.
struct PayloadLayout {
    boost::asio::const_buffer params;
    boost::asio::const_buffer data;
    uint32_t params_offset = 0;
    uint32_t data_offset = 0;

    boost::asio::const_buffer local_params;
    boost::asio::const_buffer local_data;
    std::size_t local_params_offset = 0; // absolute, i.e. already based on the data block offset
    std::size_t local_data_offset = 0;
    bool local_in_bounds = false;

    bool consistent = false;
};

// Throws MalformedOffset if an absolute block falls outside the message.
// A local layout that overruns the command data is reported, not thrown.
PayloadLayout locate_payload(const MessageContext& message, const TransactionHeader& header);

} // namespace protocol
