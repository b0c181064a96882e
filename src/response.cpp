#include "protocol/response.hpp"
#include <stdexcept>
#include <string>

namespace protocol {

const char* to_string(Disposition disposition) {
    switch (disposition) {
        case Disposition::Completed: return "completed";
        case Disposition::HandlerFailed: return "handler_failed";
        case Disposition::HandlerException: return "handler_exception";
        case Disposition::TruncatedInput: return "truncated_input";
        case Disposition::MalformedOffset: return "malformed_offset";
        case Disposition::UnknownSubcommand: return "unknown_subcommand";
        case Disposition::UnhandledSubcommand: return "unhandled_subcommand";
        case Disposition::IncompleteTransaction: return "incomplete_transaction";
        case Disposition::InvalidResult: return "invalid_result";
    }
    return "unknown";
}

ResponseLayout compute_response_layout(std::size_t params_length, std::size_t data_length,
                                       std::size_t setup_length) {
    ResponseLayout layout;
    layout.params_length = NT_TRANSACT_RESPONSE_PARAMS_LENGTH + setup_length;
    layout.data_offset = SMB_MIN_LENGTH + layout.params_length;

    std::size_t off = layout.data_offset;
    layout.pad1 = pad_length(off);
    off += layout.pad1;
    layout.sub_params_offset = off;
    off += params_length;
    layout.pad2 = pad_length(off);
    off += layout.pad2;
    layout.sub_data_offset = off;
    off += data_length;

    layout.data_length = off - layout.data_offset;
    return layout;
}

TransactionResult assemble_response(const SubcommandResult& result) {
    // SetupCount is a single byte and the parameter words must stay whole
    if (result.setup.size() > 0xFF || result.setup.size() % 2 != 0) {
        throw std::length_error("setup of " + std::to_string(result.setup.size()) +
                                " bytes cannot be carried in an NT_TRANSACT reply");
    }
    const ResponseLayout layout =
        compute_response_layout(result.params.size(), result.data.size(), result.setup.size());
    if (layout.data_length > 0xFFFF) {
        throw std::length_error("reply data area of " + std::to_string(layout.data_length) +
                                " bytes exceeds the SMB byte count");
    }

    WireWriter params;
    params.pad(3) // reserved1
        .u32le(static_cast<uint32_t>(result.params.size()))   // TotalParameterCount
        .u32le(static_cast<uint32_t>(result.data.size()))     // TotalDataCount
        .u32le(static_cast<uint32_t>(result.params.size()))   // ParameterCount
        .u32le(static_cast<uint32_t>(layout.sub_params_offset))
        .u32le(0)                                             // ParameterDisplacement
        .u32le(static_cast<uint32_t>(result.data.size()))     // DataCount
        .u32le(static_cast<uint32_t>(layout.sub_data_offset))
        .u32le(0)                                             // DataDisplacement
        .u8(static_cast<uint8_t>(result.setup.size()))        // SetupCount, in bytes on the wire
        .put(boost::asio::buffer(result.setup));

    WireWriter data;
    data.pad(layout.pad1)
        .put(boost::asio::buffer(result.params))
        .pad(layout.pad2)
        .put(boost::asio::buffer(result.data));

    TransactionResult out;
    out.status = STATUS_SUCCESS;
    out.params = params.release();
    out.data = data.release();
    out.disposition = Disposition::Completed;
    return out;
}

} // namespace protocol
