#include "protocol/payload.hpp"

namespace protocol {

PayloadLayout locate_payload(const MessageContext& message, const TransactionHeader& header) {
    PayloadLayout layout;

    layout.params = slice(message.buffer(), header.parameter_offset, header.parameter_count,
                          "NT_Trans_Parameters");
    layout.data = slice(message.buffer(), header.data_offset, header.data_count,
                        "NT_Trans_Data");
    layout.params_offset = header.parameter_offset;
    layout.data_offset = header.data_offset;

    // The first pad aligns on the message, the second on the data block
    const std::size_t base = message.command_data_offset();
    const std::size_t command_data_size = message.command_data().size();

    std::size_t off = pad_length(base);
    std::size_t params_at = off;
    off += header.parameter_count;
    off += pad_length(off);
    std::size_t data_at = off;
    off += header.data_count;

    layout.local_params_offset = base + params_at;
    layout.local_data_offset = base + data_at;
    // an empty block needs no room, even when padded past the end
    const bool params_fit = header.parameter_count == 0 ||
                            params_at + header.parameter_count <= command_data_size;
    const bool data_fit = header.data_count == 0 || off <= command_data_size;
    layout.local_in_bounds = params_fit && data_fit;

    if (layout.local_in_bounds) {
        if (header.parameter_count != 0) {
            layout.local_params = slice(message.command_data(), params_at, header.parameter_count,
                                        "local parameters");
        }
        if (header.data_count != 0) {
            layout.local_data = slice(message.command_data(), data_at, header.data_count,
                                      "local data");
        }
    }

    // empty blocks carry no bytes to disagree about
    bool params_agree = header.parameter_count == 0 ||
                        layout.local_params_offset == header.parameter_offset;
    bool data_agree = header.data_count == 0 ||
                      layout.local_data_offset == header.data_offset;
    layout.consistent = layout.local_in_bounds && params_agree && data_agree;

    return layout;
}

} // namespace protocol
