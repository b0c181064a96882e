#include "protocol/nt_transact.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace protocol {

namespace {

struct SubcommandEntry {
    NtTransactFunction function;
    const char* name;
};

const SubcommandEntry SUBCOMMANDS[] = {
    {NtTransactFunction::CREATE, "create"},
    {NtTransactFunction::IOCTL, "ioctl"},
    {NtTransactFunction::SET_SECURITY_DESC, "set_security_desc"},
    {NtTransactFunction::NOTIFY_CHANGE, "notify_change"},
    {NtTransactFunction::RENAME, "rename"},
    {NtTransactFunction::QUERY_SECURITY_DESC, "query_security_desc"},
    {NtTransactFunction::GET_USER_QUOTA, "get_user_quota"},
    {NtTransactFunction::SET_USER_QUOTA, "set_user_quota"},
};

} // namespace

TransactionHeader decode_transaction_header(boost::asio::const_buffer params) {
    WireReader in(params);
    TransactionHeader header;

    header.max_setup_count = in.read_u8();
    in.skip(2); // reserved1
    header.total_parameter_count = in.read_u32le();
    header.total_data_count = in.read_u32le();
    header.max_parameter_count = in.read_u32le();
    header.max_data_count = in.read_u32le();
    header.parameter_count = in.read_u32le();
    header.parameter_offset = in.read_u32le();
    header.data_count = in.read_u32le();
    header.data_offset = in.read_u32le();
    header.setup_count = in.read_u8();
    header.function = in.read_u16le();
    header.setup = in.read_bytes(2 * static_cast<std::size_t>(header.setup_count));

    return header;
}

const char* subcommand_name(uint16_t function) {
    for (const auto& entry : SUBCOMMANDS) {
        if (static_cast<uint16_t>(entry.function) == function) {
            return entry.name;
        }
    }
    return nullptr;
}

std::optional<uint16_t> subcommand_code(const std::string& name) {
    auto it = std::find_if(std::begin(SUBCOMMANDS), std::end(SUBCOMMANDS),
                           [&name](const SubcommandEntry& entry) { return name == entry.name; });
    if (it == std::end(SUBCOMMANDS)) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(it->function);
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace protocol
