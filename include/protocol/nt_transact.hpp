#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "protocol/wire.hpp"

namespace protocol {

enum class NtTransactFunction : uint16_t {
    CREATE = 0x0001,
    IOCTL = 0x0002,
    SET_SECURITY_DESC = 0x0003,
    NOTIFY_CHANGE = 0x0004,
    RENAME = 0x0005,
    QUERY_SECURITY_DESC = 0x0006,
    GET_USER_QUOTA = 0x0007,
    SET_USER_QUOTA = 0x0008
};

// maxSetupCount .. function, not counting the setup words
constexpr std::size_t TRANSACTION_HEADER_FIXED_LENGTH = 38;

// SMB_COM_NT_TRANSACT request parameter words
struct TransactionHeader {
    uint8_t max_setup_count = 0;
    uint32_t total_parameter_count = 0;
    uint32_t total_data_count = 0;
    uint32_t max_parameter_count = 0;
    uint32_t max_data_count = 0;
    uint32_t parameter_count = 0;
    uint32_t parameter_offset = 0;
    uint32_t data_count = 0;
    uint32_t data_offset = 0;
    uint8_t setup_count = 0;
    uint16_t function = 0;
    boost::asio::const_buffer setup; // 2 * setup_count bytes, borrowed

    // False while parameter or data bytes are still due in secondary requests.
    bool is_complete() const {
        return parameter_count >= total_parameter_count && data_count >= total_data_count;
    }
};

// Throws TruncatedInput when params is shorter than the header it declares.
TransactionHeader decode_transaction_header(boost::asio::const_buffer params);

// nullptr for codes outside the NT_TRANSACT subcommand table
const char* subcommand_name(uint16_t function);
std::optional<uint16_t> subcommand_code(const std::string& name);

std::string to_upper(std::string text);

} // namespace protocol
