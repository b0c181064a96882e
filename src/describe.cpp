#include "protocol/describe.hpp"

namespace protocol {

void to_json(nlohmann::json& j, const SmbHeader& header) {
    j = nlohmann::json{
        {"command", header.command},
        {"status", header.status},
        {"flags", header.flags},
        {"flags2", header.flags2},
        {"tid", header.tid},
        {"pid", (static_cast<uint32_t>(header.pid_high) << 16) | header.pid_low},
        {"uid", header.uid},
        {"mid", header.mid}
    };
}

void to_json(nlohmann::json& j, const TransactionHeader& header) {
    const char* name = subcommand_name(header.function);
    j = nlohmann::json{
        {"max_setup_count", header.max_setup_count},
        {"total_parameter_count", header.total_parameter_count},
        {"total_data_count", header.total_data_count},
        {"max_parameter_count", header.max_parameter_count},
        {"max_data_count", header.max_data_count},
        {"parameter_count", header.parameter_count},
        {"parameter_offset", header.parameter_offset},
        {"data_count", header.data_count},
        {"data_offset", header.data_offset},
        {"setup_count", header.setup_count},
        {"function", header.function},
        {"subcommand", name ? nlohmann::json(name) : nlohmann::json(nullptr)},
        {"setup", to_hex(header.setup)},
        {"complete", header.is_complete()}
    };
}

void to_json(nlohmann::json& j, const PayloadLayout& layout) {
    j = nlohmann::json{
        {"params_offset", layout.params_offset},
        {"params", to_hex(layout.params)},
        {"data_offset", layout.data_offset},
        {"data", to_hex(layout.data)},
        {"local_params_offset", layout.local_params_offset},
        {"local_data_offset", layout.local_data_offset},
        {"local_in_bounds", layout.local_in_bounds},
        {"consistent", layout.consistent}
    };
}

} // namespace protocol
