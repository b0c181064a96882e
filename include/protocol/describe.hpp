#pragma once

#include <nlohmann/json.hpp>
#include "protocol/nt_transact.hpp"
#include "protocol/payload.hpp"
#include "protocol/response.hpp"
#include "protocol/smb_message.hpp"

namespace protocol {

// JSON renderings used by diagnostics and the inspect command

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ResponseLayout, params_length, data_offset, pad1,
                                   sub_params_offset, pad2, sub_data_offset, data_length)

void to_json(nlohmann::json& j, const SmbHeader& header);
void to_json(nlohmann::json& j, const TransactionHeader& header);
void to_json(nlohmann::json& j, const PayloadLayout& layout);

} // namespace protocol
