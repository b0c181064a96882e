#pragma once

#include <cstddef>
#include <cstdint>

namespace protocol {

// NT status values carried in the SMB header
constexpr uint32_t STATUS_SUCCESS          = 0x00000000;
constexpr uint32_t STATUS_INVALID_SMB      = 0x00010002;
constexpr uint32_t STATUS_SMB_BAD_COMMAND  = 0x00160002;
constexpr uint32_t STATUS_UNSUCCESSFUL     = 0xC0000001;
constexpr uint32_t STATUS_NOT_IMPLEMENTED  = 0xC0000002;

constexpr uint8_t SMB_COM_NT_TRANSACT = 0xA0;

// 32-byte header + word count + byte count
constexpr std::size_t SMB_HEADER_LENGTH = 32;
constexpr std::size_t SMB_MIN_LENGTH = SMB_HEADER_LENGTH + 1 + 2;

} // namespace protocol
