#pragma once

#include <cstddef>
#include <cstdint>

namespace hmmdc {

// Default daemon endpoint (client port of the reference daemon)
inline constexpr const char* DEFAULT_HOST = "127.0.0.1";
inline constexpr uint16_t DEFAULT_PORT = 51371;

// Wire protocol version described in protocol/wire_schema.hpp
inline constexpr uint32_t PROTOCOL_VERSION = 1;

// Two-byte sentinel closing every request payload
inline constexpr char REQUEST_TERMINATOR[] = "//";
inline constexpr size_t REQUEST_TERMINATOR_SIZE = 2;

// Sanity limits on server-declared sizes, checked before allocation
inline constexpr uint64_t MAX_PAYLOAD_SIZE = uint64_t(1) << 30;      // 1 GiB
inline constexpr uint64_t MAX_ERROR_MESSAGE_SIZE = uint64_t(1) << 20; // 1 MiB

// Default database index on the daemon
inline constexpr uint32_t DEFAULT_DB_INDEX = 1;

// Residues per line when writing FASTA query bodies
inline constexpr size_t FASTA_LINE_WIDTH = 60;

} // namespace hmmdc
