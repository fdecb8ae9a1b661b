#pragma once

/** \file frame.hpp
 *  \brief WAL frame encode/decode and CRC32C verification (pure, in-memory).
 *
 * Layout (little-endian): magic u32 | len u32 | type u16 | reserved u16 | lsn u64 | payload | crc32c u32
 * `len` covers the whole frame; the CRC covers everything before it.
 * Thread-safety: functions are stateless and thread-safe.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "vexlake/error.hpp"

namespace vexlake::wal {

constexpr std::uint32_t WAL_MAGIC = 0x564C5741u; // "AWLV" on disk
constexpr std::size_t WAL_HEADER_SIZE = 4 + 4 + 2 + 2 + 8; // 20 bytes
constexpr std::size_t WAL_MAX_FRAME = 32u * 1024u * 1024u;

/** \brief Frame types. */
enum class FrameType : std::uint16_t { Insert = 1, Delete = 2 };

struct WalFrame {
  std::uint32_t magic;
  std::uint32_t len;
  std::uint16_t type;
  std::uint16_t reserved;
  std::uint64_t lsn;
  std::span<const std::uint8_t> payload; // does not own memory
  std::uint32_t crc32c;
};

// Verify CRC32C of a full frame buffer (includes CRC at the end)
auto verify_crc32c(std::span<const std::uint8_t> full_frame) -> bool;

// Encode a frame into a contiguous byte vector; rejects payloads that exceed WAL_MAX_FRAME
auto encode_frame(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

// Decode a frame from a contiguous buffer (payload is a view into `bytes`)
auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<WalFrame, core::error>;

} // namespace vexlake::wal
