#pragma once

/** \file record.hpp
 *  \brief Write-buffer operations and their WAL payload encoding.
 *
 * Insert payload: id u64 | dim u32 | dim x f32 | payload_len u32 | payload bytes
 * Delete payload: id u64
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "vexlake/error.hpp"
#include "vexlake/wal/frame.hpp"

namespace vexlake::wal {

enum class OpKind : std::uint8_t { Insert = 1, Delete = 2 };

/** \brief One buffered write, in arrival order. */
struct WalRecord {
  OpKind op{OpKind::Insert};
  std::uint64_t id{0};
  std::vector<float> vector;          /**< empty for deletes */
  std::vector<std::uint8_t> payload;  /**< opaque, may be empty */
};

auto encode_record(const WalRecord& r) -> std::vector<std::uint8_t>;

/** \brief Decode the payload of an Insert or Delete frame. */
auto decode_record(const WalFrame& frame) -> std::expected<WalRecord, core::error>;

} // namespace vexlake::wal
