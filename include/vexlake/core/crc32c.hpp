#pragma once

/** \file crc32c.hpp
 *  \brief CRC32C (Castagnoli, reflected polynomial 0x82F63B78) used by WAL frames and file trailers.
 */

#include <cstdint>
#include <span>

namespace vexlake::core {

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

/** \brief Continue a running CRC (start with 0). */
auto crc32c_extend(std::uint32_t crc, std::span<const std::uint8_t> bytes) -> std::uint32_t;

} // namespace vexlake::core
