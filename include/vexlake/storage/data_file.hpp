#pragma once

/** \file data_file.hpp
 *  \brief Immutable data file codec (vectors + payloads) with range-addressable rows.
 *
 * Layout (little-endian):
 *   [0, 32)          header: magic "VXDF0001", u32 format version, u32 dim, u64 rows, u8 metric, pad
 *   vector block     rows x (u64 id, dim x f32), sorted by ascending id
 *   payload block    concatenated payload bytes
 *   footer           u64 rows, u32 dim, u32 vector block crc32c,
 *                    rows x (u64 payload offset, u32 payload length), u64 min_id, u64 max_id
 *   trailer (32 B)   u64 footer offset, u64 footer length, u32 footer crc32c,
 *                    u32 crc32c of everything before the footer, u32 magic, u32 reserved
 *
 * A reader that knows the footer position (echoed in the version descriptor) loads
 * footer+trailer and the vector block with two range reads, then fetches single
 * payloads by offset.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "vexlake/error.hpp"
#include "vexlake/kernels/distance.hpp"
#include "vexlake/storage/storage_client.hpp"

namespace vexlake::storage {

inline constexpr std::uint64_t kDataFileHeaderSize = 32;
inline constexpr std::uint64_t kDataFileTrailerSize = 32;
inline constexpr std::uint32_t kDataFileFormatVersion = 1;

/** \brief One row handed to the encoder. Spans must outlive the call. */
struct RowRef {
    std::uint64_t id{0};
    std::span<const float> vector;
    std::span<const std::uint8_t> payload;
};

/** \brief Placement facts recorded in the version descriptor. */
struct DataFileInfo {
    std::uint64_t rows{0};
    std::uint64_t bytes{0};
    std::uint64_t footer_offset{0};
    std::uint64_t footer_length{0};
    std::uint64_t min_id{0};
    std::uint64_t max_id{0};
};

struct EncodedDataFile {
    std::vector<std::uint8_t> bytes;
    DataFileInfo info;
};

/** \brief Rows as decoded from the footer and vector block. */
struct DataFileRows {
    std::uint32_t dim{0};
    std::vector<std::uint64_t> ids;
    std::vector<float> vectors;                 /**< ids.size() x dim */
    std::vector<std::uint64_t> payload_offsets; /**< absolute file offsets */
    std::vector<std::uint32_t> payload_lengths;
};

/** \brief Fully decoded file (compaction input). */
struct DataFileContents {
    DataFileRows rows;
    std::vector<std::vector<std::uint8_t>> payloads;
};

/** \brief Encode rows (any order; sorted on output). Duplicate ids or bad dims are invalid_argument. */
auto encode_data_file(std::size_t dim, kernels::Metric metric, std::vector<RowRef> rows)
    -> std::expected<EncodedDataFile, core::error>;

/** \brief Decode and verify a whole file image. */
auto decode_data_file(std::span<const std::uint8_t> bytes)
    -> std::expected<DataFileContents, core::error>;

/** \brief Range-read footer and vector block of a published file. */
auto read_data_file_rows(StorageClient& client, const std::string& path, const DataFileInfo& info,
                         std::size_t expected_dim)
    -> std::expected<DataFileRows, core::error>;

/** \brief Range-read one row's payload. */
auto read_payload(StorageClient& client, const std::string& path, std::uint64_t offset,
                  std::uint32_t length)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace vexlake::storage
