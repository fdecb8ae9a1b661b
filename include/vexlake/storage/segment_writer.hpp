#pragma once

/** \file segment_writer.hpp
 *  \brief Write one data file and its HNSW index file; shared by flush and compaction.
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <vector>

#include "vexlake/error.hpp"
#include "vexlake/index/hnsw.hpp"
#include "vexlake/storage/data_file.hpp"
#include "vexlake/storage/storage_client.hpp"
#include "vexlake/version/version_descriptor.hpp"

namespace vexlake::storage {

/** \brief Hands out file sequence numbers (VersionManager::allocate_seq). */
using SeqSource = std::function<std::uint64_t()>;

/** \brief Sequence numbers tried before a collision is reported as already_exists. */
inline constexpr std::uint32_t kSegmentSeqAttempts = 8;

struct WrittenSegment {
    version::DataFileRef data;
    std::optional<version::IndexFileRef> index;   /**< absent when the index build failed */
};

/** \brief Encode `rows`, put the data file, then build and put its index.
 *
 * A failed index build is logged and the data file is published without one
 * (queries fall back to brute force). A failed data write removes nothing since
 * put_if_absent left no object behind. When a path is already taken (left by a
 * writer that crashed before publishing) the segment moves to the next number
 * from `next_seq`.
 */
auto write_segment(StorageClient& client, std::uint32_t partition, const SeqSource& next_seq, std::size_t dim,
                   kernels::Metric metric, const index::HnswBuildParams& hnsw, std::vector<RowRef> rows)
    -> std::expected<WrittenSegment, core::error>;

/** \brief Best-effort removal of files from an unpublished segment. */
void discard_segment(StorageClient& client, const WrittenSegment& seg);

} // namespace vexlake::storage
