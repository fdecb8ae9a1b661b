#pragma once

/** \file segment.hpp
 *  \brief Query-time view of one published data file plus its HNSW index.
 *
 * A segment holds ids and vectors (loaded with range reads) and the payload
 * directory; payload bytes stay in the object store until a result needs them.
 * If the index file is missing or fails to deserialize, `index` is null and
 * the segment is searched by brute force.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "vexlake/error.hpp"
#include "vexlake/index/hnsw.hpp"
#include "vexlake/search/top_k.hpp"
#include "vexlake/storage/data_file.hpp"
#include "vexlake/version/version_descriptor.hpp"

namespace vexlake::storage {

struct Segment {
    std::string path;
    std::size_t dim{0};
    DataFileRows rows;
    std::unordered_map<std::uint64_t, std::uint32_t> row_of;
    std::vector<search::CandidateBlock> blocks;   /**< precomputed norm bounds, excluded unset */
    std::shared_ptr<const index::HnswIndex> index;
    bool index_corrupt{false};

    [[nodiscard]] std::size_t size() const noexcept { return rows.ids.size(); }
    [[nodiscard]] auto vector_at(std::uint32_t row) const -> std::span<const float> {
        return std::span<const float>(rows.vectors).subspan(std::size_t{row} * dim, dim);
    }
    [[nodiscard]] auto find(std::uint64_t id) const -> const std::uint32_t* {
        auto it = row_of.find(id);
        return it == row_of.end() ? nullptr : &it->second;
    }
};

using SegmentPtr = std::shared_ptr<const Segment>;

/** \brief Load a data file and its index. Index problems degrade to brute force, data problems fail. */
auto load_segment(StorageClient& client, const version::DataFileRef& file, const version::IndexFileRef* index_file,
                  std::size_t dim, kernels::Metric metric) -> std::expected<SegmentPtr, core::error>;

struct SegmentCacheStats {
    std::size_t entries{0};
    std::uint64_t hits{0};
    std::uint64_t loads{0};
    std::uint64_t index_fallbacks{0};
};

/** \brief Immutable files never change, so entries are keyed by path and never invalidated, only evicted. */
class SegmentCache {
public:
    SegmentCache(std::shared_ptr<StorageClient> client, std::size_t dim, kernels::Metric metric)
        : client_(std::move(client)), dim_(dim), metric_(metric) {}

    auto acquire(const version::VersionDescriptor& version, const version::DataFileRef& file)
        -> std::expected<SegmentPtr, core::error>;

    /** \brief Drop entries whose path is not in `keep`. */
    void retain_only(const std::vector<std::string>& keep);
    void clear();
    auto stats() const -> SegmentCacheStats;

private:
    std::shared_ptr<StorageClient> client_;
    std::size_t dim_;
    kernels::Metric metric_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, SegmentPtr> entries_;
    std::uint64_t hits_{0};
    std::uint64_t loads_{0};
    std::uint64_t index_fallbacks_{0};
};

} // namespace vexlake::storage
