#pragma once

/** \file version_descriptor.hpp
 *  \brief Immutable description of one published dataset version and its JSON form.
 *
 * Tombstones are recorded per data file (only ids that file actually holds), so a
 * re-inserted id living in a newer file is never masked. `deleted_ids` is the union
 * over all files and is kept for readers and stats.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <roaring/roaring64map.hh>

#include "vexlake/error.hpp"
#include "vexlake/kernels/distance.hpp"

namespace vexlake::version {

struct DataFileRef {
    std::string path;
    std::uint32_t partition{0};
    std::uint64_t seq{0};
    std::uint64_t rows{0};
    std::uint64_t bytes{0};
    std::uint64_t footer_offset{0};
    std::uint64_t footer_length{0};
    std::uint64_t min_id{0};
    std::uint64_t max_id{0};
    roaring::Roaring64Map deleted_ids;

    [[nodiscard]] std::uint64_t live_rows() const { return rows - deleted_ids.cardinality(); }
    [[nodiscard]] double tombstone_ratio() const {
        return rows == 0 ? 0.0 : static_cast<double>(deleted_ids.cardinality()) / static_cast<double>(rows);
    }
};

struct IndexFileRef {
    std::string path;
    std::uint64_t seq{0};
    std::string data_file;   /**< data file this index covers */
};

struct VersionDescriptor {
    std::uint64_t version_id{0};
    std::int64_t created_at_ms{0};
    std::uint32_t dimension{0};
    kernels::Metric metric{kernels::Metric::Cosine};
    std::uint64_t parent_version{0};
    std::string writer;                 /**< nonce of the publishing process */
    std::vector<DataFileRef> data_files;
    std::vector<IndexFileRef> index_files;
    roaring::Roaring64Map deleted_ids;
    std::uint64_t wal_generation{0};    /**< highest WAL generation whose ops are in data_files */
    std::uint64_t next_seq{1};          /**< lower bound for the next file sequence number */
    std::uint64_t total_vectors{0};

    /** \brief Recompute deleted_ids and total_vectors from the per-file tombstones. */
    void recompute_totals();

    [[nodiscard]] auto find_data_file(const std::string& path) const -> const DataFileRef*;
    [[nodiscard]] auto find_data_file(const std::string& path) -> DataFileRef*;
    [[nodiscard]] auto index_for(const std::string& data_path) const -> const IndexFileRef*;

    /** \brief Every object key this version references. */
    [[nodiscard]] auto referenced_paths() const -> std::vector<std::string>;
};

auto encode_descriptor(const VersionDescriptor& d) -> std::string;
auto decode_descriptor(std::span<const std::uint8_t> bytes) -> std::expected<VersionDescriptor, core::error>;

} // namespace vexlake::version
