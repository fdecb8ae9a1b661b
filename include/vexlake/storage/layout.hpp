#pragma once

/** \file layout.hpp
 *  \brief Object key layout under a namespace root.
 *
 *   data/<partition>/<seq:020>.vxd    immutable vector+payload batches
 *   index/<seq:020>.vxi               serialized HNSW snapshots (one per data file)
 *   _metadata/version_<n>.json        version descriptors, n strictly increasing
 *   _metadata/latest                  newest published version id (hint only)
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vexlake::storage {

inline constexpr std::string_view kDataPrefix = "data/";
inline constexpr std::string_view kIndexPrefix = "index/";
inline constexpr std::string_view kMetadataPrefix = "_metadata/";
inline constexpr std::string_view kLatestPath = "_metadata/latest";

auto data_file_path(std::uint32_t partition, std::uint64_t seq) -> std::string;
auto index_file_path(std::uint64_t seq) -> std::string;
auto version_path(std::uint64_t version_id) -> std::string;

/** \brief Inverse of version_path; nullopt for other keys. */
auto parse_version_path(std::string_view key) -> std::optional<std::uint64_t>;
/** \brief Sequence number embedded in a data or index key. */
auto parse_file_seq(std::string_view key) -> std::optional<std::uint64_t>;

} // namespace vexlake::storage
