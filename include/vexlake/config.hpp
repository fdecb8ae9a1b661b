#pragma once

/** \file config.hpp
 *  \brief Engine configuration: defaults, VEXLAKE_* environment overlay, validation.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

#include "vexlake/compaction/compactor.hpp"
#include "vexlake/error.hpp"
#include "vexlake/index/hnsw.hpp"
#include "vexlake/kernels/distance.hpp"
#include "vexlake/storage/storage_client.hpp"

namespace vexlake {

struct EngineConfig {
    std::filesystem::path root;                 /**< storage namespace (local object store root) */
    std::filesystem::path wal_dir;              /**< empty = <root>/_wal */
    std::uint32_t dimension{0};
    kernels::Metric metric{kernels::Metric::Cosine};
    index::HnswBuildParams hnsw{};
    std::uint32_t default_ef{128};
    std::size_t flush_threshold_bytes{4u << 20};
    std::uint32_t partition{0};
    bool sync_wal{true};
    storage::RetryPolicy retry{};
    compaction::CompactionPolicy compaction{};
    bool background_compaction{true};
    std::size_t search_threads{0};              /**< 0 = hardware concurrency */
    std::chrono::milliseconds query_timeout{0}; /**< 0 = no deadline */
    std::string kernel_backend{"auto"};         /**< scalar | avx2 | auto */

    [[nodiscard]] auto effective_wal_dir() const -> std::filesystem::path {
        return wal_dir.empty() ? root / "_wal" : wal_dir;
    }
};

/** \brief Overlay VEXLAKE_* variables onto `cfg`. Unparsable values are config_invalid. */
auto apply_env_overrides(EngineConfig& cfg) -> std::expected<void, core::error>;

/** \brief Reject inconsistent settings. */
auto validate(const EngineConfig& cfg) -> std::expected<void, core::error>;

} // namespace vexlake
