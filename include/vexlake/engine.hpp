#pragma once

/** \file engine.hpp
 *  \brief The vexlake engine: WAL-backed writes, versioned immutable storage, top-K search.
 *
 * Write path: insert/remove -> WAL + write buffer -> (threshold or flush()) -> data and
 * index files -> version publish. Read path: search pins the current version, scans the
 * buffered generations by brute force and each data file through its HNSW index (or by
 * brute force when the index is unusable), then merges under the (score, id) order.
 *
 * Thread-safety: all public methods may be called concurrently.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "vexlake/buffer/memtable.hpp"
#include "vexlake/compaction/compactor.hpp"
#include "vexlake/config.hpp"
#include "vexlake/core/cancellation.hpp"
#include "vexlake/error.hpp"
#include "vexlake/storage/object_store.hpp"
#include "vexlake/version/version_manager.hpp"

namespace vexlake {

/** \brief Library version string ("major.minor.patch"). */
auto version() noexcept -> const char*;

struct SearchOptions {
    bool with_payload{false};
    std::chrono::milliseconds timeout{0};   /**< 0 = EngineConfig::query_timeout */
    const core::CancellationToken* cancel{nullptr}; /**< caller-side stop, polled with the deadline */
};

struct SearchResult {
    std::uint64_t id{0};
    float score{0.0f};                      /**< squared L2 distance, or similarity for ip/cosine */
    std::vector<std::uint8_t> payload;      /**< filled when SearchOptions::with_payload */
};

struct EngineStats {
    std::uint64_t version_id{0};
    std::size_t data_files{0};
    std::size_t index_files{0};
    std::uint64_t stored_vectors{0};        /**< live rows in the current version */
    std::size_t buffered_records{0};        /**< live rows not yet flushed */
    std::size_t buffered_ops{0};
    std::size_t buffered_bytes{0};
    std::uint64_t tombstones{0};
    std::size_t pinned_versions{0};
    std::size_t cached_segments{0};
    std::uint64_t index_fallbacks{0};
    std::uint64_t storage_retries{0};
    std::string kernel_backend;
};

class Engine {
public:
    /** \brief Open (or create) the namespace under cfg.root, replaying any unflushed WAL.
     *
     * `store` overrides the local filesystem store (tests use the in-memory store).
     */
    static auto open(const EngineConfig& cfg, std::shared_ptr<storage::ObjectStore> store = nullptr)
        -> std::expected<std::unique_ptr<Engine>, core::error>;

    ~Engine();
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /** \brief Durably insert a new id. already_exists if the id is live. */
    auto insert(std::uint64_t id, std::span<const float> vector, std::span<const std::uint8_t> payload = {})
        -> std::expected<void, core::error>;

    /** \brief Durably delete a live id. not_found otherwise. */
    auto remove(std::uint64_t id) -> std::expected<void, core::error>;

    /** \brief Top-k over the current version plus buffered writes. ef == 0 uses default_ef; ef < k is raised to k. */
    auto search(std::span<const float> query, std::uint32_t k, std::uint32_t ef = 0,
                const SearchOptions& opts = {}) -> std::expected<std::vector<SearchResult>, core::error>;

    /** \brief Pin the current published version for repeatable reads. */
    auto pin() -> version::VersionPin;

    /** \brief Search exactly the files of a pinned version; buffered writes are not visible. */
    auto search_at(const version::VersionPin& pin, std::span<const float> query, std::uint32_t k,
                   std::uint32_t ef = 0, const SearchOptions& opts = {})
        -> std::expected<std::vector<SearchResult>, core::error>;

    /** \brief Point lookup of a live record. */
    auto get(std::uint64_t id) -> std::expected<buffer::Record, core::error>;

    /** \brief Drain buffered writes into a new version. Returns the current version id. */
    auto flush() -> std::expected<std::uint64_t, core::error>;

    /** \brief Run one compaction round now. */
    auto compact() -> std::expected<compaction::CompactionResult, core::error>;

    /** \brief Drop every record: publish an empty version and discard the buffer. */
    auto clear() -> std::expected<void, core::error>;

    auto stats() const -> EngineStats;
    auto health_check() const noexcept -> bool;

    /** \brief Stop background work and flush. Further calls fail with not_initialized. */
    auto shutdown() -> std::expected<void, core::error>;

    auto dimension() const noexcept -> std::size_t;
    auto metric() const noexcept -> kernels::Metric;
    auto config() const noexcept -> const EngineConfig&;

private:
    class Impl;
    explicit Engine(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace vexlake
