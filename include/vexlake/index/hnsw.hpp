#pragma once

/** \file hnsw.hpp
 *  \brief Hierarchical Navigable Small World (HNSW) index for approximate nearest-neighbor search.
 *
 * Storage is a dense arena: nodes are addressed by slot index (insertion order) and
 * vectors live in one flat row-major buffer, so the graph holds no pointers and
 * serializes as plain tables.
 *
 * Parameters (Malkov & Yashunin, 2018):
 * - level ~ floor(-ln(U) * mL) with mL = 1/ln(M), U uniform in (0,1], capped at kMaxLevel
 * - new nodes link to M neighbors per layer; lists are pruned to M (upper) / M0 (base)
 * - neighbor choice uses the diversity heuristic (Algorithm 4) with keepPrunedConnections
 *
 * Deletes are tombstones: deleted ids still route traffic but never appear in results.
 * Thread-safety: build (add/mark_deleted) is single-threaded; const search is safe
 * to call concurrently once building has finished.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include <roaring/roaring64map.hh>

#include "vexlake/core/cancellation.hpp"
#include "vexlake/error.hpp"
#include "vexlake/kernels/distance.hpp"
#include "vexlake/search/top_k.hpp"

namespace vexlake::index {

/** \brief HNSW build parameters. */
struct HnswBuildParams {
    std::uint32_t M{16};                    /**< Max connections per node on layers > 0 */
    std::uint32_t max_M0{32};               /**< Max connections on layer 0 (2x M) */
    std::uint32_t efConstruction{200};      /**< Beam width during construction */
    std::uint32_t seed{42};                 /**< Random seed for level assignment */
    bool keep_pruned_connections{true};     /**< Refill pruned slots from discarded candidates */
    std::size_t max_elements{0};            /**< Capacity; 0 = unbounded */
};

/** \brief HNSW search parameters. */
struct HnswSearchParams {
    std::uint32_t efSearch{128};                    /**< Beam width; clamped up to k */
    std::uint32_t k{10};                            /**< Number of neighbors to return */
    const roaring::Roaring64Map* exclude{nullptr};  /**< Extra ids to hide (per-file tombstones) */
    const core::CancellationToken* cancel{nullptr};
};

class HnswIndex {
public:
    static constexpr std::uint32_t kMaxLevel = 31;

    HnswIndex();
    ~HnswIndex();
    HnswIndex(HnswIndex&&) noexcept;
    HnswIndex& operator=(HnswIndex&&) noexcept;
    HnswIndex(const HnswIndex&) = delete;
    HnswIndex& operator=(const HnswIndex&) = delete;

    /** \brief Initialize an empty index.
     *
     * Preconditions: dim > 0; M >= 2; max_M0 >= M; efConstruction >= M
     */
    auto init(std::size_t dim, kernels::Metric metric, const HnswBuildParams& params = {})
        -> std::expected<void, core::error>;

    /** \brief Insert one vector.
     *
     * Errors: not_initialized; dimension_mismatch; already_exists for a duplicate id;
     * data_integrity when the index is full or its graph invariants are broken.
     * For cosine the stored copy is unit-normalised.
     * Complexity: O(M * log(N) * efConstruction)
     */
    auto add(std::uint64_t id, std::span<const float> vector) -> std::expected<void, core::error>;

    /** \brief Insert n vectors in order (ids.size() x dim floats). */
    auto add_batch(std::span<const std::uint64_t> ids, std::span<const float> vectors)
        -> std::expected<void, core::error>;

    /** \brief Top-k search. An empty index returns an empty result.
     *
     * Scores follow the metric convention of search::Hit; ordering ties break by id.
     */
    auto search(std::span<const float> query, const HnswSearchParams& params) const
        -> std::expected<std::vector<search::Hit>, core::error>;

    /** \brief Tombstone an id (idempotent). not_found if the id was never inserted. */
    auto mark_deleted(std::uint64_t id) -> std::expected<void, core::error>;

    auto is_deleted(std::uint64_t id) const noexcept -> bool;
    auto contains(std::uint64_t id) const noexcept -> bool;

    /** \brief Self-contained blob: config echo, node table, edges, entry point, tombstones, CRC32C. */
    auto serialize() const -> std::expected<std::vector<std::uint8_t>, core::error>;

    /** \brief Rebuild from serialize() output; any structural violation is data_integrity. */
    static auto deserialize(std::span<const std::uint8_t> blob) -> std::expected<HnswIndex, core::error>;

    /** \brief Nodes reachable from the entry point on layer 0 (diagnostics). */
    auto reachable_count_base_layer() const -> std::size_t;

    auto is_initialized() const noexcept -> bool;
    auto dimension() const noexcept -> std::size_t;
    auto metric() const noexcept -> kernels::Metric;
    auto size() const noexcept -> std::size_t;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vexlake::index
