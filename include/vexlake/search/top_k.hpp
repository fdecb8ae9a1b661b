#pragma once

/** \file top_k.hpp
 *  \brief Exact (brute-force) top-K over candidate blocks; the correctness oracle for the ANN index.
 *
 * Ordering: results are sorted by rank key (ascending squared distance for L2,
 * descending similarity otherwise), ties broken by ascending id. This is a strict
 * total order for unique ids, so sequential, parallel and pruned scans agree exactly.
 *
 * Cosine: candidates must already be unit-normalised (as stored); the query is
 * normalised internally and scored by inner product. Zero vectors score 0.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include <roaring/roaring64map.hh>

#include "vexlake/core/cancellation.hpp"
#include "vexlake/core/thread_pool.hpp"
#include "vexlake/error.hpp"
#include "vexlake/kernels/dispatch.hpp"

namespace vexlake::search {

/** \brief One ranked result. `score` is squared distance (L2) or similarity (IP, cosine). */
struct Hit {
    std::uint64_t id{0};
    float score{0.0f};

    friend bool operator==(const Hit&, const Hit&) = default;
};

/** \brief Strict total order used by every ranking and merge step. */
inline bool ranks_before(kernels::Metric m, const Hit& a, const Hit& b) noexcept {
    const float ka = kernels::rank_key(m, a.score);
    const float kb = kernels::rank_key(m, b.score);
    if (ka != kb) return ka < kb;
    return a.id < b.id;
}

/** \brief Bounded best-K accumulator (max-heap on rank order). */
class TopKHeap {
public:
    /** \brief `candidates` bounds the initial allocation; k alone may be far larger than the data. */
    TopKHeap(std::size_t k, kernels::Metric metric, std::size_t candidates = 0) : k_(k), metric_(metric) {
        heap_.reserve(std::min(k, candidates));
    }

    /** \brief Offer a candidate; returns true if it was retained. */
    bool push(const Hit& h);

    [[nodiscard]] bool full() const noexcept { return heap_.size() >= k_; }
    [[nodiscard]] std::size_t size() const noexcept { return heap_.size(); }

    /** \brief Rank key of the current K-th best; only meaningful when full(). */
    [[nodiscard]] float worst_key() const noexcept;

    /** \brief Drain into ranked order. */
    [[nodiscard]] auto take_sorted() && -> std::vector<Hit>;

private:
    std::size_t k_;
    kernels::Metric metric_;
    std::vector<Hit> heap_;
};

/** \brief Contiguous candidate rows with cheap norm bounds used for early termination. */
struct CandidateBlock {
    std::span<const std::uint64_t> ids;
    std::span<const float> vectors;            /**< ids.size() x dim, row-major */
    float min_norm{0.0f};
    float max_norm{0.0f};
    const roaring::Roaring64Map* excluded{nullptr}; /**< optional tombstones to skip */
};

/** \brief Split rows into blocks of at most `block_rows`, computing norm bounds. */
auto make_blocks(std::span<const std::uint64_t> ids, std::span<const float> vectors,
                 std::size_t dim, std::size_t block_rows = 1024,
                 const roaring::Roaring64Map* excluded = nullptr)
    -> std::vector<CandidateBlock>;

struct TopKParams {
    std::size_t k{10};
    kernels::Metric metric{kernels::Metric::L2};
    const kernels::KernelOps* ops{nullptr};          /**< nullptr = select_backend_auto() */
    const core::CancellationToken* cancel{nullptr};
    bool early_termination{true};                    /**< skip blocks whose bound cannot beat the K-th best */
};

/** \brief Single-threaded exact top-K. Fails only with cancelled or dimension_mismatch. */
auto top_k(std::span<const float> query, std::span<const CandidateBlock> blocks,
           const TopKParams& params)
    -> std::expected<std::vector<Hit>, core::error>;

/** \brief Partitioned parallel top-K; identical output to top_k(). */
auto top_k_parallel(std::span<const float> query, std::span<const CandidateBlock> blocks,
                    const TopKParams& params, core::ThreadPool& pool)
    -> std::expected<std::vector<Hit>, core::error>;

/** \brief Merge already-ranked lists into the global top-k under the same total order. */
auto merge_top_k(std::vector<std::vector<Hit>> lists, std::size_t k, kernels::Metric metric)
    -> std::vector<Hit>;

} // namespace vexlake::search
