#include "vexlake/search/top_k.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace vexlake::search {

namespace {

struct PreparedQuery {
    std::vector<float> data;
    float norm{0.0f};
};

auto prepare_query(std::span<const float> query, kernels::Metric metric) -> PreparedQuery {
    PreparedQuery q;
    q.data.assign(query.begin(), query.end());
    if (metric == kernels::Metric::Cosine) kernels::normalize(q.data);
    q.norm = std::sqrt(kernels::norm_sq(q.data));
    return q;
}

// Optimistic (smallest possible) rank key for any row in the block, loosened by a
// rounding allowance so a block is never skipped because of float error.
auto block_bound(const CandidateBlock& b, const PreparedQuery& q, kernels::Metric metric) -> float {
    if (metric == kernels::Metric::L2) {
        float gap = 0.0f;
        if (q.norm < b.min_norm) gap = b.min_norm - q.norm;
        else if (q.norm > b.max_norm) gap = q.norm - b.max_norm;
        const float scale = (q.norm + b.max_norm) * (q.norm + b.max_norm);
        return gap * gap - (1e-3f * scale + 1e-6f);
    }
    const float best = q.norm * b.max_norm;
    return -best - (1e-3f * best + 1e-6f);
}

auto scan_blocks(const PreparedQuery& q, std::span<const CandidateBlock> blocks,
                 const std::vector<std::size_t>& order, const TopKParams& params,
                 const kernels::KernelOps& ops)
    -> std::expected<std::vector<Hit>, core::error> {
    using core::error_code;

    std::size_t rows = 0;
    for (const std::size_t bi : order) rows += blocks[bi].ids.size();
    TopKHeap heap(params.k, params.metric, rows);
    const std::size_t dim = q.data.size();
    const std::span<const float> qs(q.data);
    const bool use_l2 = params.metric == kernels::Metric::L2;
    std::size_t iteration = 0;

    for (const std::size_t bi : order) {
        const CandidateBlock& b = blocks[bi];
        if (params.early_termination && heap.full() &&
            block_bound(b, q, params.metric) > heap.worst_key()) {
            continue;
        }
        for (std::size_t r = 0; r < b.ids.size(); ++r, ++iteration) {
            if (params.cancel && params.cancel->should_stop_at(iteration)) {
                return core::fail(error_code::cancelled, "scan cancelled", "search.top_k");
            }
            const std::uint64_t id = b.ids[r];
            if (b.excluded && b.excluded->contains(id)) continue;
            const auto row = b.vectors.subspan(r * dim, dim);
            const float s = use_l2 ? ops.l2_sq(qs, row) : ops.inner_product(qs, row);
            heap.push(Hit{id, s});
        }
    }
    return std::move(heap).take_sorted();
}

auto validate(std::span<const float> query, std::span<const CandidateBlock> blocks)
    -> std::expected<void, core::error> {
    using core::error_code;
    if (query.empty()) {
        return core::fail(error_code::invalid_argument, "empty query", "search.top_k");
    }
    for (const auto& b : blocks) {
        if (b.vectors.size() != b.ids.size() * query.size()) {
            return core::fail(error_code::dimension_mismatch,
                              "candidate block width does not match query dimension",
                              "search.top_k");
        }
    }
    return {};
}

// Blocks visited in order of their optimistic bound so pruning kicks in early.
auto bound_order(std::span<const CandidateBlock> blocks, const PreparedQuery& q,
                 kernels::Metric metric) -> std::vector<std::size_t> {
    std::vector<float> bounds(blocks.size());
    for (std::size_t i = 0; i < blocks.size(); ++i) bounds[i] = block_bound(blocks[i], q, metric);
    std::vector<std::size_t> order(blocks.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return bounds[a] < bounds[b]; });
    return order;
}

} // namespace

bool TopKHeap::push(const Hit& h) {
    if (k_ == 0) return false;
    auto worse = [this](const Hit& a, const Hit& b) { return ranks_before(metric_, a, b); };
    if (heap_.size() < k_) {
        heap_.push_back(h);
        std::push_heap(heap_.begin(), heap_.end(), worse);
        return true;
    }
    if (!ranks_before(metric_, h, heap_.front())) return false;
    std::pop_heap(heap_.begin(), heap_.end(), worse);
    heap_.back() = h;
    std::push_heap(heap_.begin(), heap_.end(), worse);
    return true;
}

float TopKHeap::worst_key() const noexcept {
    return heap_.empty() ? 0.0f : kernels::rank_key(metric_, heap_.front().score);
}

auto TopKHeap::take_sorted() && -> std::vector<Hit> {
    std::vector<Hit> out = std::move(heap_);
    std::sort(out.begin(), out.end(),
              [m = metric_](const Hit& a, const Hit& b) { return ranks_before(m, a, b); });
    return out;
}

auto make_blocks(std::span<const std::uint64_t> ids, std::span<const float> vectors,
                 std::size_t dim, std::size_t block_rows,
                 const roaring::Roaring64Map* excluded) -> std::vector<CandidateBlock> {
    std::vector<CandidateBlock> blocks;
    if (dim == 0 || block_rows == 0) return blocks;
    const std::size_t n = std::min(ids.size(), vectors.size() / dim);
    for (std::size_t start = 0; start < n; start += block_rows) {
        const std::size_t rows = std::min(block_rows, n - start);
        CandidateBlock b;
        b.ids = ids.subspan(start, rows);
        b.vectors = vectors.subspan(start * dim, rows * dim);
        b.excluded = excluded;
        float lo = std::numeric_limits<float>::max();
        float hi = 0.0f;
        for (std::size_t r = 0; r < rows; ++r) {
            const float nrm = std::sqrt(kernels::norm_sq(b.vectors.subspan(r * dim, dim)));
            lo = std::min(lo, nrm);
            hi = std::max(hi, nrm);
        }
        b.min_norm = lo;
        b.max_norm = hi;
        blocks.push_back(b);
    }
    return blocks;
}

auto top_k(std::span<const float> query, std::span<const CandidateBlock> blocks,
           const TopKParams& params)
    -> std::expected<std::vector<Hit>, core::error> {
    if (auto ok = validate(query, blocks); !ok) return std::unexpected(ok.error());
    const auto& ops = params.ops ? *params.ops : kernels::select_backend_auto();
    const PreparedQuery q = prepare_query(query, params.metric);
    return scan_blocks(q, blocks, bound_order(blocks, q, params.metric), params, ops);
}

auto top_k_parallel(std::span<const float> query, std::span<const CandidateBlock> blocks,
                    const TopKParams& params, core::ThreadPool& pool)
    -> std::expected<std::vector<Hit>, core::error> {
    if (auto ok = validate(query, blocks); !ok) return std::unexpected(ok.error());
    const auto& ops = params.ops ? *params.ops : kernels::select_backend_auto();
    const PreparedQuery q = prepare_query(query, params.metric);
    const auto order = bound_order(blocks, q, params.metric);

    // Deal blocks round-robin so every partition sees promising blocks first.
    const std::size_t parts = std::max<std::size_t>(1, std::min(pool.size(), order.size()));
    std::vector<std::vector<std::size_t>> partitions(parts);
    for (std::size_t i = 0; i < order.size(); ++i) partitions[i % parts].push_back(order[i]);

    std::vector<std::future<std::expected<std::vector<Hit>, core::error>>> futures;
    futures.reserve(parts);
    for (auto& part : partitions) {
        futures.push_back(pool.submit([&q, blocks, &part, &params, &ops] {
            return scan_blocks(q, blocks, part, params, ops);
        }));
    }

    std::vector<std::vector<Hit>> lists;
    lists.reserve(parts);
    std::expected<void, core::error> first_error{};
    for (auto& f : futures) {
        auto r = f.get();
        if (!r) {
            if (first_error) first_error = std::unexpected(r.error());
            continue;
        }
        lists.push_back(std::move(*r));
    }
    if (!first_error) return std::unexpected(first_error.error());
    return merge_top_k(std::move(lists), params.k, params.metric);
}

auto merge_top_k(std::vector<std::vector<Hit>> lists, std::size_t k, kernels::Metric metric)
    -> std::vector<Hit> {
    std::vector<Hit> all;
    std::size_t total = 0;
    for (const auto& l : lists) total += l.size();
    all.reserve(total);
    for (auto& l : lists) all.insert(all.end(), l.begin(), l.end());
    auto cmp = [metric](const Hit& a, const Hit& b) { return ranks_before(metric, a, b); };
    if (all.size() > k) {
        std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(k), all.end(), cmp);
        all.resize(k);
    } else {
        std::sort(all.begin(), all.end(), cmp);
    }
    return all;
}

} // namespace vexlake::search
