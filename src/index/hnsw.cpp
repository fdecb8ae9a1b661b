#include "vexlake/index/hnsw.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <queue>
#include <random>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "vexlake/core/bytes.hpp"
#include "vexlake/core/crc32c.hpp"
#include "vexlake/kernels/dispatch.hpp"

namespace vexlake::index {

namespace {

constexpr char kMagic[8] = {'V', 'X', 'H', 'N', 'S', 'W', '0', '1'};
constexpr std::uint32_t kFormatVersion = 1;
constexpr std::uint32_t kInvalid = std::numeric_limits<std::uint32_t>::max();

using Candidate = std::pair<float, std::uint32_t>; // (rank key, slot)

} // namespace

/** \brief Node in the HNSW arena; `links[l]` holds slot indices on layer l. */
struct HnswNode {
    std::uint64_t id{0};
    std::uint32_t level{0};
    std::vector<std::vector<std::uint32_t>> links;
};

class HnswIndex::Impl {
public:
    struct State {
        bool initialized{false};
        bool corrupted{false};
        std::size_t dim{0};
        kernels::Metric metric{kernels::Metric::L2};
        HnswBuildParams params;
        std::uint32_t entry_point{kInvalid};
        std::uint32_t max_level{0};
        double ml{1.0 / std::log(16.0)};
        const kernels::KernelOps* ops{nullptr};
        std::mt19937_64 rng;
    } state_;

    std::vector<HnswNode> nodes_;
    std::vector<float> vectors_;
    std::unordered_map<std::uint64_t, std::uint32_t> id_to_idx_;
    roaring::Roaring64Map deleted_;

    auto init(std::size_t dim, kernels::Metric metric, const HnswBuildParams& params)
        -> std::expected<void, core::error>;
    auto add(std::uint64_t id, std::span<const float> vector) -> std::expected<void, core::error>;
    auto search(std::span<const float> query, const HnswSearchParams& params) const
        -> std::expected<std::vector<search::Hit>, core::error>;

    auto select_level() -> std::uint32_t;
    auto vec(std::uint32_t idx) const noexcept -> const float* { return vectors_.data() + idx * state_.dim; }
    auto key_to(const float* q, std::uint32_t idx) const noexcept -> float;
    auto max_links(std::uint32_t level) const noexcept -> std::uint32_t {
        return level == 0 ? state_.params.max_M0 : state_.params.M;
    }

    /** \brief Beam search on one layer; result sorted ascending by (key, slot). */
    auto search_layer(const float* query, std::uint32_t entry, std::uint32_t ef, std::uint32_t layer,
                      const core::CancellationToken* cancel, std::size_t& iteration) const
        -> std::expected<std::vector<Candidate>, core::error>;

    /** \brief Diversity heuristic (Algorithm 4); `candidates` sorted ascending by key to the base. */
    auto select_neighbors(const std::vector<Candidate>& candidates, std::uint32_t M) const
        -> std::vector<std::uint32_t>;

    void connect(std::uint32_t new_idx, const std::vector<Candidate>& candidates, std::uint32_t layer);
    void shrink_links(std::uint32_t idx, std::uint32_t layer);
    auto check_invariants() const -> bool;
};

auto HnswIndex::Impl::init(std::size_t dim, kernels::Metric metric, const HnswBuildParams& params)
    -> std::expected<void, core::error> {
    using core::error_code;
    if (dim == 0) {
        return core::fail(error_code::invalid_argument, "dimension must be > 0", "index.hnsw");
    }
    if (params.M < 2 || params.max_M0 < params.M || params.efConstruction < params.M) {
        return core::fail(error_code::invalid_argument,
                          "require M >= 2, max_M0 >= M, efConstruction >= M", "index.hnsw");
    }
    state_ = State{};
    state_.initialized = true;
    state_.dim = dim;
    state_.metric = metric;
    state_.params = params;
    state_.ml = 1.0 / std::log(static_cast<double>(params.M));
    state_.ops = &kernels::select_backend_auto();
    state_.rng.seed(params.seed);
    nodes_.clear();
    vectors_.clear();
    id_to_idx_.clear();
    deleted_ = roaring::Roaring64Map{};
    if (params.max_elements > 0) {
        nodes_.reserve(params.max_elements);
        vectors_.reserve(params.max_elements * dim);
    }
    return {};
}

auto HnswIndex::Impl::select_level() -> std::uint32_t {
    // U in (0, 1] so that -log(U) is finite
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    const double u = 1.0 - dist(state_.rng);
    const double f = -std::log(u) * state_.ml;
    return static_cast<std::uint32_t>(std::min<double>(f, HnswIndex::kMaxLevel));
}

auto HnswIndex::Impl::key_to(const float* q, std::uint32_t idx) const noexcept -> float {
    const std::span<const float> a(q, state_.dim);
    const std::span<const float> b(vec(idx), state_.dim);
    if (state_.metric == kernels::Metric::L2) return state_.ops->l2_sq(a, b);
    // Cosine vectors are unit-length, so both non-L2 metrics rank by inner product.
    return -state_.ops->inner_product(a, b);
}

auto HnswIndex::Impl::search_layer(const float* query, std::uint32_t entry, std::uint32_t ef,
                                   std::uint32_t layer, const core::CancellationToken* cancel,
                                   std::size_t& iteration) const
    -> std::expected<std::vector<Candidate>, core::error> {
    const std::size_t N = nodes_.size();

    // Thread-local epoch-based visited marking (avoids hash set overhead)
    struct TLSVisited { std::vector<std::uint32_t> seen; std::uint32_t epoch{0}; };
    thread_local TLSVisited tls;
    if (tls.seen.size() < N) tls.seen.resize(N, 0);
    if (++tls.epoch == 0) {
        std::fill(tls.seen.begin(), tls.seen.end(), 0u);
        tls.epoch = 1;
    }

    // candidates: min-heap by key (stored negated); nearest: max-heap by key
    std::priority_queue<Candidate> candidates;
    std::priority_queue<Candidate> nearest;

    const float entry_key = key_to(query, entry);
    candidates.emplace(-entry_key, entry);
    nearest.emplace(entry_key, entry);
    tls.seen[entry] = tls.epoch;

    while (!candidates.empty()) {
        if (cancel && cancel->should_stop_at(++iteration)) {
            return core::fail(core::error_code::cancelled, "search cancelled", "index.hnsw");
        }
        const auto [neg_key, current] = candidates.top();
        if (-neg_key > nearest.top().first) break;
        candidates.pop();

        const auto& node = nodes_[current];
        if (layer >= node.links.size()) continue;
        for (const std::uint32_t nb : node.links[layer]) {
            if (tls.seen[nb] == tls.epoch) continue;
            tls.seen[nb] = tls.epoch;
            const float k = key_to(query, nb);
            if (nearest.size() < ef || k < nearest.top().first) {
                candidates.emplace(-k, nb);
                nearest.emplace(k, nb);
                if (nearest.size() > ef) nearest.pop();
            }
        }
    }

    std::vector<Candidate> result;
    result.reserve(nearest.size());
    while (!nearest.empty()) {
        result.push_back(nearest.top());
        nearest.pop();
    }
    // Deterministic ordering on ties (key, then slot)
    std::sort(result.begin(), result.end());
    return result;
}

auto HnswIndex::Impl::select_neighbors(const std::vector<Candidate>& candidates, std::uint32_t M) const
    -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> selected;
    std::vector<std::uint32_t> discarded;
    selected.reserve(M);
    for (const auto& [key_c, c] : candidates) {
        if (selected.size() >= M) break;
        // Keep c only if it is closer to the base than to every neighbor already kept
        bool diverse = true;
        for (const std::uint32_t r : selected) {
            if (key_to(vec(c), r) < key_c) {
                diverse = false;
                break;
            }
        }
        if (diverse) selected.push_back(c);
        else discarded.push_back(c);
    }
    if (state_.params.keep_pruned_connections) {
        for (std::size_t i = 0; i < discarded.size() && selected.size() < M; ++i) {
            selected.push_back(discarded[i]);
        }
    }
    return selected;
}

void HnswIndex::Impl::shrink_links(std::uint32_t idx, std::uint32_t layer) {
    auto& links = nodes_[idx].links[layer];
    std::vector<Candidate> cand;
    cand.reserve(links.size());
    for (const std::uint32_t nb : links) cand.emplace_back(key_to(vec(idx), nb), nb);
    std::sort(cand.begin(), cand.end());
    links = select_neighbors(cand, max_links(layer));
}

void HnswIndex::Impl::connect(std::uint32_t new_idx, const std::vector<Candidate>& candidates,
                              std::uint32_t layer) {
    auto chosen = select_neighbors(candidates, state_.params.M);
    for (const std::uint32_t nb : chosen) {
        auto& back = nodes_[nb].links[layer];
        back.push_back(new_idx);
        if (back.size() > max_links(layer)) shrink_links(nb, layer);
    }
    nodes_[new_idx].links[layer] = std::move(chosen);
}

auto HnswIndex::Impl::check_invariants() const -> bool {
    if (nodes_.empty()) return state_.entry_point == kInvalid;
    if (state_.entry_point >= nodes_.size()) return false;
    if (nodes_[state_.entry_point].level != state_.max_level) return false;
    if (vectors_.size() != nodes_.size() * state_.dim) return false;
    for (const auto& n : nodes_) {
        if (n.links.size() != n.level + 1) return false;
        for (std::uint32_t l = 0; l <= n.level; ++l) {
            for (const std::uint32_t nb : n.links[l]) {
                if (nb >= nodes_.size() || nodes_[nb].level < l) return false;
            }
        }
    }
    return true;
}

auto HnswIndex::Impl::add(std::uint64_t id, std::span<const float> vector)
    -> std::expected<void, core::error> {
    using core::error_code;

    if (!state_.initialized) {
        return core::fail(error_code::not_initialized, "index not initialized", "index.hnsw");
    }
    if (state_.corrupted) {
        return core::fail(error_code::data_integrity, "index graph is corrupt", "index.hnsw");
    }
    if (vector.size() != state_.dim) {
        return core::fail(error_code::dimension_mismatch, "vector dimension mismatch", "index.hnsw");
    }
    if (id_to_idx_.count(id) > 0) {
        return core::fail(error_code::already_exists, "id already indexed", "index.hnsw");
    }
    if ((state_.params.max_elements > 0 && nodes_.size() >= state_.params.max_elements) ||
        nodes_.size() >= kInvalid) {
        return core::fail(error_code::data_integrity, "index is full", "index.hnsw");
    }
    if (!nodes_.empty() && (state_.entry_point >= nodes_.size() ||
                            nodes_[state_.entry_point].level != state_.max_level)) {
        state_.corrupted = true;
        return core::fail(error_code::data_integrity, "entry point invariant violated", "index.hnsw");
    }

    const auto new_idx = static_cast<std::uint32_t>(nodes_.size());
    const std::uint32_t level = select_level();
    HnswNode node;
    node.id = id;
    node.level = level;
    node.links.resize(level + 1);
    nodes_.push_back(std::move(node));
    vectors_.insert(vectors_.end(), vector.begin(), vector.end());
    if (state_.metric == kernels::Metric::Cosine) {
        kernels::normalize(std::span<float>(vectors_.data() + new_idx * state_.dim, state_.dim));
    }
    id_to_idx_.emplace(id, new_idx);

    if (new_idx == 0) {
        state_.entry_point = 0;
        state_.max_level = level;
        return {};
    }

    const float* q = vec(new_idx);
    std::uint32_t curr = state_.entry_point;
    std::size_t iteration = 0;

    // Greedy descent through layers above the new node's level
    for (std::int64_t lc = state_.max_level; lc > static_cast<std::int64_t>(level); --lc) {
        auto nearest = search_layer(q, curr, 1, static_cast<std::uint32_t>(lc), nullptr, iteration);
        if (nearest && !nearest->empty()) curr = nearest->front().second;
    }

    for (std::int64_t lc = std::min(level, state_.max_level); lc >= 0; --lc) {
        const auto layer = static_cast<std::uint32_t>(lc);
        auto nearest = search_layer(q, curr, state_.params.efConstruction, layer, nullptr, iteration);
        if (!nearest) return std::unexpected(nearest.error());
        // The new node is not yet linked, so it can only appear as its own entry; drop it.
        std::erase_if(*nearest, [new_idx](const Candidate& c) { return c.second == new_idx; });
        if (nearest->empty()) continue;
        connect(new_idx, *nearest, layer);
        curr = nearest->front().second;
    }

    if (level > state_.max_level) {
        state_.max_level = level;
        state_.entry_point = new_idx;
    }
    return {};
}

auto HnswIndex::Impl::search(std::span<const float> query, const HnswSearchParams& params) const
    -> std::expected<std::vector<search::Hit>, core::error> {
    using core::error_code;

    if (!state_.initialized) {
        return core::fail(error_code::not_initialized, "index not initialized", "index.hnsw");
    }
    if (query.size() != state_.dim) {
        return core::fail(error_code::dimension_mismatch, "query dimension mismatch", "index.hnsw");
    }
    std::vector<search::Hit> hits;
    if (nodes_.empty() || params.k == 0) return hits;

    std::vector<float> q(query.begin(), query.end());
    if (state_.metric == kernels::Metric::Cosine) kernels::normalize(q);

    std::size_t iteration = 0;
    std::uint32_t curr = state_.entry_point;
    for (std::int64_t lc = state_.max_level; lc > 0; --lc) {
        auto nearest = search_layer(q.data(), curr, 1, static_cast<std::uint32_t>(lc), params.cancel, iteration);
        if (!nearest) return std::unexpected(nearest.error());
        if (!nearest->empty()) curr = nearest->front().second;
    }

    auto hidden = [&](std::uint32_t idx) {
        const std::uint64_t id = nodes_[idx].id;
        return deleted_.contains(id) || (params.exclude && params.exclude->contains(id));
    };

    // Widen the beam while tombstones leave fewer than k visible results.
    std::uint32_t ef = std::max(params.efSearch, params.k);
    std::vector<Candidate> base;
    for (;;) {
        auto layer0 = search_layer(q.data(), curr, ef, 0, params.cancel, iteration);
        if (!layer0) return std::unexpected(layer0.error());
        base = std::move(*layer0);
        std::size_t visible = 0;
        for (const auto& c : base) visible += hidden(c.second) ? 0 : 1;
        if (visible >= params.k || base.size() < ef || ef >= nodes_.size()) break;
        ef = static_cast<std::uint32_t>(std::min<std::size_t>(std::size_t{ef} * 2, nodes_.size()));
    }

    hits.reserve(base.size());
    for (const auto& [key, idx] : base) {
        if (hidden(idx)) continue;
        hits.push_back(search::Hit{nodes_[idx].id, kernels::score_from_key(state_.metric, key)});
    }
    const auto m = state_.metric;
    std::sort(hits.begin(), hits.end(),
              [m](const search::Hit& a, const search::Hit& b) { return search::ranks_before(m, a, b); });
    if (hits.size() > params.k) hits.resize(params.k);
    return hits;
}

HnswIndex::HnswIndex() : impl_(std::make_unique<Impl>()) {}
HnswIndex::~HnswIndex() = default;
HnswIndex::HnswIndex(HnswIndex&&) noexcept = default;
HnswIndex& HnswIndex::operator=(HnswIndex&&) noexcept = default;

auto HnswIndex::init(std::size_t dim, kernels::Metric metric, const HnswBuildParams& params)
    -> std::expected<void, core::error> {
    return impl_->init(dim, metric, params);
}

auto HnswIndex::add(std::uint64_t id, std::span<const float> vector) -> std::expected<void, core::error> {
    return impl_->add(id, vector);
}

auto HnswIndex::add_batch(std::span<const std::uint64_t> ids, std::span<const float> vectors)
    -> std::expected<void, core::error> {
    const std::size_t dim = impl_->state_.dim;
    if (dim == 0 || vectors.size() != ids.size() * dim) {
        return core::fail(core::error_code::dimension_mismatch, "batch size mismatch", "index.hnsw");
    }
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (auto r = impl_->add(ids[i], vectors.subspan(i * dim, dim)); !r) return r;
    }
    return {};
}

auto HnswIndex::search(std::span<const float> query, const HnswSearchParams& params) const
    -> std::expected<std::vector<search::Hit>, core::error> {
    return impl_->search(query, params);
}

auto HnswIndex::mark_deleted(std::uint64_t id) -> std::expected<void, core::error> {
    if (impl_->id_to_idx_.count(id) == 0) {
        return core::fail(core::error_code::not_found, "id not in index", "index.hnsw");
    }
    impl_->deleted_.add(id);
    return {};
}

auto HnswIndex::is_deleted(std::uint64_t id) const noexcept -> bool { return impl_->deleted_.contains(id); }
auto HnswIndex::contains(std::uint64_t id) const noexcept -> bool { return impl_->id_to_idx_.count(id) > 0; }

auto HnswIndex::serialize() const -> std::expected<std::vector<std::uint8_t>, core::error> {
    using core::error_code;
    const auto& s = impl_->state_;
    if (!s.initialized) {
        return core::fail(error_code::not_initialized, "index not initialized", "index.hnsw");
    }
    core::ByteWriter w(64 + impl_->vectors_.size() * sizeof(float) + impl_->nodes_.size() * 64);
    w.put_bytes({reinterpret_cast<const std::uint8_t*>(kMagic), sizeof(kMagic)});
    w.put<std::uint32_t>(kFormatVersion);
    w.put<std::uint8_t>(static_cast<std::uint8_t>(s.metric));
    w.put<std::uint8_t>(s.params.keep_pruned_connections ? 1 : 0);
    w.put<std::uint16_t>(0);
    w.put<std::uint32_t>(static_cast<std::uint32_t>(s.dim));
    w.put<std::uint32_t>(s.params.M);
    w.put<std::uint32_t>(s.params.max_M0);
    w.put<std::uint32_t>(s.params.efConstruction);
    w.put<std::uint32_t>(s.params.seed);
    w.put<std::uint64_t>(s.params.max_elements);
    w.put<std::uint64_t>(impl_->nodes_.size());
    w.put<std::uint32_t>(s.entry_point);
    w.put<std::uint32_t>(s.max_level);
    for (const auto& n : impl_->nodes_) {
        w.put<std::uint64_t>(n.id);
        w.put<std::uint32_t>(n.level);
        for (const auto& links : n.links) {
            w.put<std::uint32_t>(static_cast<std::uint32_t>(links.size()));
            for (const std::uint32_t nb : links) w.put<std::uint32_t>(nb);
        }
    }
    w.put_floats(impl_->vectors_);

    const std::size_t tomb_bytes = impl_->deleted_.getSizeInBytes(true);
    std::vector<char> tomb(tomb_bytes);
    impl_->deleted_.write(tomb.data(), true);
    w.put<std::uint64_t>(tomb_bytes);
    w.put_bytes({reinterpret_cast<const std::uint8_t*>(tomb.data()), tomb.size()});

    w.put<std::uint32_t>(core::crc32c(w.view()));
    return std::move(w).take();
}

auto HnswIndex::deserialize(std::span<const std::uint8_t> blob) -> std::expected<HnswIndex, core::error> {
    using core::error_code;
    auto corrupt = [](const char* what) {
        return core::fail(error_code::data_integrity, std::string("hnsw blob: ") + what, "index.hnsw");
    };
    if (blob.size() < sizeof(kMagic) + 4) return corrupt("too short");
    std::uint32_t stored_crc = 0;
    std::memcpy(&stored_crc, blob.data() + blob.size() - 4, 4);
    const auto body = blob.first(blob.size() - 4);
    if (core::crc32c(body) != stored_crc) return corrupt("crc mismatch");

    core::ByteReader in(body);
    std::span<const std::uint8_t> magic;
    if (!in.get_bytes(sizeof(kMagic), magic) || std::memcmp(magic.data(), kMagic, sizeof(kMagic)) != 0) {
        return corrupt("bad magic");
    }
    std::uint32_t version = 0, dim = 0, entry = 0, max_level = 0;
    std::uint8_t metric = 0, keep_pruned = 0;
    std::uint16_t reserved = 0;
    std::uint64_t count = 0;
    HnswBuildParams params;
    std::uint64_t max_elements = 0;
    if (!in.get(version) || !in.get(metric) || !in.get(keep_pruned) || !in.get(reserved) ||
        !in.get(dim) || !in.get(params.M) || !in.get(params.max_M0) || !in.get(params.efConstruction) ||
        !in.get(params.seed) || !in.get(max_elements) || !in.get(count) || !in.get(entry) ||
        !in.get(max_level)) {
        return corrupt("truncated header");
    }
    if (version != kFormatVersion) return corrupt("unsupported format version");
    if (metric > static_cast<std::uint8_t>(kernels::Metric::Cosine)) return corrupt("unknown metric");
    params.keep_pruned_connections = keep_pruned != 0;
    params.max_elements = static_cast<std::size_t>(max_elements);
    // Each node needs at least id + level + one link count
    if (count > in.remaining() / 16 || count >= kInvalid) return corrupt("node count out of range");

    HnswIndex idx;
    if (auto r = idx.impl_->init(dim, static_cast<kernels::Metric>(metric), params); !r) {
        return corrupt("invalid parameters");
    }
    auto& impl = *idx.impl_;
    impl.nodes_.resize(static_cast<std::size_t>(count));
    for (std::size_t i = 0; i < count; ++i) {
        auto& n = impl.nodes_[i];
        if (!in.get(n.id) || !in.get(n.level)) return corrupt("truncated node");
        if (n.level > kMaxLevel) return corrupt("node level out of range");
        n.links.resize(n.level + 1);
        for (auto& links : n.links) {
            std::uint32_t nl = 0;
            if (!in.get(nl) || nl > count || nl > in.remaining() / 4) return corrupt("bad link count");
            links.resize(nl);
            for (auto& nb : links) {
                if (!in.get(nb)) return corrupt("truncated links");
            }
        }
        if (!impl.id_to_idx_.emplace(n.id, static_cast<std::uint32_t>(i)).second) {
            return corrupt("duplicate id");
        }
    }
    if (!in.get_floats(static_cast<std::size_t>(count) * dim, impl.vectors_)) return corrupt("truncated vectors");

    std::uint64_t tomb_bytes = 0;
    std::span<const std::uint8_t> tomb;
    if (!in.get(tomb_bytes) || !in.get_bytes(static_cast<std::size_t>(tomb_bytes), tomb)) {
        return corrupt("truncated tombstones");
    }
    try {
        impl.deleted_ = roaring::Roaring64Map::readSafe(reinterpret_cast<const char*>(tomb.data()), tomb.size());
    } catch (const std::exception&) {
        return corrupt("invalid tombstone bitmap");
    }
    if (in.remaining() != 0) return corrupt("trailing bytes");

    impl.state_.entry_point = count == 0 ? kInvalid : entry;
    impl.state_.max_level = count == 0 ? 0 : max_level;
    if (!impl.check_invariants()) return corrupt("graph invariants violated");
    impl.state_.rng.seed(params.seed ^ count);
    return idx;
}

auto HnswIndex::reachable_count_base_layer() const -> std::size_t {
    const auto& nodes = impl_->nodes_;
    if (nodes.empty()) return 0;
    std::vector<bool> seen(nodes.size(), false);
    std::vector<std::uint32_t> stack{impl_->state_.entry_point};
    seen[impl_->state_.entry_point] = true;
    std::size_t reached = 0;
    while (!stack.empty()) {
        const auto cur = stack.back();
        stack.pop_back();
        ++reached;
        for (const auto nb : nodes[cur].links[0]) {
            if (!seen[nb]) {
                seen[nb] = true;
                stack.push_back(nb);
            }
        }
    }
    return reached;
}

auto HnswIndex::is_initialized() const noexcept -> bool { return impl_->state_.initialized; }
auto HnswIndex::dimension() const noexcept -> std::size_t { return impl_->state_.dim; }
auto HnswIndex::metric() const noexcept -> kernels::Metric { return impl_->state_.metric; }
auto HnswIndex::size() const noexcept -> std::size_t { return impl_->nodes_.size(); }

} // namespace vexlake::index
