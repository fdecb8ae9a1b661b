#include "vexlake/engine.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "vexlake/buffer/write_buffer.hpp"
#include "vexlake/core/cancellation.hpp"
#include "vexlake/core/platform_utils.hpp"
#include "vexlake/core/thread_pool.hpp"
#include "vexlake/kernels/dispatch.hpp"
#include "vexlake/search/top_k.hpp"
#include "vexlake/storage/data_file.hpp"
#include "vexlake/storage/layout.hpp"
#include "vexlake/storage/local_object_store.hpp"
#include "vexlake/storage/segment.hpp"
#include "vexlake/storage/segment_writer.hpp"

namespace vexlake {

auto version() noexcept -> const char* { return "0.3.0"; }

namespace {

constexpr std::size_t kParallelScanRows = 16384;

auto not_ready() -> std::unexpected<core::error> {
    return core::fail(core::error_code::not_initialized, "engine is not open", "engine");
}

/** Where a candidate came from, for payload retrieval. */
struct Origin {
    storage::SegmentPtr segment;   // null for buffered rows
    std::uint32_t row{0};
    std::vector<std::uint8_t> buffered_payload;
};

enum class BufferVerdict { Live, Deleted, Unknown };

auto buffer_verdict(const std::vector<const buffer::MemTable*>& layers, std::uint64_t id) -> BufferVerdict {
    for (const auto* layer : layers) {
        if (layer->contains_live(id)) return BufferVerdict::Live;
        if (layer->deletes(id)) return BufferVerdict::Deleted;
    }
    return BufferVerdict::Unknown;
}

} // namespace

class Engine::Impl {
public:
    EngineConfig cfg;
    std::shared_ptr<storage::ObjectStore> store;
    std::shared_ptr<storage::StorageClient> client;
    std::unique_ptr<version::VersionManager> versions;
    std::unique_ptr<buffer::WriteBuffer> buffer;
    std::unique_ptr<storage::SegmentCache> cache;
    std::unique_ptr<compaction::Compactor> compactor;
    std::unique_ptr<core::ThreadPool> pool;
    const kernels::KernelOps* ops{nullptr};

    std::mutex write_mutex;     // liveness check + append are one step
    std::mutex flush_mutex;     // one flush or clear at a time
    std::atomic<bool> open{false};

    auto prepare_vector(std::span<const float> v) const -> std::expected<std::vector<float>, core::error> {
        if (v.size() != cfg.dimension) {
            return core::fail(core::error_code::dimension_mismatch,
                              "expected dimension " + std::to_string(cfg.dimension) + ", got " +
                                  std::to_string(v.size()),
                              "engine");
        }
        std::vector<float> out(v.begin(), v.end());
        if (cfg.metric == kernels::Metric::Cosine) kernels::normalize(out);
        return out;
    }

    /** Row of `id` in a live copy within `v`, if any. */
    auto find_in_version(const version::VersionDescriptor& v, std::uint64_t id)
        -> std::expected<std::optional<std::pair<storage::SegmentPtr, std::uint32_t>>, core::error> {
        for (auto it = v.data_files.rbegin(); it != v.data_files.rend(); ++it) {
            const auto& f = *it;
            if (id < f.min_id || id > f.max_id || f.deleted_ids.contains(id)) continue;
            auto seg = cache->acquire(v, f);
            if (!seg) return std::unexpected(seg.error());
            if (const auto* row = (*seg)->find(id)) return std::make_pair(*seg, *row);
        }
        return std::nullopt;
    }

    auto is_live(std::uint64_t id) -> std::expected<bool, core::error> {
        version::VersionPin snapshot;
        // Pinning inside the buffer lock means a concurrent flush is seen either as buffered
        // generations or as the published version that replaced them, and GC keeps its files.
        const auto verdict = buffer->read([&](const std::vector<const buffer::MemTable*>& layers) {
            snapshot = versions->pin();
            return buffer_verdict(layers, id);
        });
        if (verdict != BufferVerdict::Unknown) return verdict == BufferVerdict::Live;
        auto found = find_in_version(*snapshot.descriptor(), id);
        if (!found) return std::unexpected(found.error());
        return found->has_value();
    }

    void after_publish(const version::VersionDescriptor& v) {
        std::vector<std::string> keep;
        keep.reserve(v.data_files.size());
        for (const auto& f : v.data_files) keep.push_back(f.path);
        cache->retain_only(keep);
    }

    void collect_garbage() {
        if (auto gc = versions->collect_garbage(); !gc) {
            std::cerr << "[vexlake][engine] garbage collection failed: " << gc.error().message << "\n";
        }
    }

    void maybe_flush(bool crossed) {
        if (!crossed) return;
        if (auto r = flush(); !r) {
            // The write itself is durable in the WAL; the next flush retries these generations.
            std::cerr << "[vexlake][engine] threshold flush failed: " << r.error().message << "\n";
        }
    }

    auto flush() -> std::expected<std::uint64_t, core::error> {
        std::lock_guard<std::mutex> lock(flush_mutex);
        auto batch = buffer->freeze();
        if (!batch) return std::unexpected(batch.error());
        if (batch->empty()) return versions->current_id();

        // Net effect of the frozen generations, oldest first.
        std::unordered_map<std::uint64_t, storage::RowRef> net;
        roaring::Roaring64Map deletes;
        for (const auto& gen : batch->generations) {
            const auto& gen_deletes = gen->deleted_ids();
            for (auto it = gen_deletes.begin(); it != gen_deletes.end(); ++it) net.erase(*it);
            deletes |= gen_deletes;
            const auto ids = gen->ids();
            for (std::size_t r = 0; r < ids.size(); ++r) {
                net[ids[r]] = storage::RowRef{ids[r], gen->vectors().subspan(r * cfg.dimension, cfg.dimension),
                                              gen->payload_at(r)};
            }
        }

        std::optional<storage::WrittenSegment> written;
        if (!net.empty()) {
            std::vector<storage::RowRef> rows;
            rows.reserve(net.size());
            for (auto& [id, row] : net) rows.push_back(row);
            auto seg = storage::write_segment(*client, cfg.partition, [this] { return versions->allocate_seq(); },
                                              cfg.dimension, cfg.metric, cfg.hnsw, std::move(rows));
            if (!seg) return std::unexpected(seg.error());
            written = std::move(*seg);
        }

        const std::uint64_t through = batch->through_generation;
        auto published = versions->commit([&](version::VersionDescriptor& next) -> std::expected<void, core::error> {
            if (!deletes.isEmpty()) {
                for (auto& f : next.data_files) {
                    roaring::Roaring64Map hits;
                    for (auto it = deletes.begin(); it != deletes.end(); ++it) {
                        const std::uint64_t id = *it;
                        if (id < f.min_id || id > f.max_id || f.deleted_ids.contains(id)) continue;
                        auto seg = cache->acquire(next, f);
                        if (!seg) {
                            // A compaction replaced the base and collected this file; redo against its output.
                            if (seg.error().code == core::error_code::not_found &&
                                versions->current_id() != next.parent_version) {
                                return core::fail(core::error_code::conflict, "flush base superseded", "engine");
                            }
                            return std::unexpected(seg.error());
                        }
                        if ((*seg)->find(id)) hits.add(id);
                    }
                    f.deleted_ids |= hits;
                }
            }
            if (written) {
                next.data_files.push_back(written->data);
                if (written->index) next.index_files.push_back(*written->index);
            }
            next.wal_generation = std::max(next.wal_generation, through);
            return {};
        });
        if (!published) {
            if (written && published.error().code != core::error_code::unavailable) {
                storage::discard_segment(*client, *written);
            }
            return std::unexpected(published.error());
        }
        if (auto r = buffer->complete_flush(through); !r) {
            std::cerr << "[vexlake][engine] wal cleanup after flush failed: " << r.error().message << "\n";
        }
        after_publish(**published);
        collect_garbage();
        if (core::debug_enabled()) {
            std::cerr << "[vexlake][engine] flushed " << net.size() << " rows and " << deletes.cardinality()
                      << " deletes into version " << (*published)->version_id << "\n";
        }
        return (*published)->version_id;
    }

    struct Candidates {
        std::vector<std::vector<search::Hit>> lists;
        std::unordered_map<std::uint64_t, Origin> origins;
    };

    auto search_segments(const version::VersionDescriptor& v, std::span<const float> query, std::uint32_t k,
                         std::uint32_t ef, const roaring::Roaring64Map* buffer_deletes,
                         const core::CancellationToken& cancel, Candidates& out) -> std::expected<void, core::error> {
        for (const auto& f : v.data_files) {
            auto seg = cache->acquire(v, f);
            if (!seg) return std::unexpected(seg.error());
            roaring::Roaring64Map excluded = f.deleted_ids;
            if (buffer_deletes != nullptr) excluded |= *buffer_deletes;

            std::expected<std::vector<search::Hit>, core::error> hits;
            if ((*seg)->index) {
                index::HnswSearchParams hp;
                hp.efSearch = ef;
                hp.k = k;
                hp.exclude = &excluded;
                hp.cancel = &cancel;
                hits = (*seg)->index->search(query, hp);
            } else {
                std::vector<search::CandidateBlock> blocks = (*seg)->blocks;
                for (auto& b : blocks) b.excluded = &excluded;
                search::TopKParams tp;
                tp.k = k;
                tp.metric = cfg.metric;
                tp.ops = ops;
                tp.cancel = &cancel;
                hits = (*seg)->size() >= kParallelScanRows ? search::top_k_parallel(query, blocks, tp, *pool)
                                                           : search::top_k(query, blocks, tp);
            }
            if (!hits) return std::unexpected(hits.error());
            for (const auto& h : *hits) {
                if (const auto* row = (*seg)->find(h.id)) out.origins.try_emplace(h.id, Origin{*seg, *row, {}});
            }
            out.lists.push_back(std::move(*hits));
        }
        return {};
    }

    auto finish(Candidates& c, std::uint32_t k, bool with_payload, const core::CancellationToken& cancel)
        -> std::expected<std::vector<SearchResult>, core::error> {
        std::size_t total = 0;
        for (const auto& l : c.lists) total += l.size();
        auto merged = search::merge_top_k(std::move(c.lists), total, cfg.metric);

        std::vector<SearchResult> out;
        out.reserve(std::min<std::size_t>(k, merged.size()));
        std::unordered_set<std::uint64_t> seen;
        for (const auto& h : merged) {
            if (out.size() >= k) break;
            if (!seen.insert(h.id).second) continue;   // same row seen in a buffer and its just-published file
            out.push_back(SearchResult{h.id, h.score, {}});
        }
        if (cancel.should_stop()) {
            return core::fail(core::error_code::cancelled, "query cancelled or past its deadline", "engine");
        }
        if (with_payload) {
            for (auto& r : out) {
                auto it = c.origins.find(r.id);
                if (it == c.origins.end()) continue;
                auto& origin = it->second;
                if (!origin.segment) {
                    r.payload = std::move(origin.buffered_payload);
                    continue;
                }
                const auto& rows = origin.segment->rows;
                auto p = storage::read_payload(*client, origin.segment->path, rows.payload_offsets[origin.row],
                                               rows.payload_lengths[origin.row]);
                if (!p) return std::unexpected(p.error());
                r.payload = std::move(*p);
            }
        }
        return out;
    }

    auto make_token(const SearchOptions& opts) const -> core::CancellationToken {
        const auto timeout = opts.timeout.count() > 0 ? opts.timeout : cfg.query_timeout;
        auto token = timeout.count() > 0 ? core::CancellationToken::with_timeout(timeout) : core::CancellationToken{};
        token.link(opts.cancel);
        return token;
    }

    auto check_query(std::span<const float> query, std::uint32_t k, std::uint32_t& ef) const
        -> std::expected<void, core::error> {
        if (!open.load()) return not_ready();
        if (query.size() != cfg.dimension) {
            return core::fail(core::error_code::dimension_mismatch,
                              "query dimension " + std::to_string(query.size()) + " != " +
                                  std::to_string(cfg.dimension),
                              "engine");
        }
        if (k == 0) return core::fail(core::error_code::invalid_argument, "k must be > 0", "engine");
        if (ef == 0) ef = cfg.default_ef;
        ef = std::max(ef, k);
        return {};
    }
};

Engine::Engine(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Engine::~Engine() {
    if (impl_ && impl_->open.load()) {
        if (auto r = shutdown(); !r) {
            std::cerr << "[vexlake][engine] shutdown during destruction failed: " << r.error().message << "\n";
        }
    }
}

auto Engine::open(const EngineConfig& cfg, std::shared_ptr<storage::ObjectStore> store)
    -> std::expected<std::unique_ptr<Engine>, core::error> {
    if (auto v = validate(cfg); !v) return std::unexpected(v.error());
    auto impl = std::make_unique<Impl>();
    impl->cfg = cfg;
    if (!store) {
        auto local = storage::LocalObjectStore::open(cfg.root);
        if (!local) return std::unexpected(local.error());
        store = std::move(*local);
    }
    impl->store = std::move(store);
    impl->client = std::make_shared<storage::StorageClient>(impl->store, cfg.retry);

    auto versions = version::VersionManager::open(impl->client, {cfg.dimension, cfg.metric});
    if (!versions) return std::unexpected(versions.error());
    impl->versions = std::move(*versions);
    if (auto swept = impl->versions->sweep_orphans(); !swept) {
        std::cerr << "[vexlake][engine] orphan sweep failed: " << swept.error().message << "\n";
    }

    buffer::WriteBufferOptions bopts;
    bopts.wal_dir = cfg.effective_wal_dir();
    bopts.dim = cfg.dimension;
    bopts.flush_threshold_bytes = cfg.flush_threshold_bytes;
    bopts.sync_wal = cfg.sync_wal;
    auto wb = buffer::WriteBuffer::open(bopts, impl->versions->current()->wal_generation);
    if (!wb) return std::unexpected(wb.error());
    impl->buffer = std::move(*wb);

    impl->cache = std::make_unique<storage::SegmentCache>(impl->client, cfg.dimension, cfg.metric);
    impl->pool = std::make_unique<core::ThreadPool>(cfg.search_threads);
    impl->ops = cfg.kernel_backend == "auto" ? &kernels::select_backend_auto()
                                             : &kernels::select_backend(cfg.kernel_backend);

    Impl* raw = impl.get();
    impl->compactor = std::make_unique<compaction::Compactor>(
        *impl->versions, impl->client, cfg.hnsw, cfg.compaction,
        [raw](const version::DescriptorPtr& v) { raw->after_publish(*v); });
    impl->open.store(true);
    if (cfg.background_compaction) impl->compactor->start();

    const auto st = impl->buffer->stats();
    std::cerr << "[vexlake][engine] opened " << cfg.root.string() << " at version " << impl->versions->current_id()
              << " (dim " << cfg.dimension << ", " << kernels::to_string(cfg.metric) << ", kernels "
              << impl->ops->name << ", " << st.replayed_frames << " wal frames replayed)\n";
    return std::unique_ptr<Engine>(new Engine(std::move(impl)));
}

auto Engine::insert(std::uint64_t id, std::span<const float> vector, std::span<const std::uint8_t> payload)
    -> std::expected<void, core::error> {
    auto& d = *impl_;
    if (!d.open.load()) return not_ready();
    auto v = d.prepare_vector(vector);
    if (!v) return std::unexpected(v.error());

    bool crossed = false;
    {
        std::lock_guard<std::mutex> lock(d.write_mutex);
        auto live = d.is_live(id);
        if (!live) return std::unexpected(live.error());
        if (*live) {
            return core::fail(core::error_code::already_exists, "id " + std::to_string(id) + " already exists",
                              "engine");
        }
        wal::WalRecord rec{wal::OpKind::Insert, id, std::move(*v), {payload.begin(), payload.end()}};
        auto appended = d.buffer->append(rec);
        if (!appended) return std::unexpected(appended.error());
        crossed = *appended;
    }
    d.maybe_flush(crossed);
    return {};
}

auto Engine::remove(std::uint64_t id) -> std::expected<void, core::error> {
    auto& d = *impl_;
    if (!d.open.load()) return not_ready();
    bool crossed = false;
    {
        std::lock_guard<std::mutex> lock(d.write_mutex);
        auto live = d.is_live(id);
        if (!live) return std::unexpected(live.error());
        if (!*live) return core::fail(core::error_code::not_found, "id " + std::to_string(id) + " not found", "engine");
        auto appended = d.buffer->append(wal::WalRecord{wal::OpKind::Delete, id, {}, {}});
        if (!appended) return std::unexpected(appended.error());
        crossed = *appended;
    }
    d.maybe_flush(crossed);
    return {};
}

auto Engine::search(std::span<const float> query, std::uint32_t k, std::uint32_t ef, const SearchOptions& opts)
    -> std::expected<std::vector<SearchResult>, core::error> {
    auto& d = *impl_;
    if (auto r = d.check_query(query, k, ef); !r) return std::unexpected(r.error());
    const auto cancel = d.make_token(opts);

    Impl::Candidates cand;
    version::VersionPin pin;
    // The pin is taken while the generations are fixed, so a concurrent flush shows up either
    // as buffered layers or as the version that replaced them. Scanning happens unlocked.
    const auto layers = d.buffer->snapshot([&] { pin = d.versions->pin(); });
    roaring::Roaring64Map buffer_deletes;
    for (const auto& layer : layers) {
        if (layer->live_count() > 0) {
            auto blocks = search::make_blocks(layer->ids(), layer->vectors(), d.cfg.dimension, 1024,
                                              &buffer_deletes);
            search::TopKParams tp;
            tp.k = k;
            tp.metric = d.cfg.metric;
            tp.ops = d.ops;
            tp.cancel = &cancel;
            auto hits = search::top_k(query, blocks, tp);
            if (!hits) return std::unexpected(hits.error());
            for (const auto& h : *hits) {
                Origin o;
                if (opts.with_payload) {
                    if (auto rec = layer->get(h.id)) o.buffered_payload = std::move(rec->payload);
                }
                cand.origins.try_emplace(h.id, std::move(o));
            }
            cand.lists.push_back(std::move(*hits));
        }
        buffer_deletes |= layer->deleted_ids();
    }

    if (auto r = d.search_segments(*pin.descriptor(), query, k, ef, &buffer_deletes, cancel, cand); !r) {
        return std::unexpected(r.error());
    }
    return d.finish(cand, k, opts.with_payload, cancel);
}

auto Engine::pin() -> version::VersionPin { return impl_->versions->pin(); }

auto Engine::search_at(const version::VersionPin& pin, std::span<const float> query, std::uint32_t k,
                       std::uint32_t ef, const SearchOptions& opts)
    -> std::expected<std::vector<SearchResult>, core::error> {
    auto& d = *impl_;
    if (auto r = d.check_query(query, k, ef); !r) return std::unexpected(r.error());
    if (!pin) return core::fail(core::error_code::invalid_argument, "empty version pin", "engine");
    const auto cancel = d.make_token(opts);
    Impl::Candidates cand;
    if (auto r = d.search_segments(*pin.descriptor(), query, k, ef, nullptr, cancel, cand); !r) {
        return std::unexpected(r.error());
    }
    return d.finish(cand, k, opts.with_payload, cancel);
}

auto Engine::get(std::uint64_t id) -> std::expected<buffer::Record, core::error> {
    auto& d = *impl_;
    if (!d.open.load()) return not_ready();
    version::VersionPin pin;
    std::optional<buffer::Record> buffered;
    const auto verdict = d.buffer->read([&](const std::vector<const buffer::MemTable*>& layers) {
        pin = d.versions->pin();
        for (const auto* layer : layers) {
            if (auto rec = layer->get(id)) {
                buffered = std::move(rec);
                return BufferVerdict::Live;
            }
            if (layer->deletes(id)) return BufferVerdict::Deleted;
        }
        return BufferVerdict::Unknown;
    });
    if (verdict == BufferVerdict::Live) return std::move(*buffered);
    auto missing = [id] {
        return core::fail(core::error_code::not_found, "id " + std::to_string(id) + " not found", "engine");
    };
    if (verdict == BufferVerdict::Deleted) return missing();

    auto found = d.find_in_version(*pin.descriptor(), id);
    if (!found) return std::unexpected(found.error());
    if (!found->has_value()) return missing();
    const auto& [seg, row] = **found;
    buffer::Record rec;
    rec.id = id;
    const auto v = seg->vector_at(row);
    rec.vector.assign(v.begin(), v.end());
    auto payload = storage::read_payload(*d.client, seg->path, seg->rows.payload_offsets[row],
                                         seg->rows.payload_lengths[row]);
    if (!payload) return std::unexpected(payload.error());
    rec.payload = std::move(*payload);
    return rec;
}

auto Engine::flush() -> std::expected<std::uint64_t, core::error> {
    if (!impl_->open.load()) return not_ready();
    return impl_->flush();
}

auto Engine::compact() -> std::expected<compaction::CompactionResult, core::error> {
    if (!impl_->open.load()) return not_ready();
    return impl_->compactor->run_once();
}

auto Engine::clear() -> std::expected<void, core::error> {
    auto& d = *impl_;
    if (!d.open.load()) return not_ready();
    std::lock_guard<std::mutex> flock(d.flush_mutex);
    std::lock_guard<std::mutex> wlock(d.write_mutex);
    const std::uint64_t active = d.buffer->stats().active_generation;
    auto published = d.versions->commit([&](version::VersionDescriptor& next) -> std::expected<void, core::error> {
        next.data_files.clear();
        next.index_files.clear();
        next.wal_generation = std::max(next.wal_generation, active);
        return {};
    });
    if (!published) return std::unexpected(published.error());
    if (auto r = d.buffer->discard_all(); !r) return std::unexpected(r.error());
    d.cache->clear();
    d.collect_garbage();
    std::cerr << "[vexlake][engine] cleared; version " << (*published)->version_id << "\n";
    return {};
}

auto Engine::stats() const -> EngineStats {
    const auto& d = *impl_;
    EngineStats st;
    const auto cur = d.versions->current();
    st.version_id = cur->version_id;
    st.data_files = cur->data_files.size();
    st.index_files = cur->index_files.size();
    st.stored_vectors = cur->total_vectors;
    st.tombstones = cur->deleted_ids.cardinality();
    const auto bs = d.buffer->stats();
    st.buffered_records = bs.live_records;
    st.buffered_ops = bs.buffered_ops;
    st.buffered_bytes = bs.buffered_bytes;
    st.pinned_versions = d.versions->pinned_count();
    const auto cs = d.cache->stats();
    st.cached_segments = cs.entries;
    st.index_fallbacks = cs.index_fallbacks;
    st.storage_retries = d.client->stats().retries;
    st.kernel_backend = std::string(d.ops->name);
    return st;
}

auto Engine::health_check() const noexcept -> bool {
    if (!impl_ || !impl_->open.load()) return false;
    try {
        auto listed = impl_->client->list(std::string(storage::kMetadataPrefix));
        if (!listed) {
            std::cerr << "[vexlake][engine] health check: " << listed.error().message << "\n";
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[vexlake][engine] health check threw: " << e.what() << "\n";
        return false;
    }
}

auto Engine::shutdown() -> std::expected<void, core::error> {
    auto& d = *impl_;
    if (!d.open.load()) return not_ready();
    d.compactor->stop();
    auto flushed = d.flush();
    d.open.store(false);
    if (!flushed) return std::unexpected(flushed.error());
    std::cerr << "[vexlake][engine] shut down at version " << *flushed << "\n";
    return {};
}

auto Engine::dimension() const noexcept -> std::size_t { return impl_->cfg.dimension; }
auto Engine::metric() const noexcept -> kernels::Metric { return impl_->cfg.metric; }
auto Engine::config() const noexcept -> const EngineConfig& { return impl_->cfg; }

} // namespace vexlake
