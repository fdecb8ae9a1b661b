#include "vexlake/version/version_manager.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <cstdio>
#include <iostream>
#include <random>
#include <thread>

#include "vexlake/core/platform_utils.hpp"
#include "vexlake/storage/layout.hpp"

namespace vexlake::version {

namespace {

auto now_ms() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto make_writer_nonce() -> std::string {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd() ^
                        static_cast<std::uint64_t>(now_ms()));
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
    return buf;
}

auto as_bytes(const std::string& s) -> std::span<const std::uint8_t> {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace

void VersionPin::release() noexcept {
    if (registry_ && desc_) {
        std::lock_guard<std::mutex> lock(registry_->mu);
        auto it = registry_->counts.find(desc_->version_id);
        if (it != registry_->counts.end() && --it->second == 0) registry_->counts.erase(it);
    }
    registry_.reset();
    desc_.reset();
}

VersionManager::VersionManager(std::shared_ptr<storage::StorageClient> client, const VersionManagerOptions& opts)
    : client_(std::move(client)), opts_(opts), writer_(make_writer_nonce()) {}

auto VersionManager::open(std::shared_ptr<storage::StorageClient> client, const VersionManagerOptions& opts)
    -> std::expected<std::unique_ptr<VersionManager>, core::error> {
    if (opts.dimension == 0) {
        return core::fail(core::error_code::config_invalid, "dimension must be > 0", "version.manager");
    }
    std::unique_ptr<VersionManager> vm(new VersionManager(std::move(client), opts));

    // Start from the larger of the hint and the listing; both may lag, so read forward by path.
    std::uint64_t start = 0;
    if (auto hint = vm->client_->get_file(std::string(storage::kLatestPath)); hint) {
        std::uint64_t v = 0;
        const auto* b = reinterpret_cast<const char*>(hint->data());
        if (std::from_chars(b, b + hint->size(), v).ec == std::errc{}) start = v;
    } else if (hint.error().code != core::error_code::not_found) {
        return std::unexpected(hint.error());
    }
    auto listed = vm->client_->list(std::string(storage::kMetadataPrefix));
    if (!listed) return std::unexpected(listed.error());
    for (const auto& key : *listed) {
        if (auto v = storage::parse_version_path(key)) start = std::max(start, *v);
    }

    VersionDescriptor base;
    base.dimension = opts.dimension;
    base.metric = opts.metric;
    if (start > 0) {
        auto loaded = vm->load_version(start);
        if (!loaded) return std::unexpected(loaded.error());
        base = std::move(*loaded);
        if (base.dimension != opts.dimension || base.metric != opts.metric) {
            return core::fail(core::error_code::config_invalid,
                              "namespace holds dimension " + std::to_string(base.dimension) + "/" +
                                  std::string(kernels::to_string(base.metric)) + ", configured " +
                                  std::to_string(opts.dimension) + "/" +
                                  std::string(kernels::to_string(opts.metric)),
                              "version.manager");
        }
    }
    vm->table_base_ = base.version_id;
    vm->next_seq_.store(base.next_seq);
    vm->install(std::make_shared<const VersionDescriptor>(std::move(base)));
    if (auto r = vm->refresh(); !r) return std::unexpected(r.error());
    if (core::debug_enabled()) {
        std::cerr << "[vexlake][version] opened at version " << vm->current_id() << " writer " << vm->writer_
                  << "\n";
    }
    return vm;
}

auto VersionManager::load_version(std::uint64_t id) -> std::expected<VersionDescriptor, core::error> {
    auto bytes = client_->get_file(storage::version_path(id));
    if (!bytes) return std::unexpected(bytes.error());
    auto d = decode_descriptor(*bytes);
    if (!d) return std::unexpected(d.error());
    if (d->version_id != id) {
        return core::fail(core::error_code::data_integrity,
                          "descriptor " + storage::version_path(id) + " carries id " + std::to_string(d->version_id),
                          "version.manager");
    }
    return d;
}

void VersionManager::install(DescriptorPtr d) {
    std::unique_lock<std::shared_mutex> lock(table_mutex_);
    const std::uint64_t id = d->version_id;
    if (id != table_base_ + table_.size()) return; // already installed
    raise_next_seq(d->next_seq);
    table_.push_back(std::move(d));
    current_id_.store(id, std::memory_order_release);
}

void VersionManager::raise_next_seq(std::uint64_t at_least) noexcept {
    std::uint64_t seq = next_seq_.load();
    while (seq < at_least && !next_seq_.compare_exchange_weak(seq, at_least)) {
    }
}

auto VersionManager::current() const -> DescriptorPtr {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    return table_.back();
}

auto VersionManager::get(std::uint64_t version_id) const -> std::expected<DescriptorPtr, core::error> {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    if (version_id < table_base_ || version_id >= table_base_ + table_.size()) {
        return core::fail(core::error_code::not_found, "version " + std::to_string(version_id) + " not loaded",
                          "version.manager");
    }
    return table_[version_id - table_base_];
}

auto VersionManager::refresh() -> std::expected<std::uint64_t, core::error> {
    for (;;) {
        const std::uint64_t next = current_id() + 1;
        auto d = load_version(next);
        if (!d) {
            if (d.error().code == core::error_code::not_found) return current_id();
            return std::unexpected(d.error());
        }
        install(std::make_shared<const VersionDescriptor>(std::move(*d)));
    }
}

void VersionManager::write_latest_hint(std::uint64_t id) {
    const std::string body = std::to_string(id);
    if (auto r = client_->put_overwrite(std::string(storage::kLatestPath), as_bytes(body)); !r) {
        // Readers walk forward by path, so a stale hint only costs extra reads.
        std::cerr << "[vexlake][version] latest hint update failed: " << r.error().message << "\n";
    }
}

auto VersionManager::publish(VersionDescriptor next) -> std::expected<DescriptorPtr, core::error> {
    const std::uint64_t base = current_id();
    if (next.version_id != base + 1) {
        return core::fail(core::error_code::conflict,
                          "version " + std::to_string(next.version_id) + " does not succeed " + std::to_string(base),
                          "version.manager");
    }
    next.writer = writer_;
    const std::string body = encode_descriptor(next);
    const std::string path = storage::version_path(next.version_id);
    auto put = client_->put_file(path, as_bytes(body));
    if (!put) {
        const auto code = put.error().code;
        if (code != core::error_code::already_exists && code != core::error_code::unavailable) {
            return std::unexpected(put.error());
        }
        // Either another writer won, or our own write landed and was reported as failed.
        auto stored = load_version(next.version_id);
        if (!stored) {
            if (code == core::error_code::unavailable) return std::unexpected(put.error());
            return std::unexpected(stored.error());
        }
        if (stored->writer != writer_ || stored->created_at_ms != next.created_at_ms) {
            install(std::make_shared<const VersionDescriptor>(std::move(*stored)));
            return core::fail(core::error_code::conflict,
                              "version " + std::to_string(next.version_id) + " published by another writer",
                              "version.manager");
        }
    }
    auto published = std::make_shared<const VersionDescriptor>(std::move(next));
    install(published);
    write_latest_hint(published->version_id);
    if (core::debug_enabled()) {
        std::cerr << "[vexlake][version] published " << published->version_id << " (" << published->data_files.size()
                  << " data files, " << published->total_vectors << " vectors)\n";
    }
    return published;
}

auto VersionManager::commit(const Mutation& mutate) -> std::expected<DescriptorPtr, core::error> {
    std::uint32_t attempt = 0;
    for (;;) {
        const DescriptorPtr base = current();
        VersionDescriptor next = *base;
        next.version_id = base->version_id + 1;
        next.parent_version = base->version_id;
        next.created_at_ms = std::max(now_ms(), base->created_at_ms);
        std::expected<DescriptorPtr, core::error> published;
        if (auto r = mutate(next); !r) {
            published = std::unexpected(r.error());
        } else {
            next.next_seq = std::max(next.next_seq, next_seq_.load());
            next.recompute_totals();
            published = publish(std::move(next));
        }
        if (published) return published;
        if (published.error().code != core::error_code::conflict) return std::unexpected(published.error());

        ++attempt;
        if (auto r = refresh(); !r) return std::unexpected(r.error());
        const std::uint32_t shift = std::min<std::uint32_t>(attempt, 10);
        const auto delay = std::min(opts_.conflict_backoff_base * (1 << shift), opts_.conflict_backoff_cap);
        if (core::debug_enabled()) {
            std::cerr << "[vexlake][version] publish conflict (attempt " << attempt << "), retrying\n";
        }
        std::this_thread::sleep_for(delay);
    }
}

auto VersionManager::pin() -> VersionPin {
    std::lock_guard<std::mutex> lock(pins_->mu);
    auto d = current();
    ++pins_->counts[d->version_id];
    return VersionPin(pins_, std::move(d));
}

auto VersionManager::pin(std::uint64_t version_id) -> std::expected<VersionPin, core::error> {
    std::lock_guard<std::mutex> lock(pins_->mu);
    auto d = get(version_id);
    if (!d) return std::unexpected(d.error());
    ++pins_->counts[version_id];
    return VersionPin(pins_, std::move(*d));
}

auto VersionManager::pinned_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(pins_->mu);
    std::size_t n = 0;
    for (const auto& [id, c] : pins_->counts) n += c;
    return n;
}

auto VersionManager::live_paths() const -> std::unordered_set<std::string> {
    // Caller holds pins_->mu so no new pin can appear on an older version meanwhile.
    std::unordered_set<std::string> live;
    for (const auto& p : current()->referenced_paths()) live.insert(p);
    for (const auto& [id, count] : pins_->counts) {
        if (auto d = get(id)) {
            for (const auto& p : (*d)->referenced_paths()) live.insert(p);
        }
    }
    return live;
}

auto VersionManager::collect_garbage() -> std::expected<GcStats, core::error> {
    std::lock_guard<std::mutex> gc_lock(gc_mutex_);
    std::unordered_set<std::string> live;
    std::vector<std::string> candidates;
    std::uint64_t floor = 0;
    {
        std::lock_guard<std::mutex> lock(pins_->mu);
        const std::uint64_t cur = current_id();
        live = live_paths();
        floor = oldest_needed(cur);
        std::shared_lock<std::shared_mutex> tlock(table_mutex_);
        for (std::uint64_t v = table_base_; v < cur; ++v) {
            for (auto& p : table_[v - table_base_]->referenced_paths()) candidates.push_back(std::move(p));
        }
    }
    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

    const auto cur_paths = current()->referenced_paths();
    const std::unordered_set<std::string> in_current(cur_paths.begin(), cur_paths.end());
    GcStats st;
    for (const auto& path : candidates) {
        if (collected_.count(path)) continue;
        if (live.count(path)) {
            if (!in_current.count(path)) ++st.retained_pinned;
            continue;
        }
        if (auto r = client_->remove(path); !r) {
            ++st.failed;
            std::cerr << "[vexlake][gc] remove " << path << " failed: " << r.error().message << "\n";
            continue;
        }
        collected_.insert(path);
        ++st.removed;
    }
    // A failed remove is retried next round only while some loaded version still names it.
    if (st.failed == 0) trim_table(floor);
    if (core::debug_enabled() && (st.removed || st.retained_pinned)) {
        std::cerr << "[vexlake][gc] removed " << st.removed << ", retained for pins " << st.retained_pinned << "\n";
    }
    return st;
}

auto VersionManager::oldest_needed(std::uint64_t cur) const -> std::uint64_t {
    // Caller holds pins_->mu.
    std::uint64_t floor = cur;
    for (const auto& [id, count] : pins_->counts) floor = std::min(floor, id);
    return floor;
}

void VersionManager::trim_table(std::uint64_t floor) {
    std::lock_guard<std::mutex> lock(pins_->mu);
    floor = std::min(floor, oldest_needed(current_id()));
    std::unique_lock<std::shared_mutex> tlock(table_mutex_);
    if (floor <= table_base_) return;
    const auto drop = static_cast<std::ptrdiff_t>(floor - table_base_);
    table_.erase(table_.begin(), table_.begin() + drop);
    table_base_ = floor;

    std::unordered_set<std::string> named;
    for (const auto& d : table_) {
        for (auto& p : d->referenced_paths()) named.insert(std::move(p));
    }
    for (auto it = collected_.begin(); it != collected_.end();) {
        it = named.count(*it) ? std::next(it) : collected_.erase(it);
    }
}

auto VersionManager::loaded_versions() const -> std::size_t {
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    return table_.size();
}

auto VersionManager::sweep_orphans() -> std::expected<std::size_t, core::error> {
    std::lock_guard<std::mutex> gc_lock(gc_mutex_);
    std::unordered_set<std::string> live;
    std::uint64_t seq_bound = 0;
    {
        std::lock_guard<std::mutex> lock(pins_->mu);
        live = live_paths();
        seq_bound = current()->next_seq;
    }
    std::size_t removed = 0;
    std::uint64_t max_seen = 0;
    for (const auto prefix : {storage::kDataPrefix, storage::kIndexPrefix}) {
        auto keys = client_->list(std::string(prefix));
        if (!keys) return std::unexpected(keys.error());
        for (const auto& key : *keys) {
            const auto seq = storage::parse_file_seq(key);
            if (seq) max_seen = std::max(max_seen, *seq);
            // Sequence numbers at or past next_seq may belong to a flush still in flight.
            if (!seq || *seq >= seq_bound || live.count(key)) continue;
            if (auto r = client_->remove(key); !r) {
                std::cerr << "[vexlake][gc] orphan " << key << " not removed: " << r.error().message << "\n";
                continue;
            }
            ++removed;
        }
    }
    // Never hand out a number that is already on storage, published or not.
    raise_next_seq(max_seen + 1);
    if (removed) std::cerr << "[vexlake][gc] swept " << removed << " orphaned objects\n";
    return removed;
}

} // namespace vexlake::version
