#pragma once

/** \file version_manager.hpp
 *  \brief MVCC over version descriptors stored in the object namespace.
 *
 * Publication is compare-and-swap by write-once key: version n+1 is published by
 * put_if_absent("_metadata/version_<n+1>.json"). Losing the race yields conflict;
 * commit() re-reads the winner and re-applies its mutation until it succeeds.
 *
 * Published descriptors are kept in a table indexed by version id; `current()` is
 * one atomic id into that table. Version 0 is the implicit empty dataset and is
 * never written.
 *
 * Pins keep a version's files alive: collect_garbage() deletes files referenced
 * only by superseded, unpinned versions, then drops descriptors older than both
 * the current version and the oldest pin from the table.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "vexlake/error.hpp"
#include "vexlake/storage/storage_client.hpp"
#include "vexlake/version/version_descriptor.hpp"

namespace vexlake::version {

using DescriptorPtr = std::shared_ptr<const VersionDescriptor>;

struct VersionManagerOptions {
    std::uint32_t dimension{0};
    kernels::Metric metric{kernels::Metric::Cosine};
    std::chrono::milliseconds conflict_backoff_base{1};
    std::chrono::milliseconds conflict_backoff_cap{50};
};

struct GcStats {
    std::size_t removed{0};
    std::size_t retained_pinned{0};
    std::size_t failed{0};
};

namespace detail {
struct PinRegistry {
    std::mutex mu;
    std::unordered_map<std::uint64_t, std::size_t> counts;
};
} // namespace detail

/** \brief RAII handle on one version. Move-only; releasing it makes its files collectable. */
class VersionPin {
public:
    VersionPin() = default;
    ~VersionPin() { release(); }
    VersionPin(VersionPin&& o) noexcept : registry_(std::move(o.registry_)), desc_(std::move(o.desc_)) {}
    VersionPin& operator=(VersionPin&& o) noexcept {
        if (this != &o) {
            release();
            registry_ = std::move(o.registry_);
            desc_ = std::move(o.desc_);
        }
        return *this;
    }
    VersionPin(const VersionPin&) = delete;
    VersionPin& operator=(const VersionPin&) = delete;

    [[nodiscard]] std::uint64_t version_id() const noexcept { return desc_ ? desc_->version_id : 0; }
    [[nodiscard]] const DescriptorPtr& descriptor() const noexcept { return desc_; }
    explicit operator bool() const noexcept { return desc_ != nullptr; }

    void release() noexcept;

private:
    friend class VersionManager;
    VersionPin(std::shared_ptr<detail::PinRegistry> registry, DescriptorPtr desc)
        : registry_(std::move(registry)), desc_(std::move(desc)) {}

    std::shared_ptr<detail::PinRegistry> registry_;
    DescriptorPtr desc_;
};

class VersionManager {
public:
    using Mutation = std::function<std::expected<void, core::error>(VersionDescriptor&)>;

    /** \brief Resolve the newest published version (hint, listing, then reading forward by path). */
    static auto open(std::shared_ptr<storage::StorageClient> client, const VersionManagerOptions& opts)
        -> std::expected<std::unique_ptr<VersionManager>, core::error>;

    [[nodiscard]] auto current() const -> DescriptorPtr;
    [[nodiscard]] auto current_id() const noexcept -> std::uint64_t { return current_id_.load(std::memory_order_acquire); }

    /** \brief Descriptor of a version still held by this manager. not_found otherwise. */
    auto get(std::uint64_t version_id) const -> std::expected<DescriptorPtr, core::error>;

    /** \brief Pick up versions published by other writers. Returns the new current id. */
    auto refresh() -> std::expected<std::uint64_t, core::error>;

    /** \brief Conditionally publish `next` (must be current()+1). conflict if another writer won. */
    auto publish(VersionDescriptor next) -> std::expected<DescriptorPtr, core::error>;

    /** \brief Build the successor of current() with `mutate` and publish it, retrying on conflict.
     *
     * `mutate` runs once per attempt against a fresh copy of the latest version. A conflict
     * error from it retries like a lost publish; any other error aborts the commit.
     */
    auto commit(const Mutation& mutate) -> std::expected<DescriptorPtr, core::error>;

    [[nodiscard]] auto pin() -> VersionPin;
    auto pin(std::uint64_t version_id) -> std::expected<VersionPin, core::error>;
    [[nodiscard]] auto pinned_count() const -> std::size_t;

    /** \brief Next unused file sequence number. Monotonic for this process. */
    auto allocate_seq() noexcept -> std::uint64_t { return next_seq_.fetch_add(1, std::memory_order_relaxed); }

    /** \brief Delete files that only superseded, unpinned versions reference.
     *
     * When every remove succeeds, versions below min(current, oldest pin) are forgotten:
     * get() and pin(id) report not_found for them afterwards.
     */
    auto collect_garbage() -> std::expected<GcStats, core::error>;

    /** \brief Descriptors currently held in memory. */
    [[nodiscard]] auto loaded_versions() const -> std::size_t;

    /** \brief Remove unreferenced data/index objects left by interrupted writers.
     *
     * Also moves allocate_seq() past every sequence number found on storage.
     */
    auto sweep_orphans() -> std::expected<std::size_t, core::error>;

    [[nodiscard]] const std::string& writer_id() const noexcept { return writer_; }
    [[nodiscard]] storage::StorageClient& storage() noexcept { return *client_; }

private:
    VersionManager(std::shared_ptr<storage::StorageClient> client, const VersionManagerOptions& opts);

    auto load_version(std::uint64_t id) -> std::expected<VersionDescriptor, core::error>;
    void install(DescriptorPtr d);
    void raise_next_seq(std::uint64_t at_least) noexcept;
    void write_latest_hint(std::uint64_t id);
    auto live_paths() const -> std::unordered_set<std::string>;
    auto oldest_needed(std::uint64_t cur) const -> std::uint64_t;
    void trim_table(std::uint64_t floor);

    std::shared_ptr<storage::StorageClient> client_;
    VersionManagerOptions opts_;
    std::string writer_;

    mutable std::shared_mutex table_mutex_;
    std::uint64_t table_base_{0};
    std::deque<DescriptorPtr> table_;           // table_[i] is version table_base_ + i
    std::atomic<std::uint64_t> current_id_{0};
    std::atomic<std::uint64_t> next_seq_{1};

    std::shared_ptr<detail::PinRegistry> pins_ = std::make_shared<detail::PinRegistry>();
    std::mutex gc_mutex_;
    std::unordered_set<std::string> collected_; // removed paths still named by a loaded version
};

} // namespace vexlake::version
