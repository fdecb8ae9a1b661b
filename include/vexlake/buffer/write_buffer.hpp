#pragma once

/** \file write_buffer.hpp
 *  \brief WAL-backed write buffer with copy-on-flush generations.
 *
 * - append() logs the operation (fsync) before applying it; a logging failure
 *   is returned as durability_failed and the operation is not applied.
 * - freeze() retires the active generation and opens a fresh one (with its own
 *   WAL file), so writers never wait on an in-flight flush.
 * - complete_flush() drops frozen generations once a version referencing their
 *   data is published, then deletes their WAL files.
 * - snapshot() hands readers owning references to the generations so long scans
 *   run without holding the state lock.
 * - open() replays every WAL generation newer than the durable one into frozen
 *   generations before the buffer accepts traffic.
 */

#include <atomic>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "vexlake/buffer/memtable.hpp"
#include "vexlake/error.hpp"
#include "vexlake/wal/io.hpp"

namespace vexlake::buffer {

struct WriteBufferOptions {
    std::filesystem::path wal_dir;
    std::size_t dim{0};
    std::size_t flush_threshold_bytes{4u << 20};
    bool sync_wal{true};
};

/** \brief Generations handed to one flush, oldest first. */
struct FlushBatch {
    std::vector<std::shared_ptr<const MemTable>> generations;
    std::uint64_t through_generation{0};

    [[nodiscard]] bool empty() const noexcept { return generations.empty(); }
};

struct WriteBufferStats {
    std::uint64_t active_generation{0};
    std::size_t frozen_generations{0};
    std::size_t live_records{0};
    std::size_t buffered_ops{0};
    std::size_t buffered_bytes{0};
    std::size_t replayed_frames{0};
};

class WriteBuffer {
public:
    using Layers = std::vector<std::shared_ptr<const MemTable>>;

    /** \brief Open the buffer, replaying WAL generations newer than `durable_generation`. */
    static auto open(const WriteBufferOptions& opts, std::uint64_t durable_generation)
        -> std::expected<std::unique_ptr<WriteBuffer>, core::error>;

    /** \brief Durably log then apply. Returns true for the append that crosses the flush threshold. */
    auto append(const wal::WalRecord& rec) -> std::expected<bool, core::error>;

    /** \brief Retire the active generation; returns every frozen generation not yet flushed. */
    auto freeze() -> std::expected<FlushBatch, core::error>;

    /** \brief Forget generations <= `through_generation` and delete their logs. */
    auto complete_flush(std::uint64_t through_generation) -> std::expected<void, core::error>;

    /** \brief Drop all buffered state (active and frozen) and their logs. */
    auto discard_all() -> std::expected<void, core::error>;

    /** \brief Run `f` with generations newest first while holding a shared lock.
     *
     * Appends wait for `f`; keep it to point lookups and do not retain the pointers.
     */
    template <typename F>
    decltype(auto) read(F&& f) const {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        std::vector<const MemTable*> layers;
        layers.reserve(frozen_.size() + 1);
        layers.push_back(active_.get());
        for (auto it = frozen_.rbegin(); it != frozen_.rend(); ++it) layers.push_back(it->get());
        return f(static_cast<const std::vector<const MemTable*>&>(layers));
    }

    /** \brief Generations newest first, owned by the caller.
     *
     * `under_lock` runs while the set of generations cannot change. The layers stay valid
     * and unchanged after the lock drops: the next append copies the active generation
     * instead of modifying the one handed out here.
     */
    template <typename F>
    auto snapshot(F&& under_lock) const -> Layers {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        std::forward<F>(under_lock)();
        Layers layers;
        layers.reserve(frozen_.size() + 1);
        active_shared_.store(true, std::memory_order_relaxed);
        layers.push_back(active_);
        for (auto it = frozen_.rbegin(); it != frozen_.rend(); ++it) layers.push_back(*it);
        return layers;
    }

    auto stats() const -> WriteBufferStats;

private:
    explicit WriteBuffer(const WriteBufferOptions& opts) : opts_(opts) {}

    WriteBufferOptions opts_;
    std::mutex write_mutex_;                  // serializes WAL appends and generation switches
    mutable std::shared_mutex state_mutex_;   // guards active_/frozen_
    std::shared_ptr<MemTable> active_;
    mutable std::atomic<bool> active_shared_{false};   // active_ was handed out by snapshot()
    std::deque<std::shared_ptr<const MemTable>> frozen_;
    wal::WalWriter wal_;
    std::uint64_t next_lsn_{1};
    std::size_t replayed_frames_{0};
};

} // namespace vexlake::buffer
