#include "vexlake/buffer/write_buffer.hpp"

#include <algorithm>
#include <iostream>

#include "vexlake/core/platform_utils.hpp"

namespace vexlake::buffer {

auto WriteBuffer::open(const WriteBufferOptions& opts, std::uint64_t durable_generation)
    -> std::expected<std::unique_ptr<WriteBuffer>, core::error> {
    using core::error_code;
    if (opts.dim == 0) {
        return core::fail(error_code::invalid_argument, "dimension must be > 0", "buffer");
    }
    std::unique_ptr<WriteBuffer> wb(new WriteBuffer(opts));

    auto gens = wal::list_generations(opts.wal_dir);
    if (!gens) return std::unexpected(gens.error());

    std::uint64_t max_gen = durable_generation;
    std::uint64_t last_lsn = 0;
    for (const std::uint64_t g : *gens) {
        max_gen = std::max(max_gen, g);
        if (g <= durable_generation) continue;
        auto table = std::make_shared<MemTable>(g, opts.dim);
        std::expected<void, core::error> replay_error{};
        auto st = wal::recover_scan(wal::wal_path(opts.wal_dir, g), [&](const wal::WalFrame& f) {
            if (!replay_error) return;
            auto rec = wal::decode_record(f);
            if (!rec) {
                replay_error = std::unexpected(rec.error());
                return;
            }
            if (rec->op == wal::OpKind::Insert && rec->vector.size() != opts.dim) {
                replay_error = core::fail(error_code::data_integrity,
                                          "replayed vector has wrong dimension", "buffer");
                return;
            }
            table->apply(*rec);
        });
        if (!st) return std::unexpected(st.error());
        if (!replay_error) return std::unexpected(replay_error.error());
        last_lsn = std::max(last_lsn, st->last_lsn);
        wb->replayed_frames_ += st->frames;
        if (!table->empty()) wb->frozen_.push_back(std::move(table));
    }
    // Logs at or below the durable generation were flushed already; removal may have been interrupted.
    if (auto r = wal::remove_generations_through(opts.wal_dir, durable_generation); !r) {
        std::cerr << "[vexlake][buffer] stale wal cleanup failed: " << r.error().message << "\n";
    }
    if (core::debug_enabled() && wb->replayed_frames_ > 0) {
        std::cerr << "[vexlake][buffer] replayed " << wb->replayed_frames_ << " frames into "
                  << wb->frozen_.size() << " generations\n";
    }

    const std::uint64_t active_gen = max_gen + 1;
    auto writer = wal::WalWriter::open(opts.wal_dir, active_gen, opts.sync_wal);
    if (!writer) return std::unexpected(writer.error());
    wb->wal_ = std::move(*writer);
    wb->active_ = std::make_shared<MemTable>(active_gen, opts.dim);
    wb->next_lsn_ = last_lsn + 1;
    return wb;
}

auto WriteBuffer::append(const wal::WalRecord& rec) -> std::expected<bool, core::error> {
    std::lock_guard<std::mutex> wlock(write_mutex_);
    if (auto r = wal_.append(next_lsn_, rec); !r) {
        return core::fail(core::error_code::durability_failed, r.error().message, "buffer.wal");
    }
    ++next_lsn_;
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (active_shared_.exchange(false, std::memory_order_relaxed)) {
        active_ = std::make_shared<MemTable>(*active_);
    }
    const std::size_t before = active_->bytes();
    active_->apply(rec);
    const std::size_t after = active_->bytes();
    return before < opts_.flush_threshold_bytes && after >= opts_.flush_threshold_bytes;
}

auto WriteBuffer::freeze() -> std::expected<FlushBatch, core::error> {
    std::lock_guard<std::mutex> wlock(write_mutex_);
    bool has_active = false;
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        has_active = !active_->empty();
    }
    if (has_active) {
        const std::uint64_t next_gen = active_->generation() + 1;
        auto writer = wal::WalWriter::open(opts_.wal_dir, next_gen, opts_.sync_wal);
        if (!writer) return std::unexpected(writer.error());
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        frozen_.push_back(std::move(active_));
        active_ = std::make_shared<MemTable>(next_gen, opts_.dim);
        active_shared_.store(false, std::memory_order_relaxed);
        wal_ = std::move(*writer);
    }
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    FlushBatch batch;
    batch.generations.assign(frozen_.begin(), frozen_.end());
    if (!frozen_.empty()) batch.through_generation = frozen_.back()->generation();
    return batch;
}

auto WriteBuffer::complete_flush(std::uint64_t through_generation) -> std::expected<void, core::error> {
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        while (!frozen_.empty() && frozen_.front()->generation() <= through_generation) {
            frozen_.pop_front();
        }
    }
    return wal::remove_generations_through(opts_.wal_dir, through_generation);
}

auto WriteBuffer::discard_all() -> std::expected<void, core::error> {
    std::lock_guard<std::mutex> wlock(write_mutex_);
    const std::uint64_t old_gen = active_->generation();
    auto writer = wal::WalWriter::open(opts_.wal_dir, old_gen + 1, opts_.sync_wal);
    if (!writer) return std::unexpected(writer.error());
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        frozen_.clear();
        active_ = std::make_shared<MemTable>(old_gen + 1, opts_.dim);
        active_shared_.store(false, std::memory_order_relaxed);
        wal_ = std::move(*writer);
    }
    return wal::remove_generations_through(opts_.wal_dir, old_gen);
}

auto WriteBuffer::stats() const -> WriteBufferStats {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    WriteBufferStats st;
    st.active_generation = active_->generation();
    st.frozen_generations = frozen_.size();
    st.replayed_frames = replayed_frames_;
    auto add = [&st](const MemTable& t) {
        st.live_records += t.live_count();
        st.buffered_ops += t.op_count();
        st.buffered_bytes += t.bytes();
    };
    add(*active_);
    for (const auto& f : frozen_) add(*f);
    return st;
}

} // namespace vexlake::buffer
