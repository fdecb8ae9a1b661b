#pragma once

/** \file cancellation.hpp
 *  \brief Polled cancellation token for long-running scans.
 *
 * Search and scan loops call `should_stop()` at fixed iteration granularity
 * (kCheckInterval) and abort with error_code::cancelled; no partial results
 * are returned on cancellation.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>

namespace vexlake::core {

class CancellationToken {
public:
    using clock = std::chrono::steady_clock;

    static constexpr std::size_t kCheckInterval = 256;

    CancellationToken() = default;

    /** \brief Token that expires `timeout` from now. */
    static auto with_timeout(std::chrono::milliseconds timeout) -> CancellationToken {
        CancellationToken t;
        t.deadline_ = clock::now() + timeout;
        return t;
    }

    CancellationToken(const CancellationToken& o)
        : cancelled_(o.cancelled_.load(std::memory_order_relaxed)), deadline_(o.deadline_), parent_(o.parent_) {}
    CancellationToken& operator=(const CancellationToken& o) {
        cancelled_.store(o.cancelled_.load(std::memory_order_relaxed), std::memory_order_relaxed);
        deadline_ = o.deadline_;
        parent_ = o.parent_;
        return *this;
    }

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    /** \brief Also stop whenever `parent` does. `parent` must outlive this token; nullptr unlinks. */
    void link(const CancellationToken* parent) noexcept { parent_ = parent; }

    [[nodiscard]] bool should_stop() const noexcept {
        if (cancelled_.load(std::memory_order_relaxed)) return true;
        if (deadline_ && clock::now() >= *deadline_) return true;
        return parent_ != nullptr && parent_->should_stop();
    }

    /** \brief Cheap check meant for hot loops: only polls every kCheckInterval iterations. */
    [[nodiscard]] bool should_stop_at(std::size_t iteration) const noexcept {
        return (iteration % kCheckInterval) == 0 && should_stop();
    }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<clock::time_point> deadline_;
    const CancellationToken* parent_{nullptr};
};

} // namespace vexlake::core
