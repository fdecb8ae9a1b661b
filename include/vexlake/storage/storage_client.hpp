#pragma once

/** \file storage_client.hpp
 *  \brief ObjectStore wrapper that retries transient failures with bounded exponential backoff.
 *
 * Only `unavailable` is retried. Once the attempt budget is spent the caller sees
 * `unavailable` ("temporarily unavailable"); other errors pass through unchanged.
 * A write-once put that already landed but reported a transient failure is
 * recognised on retry by comparing the stored bytes.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include "vexlake/storage/object_store.hpp"

namespace vexlake::storage {

struct RetryPolicy {
    std::uint32_t max_attempts{5};
    std::chrono::milliseconds base_delay{10};
    std::chrono::milliseconds max_delay{1000};

    /** \brief Delay before attempt `attempt` (1-based retry count). */
    [[nodiscard]] auto delay_for(std::uint32_t attempt) const noexcept -> std::chrono::milliseconds;
};

struct StorageStats {
    std::uint64_t retries{0};
    std::uint64_t exhausted{0};
};

class StorageClient {
public:
    StorageClient(std::shared_ptr<ObjectStore> store, RetryPolicy policy = {})
        : store_(std::move(store)), policy_(policy) {}

    auto put_file(const std::string& path, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error>;
    auto put_overwrite(const std::string& path, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error>;
    auto get_file(const std::string& path) -> std::expected<std::vector<std::uint8_t>, core::error>;
    auto get_range(const std::string& path, ByteRange range)
        -> std::expected<std::vector<std::uint8_t>, core::error>;
    auto list(const std::string& prefix) -> std::expected<std::vector<std::string>, core::error>;
    auto remove(const std::string& path) -> std::expected<void, core::error>;

    auto stats() const noexcept -> StorageStats { return {retries_.load(), exhausted_.load()}; }
    const RetryPolicy& policy() const noexcept { return policy_; }

private:
    template <typename Fn>
    auto with_retry(const char* op, const std::string& path, Fn&& fn) -> decltype(fn());

    std::shared_ptr<ObjectStore> store_;
    RetryPolicy policy_;
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> exhausted_{0};
};

} // namespace vexlake::storage
