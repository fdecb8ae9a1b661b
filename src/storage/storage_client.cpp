#include "vexlake/storage/storage_client.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

#include "vexlake/core/platform_utils.hpp"

namespace vexlake::storage {

auto RetryPolicy::delay_for(std::uint32_t attempt) const noexcept -> std::chrono::milliseconds {
    const std::uint32_t shift = std::min<std::uint32_t>(attempt > 0 ? attempt - 1 : 0, 20);
    const auto d = base_delay * (std::int64_t{1} << shift);
    return std::min(d, max_delay);
}

template <typename Fn>
auto StorageClient::with_retry(const char* op, const std::string& path, Fn&& fn) -> decltype(fn()) {
    const std::uint32_t attempts = std::max<std::uint32_t>(1, policy_.max_attempts);
    for (std::uint32_t attempt = 1;; ++attempt) {
        auto r = fn();
        if (r || r.error().code != core::error_code::unavailable) return r;
        if (attempt >= attempts) {
            exhausted_.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[vexlake][storage] " << op << " " << path << " failed after " << attempt
                      << " attempts: " << r.error().message << "\n";
            return core::fail(core::error_code::unavailable, "temporarily unavailable", "storage.client");
        }
        retries_.fetch_add(1, std::memory_order_relaxed);
        if (core::debug_enabled()) {
            std::cerr << "[vexlake][storage] retrying " << op << " " << path << " (attempt " << attempt
                      << "): " << r.error().message << "\n";
        }
        std::this_thread::sleep_for(policy_.delay_for(attempt));
    }
}

auto StorageClient::put_file(const std::string& path, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
    bool retried = false;
    auto r = with_retry("put", path, [&]() -> std::expected<void, core::error> {
        auto res = store_->put_if_absent(path, bytes);
        if (!res && res.error().code == core::error_code::unavailable) retried = true;
        return res;
    });
    if (!r && retried && r.error().code == core::error_code::already_exists) {
        // An earlier attempt may have landed before the transient error was reported.
        auto existing = get_file(path);
        if (existing && std::equal(existing->begin(), existing->end(), bytes.begin(), bytes.end())) return {};
    }
    return r;
}

auto StorageClient::put_overwrite(const std::string& path, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
    return with_retry("put_overwrite", path, [&] { return store_->put_overwrite(path, bytes); });
}

auto StorageClient::get_file(const std::string& path) -> std::expected<std::vector<std::uint8_t>, core::error> {
    return with_retry("get", path, [&] { return store_->get(path); });
}

auto StorageClient::get_range(const std::string& path, ByteRange range)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
    return with_retry("get_range", path, [&] { return store_->get_range(path, range); });
}

auto StorageClient::list(const std::string& prefix) -> std::expected<std::vector<std::string>, core::error> {
    return with_retry("list", prefix, [&] { return store_->list(prefix); });
}

auto StorageClient::remove(const std::string& path) -> std::expected<void, core::error> {
    return with_retry("remove", path, [&] { return store_->remove(path); });
}

} // namespace vexlake::storage
