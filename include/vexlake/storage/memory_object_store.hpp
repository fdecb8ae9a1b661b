#pragma once

/** \file memory_object_store.hpp
 *  \brief In-process ObjectStore with injectable transient faults and listing lag.
 *
 * Faults: `inject_failures(op, n)` makes the next n calls of that operation fail
 * with unavailable before touching state. Listing lag: a key written while
 * `set_list_lag(n)` is in effect stays invisible to the next n list() calls.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include "vexlake/storage/object_store.hpp"

namespace vexlake::storage {

class MemoryObjectStore final : public ObjectStore {
public:
    enum class Op : std::uint8_t { Put, Get, GetRange, List, Remove };

    struct Counters {
        std::uint64_t puts{0};
        std::uint64_t gets{0};
        std::uint64_t range_gets{0};
        std::uint64_t bytes_read{0};
        std::uint64_t lists{0};
        std::uint64_t removes{0};
        std::uint64_t injected_failures{0};
    };

    auto put_if_absent(const std::string& path, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> override;
    auto put_overwrite(const std::string& path, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> override;
    auto get(const std::string& path) -> std::expected<std::vector<std::uint8_t>, core::error> override;
    auto get_range(const std::string& path, ByteRange range)
        -> std::expected<std::vector<std::uint8_t>, core::error> override;
    auto list(const std::string& prefix) -> std::expected<std::vector<std::string>, core::error> override;
    auto remove(const std::string& path) -> std::expected<void, core::error> override;

    void inject_failures(Op op, std::uint32_t count);
    void set_list_lag(std::uint32_t lists);
    /** \brief Replace an object's bytes in place (corruption tests). */
    void corrupt(const std::string& path, std::size_t offset, std::uint8_t xor_mask);
    bool exists(const std::string& path) const;
    std::size_t object_count() const;
    Counters counters() const;

private:
    struct Object {
        std::shared_ptr<const std::vector<std::uint8_t>> bytes;
        std::uint32_t hidden_lists{0};
    };

    auto take_fault(Op op) -> bool;

    mutable std::mutex mutex_;
    std::map<std::string, Object> objects_;
    std::map<Op, std::uint32_t> faults_;
    std::uint32_t list_lag_{0};
    Counters counters_;
};

} // namespace vexlake::storage
