#pragma once

/** \file object_store.hpp
 *  \brief Object-storage namespace abstraction.
 *
 * Paths are '/'-separated keys relative to the namespace root.
 * Contract
 * - put_if_absent never overwrites: an existing key yields already_exists.
 * - put_overwrite is reserved for mutable hint objects (the latest-version pointer).
 * - get_range beyond the object end yields out_of_range.
 * - list may lag recent writes; callers that need a just-written key read it by path.
 * - remove of a missing key succeeds.
 * - Transient backend failures surface as unavailable.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "vexlake/error.hpp"

namespace vexlake::storage {

struct ByteRange {
    std::uint64_t offset{0};
    std::uint64_t length{0};
};

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual auto put_if_absent(const std::string& path, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> = 0;
    virtual auto put_overwrite(const std::string& path, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> = 0;
    virtual auto get(const std::string& path) -> std::expected<std::vector<std::uint8_t>, core::error> = 0;
    virtual auto get_range(const std::string& path, ByteRange range)
        -> std::expected<std::vector<std::uint8_t>, core::error> = 0;
    /** \brief Keys starting with `prefix`, sorted ascending. */
    virtual auto list(const std::string& prefix) -> std::expected<std::vector<std::string>, core::error> = 0;
    virtual auto remove(const std::string& path) -> std::expected<void, core::error> = 0;
};

} // namespace vexlake::storage
