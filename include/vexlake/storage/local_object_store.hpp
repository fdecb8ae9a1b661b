#pragma once

/** \file local_object_store.hpp
 *  \brief ObjectStore over a local directory.
 *
 * Write-once puts stage into a temporary sibling, fsync it, then hard-link it into
 * place (link(2) fails if the key exists, which makes the put a compare-and-swap).
 * Overwrites use write-temp + fsync + rename. Temporaries are never listed.
 */

#include <filesystem>
#include <memory>

#include "vexlake/storage/object_store.hpp"

namespace vexlake::storage {

class LocalObjectStore final : public ObjectStore {
public:
    /** \brief Create the root directory if needed. */
    static auto open(const std::filesystem::path& root)
        -> std::expected<std::shared_ptr<LocalObjectStore>, core::error>;

    auto put_if_absent(const std::string& path, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> override;
    auto put_overwrite(const std::string& path, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> override;
    auto get(const std::string& path) -> std::expected<std::vector<std::uint8_t>, core::error> override;
    auto get_range(const std::string& path, ByteRange range)
        -> std::expected<std::vector<std::uint8_t>, core::error> override;
    auto list(const std::string& prefix) -> std::expected<std::vector<std::string>, core::error> override;
    auto remove(const std::string& path) -> std::expected<void, core::error> override;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    explicit LocalObjectStore(std::filesystem::path root) : root_(std::move(root)) {}

    auto resolve(const std::string& path) const -> std::expected<std::filesystem::path, core::error>;
    auto stage(const std::filesystem::path& target, std::span<const std::uint8_t> bytes) const
        -> std::expected<std::filesystem::path, core::error>;

    std::filesystem::path root_;
};

} // namespace vexlake::storage
