#include "vexlake/storage/local_object_store.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vexlake::storage {

namespace {

constexpr const char* kTempPrefix = ".tmp-";

auto io_error(const std::string& what, int err) -> std::unexpected<core::error> {
    // Resource pressure on the backing volume is worth retrying; everything else is not.
    const auto code = (err == EAGAIN || err == EINTR || err == EBUSY || err == ENOSPC)
        ? core::error_code::unavailable
        : core::error_code::io_failed;
    return core::fail(code, what + ": " + std::strerror(err), "storage.local");
}

void fsync_dir(const std::filesystem::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY);
    if (fd < 0) return; // best-effort for directory metadata
    (void)::fsync(fd);
    (void)::close(fd);
}

auto write_all(int fd, std::span<const std::uint8_t> bytes) -> int {
    std::size_t off = 0;
    while (off < bytes.size()) {
        const ssize_t n = ::write(fd, bytes.data() + off, bytes.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        off += static_cast<std::size_t>(n);
    }
    return 0;
}

} // namespace

auto LocalObjectStore::open(const std::filesystem::path& root)
    -> std::expected<std::shared_ptr<LocalObjectStore>, core::error> {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return core::fail(core::error_code::io_failed, "cannot create root: " + ec.message(), "storage.local");
    }
    return std::shared_ptr<LocalObjectStore>(new LocalObjectStore(root));
}

auto LocalObjectStore::resolve(const std::string& path) const
    -> std::expected<std::filesystem::path, core::error> {
    if (path.empty() || path.front() == '/' || path.find("..") != std::string::npos) {
        return core::fail(core::error_code::invalid_argument, "invalid object key: " + path, "storage.local");
    }
    return root_ / path;
}

auto LocalObjectStore::stage(const std::filesystem::path& target, std::span<const std::uint8_t> bytes) const
    -> std::expected<std::filesystem::path, core::error> {
    static std::atomic<std::uint64_t> counter{0};
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) return core::fail(core::error_code::io_failed, "mkdir failed: " + ec.message(), "storage.local");

    const auto tmp = target.parent_path() /
        (std::string(kTempPrefix) + target.filename().string() + "-" + std::to_string(::getpid()) + "-" +
         std::to_string(counter.fetch_add(1)));
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) return io_error("create temp failed", errno);
    int err = write_all(fd, bytes);
    if (err == 0 && ::fsync(fd) != 0) err = errno;
    (void)::close(fd);
    if (err != 0) {
        (void)::unlink(tmp.c_str());
        return io_error("write temp failed", err);
    }
    return tmp;
}

auto LocalObjectStore::put_if_absent(const std::string& path, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
    auto target = resolve(path);
    if (!target) return std::unexpected(target.error());
    auto tmp = stage(*target, bytes);
    if (!tmp) return std::unexpected(tmp.error());
    const int rc = ::link(tmp->c_str(), target->c_str());
    const int err = rc == 0 ? 0 : errno;
    (void)::unlink(tmp->c_str());
    if (err == EEXIST) {
        return core::fail(core::error_code::already_exists, "object exists: " + path, "storage.local");
    }
    if (err != 0) return io_error("link failed", err);
    fsync_dir(target->parent_path());
    return {};
}

auto LocalObjectStore::put_overwrite(const std::string& path, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
    auto target = resolve(path);
    if (!target) return std::unexpected(target.error());
    auto tmp = stage(*target, bytes);
    if (!tmp) return std::unexpected(tmp.error());
    if (::rename(tmp->c_str(), target->c_str()) != 0) {
        const int err = errno;
        (void)::unlink(tmp->c_str());
        return io_error("rename failed", err);
    }
    fsync_dir(target->parent_path());
    return {};
}

auto LocalObjectStore::get(const std::string& path) -> std::expected<std::vector<std::uint8_t>, core::error> {
    auto target = resolve(path);
    if (!target) return std::unexpected(target.error());
    std::ifstream in(*target, std::ios::binary | std::ios::ate);
    if (!in) return core::fail(core::error_code::not_found, "no such object: " + path, "storage.local");
    const auto size = static_cast<std::size_t>(in.tellg());
    std::vector<std::uint8_t> out(size);
    in.seekg(0);
    in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(in.gcount()) != size) {
        return core::fail(core::error_code::io_failed, "short read: " + path, "storage.local");
    }
    return out;
}

auto LocalObjectStore::get_range(const std::string& path, ByteRange range)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
    auto target = resolve(path);
    if (!target) return std::unexpected(target.error());
    std::ifstream in(*target, std::ios::binary | std::ios::ate);
    if (!in) return core::fail(core::error_code::not_found, "no such object: " + path, "storage.local");
    const auto size = static_cast<std::uint64_t>(in.tellg());
    if (range.offset > size || range.length > size - range.offset) {
        return core::fail(core::error_code::out_of_range, "range beyond object end: " + path, "storage.local");
    }
    std::vector<std::uint8_t> out(static_cast<std::size_t>(range.length));
    in.seekg(static_cast<std::streamoff>(range.offset));
    in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(range.length));
    if (static_cast<std::uint64_t>(in.gcount()) != range.length) {
        return core::fail(core::error_code::io_failed, "short range read: " + path, "storage.local");
    }
    return out;
}

auto LocalObjectStore::list(const std::string& prefix) -> std::expected<std::vector<std::string>, core::error> {
    std::vector<std::string> out;
    std::error_code ec;
    if (!std::filesystem::exists(root_, ec)) return out;
    for (auto it = std::filesystem::recursive_directory_iterator(root_, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;   // also skips entries removed mid-listing
        if (it->path().filename().string().rfind(kTempPrefix, 0) == 0) continue;
        auto key = std::filesystem::relative(it->path(), root_, ec).generic_string();
        if (ec) break;
        if (key.rfind(prefix, 0) == 0) out.push_back(std::move(key));
    }
    if (ec) return core::fail(core::error_code::io_failed, "list failed: " + ec.message(), "storage.local");
    std::sort(out.begin(), out.end());
    return out;
}

auto LocalObjectStore::remove(const std::string& path) -> std::expected<void, core::error> {
    auto target = resolve(path);
    if (!target) return std::unexpected(target.error());
    if (::unlink(target->c_str()) != 0 && errno != ENOENT) return io_error("unlink failed", errno);
    return {};
}

} // namespace vexlake::storage
