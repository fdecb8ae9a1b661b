#include "vexlake/storage/memory_object_store.hpp"

namespace vexlake::storage {

namespace {

auto injected() -> std::unexpected<core::error> {
    return core::fail(core::error_code::unavailable, "injected transient failure", "storage.memory");
}

} // namespace

auto MemoryObjectStore::take_fault(Op op) -> bool {
    auto it = faults_.find(op);
    if (it == faults_.end() || it->second == 0) return false;
    --it->second;
    ++counters_.injected_failures;
    return true;
}

auto MemoryObjectStore::put_if_absent(const std::string& path, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (take_fault(Op::Put)) return injected();
    if (objects_.count(path) > 0) {
        return core::fail(core::error_code::already_exists, "object exists: " + path, "storage.memory");
    }
    objects_[path] = Object{std::make_shared<const std::vector<std::uint8_t>>(bytes.begin(), bytes.end()), list_lag_};
    ++counters_.puts;
    return {};
}

auto MemoryObjectStore::put_overwrite(const std::string& path, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (take_fault(Op::Put)) return injected();
    objects_[path] = Object{std::make_shared<const std::vector<std::uint8_t>>(bytes.begin(), bytes.end()), list_lag_};
    ++counters_.puts;
    return {};
}

auto MemoryObjectStore::get(const std::string& path) -> std::expected<std::vector<std::uint8_t>, core::error> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (take_fault(Op::Get)) return injected();
    auto it = objects_.find(path);
    if (it == objects_.end()) {
        return core::fail(core::error_code::not_found, "no such object: " + path, "storage.memory");
    }
    ++counters_.gets;
    counters_.bytes_read += it->second.bytes->size();
    return *it->second.bytes;
}

auto MemoryObjectStore::get_range(const std::string& path, ByteRange range)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (take_fault(Op::GetRange)) return injected();
    auto it = objects_.find(path);
    if (it == objects_.end()) {
        return core::fail(core::error_code::not_found, "no such object: " + path, "storage.memory");
    }
    const auto& bytes = *it->second.bytes;
    if (range.offset > bytes.size() || range.length > bytes.size() - range.offset) {
        return core::fail(core::error_code::out_of_range, "range beyond object end: " + path, "storage.memory");
    }
    ++counters_.range_gets;
    counters_.bytes_read += range.length;
    const auto first = bytes.begin() + static_cast<std::ptrdiff_t>(range.offset);
    return std::vector<std::uint8_t>(first, first + static_cast<std::ptrdiff_t>(range.length));
}

auto MemoryObjectStore::list(const std::string& prefix) -> std::expected<std::vector<std::string>, core::error> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (take_fault(Op::List)) return injected();
    ++counters_.lists;
    std::vector<std::string> out;
    for (auto it = objects_.lower_bound(prefix); it != objects_.end() && it->first.rfind(prefix, 0) == 0; ++it) {
        if (it->second.hidden_lists > 0) {
            --it->second.hidden_lists;
            continue;
        }
        out.push_back(it->first);
    }
    return out;
}

auto MemoryObjectStore::remove(const std::string& path) -> std::expected<void, core::error> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (take_fault(Op::Remove)) return injected();
    objects_.erase(path);
    ++counters_.removes;
    return {};
}

void MemoryObjectStore::inject_failures(Op op, std::uint32_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_[op] = count;
}

void MemoryObjectStore::set_list_lag(std::uint32_t lists) {
    std::lock_guard<std::mutex> lock(mutex_);
    list_lag_ = lists;
}

void MemoryObjectStore::corrupt(const std::string& path, std::size_t offset, std::uint8_t xor_mask) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(path);
    if (it == objects_.end() || offset >= it->second.bytes->size()) return;
    auto copy = std::make_shared<std::vector<std::uint8_t>>(*it->second.bytes);
    (*copy)[offset] ^= xor_mask;
    it->second.bytes = std::move(copy);
}

bool MemoryObjectStore::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(path) > 0;
}

std::size_t MemoryObjectStore::object_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

auto MemoryObjectStore::counters() const -> Counters {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

} // namespace vexlake::storage
