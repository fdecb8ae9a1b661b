#include "vexlake/storage/layout.hpp"

#include <charconv>
#include <cstdio>

namespace vexlake::storage {

namespace {

auto padded(std::uint64_t v) -> std::string {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(v));
    return buf;
}

auto parse_u64(std::string_view s) -> std::optional<std::uint64_t> {
    if (s.empty()) return std::nullopt;
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

} // namespace

auto data_file_path(std::uint32_t partition, std::uint64_t seq) -> std::string {
    return std::string(kDataPrefix) + std::to_string(partition) + "/" + padded(seq) + ".vxd";
}

auto index_file_path(std::uint64_t seq) -> std::string {
    return std::string(kIndexPrefix) + padded(seq) + ".vxi";
}

auto version_path(std::uint64_t version_id) -> std::string {
    return std::string(kMetadataPrefix) + "version_" + std::to_string(version_id) + ".json";
}

auto parse_version_path(std::string_view key) -> std::optional<std::uint64_t> {
    constexpr std::string_view head = "_metadata/version_";
    constexpr std::string_view tail = ".json";
    if (key.size() <= head.size() + tail.size() || key.substr(0, head.size()) != head ||
        key.substr(key.size() - tail.size()) != tail) {
        return std::nullopt;
    }
    return parse_u64(key.substr(head.size(), key.size() - head.size() - tail.size()));
}

auto parse_file_seq(std::string_view key) -> std::optional<std::uint64_t> {
    const auto slash = key.rfind('/');
    const auto dot = key.rfind('.');
    if (slash == std::string_view::npos || dot == std::string_view::npos || dot <= slash) return std::nullopt;
    return parse_u64(key.substr(slash + 1, dot - slash - 1));
}

} // namespace vexlake::storage
