#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include "vexlake/config.hpp"
#include "vexlake/search/top_k.hpp"

namespace test_support {

// Unique directory under the system temp dir, removed (recursively) on destruction.
class TempDir {
public:
    explicit TempDir(const char* tag = "vexlake");
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// n x dim floats, uniform in [-1, 1), deterministic for a given seed.
std::vector<float> random_vectors(std::size_t n, std::size_t dim, std::uint32_t seed);

// Same as random_vectors with each row scaled to unit length.
std::vector<float> random_unit_vectors(std::size_t n, std::size_t dim, std::uint32_t seed);

// 0, 1, ..., n-1 offset by `base`.
std::vector<std::uint64_t> sequential_ids(std::size_t n, std::uint64_t base = 0);

// Exact reference ranking by scalar kernels over all rows (no pruning).
std::vector<vexlake::search::Hit> exact_top_k(std::span<const float> query, std::span<const std::uint64_t> ids,
                                              std::span<const float> vectors, std::size_t dim, std::size_t k,
                                              vexlake::kernels::Metric metric);

// Small-footprint engine config rooted in `dir`: no background compaction, cheap HNSW.
vexlake::EngineConfig small_engine_config(const std::filesystem::path& dir, std::uint32_t dim,
                                          vexlake::kernels::Metric metric);

} // namespace test_support
