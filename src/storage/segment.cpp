#include "vexlake/storage/segment.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_set>

#include "vexlake/core/platform_utils.hpp"

namespace vexlake::storage {

auto load_segment(StorageClient& client, const version::DataFileRef& file, const version::IndexFileRef* index_file,
                  std::size_t dim, kernels::Metric metric) -> std::expected<SegmentPtr, core::error> {
    const DataFileInfo info{file.rows, file.bytes, file.footer_offset, file.footer_length, file.min_id, file.max_id};
    auto rows = read_data_file_rows(client, file.path, info, dim);
    if (!rows) return std::unexpected(rows.error());

    auto seg = std::make_shared<Segment>();
    seg->path = file.path;
    seg->dim = dim;
    seg->rows = std::move(*rows);
    seg->row_of.reserve(seg->rows.ids.size());
    for (std::uint32_t i = 0; i < seg->rows.ids.size(); ++i) seg->row_of.emplace(seg->rows.ids[i], i);
    seg->blocks = search::make_blocks(seg->rows.ids, seg->rows.vectors, dim);

    if (index_file != nullptr) {
        auto blob = client.get_file(index_file->path);
        if (!blob) {
            if (blob.error().code != core::error_code::not_found && blob.error().code != core::error_code::data_integrity) {
                return std::unexpected(blob.error());
            }
            std::cerr << "[vexlake][segment] index " << index_file->path << " unreadable ("
                      << blob.error().message << "), using brute force\n";
            seg->index_corrupt = true;
        } else if (auto ix = index::HnswIndex::deserialize(*blob); !ix) {
            std::cerr << "[vexlake][segment] index " << index_file->path << " corrupt (" << ix.error().message
                      << "), using brute force\n";
            seg->index_corrupt = true;
        } else if (ix->dimension() != dim || ix->metric() != metric || ix->size() != seg->rows.ids.size()) {
            std::cerr << "[vexlake][segment] index " << index_file->path
                      << " does not match its data file, using brute force\n";
            seg->index_corrupt = true;
        } else {
            seg->index = std::make_shared<const index::HnswIndex>(std::move(*ix));
        }
    }
    return SegmentPtr(std::move(seg));
}

auto SegmentCache::acquire(const version::VersionDescriptor& version, const version::DataFileRef& file)
    -> std::expected<SegmentPtr, core::error> {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (auto it = entries_.find(file.path); it != entries_.end()) {
            ++hits_;
            return it->second;
        }
    }
    // Loads run unlocked; a concurrent duplicate load is harmless since both copies are equal.
    auto seg = load_segment(*client_, file, version.index_for(file.path), dim_, metric_);
    if (!seg) return std::unexpected(seg.error());
    std::lock_guard<std::mutex> lock(mu_);
    ++loads_;
    if ((*seg)->index_corrupt) ++index_fallbacks_;
    return entries_.emplace(file.path, *seg).first->second;
}

void SegmentCache::retain_only(const std::vector<std::string>& keep) {
    const std::unordered_set<std::string> k(keep.begin(), keep.end());
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (k.count(it->first)) {
            ++it;
        } else {
            it = entries_.erase(it);
        }
    }
}

void SegmentCache::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.clear();
}

auto SegmentCache::stats() const -> SegmentCacheStats {
    std::lock_guard<std::mutex> lock(mu_);
    return SegmentCacheStats{entries_.size(), hits_, loads_, index_fallbacks_};
}

} // namespace vexlake::storage
