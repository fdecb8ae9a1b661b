#include "vexlake/storage/segment_writer.hpp"

#include <iostream>

#include "vexlake/core/platform_utils.hpp"
#include "vexlake/storage/layout.hpp"

namespace vexlake::storage {

namespace {

auto build_index(std::size_t dim, kernels::Metric metric, const index::HnswBuildParams& params,
                 const std::vector<RowRef>& rows) -> std::expected<std::vector<std::uint8_t>, core::error> {
    index::HnswIndex ix;
    if (auto r = ix.init(dim, metric, params); !r) return std::unexpected(r.error());
    for (const auto& row : rows) {
        if (auto r = ix.add(row.id, row.vector); !r) return std::unexpected(r.error());
    }
    return ix.serialize();
}

} // namespace

auto write_segment(StorageClient& client, std::uint32_t partition, const SeqSource& next_seq, std::size_t dim,
                   kernels::Metric metric, const index::HnswBuildParams& hnsw, std::vector<RowRef> rows)
    -> std::expected<WrittenSegment, core::error> {
    auto encoded = encode_data_file(dim, metric, rows);
    if (!encoded) return std::unexpected(encoded.error());

    auto blob = build_index(dim, metric, hnsw, rows);
    if (!blob) {
        std::cerr << "[vexlake][segment] index build failed: " << blob.error().message << "\n";
    }

    for (std::uint32_t attempt = 1;; ++attempt) {
        const std::uint64_t seq = next_seq();
        WrittenSegment out;
        out.data.path = data_file_path(partition, seq);
        out.data.partition = partition;
        out.data.seq = seq;
        out.data.rows = encoded->info.rows;
        out.data.bytes = encoded->info.bytes;
        out.data.footer_offset = encoded->info.footer_offset;
        out.data.footer_length = encoded->info.footer_length;
        out.data.min_id = encoded->info.min_id;
        out.data.max_id = encoded->info.max_id;

        // A taken path belongs to a writer that died before publishing; move on to a fresh sequence.
        auto taken = [&](const std::string& path) {
            std::cerr << "[vexlake][segment] " << path << " already exists, taking a new sequence number\n";
            return attempt < kSegmentSeqAttempts;
        };

        if (auto r = client.put_file(out.data.path, encoded->bytes); !r) {
            if (r.error().code == core::error_code::already_exists && taken(out.data.path)) continue;
            return std::unexpected(r.error());
        }
        if (!blob) return out;

        version::IndexFileRef ix{index_file_path(seq), seq, out.data.path};
        if (auto r = client.put_file(ix.path, *blob); !r) {
            if (r.error().code == core::error_code::already_exists && taken(ix.path)) {
                discard_segment(client, out);
                continue;
            }
            if (r.error().code == core::error_code::unavailable) {
                discard_segment(client, out);
                return std::unexpected(r.error());
            }
            std::cerr << "[vexlake][segment] index write for " << out.data.path << " failed: " << r.error().message
                      << "\n";
            return out;
        }
        out.index = std::move(ix);
        if (core::debug_enabled()) {
            std::cerr << "[vexlake][segment] wrote " << out.data.path << " (" << out.data.rows << " rows, "
                      << out.data.bytes << " bytes)\n";
        }
        return out;
    }
}

void discard_segment(StorageClient& client, const WrittenSegment& seg) {
    auto drop = [&client](const std::string& path) {
        if (auto r = client.remove(path); !r) {
            std::cerr << "[vexlake][segment] cleanup of " << path << " failed: " << r.error().message << "\n";
        }
    };
    if (seg.index) drop(seg.index->path);
    drop(seg.data.path);
}

} // namespace vexlake::storage
