#include "vexlake/compaction/compactor.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <optional>

#include "vexlake/core/platform_utils.hpp"
#include "vexlake/storage/data_file.hpp"
#include "vexlake/storage/segment_writer.hpp"

namespace vexlake::compaction {

namespace {

/** Split candidates into chunks whose live rows stay near target_rows. */
void chunk_into(std::uint32_t partition, std::vector<version::DataFileRef> files, std::uint64_t target_rows,
                std::vector<CompactionGroup>& out) {
    CompactionGroup cur{partition, {}};
    std::uint64_t rows = 0;
    for (auto& f : files) {
        if (!cur.inputs.empty() && rows + f.live_rows() > target_rows) {
            out.push_back(std::move(cur));
            cur = CompactionGroup{partition, {}};
            rows = 0;
        }
        rows += f.live_rows();
        cur.inputs.push_back(std::move(f));
    }
    if (!cur.inputs.empty()) out.push_back(std::move(cur));
}

struct MergedRows {
    std::vector<std::uint64_t> ids;
    std::vector<float> vectors;
    std::vector<std::vector<std::uint8_t>> payloads;
};

} // namespace

auto plan_compaction(const version::VersionDescriptor& v, const CompactionPolicy& policy)
    -> std::vector<CompactionGroup> {
    std::map<std::uint32_t, std::vector<version::DataFileRef>> small;
    std::map<std::uint32_t, std::vector<version::DataFileRef>> heavy;
    for (const auto& f : v.data_files) {
        if (f.rows > 0 && f.tombstone_ratio() >= policy.tombstone_ratio) {
            heavy[f.partition].push_back(f);
        } else if (f.rows < policy.small_file_rows) {
            small[f.partition].push_back(f);
        }
    }
    std::vector<CompactionGroup> groups;
    for (auto& [partition, files] : small) {
        auto& extra = heavy[partition];
        // Tombstone-heavy files in the same partition are rewritten anyway, so they count toward the merge.
        if (files.size() + extra.size() < policy.min_files) continue;
        files.insert(files.end(), extra.begin(), extra.end());
        extra.clear();
        std::sort(files.begin(), files.end(),
                  [](const version::DataFileRef& a, const version::DataFileRef& b) { return a.seq < b.seq; });
        chunk_into(partition, std::move(files), policy.target_rows, groups);
    }
    for (auto& [partition, files] : heavy) {
        for (auto& f : files) groups.push_back(CompactionGroup{partition, {std::move(f)}});
    }
    // A single small file merged with nothing is a plain copy.
    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [&](const CompactionGroup& g) {
                                    return g.inputs.size() == 1 && g.inputs.front().deleted_ids.isEmpty();
                                }),
                 groups.end());
    return groups;
}

Compactor::Compactor(version::VersionManager& versions, std::shared_ptr<storage::StorageClient> client,
                     index::HnswBuildParams hnsw, CompactionPolicy policy, PublishedHook on_published)
    : versions_(versions), client_(std::move(client)), hnsw_(hnsw), policy_(policy),
      on_published_(std::move(on_published)) {}

Compactor::~Compactor() { stop(); }

auto Compactor::run_once() -> std::expected<CompactionResult, core::error> {
    std::lock_guard<std::mutex> run_lock(run_mutex_);
    const version::DescriptorPtr base = versions_.current();
    const auto groups = plan_compaction(*base, policy_);
    CompactionResult result;
    if (groups.empty()) return result;

    const std::size_t dim = base->dimension;
    std::vector<storage::WrittenSegment> written;
    std::vector<std::optional<std::size_t>> output_of(groups.size());   // index into written
    auto discard_all = [&] {
        for (const auto& w : written) storage::discard_segment(*client_, w);
    };

    for (std::size_t g = 0; g < groups.size(); ++g) {
        MergedRows merged;
        for (const auto& in : groups[g].inputs) {
            auto bytes = client_->get_file(in.path);
            if (!bytes) {
                discard_all();
                return std::unexpected(bytes.error());
            }
            auto contents = storage::decode_data_file(*bytes);
            if (!contents) {
                discard_all();
                return std::unexpected(contents.error());
            }
            const auto& rows = contents->rows;
            for (std::size_t i = 0; i < rows.ids.size(); ++i) {
                if (in.deleted_ids.contains(rows.ids[i])) {
                    ++result.rows_dropped;
                    continue;
                }
                merged.ids.push_back(rows.ids[i]);
                merged.vectors.insert(merged.vectors.end(), rows.vectors.begin() + static_cast<std::ptrdiff_t>(i * dim),
                                      rows.vectors.begin() + static_cast<std::ptrdiff_t>((i + 1) * dim));
                merged.payloads.push_back(std::move(contents->payloads[i]));
            }
        }
        result.input_files += groups[g].inputs.size();
        if (merged.ids.empty()) continue;

        std::vector<storage::RowRef> refs;
        refs.reserve(merged.ids.size());
        for (std::size_t i = 0; i < merged.ids.size(); ++i) {
            refs.push_back(storage::RowRef{merged.ids[i],
                                           std::span<const float>(merged.vectors).subspan(i * dim, dim),
                                           merged.payloads[i]});
        }
        auto seg = storage::write_segment(*client_, groups[g].partition,
                                          [this] { return versions_.allocate_seq(); }, dim, base->metric, hnsw_,
                                          std::move(refs));
        if (!seg) {
            discard_all();
            return std::unexpected(seg.error());
        }
        result.rows_written += seg->data.rows;
        output_of[g] = written.size();
        written.push_back(std::move(*seg));
    }

    auto published = versions_.commit([&](version::VersionDescriptor& next) -> std::expected<void, core::error> {
        for (std::size_t g = 0; g < groups.size(); ++g) {
            roaring::Roaring64Map carried;
            for (const auto& in : groups[g].inputs) {
                const auto* now = next.find_data_file(in.path);
                if (now == nullptr) {
                    return core::fail(core::error_code::precondition_failed,
                                      "compaction input " + in.path + " no longer current", "compactor");
                }
                carried |= now->deleted_ids - in.deleted_ids;
            }
            for (const auto& in : groups[g].inputs) {
                std::erase_if(next.data_files, [&](const version::DataFileRef& f) { return f.path == in.path; });
                std::erase_if(next.index_files,
                              [&](const version::IndexFileRef& ix) { return ix.data_file == in.path; });
            }
            if (!output_of[g]) continue;
            const auto& w = written[*output_of[g]];
            version::DataFileRef out = w.data;
            out.deleted_ids = carried;
            next.data_files.push_back(std::move(out));
            if (w.index) next.index_files.push_back(*w.index);
        }
        return {};
    });
    if (!published) {
        // An unavailable commit may still have landed; leave its files for the orphan sweep.
        if (published.error().code != core::error_code::unavailable) discard_all();
        return std::unexpected(published.error());
    }

    result.groups = groups.size();
    result.output_files = written.size();
    result.version_id = (*published)->version_id;
    std::cerr << "[vexlake][compactor] merged " << result.input_files << " files into " << result.output_files
              << " (" << result.rows_written << " rows kept, " << result.rows_dropped << " dropped), version "
              << result.version_id << "\n";
    if (on_published_) on_published_(*published);
    if (auto gc = versions_.collect_garbage(); !gc) {
        std::cerr << "[vexlake][compactor] garbage collection failed: " << gc.error().message << "\n";
    }
    return result;
}

void Compactor::start() {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (running_.load()) return;
    stop_requested_ = false;
    running_.store(true);
    thread_ = std::thread([this] { loop(); });
}

void Compactor::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) thread_.join();
    running_.store(false);
}

void Compactor::loop() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    while (!stop_requested_) {
        if (wake_.wait_for(lock, policy_.interval, [this] { return stop_requested_; })) break;
        lock.unlock();
        if (auto r = run_once(); !r) {
            std::cerr << "[vexlake][compactor] round failed: " << r.error().message << "\n";
        } else if (core::debug_enabled() && r->groups == 0) {
            std::cerr << "[vexlake][compactor] nothing to compact\n";
        }
        lock.lock();
    }
}

} // namespace vexlake::compaction
