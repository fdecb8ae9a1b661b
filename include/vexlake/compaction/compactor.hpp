#pragma once

/** \file compactor.hpp
 *  \brief Background merge of small or tombstone-heavy data files.
 *
 * The compactor is an ordinary writer: it reads a base version, writes merged
 * files under fresh sequence numbers, and publishes through VersionManager::commit.
 * Tombstones added to an input after the base was read are carried onto the merged
 * output during commit; if an input disappeared (another compaction, clear) the
 * round is abandoned and its files removed. The current version is never touched
 * until the replacement is fully written.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "vexlake/error.hpp"
#include "vexlake/index/hnsw.hpp"
#include "vexlake/version/version_manager.hpp"

namespace vexlake::compaction {

struct CompactionPolicy {
    std::chrono::milliseconds interval{30000};
    std::size_t min_files{4};              /**< small files per partition before merging */
    std::uint64_t small_file_rows{4096};
    std::uint64_t target_rows{65536};      /**< live rows per merged output */
    double tombstone_ratio{0.2};           /**< rewrite any file at or above this deleted fraction */
};

struct CompactionResult {
    std::size_t groups{0};
    std::size_t input_files{0};
    std::size_t output_files{0};
    std::uint64_t rows_written{0};
    std::uint64_t rows_dropped{0};
    std::uint64_t version_id{0};           /**< 0 when nothing was published */
};

/** \brief Inputs chosen from one version. Exposed for tests. */
struct CompactionGroup {
    std::uint32_t partition{0};
    std::vector<version::DataFileRef> inputs;
};

auto plan_compaction(const version::VersionDescriptor& v, const CompactionPolicy& policy)
    -> std::vector<CompactionGroup>;

class Compactor {
public:
    using PublishedHook = std::function<void(const version::DescriptorPtr&)>;

    Compactor(version::VersionManager& versions, std::shared_ptr<storage::StorageClient> client,
              index::HnswBuildParams hnsw, CompactionPolicy policy, PublishedHook on_published = {});
    ~Compactor();

    Compactor(const Compactor&) = delete;
    Compactor& operator=(const Compactor&) = delete;

    /** \brief One planning + merge + publish round. Serialized with the background loop. */
    auto run_once() -> std::expected<CompactionResult, core::error>;

    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] const CompactionPolicy& policy() const noexcept { return policy_; }

private:
    void loop();

    version::VersionManager& versions_;
    std::shared_ptr<storage::StorageClient> client_;
    index::HnswBuildParams hnsw_;
    CompactionPolicy policy_;
    PublishedHook on_published_;

    std::mutex run_mutex_;
    std::mutex wait_mutex_;
    std::condition_variable wake_;
    std::atomic<bool> running_{false};
    bool stop_requested_{false};
    std::thread thread_;
};

} // namespace vexlake::compaction
