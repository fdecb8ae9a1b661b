#pragma once

/** \file io.hpp
 *  \brief WAL writer and recovery scan. One log file per write-buffer generation:
 *  `<dir>/wal-<generation:08>.log`.
 *
 * Notes
 * - Writer is not thread-safe; the write buffer serializes appends.
 * - append() with sync enabled fsyncs before returning; any write or sync failure
 *   is reported as durability_failed and must fail the originating operation.
 * - recover_scan stops on a torn/truncated tail without error.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <span>
#include <vector>

#include "vexlake/error.hpp"
#include "vexlake/wal/frame.hpp"
#include "vexlake/wal/record.hpp"

namespace vexlake::wal {

struct RecoveryStats {
  std::size_t frames{};       /**< number of delivered frames */
  std::size_t bytes{};        /**< total frame bytes delivered */
  std::uint64_t last_lsn{};   /**< LSN of the last valid frame */
  bool torn_tail{false};      /**< scan stopped before end of file */
};

class WalWriter {
public:
  WalWriter() = default;
  ~WalWriter();
  WalWriter(WalWriter&&) noexcept = default;
  WalWriter& operator=(WalWriter&&) noexcept = default;
  WalWriter(const WalWriter&) = delete;
  WalWriter& operator=(const WalWriter&) = delete;

  /** \brief Open (append mode) the log for `generation`, creating `dir` if needed. */
  static auto open(const std::filesystem::path& dir, std::uint64_t generation, bool sync_on_append = true)
      -> std::expected<WalWriter, core::error>;

  /** \brief Append one frame and make it durable before returning. */
  auto append(std::uint64_t lsn, const WalRecord& record) -> std::expected<void, core::error>;

  /** \brief Flush buffered bytes; fsync when `sync` is set. */
  auto flush(bool sync = false) -> std::expected<void, core::error>;

  const std::filesystem::path& path() const noexcept { return path_; }
  std::uint64_t generation() const noexcept { return generation_; }
  std::uint64_t bytes_written() const noexcept { return bytes_; }

private:
  std::filesystem::path path_;
  std::uint64_t generation_{0};
  std::uint64_t bytes_{0};
  bool sync_on_append_{true};
  std::ofstream out_;
};

auto wal_path(const std::filesystem::path& dir, std::uint64_t generation) -> std::filesystem::path;

/** \brief Generations present in `dir`, ascending. A missing directory yields an empty list. */
auto list_generations(const std::filesystem::path& dir) -> std::expected<std::vector<std::uint64_t>, core::error>;

/** \brief Remove every log whose generation is <= `generation`. */
auto remove_generations_through(const std::filesystem::path& dir, std::uint64_t generation)
    -> std::expected<void, core::error>;

// Sequentially scans a WAL file and invokes on_frame for each valid frame.
// Stops on torn/truncated tail without error.
[[nodiscard]] auto recover_scan(const std::filesystem::path& path,
                                const std::function<void(const WalFrame&)>& on_frame)
    -> std::expected<RecoveryStats, core::error>;

} // namespace vexlake::wal
