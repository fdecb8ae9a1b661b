#include "vexlake/wal/io.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

#include "vexlake/core/platform_utils.hpp"

namespace vexlake::wal {

namespace {

auto fsync_file_path(const std::filesystem::path& p) -> std::expected<void, core::error> {
  using core::error_code;
#if defined(__linux__) || defined(__APPLE__)
  const int fd = ::open(p.c_str(), O_RDONLY);
  if (fd < 0) {
    return core::fail(error_code::durability_failed, "fsync open failed", "wal.io");
  }
  const int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return core::fail(error_code::durability_failed, "fsync failed", "wal.io");
  }
#endif
  return {};
}

void fsync_dir_path(const std::filesystem::path& dir) {
#if defined(__linux__) || defined(__APPLE__)
  const int fd = ::open(dir.c_str(), O_RDONLY);
  if (fd < 0) return; // best-effort for directory metadata
  (void)::fsync(fd);
  (void)::close(fd);
#endif
}

auto read_exact(std::ifstream& in, std::vector<std::uint8_t>& buf, std::size_t n) -> bool {
  buf.resize(n);
  in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
  return static_cast<std::size_t>(in.gcount()) == n;
}

auto parse_generation(const std::string& name) -> std::optional<std::uint64_t> {
  // wal-XXXXXXXX.log
  if (name.size() != 16 || name.rfind("wal-", 0) != 0 || name.substr(12) != ".log") return std::nullopt;
  std::uint64_t g = 0;
  for (std::size_t i = 4; i < 12; ++i) {
    if (name[i] < '0' || name[i] > '9') return std::nullopt;
    g = g * 10 + static_cast<std::uint64_t>(name[i] - '0');
  }
  return g;
}

} // namespace

WalWriter::~WalWriter() {
  if (out_.is_open()) out_.close();
}

auto wal_path(const std::filesystem::path& dir, std::uint64_t generation) -> std::filesystem::path {
  std::ostringstream oss;
  oss << "wal-" << std::setw(8) << std::setfill('0') << generation << ".log";
  return dir / oss.str();
}

auto WalWriter::open(const std::filesystem::path& dir, std::uint64_t generation, bool sync_on_append)
    -> std::expected<WalWriter, core::error> {
  using core::error_code;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) return core::fail(error_code::io_failed, "mkdir failed: " + ec.message(), "wal.io");

  WalWriter w;
  w.path_ = wal_path(dir, generation);
  w.generation_ = generation;
  w.sync_on_append_ = sync_on_append;
  const bool existed = std::filesystem::exists(w.path_, ec);
  w.out_.open(w.path_, std::ios::binary | std::ios::out | std::ios::app);
  if (!w.out_.good()) {
    return core::fail(error_code::io_failed, "open failed: " + w.path_.string(), "wal.io");
  }
  if (!existed) fsync_dir_path(dir);
  return w;
}

auto WalWriter::append(std::uint64_t lsn, const WalRecord& record) -> std::expected<void, core::error> {
  using core::error_code;
  const auto payload = encode_record(record);
  const auto type = record.op == OpKind::Insert ? FrameType::Insert : FrameType::Delete;
  auto enc = encode_frame(lsn, static_cast<std::uint16_t>(type), payload);
  if (!enc) return std::unexpected(enc.error());
  if (!out_.is_open()) {
    return core::fail(error_code::durability_failed, "writer closed", "wal.io");
  }
  out_.write(reinterpret_cast<const char*>(enc->data()), static_cast<std::streamsize>(enc->size()));
  if (!out_.good()) {
    return core::fail(error_code::durability_failed, "write failed", "wal.io");
  }
  bytes_ += enc->size();
  return flush(sync_on_append_);
}

auto WalWriter::flush(bool sync) -> std::expected<void, core::error> {
  using core::error_code;
  if (!out_.good()) return core::fail(error_code::durability_failed, "writer closed", "wal.io");
  out_.flush();
  if (!out_.good()) return core::fail(error_code::durability_failed, "flush failed", "wal.io");
  if (sync) return fsync_file_path(path_);
  return {};
}

auto list_generations(const std::filesystem::path& dir)
    -> std::expected<std::vector<std::uint64_t>, core::error> {
  using core::error_code;
  std::vector<std::uint64_t> out;
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) return out;
  for (auto it = std::filesystem::directory_iterator(dir, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    if (auto g = parse_generation(it->path().filename().string())) out.push_back(*g);
  }
  if (ec) return core::fail(error_code::io_failed, "list failed: " + ec.message(), "wal.io");
  std::sort(out.begin(), out.end());
  return out;
}

auto remove_generations_through(const std::filesystem::path& dir, std::uint64_t generation)
    -> std::expected<void, core::error> {
  using core::error_code;
  auto gens = list_generations(dir);
  if (!gens) return std::unexpected(gens.error());
  for (const auto g : *gens) {
    if (g > generation) break;
    std::error_code ec;
    std::filesystem::remove(wal_path(dir, g), ec);
    if (ec) return core::fail(error_code::io_failed, "remove failed: " + ec.message(), "wal.io");
  }
  fsync_dir_path(dir);
  return {};
}

auto recover_scan(const std::filesystem::path& path,
                  const std::function<void(const WalFrame&)>& on_frame)
    -> std::expected<RecoveryStats, core::error> {
  using core::error_code;
  RecoveryStats stats{};
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) return core::fail(error_code::not_found, "open failed: " + path.string(), "wal.io");

  std::error_code fec;
  const auto file_sz = std::filesystem::file_size(path, fec);
  std::uint64_t consumed = 0;

  std::vector<std::uint8_t> frame;
  std::vector<std::uint8_t> rest;
  while (true) {
    if (!read_exact(in, frame, WAL_HEADER_SIZE)) {
      stats.torn_tail = in.gcount() > 0;
      break;
    }
    std::uint32_t magic; std::memcpy(&magic, frame.data(), 4);
    std::uint32_t len; std::memcpy(&len, frame.data() + 4, 4);
    if (magic != WAL_MAGIC || len < WAL_HEADER_SIZE + 4 || len > WAL_MAX_FRAME) {
      stats.torn_tail = true;
      break;
    }
    if (!fec && consumed + len > file_sz) {
      stats.torn_tail = true;
      break;
    }
    if (!read_exact(in, rest, len - WAL_HEADER_SIZE)) {
      stats.torn_tail = true;
      break;
    }
    frame.insert(frame.end(), rest.begin(), rest.end());
    auto dec = decode_frame(frame);
    if (!dec) {
      stats.torn_tail = true;
      break;
    }
    on_frame(*dec);
    stats.frames += 1;
    stats.bytes += frame.size();
    stats.last_lsn = dec->lsn;
    consumed += len;
  }
  if (stats.torn_tail && core::debug_enabled()) {
    std::cerr << "[vexlake][wal] torn tail in " << path.string() << " after " << stats.frames
              << " frames\n";
  }
  return stats;
}

} // namespace vexlake::wal
