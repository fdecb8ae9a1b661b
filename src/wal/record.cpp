#include "vexlake/wal/record.hpp"

#include "vexlake/core/bytes.hpp"

namespace vexlake::wal {

auto encode_record(const WalRecord& r) -> std::vector<std::uint8_t> {
  core::ByteWriter w(16 + r.vector.size() * sizeof(float) + r.payload.size());
  w.put<std::uint64_t>(r.id);
  if (r.op == OpKind::Insert) {
    w.put<std::uint32_t>(static_cast<std::uint32_t>(r.vector.size()));
    w.put_floats(r.vector);
    w.put<std::uint32_t>(static_cast<std::uint32_t>(r.payload.size()));
    w.put_bytes(r.payload);
  }
  return std::move(w).take();
}

auto decode_record(const WalFrame& frame) -> std::expected<WalRecord, core::error> {
  using core::error_code;
  core::ByteReader in(frame.payload);
  WalRecord r;
  if (!in.get(r.id)) {
    return core::fail(error_code::data_integrity, "truncated record id", "wal.record");
  }
  switch (static_cast<FrameType>(frame.type)) {
    case FrameType::Delete:
      r.op = OpKind::Delete;
      return r;
    case FrameType::Insert: {
      r.op = OpKind::Insert;
      std::uint32_t dim = 0, plen = 0;
      std::span<const std::uint8_t> bytes;
      if (!in.get(dim) || !in.get_floats(dim, r.vector) || !in.get(plen) ||
          !in.get_bytes(plen, bytes)) {
        return core::fail(error_code::data_integrity, "truncated insert record", "wal.record");
      }
      r.payload.assign(bytes.begin(), bytes.end());
      return r;
    }
  }
  return core::fail(error_code::data_integrity, "unknown frame type", "wal.record");
}

} // namespace vexlake::wal
