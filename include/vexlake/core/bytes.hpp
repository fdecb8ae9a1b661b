#pragma once

/** \file bytes.hpp
 *  \brief Little-endian byte writer/reader shared by the WAL, data file and index codecs.
 *
 * Reader accessors return false on short input instead of throwing; codecs map that
 * to error_code::data_integrity.
 */

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace vexlake::core {

class ByteWriter {
public:
  ByteWriter() = default;
  explicit ByteWriter(std::size_t reserve) { buf_.reserve(reserve); }

  template <typename T>
  void put(T v) {
    static_assert(std::is_trivially_copyable_v<T>);
    const auto off = buf_.size();
    buf_.resize(off + sizeof(T));
    std::memcpy(buf_.data() + off, &v, sizeof(T));
  }

  void put_bytes(std::span<const std::uint8_t> bytes) {
    buf_.insert(buf_.end(), bytes.begin(), bytes.end());
  }

  void put_floats(std::span<const float> v) {
    const auto off = buf_.size();
    buf_.resize(off + v.size_bytes());
    if (!v.empty()) std::memcpy(buf_.data() + off, v.data(), v.size_bytes());
  }

  /** \brief Overwrite a previously reserved fixed-width slot. */
  template <typename T>
  void patch(std::size_t offset, T v) {
    std::memcpy(buf_.data() + offset, &v, sizeof(T));
  }

  [[nodiscard]] std::size_t size() const noexcept { return buf_.size(); }
  [[nodiscard]] std::span<const std::uint8_t> view() const noexcept { return buf_; }
  [[nodiscard]] std::vector<std::uint8_t> take() && { return std::move(buf_); }

private:
  std::vector<std::uint8_t> buf_;
};

class ByteReader {
public:
  explicit ByteReader(std::span<const std::uint8_t> bytes) : bytes_(bytes) {}

  template <typename T>
  [[nodiscard]] bool get(T& out) noexcept {
    static_assert(std::is_trivially_copyable_v<T>);
    if (remaining() < sizeof(T)) return false;
    std::memcpy(&out, bytes_.data() + pos_, sizeof(T));
    pos_ += sizeof(T);
    return true;
  }

  [[nodiscard]] bool get_bytes(std::size_t n, std::span<const std::uint8_t>& out) noexcept {
    if (remaining() < n) return false;
    out = bytes_.subspan(pos_, n);
    pos_ += n;
    return true;
  }

  [[nodiscard]] bool get_floats(std::size_t n, std::vector<float>& out) {
    if (n > remaining() / sizeof(float)) return false;
    out.resize(n);
    if (n) std::memcpy(out.data(), bytes_.data() + pos_, n * sizeof(float));
    pos_ += n * sizeof(float);
    return true;
  }

  [[nodiscard]] std::size_t remaining() const noexcept { return bytes_.size() - pos_; }
  [[nodiscard]] std::size_t position() const noexcept { return pos_; }

private:
  std::span<const std::uint8_t> bytes_;
  std::size_t pos_{0};
};

} // namespace vexlake::core
