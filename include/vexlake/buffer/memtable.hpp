#pragma once

/** \file memtable.hpp
 *  \brief One write-buffer generation: the net effect of its operations in arrival order.
 *
 * Live inserts are kept as dense rows (ids, row-major vectors, payloads) so the
 * brute-force scanner can read them directly. Every delete is remembered in
 * `deleted_ids()`; it hides older copies of the id in frozen generations and
 * data files, and becomes a per-file tombstone at flush time.
 */

#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include <roaring/roaring64map.hh>

#include "vexlake/wal/record.hpp"

namespace vexlake::buffer {

/** \brief Materialised record as returned by point lookups. */
struct Record {
    std::uint64_t id{0};
    std::vector<float> vector;
    std::vector<std::uint8_t> payload;
};

class MemTable {
public:
    MemTable(std::uint64_t generation, std::size_t dim) : generation_(generation), dim_(dim) {}

    /** \brief Apply one operation; vectors are stored as given (callers normalise). */
    void apply(const wal::WalRecord& r);

    [[nodiscard]] bool contains_live(std::uint64_t id) const noexcept { return row_of_.count(id) > 0; }
    [[nodiscard]] bool deletes(std::uint64_t id) const noexcept { return deleted_.contains(id); }
    [[nodiscard]] auto get(std::uint64_t id) const -> std::optional<Record>;

    [[nodiscard]] std::span<const std::uint64_t> ids() const noexcept { return ids_; }
    [[nodiscard]] std::span<const float> vectors() const noexcept { return vectors_; }
    [[nodiscard]] const roaring::Roaring64Map& deleted_ids() const noexcept { return deleted_; }
    [[nodiscard]] auto payload_at(std::size_t row) const noexcept -> std::span<const std::uint8_t> {
        return payloads_[row];
    }

    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }
    [[nodiscard]] std::size_t dimension() const noexcept { return dim_; }
    [[nodiscard]] std::size_t live_count() const noexcept { return ids_.size(); }
    [[nodiscard]] std::size_t op_count() const noexcept { return ops_; }
    /** \brief Logical bytes buffered: 8 + 4*dim + payload per insert, 8 per delete. */
    [[nodiscard]] std::size_t bytes() const noexcept { return bytes_; }
    [[nodiscard]] bool empty() const noexcept { return ops_ == 0; }

private:
    void erase_row(std::size_t row);

    std::uint64_t generation_;
    std::size_t dim_;
    std::vector<std::uint64_t> ids_;
    std::vector<float> vectors_;
    std::vector<std::vector<std::uint8_t>> payloads_;
    std::unordered_map<std::uint64_t, std::size_t> row_of_;
    roaring::Roaring64Map deleted_;
    std::size_t ops_{0};
    std::size_t bytes_{0};
};

} // namespace vexlake::buffer
