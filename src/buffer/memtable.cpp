#include "vexlake/buffer/memtable.hpp"

#include <algorithm>

namespace vexlake::buffer {

void MemTable::apply(const wal::WalRecord& r) {
    ++ops_;
    if (r.op == wal::OpKind::Delete) {
        bytes_ += sizeof(std::uint64_t);
        deleted_.add(r.id);
        if (auto it = row_of_.find(r.id); it != row_of_.end()) erase_row(it->second);
        return;
    }
    bytes_ += sizeof(std::uint64_t) + r.vector.size() * sizeof(float) + r.payload.size();
    if (auto it = row_of_.find(r.id); it != row_of_.end()) erase_row(it->second);
    row_of_[r.id] = ids_.size();
    ids_.push_back(r.id);
    vectors_.insert(vectors_.end(), r.vector.begin(), r.vector.end());
    payloads_.push_back(r.payload);
}

void MemTable::erase_row(std::size_t row) {
    const std::size_t last = ids_.size() - 1;
    row_of_.erase(ids_[row]);
    if (row != last) {
        ids_[row] = ids_[last];
        std::copy_n(vectors_.begin() + static_cast<std::ptrdiff_t>(last * dim_), dim_,
                    vectors_.begin() + static_cast<std::ptrdiff_t>(row * dim_));
        payloads_[row] = std::move(payloads_[last]);
        row_of_[ids_[row]] = row;
    }
    ids_.pop_back();
    vectors_.resize(last * dim_);
    payloads_.pop_back();
}

auto MemTable::get(std::uint64_t id) const -> std::optional<Record> {
    auto it = row_of_.find(id);
    if (it == row_of_.end()) return std::nullopt;
    const std::size_t row = it->second;
    Record rec;
    rec.id = id;
    rec.vector.assign(vectors_.begin() + static_cast<std::ptrdiff_t>(row * dim_),
                      vectors_.begin() + static_cast<std::ptrdiff_t>((row + 1) * dim_));
    rec.payload = payloads_[row];
    return rec;
}

} // namespace vexlake::buffer
