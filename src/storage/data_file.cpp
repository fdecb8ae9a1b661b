#include "vexlake/storage/data_file.hpp"

#include <algorithm>
#include <cstring>
#include <numeric>

#include "vexlake/core/bytes.hpp"
#include "vexlake/core/crc32c.hpp"

namespace vexlake::storage {

namespace {

constexpr char kHeaderMagic[8] = {'V', 'X', 'D', 'F', '0', '0', '0', '1'};
constexpr std::uint32_t kTrailerMagic = 0x46445856; // "VXDF"

auto corrupt(const std::string& what) -> std::unexpected<core::error> {
    return core::fail(core::error_code::data_integrity, what, "storage.data_file");
}

struct Trailer {
    std::uint64_t footer_offset{0};
    std::uint64_t footer_length{0};
    std::uint32_t footer_crc{0};
    std::uint32_t body_crc{0};
};

auto parse_trailer(std::span<const std::uint8_t> bytes) -> std::expected<Trailer, core::error> {
    core::ByteReader r(bytes);
    Trailer t;
    std::uint32_t magic = 0, reserved = 0;
    if (!r.get(t.footer_offset) || !r.get(t.footer_length) || !r.get(t.footer_crc) || !r.get(t.body_crc) ||
        !r.get(magic) || !r.get(reserved)) {
        return corrupt("truncated trailer");
    }
    if (magic != kTrailerMagic) return corrupt("bad trailer magic");
    if (reserved != 0) return corrupt("trailer reserved bits set");
    return t;
}

struct Footer {
    std::uint64_t rows{0};
    std::uint32_t dim{0};
    std::uint32_t vector_crc{0};
    std::vector<std::uint64_t> offsets;
    std::vector<std::uint32_t> lengths;
    std::uint64_t min_id{0};
    std::uint64_t max_id{0};
};

auto parse_footer(std::span<const std::uint8_t> bytes, std::uint64_t payload_begin, std::uint64_t payload_end)
    -> std::expected<Footer, core::error> {
    core::ByteReader r(bytes);
    Footer f;
    if (!r.get(f.rows) || !r.get(f.dim) || !r.get(f.vector_crc)) return corrupt("truncated footer");
    constexpr std::size_t kEntry = sizeof(std::uint64_t) + sizeof(std::uint32_t);
    if (f.rows > r.remaining() / kEntry) return corrupt("footer row count exceeds footer size");
    f.offsets.resize(f.rows);
    f.lengths.resize(f.rows);
    for (std::uint64_t i = 0; i < f.rows; ++i) {
        if (!r.get(f.offsets[i]) || !r.get(f.lengths[i])) return corrupt("truncated footer entry");
        if (f.offsets[i] < payload_begin || f.offsets[i] > payload_end ||
            f.lengths[i] > payload_end - f.offsets[i]) {
            return corrupt("payload entry outside payload block");
        }
    }
    if (!r.get(f.min_id) || !r.get(f.max_id) || r.remaining() != 0) return corrupt("bad footer tail");
    return f;
}

auto vector_block_size(std::uint64_t rows, std::uint32_t dim) -> std::uint64_t {
    return rows * (sizeof(std::uint64_t) + std::uint64_t{dim} * sizeof(float));
}

auto parse_vector_block(std::span<const std::uint8_t> block, std::uint64_t rows, std::uint32_t dim,
                        DataFileRows& out) -> std::expected<void, core::error> {
    core::ByteReader r(block);
    out.dim = dim;
    out.ids.resize(rows);
    out.vectors.resize(rows * dim);
    std::vector<float> row;
    for (std::uint64_t i = 0; i < rows; ++i) {
        if (!r.get(out.ids[i]) || !r.get_floats(dim, row)) return corrupt("truncated vector block");
        if (i > 0 && out.ids[i] <= out.ids[i - 1]) return corrupt("row ids not strictly ascending");
        std::copy(row.begin(), row.end(), out.vectors.begin() + static_cast<std::ptrdiff_t>(i * dim));
    }
    return {};
}

} // namespace

auto encode_data_file(std::size_t dim, kernels::Metric metric, std::vector<RowRef> rows)
    -> std::expected<EncodedDataFile, core::error> {
    if (dim == 0) return core::fail(core::error_code::invalid_argument, "dimension must be > 0", "storage.data_file");
    std::sort(rows.begin(), rows.end(), [](const RowRef& a, const RowRef& b) { return a.id < b.id; });
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].vector.size() != dim) {
            return core::fail(core::error_code::dimension_mismatch, "row vector has wrong dimension",
                              "storage.data_file");
        }
        if (i > 0 && rows[i].id == rows[i - 1].id) {
            return core::fail(core::error_code::invalid_argument, "duplicate id in data file", "storage.data_file");
        }
    }

    const std::uint64_t n = rows.size();
    const std::uint64_t payload_total = std::accumulate(
        rows.begin(), rows.end(), std::uint64_t{0},
        [](std::uint64_t acc, const RowRef& r) { return acc + r.payload.size(); });
    core::ByteWriter w(kDataFileHeaderSize + vector_block_size(n, static_cast<std::uint32_t>(dim)) +
                       payload_total + n * 12 + 64);

    w.put_bytes(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(kHeaderMagic), 8));
    w.put<std::uint32_t>(kDataFileFormatVersion);
    w.put<std::uint32_t>(static_cast<std::uint32_t>(dim));
    w.put<std::uint64_t>(n);
    w.put<std::uint8_t>(static_cast<std::uint8_t>(metric));
    while (w.size() < kDataFileHeaderSize) w.put<std::uint8_t>(0);

    for (const auto& r : rows) {
        w.put<std::uint64_t>(r.id);
        w.put_floats(r.vector);
    }
    const std::uint32_t vector_crc =
        core::crc32c(w.view().subspan(kDataFileHeaderSize, w.size() - kDataFileHeaderSize));

    std::vector<std::uint64_t> offsets(n);
    for (std::uint64_t i = 0; i < n; ++i) {
        offsets[i] = w.size();
        w.put_bytes(rows[i].payload);
    }
    const std::uint64_t footer_offset = w.size();
    const std::uint32_t body_crc = core::crc32c(w.view());

    w.put<std::uint64_t>(n);
    w.put<std::uint32_t>(static_cast<std::uint32_t>(dim));
    w.put<std::uint32_t>(vector_crc);
    for (std::uint64_t i = 0; i < n; ++i) {
        w.put<std::uint64_t>(offsets[i]);
        w.put<std::uint32_t>(static_cast<std::uint32_t>(rows[i].payload.size()));
    }
    const std::uint64_t min_id = n ? rows.front().id : 0;
    const std::uint64_t max_id = n ? rows.back().id : 0;
    w.put<std::uint64_t>(min_id);
    w.put<std::uint64_t>(max_id);
    const std::uint64_t footer_length = w.size() - footer_offset;
    const std::uint32_t footer_crc = core::crc32c(w.view().subspan(footer_offset, footer_length));

    w.put<std::uint64_t>(footer_offset);
    w.put<std::uint64_t>(footer_length);
    w.put<std::uint32_t>(footer_crc);
    w.put<std::uint32_t>(body_crc);
    w.put<std::uint32_t>(kTrailerMagic);
    w.put<std::uint32_t>(0);

    EncodedDataFile out;
    out.info = DataFileInfo{n, w.size(), footer_offset, footer_length, min_id, max_id};
    out.bytes = std::move(w).take();
    return out;
}

auto decode_data_file(std::span<const std::uint8_t> bytes) -> std::expected<DataFileContents, core::error> {
    if (bytes.size() < kDataFileHeaderSize + kDataFileTrailerSize) return corrupt("file too small");
    if (std::memcmp(bytes.data(), kHeaderMagic, sizeof(kHeaderMagic)) != 0) return corrupt("bad header magic");

    core::ByteReader hr(bytes.subspan(8, kDataFileHeaderSize - 8));
    std::uint32_t version = 0, dim = 0;
    std::uint64_t rows = 0;
    if (!hr.get(version) || !hr.get(dim) || !hr.get(rows)) return corrupt("truncated header");
    if (version != kDataFileFormatVersion) return corrupt("unsupported data file version");
    if (dim == 0) return corrupt("zero dimension");

    auto trailer = parse_trailer(bytes.subspan(bytes.size() - kDataFileTrailerSize));
    if (!trailer) return std::unexpected(trailer.error());
    const std::uint64_t body_end = bytes.size() - kDataFileTrailerSize;
    if (trailer->footer_offset > body_end || trailer->footer_length != body_end - trailer->footer_offset) {
        return corrupt("footer position inconsistent with file size");
    }
    if (core::crc32c(bytes.subspan(0, trailer->footer_offset)) != trailer->body_crc) {
        return corrupt("body checksum mismatch");
    }
    const auto footer_bytes = bytes.subspan(trailer->footer_offset, trailer->footer_length);
    if (core::crc32c(footer_bytes) != trailer->footer_crc) return corrupt("footer checksum mismatch");

    if (rows > (trailer->footer_offset - kDataFileHeaderSize) / (8 + std::uint64_t{dim} * 4)) {
        return corrupt("row count exceeds file size");
    }
    const std::uint64_t vblock = vector_block_size(rows, dim);
    auto footer = parse_footer(footer_bytes, kDataFileHeaderSize + vblock, trailer->footer_offset);
    if (!footer) return std::unexpected(footer.error());
    if (footer->rows != rows || footer->dim != dim) return corrupt("footer disagrees with header");

    DataFileContents out;
    if (auto r = parse_vector_block(bytes.subspan(kDataFileHeaderSize, vblock), rows, dim, out.rows); !r) {
        return std::unexpected(r.error());
    }
    out.rows.payload_offsets = std::move(footer->offsets);
    out.rows.payload_lengths = std::move(footer->lengths);
    out.payloads.reserve(rows);
    for (std::uint64_t i = 0; i < rows; ++i) {
        const auto p = bytes.subspan(out.rows.payload_offsets[i], out.rows.payload_lengths[i]);
        out.payloads.emplace_back(p.begin(), p.end());
    }
    return out;
}

auto read_data_file_rows(StorageClient& client, const std::string& path, const DataFileInfo& info,
                         std::size_t expected_dim) -> std::expected<DataFileRows, core::error> {
    if (info.footer_offset < kDataFileHeaderSize ||
        info.bytes != info.footer_offset + info.footer_length + kDataFileTrailerSize) {
        return corrupt("descriptor footer position inconsistent: " + path);
    }
    auto tail = client.get_range(path, ByteRange{info.footer_offset, info.footer_length + kDataFileTrailerSize});
    if (!tail) return std::unexpected(tail.error());
    const std::span<const std::uint8_t> tail_view(*tail);
    auto trailer = parse_trailer(tail_view.subspan(info.footer_length));
    if (!trailer) return std::unexpected(trailer.error());
    if (trailer->footer_offset != info.footer_offset || trailer->footer_length != info.footer_length) {
        return corrupt("trailer disagrees with descriptor: " + path);
    }
    const auto footer_bytes = tail_view.subspan(0, info.footer_length);
    if (core::crc32c(footer_bytes) != trailer->footer_crc) return corrupt("footer checksum mismatch: " + path);

    // Peek rows/dim to size the vector block before validating payload bounds.
    core::ByteReader peek(footer_bytes);
    std::uint64_t rows = 0;
    std::uint32_t dim = 0;
    if (!peek.get(rows) || !peek.get(dim)) return corrupt("truncated footer: " + path);
    if (dim != expected_dim) {
        return corrupt("data file dimension " + std::to_string(dim) + " != " + std::to_string(expected_dim));
    }
    if (rows != info.rows) return corrupt("row count disagrees with descriptor: " + path);
    const std::uint64_t vblock = vector_block_size(rows, dim);
    if (kDataFileHeaderSize + vblock > info.footer_offset) return corrupt("vector block overruns footer: " + path);

    auto footer = parse_footer(footer_bytes, kDataFileHeaderSize + vblock, info.footer_offset);
    if (!footer) return std::unexpected(footer.error());

    auto block = client.get_range(path, ByteRange{kDataFileHeaderSize, vblock});
    if (!block) return std::unexpected(block.error());
    if (core::crc32c(*block) != footer->vector_crc) return corrupt("vector block checksum mismatch: " + path);

    DataFileRows out;
    if (auto r = parse_vector_block(*block, rows, dim, out); !r) return std::unexpected(r.error());
    out.payload_offsets = std::move(footer->offsets);
    out.payload_lengths = std::move(footer->lengths);
    return out;
}

auto read_payload(StorageClient& client, const std::string& path, std::uint64_t offset, std::uint32_t length)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
    if (length == 0) return std::vector<std::uint8_t>{};
    return client.get_range(path, ByteRange{offset, length});
}

} // namespace vexlake::storage
