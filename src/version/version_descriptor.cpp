#include "vexlake/version/version_descriptor.hpp"

#include <nlohmann/json.hpp>

namespace vexlake::version {

using json = nlohmann::json;

namespace {

auto bitmap_to_json(const roaring::Roaring64Map& m) -> json {
    json arr = json::array();
    for (auto it = m.begin(); it != m.end(); ++it) arr.push_back(*it);
    return arr;
}

auto bitmap_from_json(const json& arr) -> roaring::Roaring64Map {
    roaring::Roaring64Map m;
    for (const auto& v : arr) m.add(v.get<std::uint64_t>());
    return m;
}

} // namespace

void VersionDescriptor::recompute_totals() {
    deleted_ids = roaring::Roaring64Map();
    total_vectors = 0;
    for (const auto& f : data_files) {
        deleted_ids |= f.deleted_ids;
        total_vectors += f.live_rows();
    }
}

auto VersionDescriptor::find_data_file(const std::string& path) const -> const DataFileRef* {
    for (const auto& f : data_files) {
        if (f.path == path) return &f;
    }
    return nullptr;
}

auto VersionDescriptor::find_data_file(const std::string& path) -> DataFileRef* {
    for (auto& f : data_files) {
        if (f.path == path) return &f;
    }
    return nullptr;
}

auto VersionDescriptor::index_for(const std::string& data_path) const -> const IndexFileRef* {
    for (const auto& ix : index_files) {
        if (ix.data_file == data_path) return &ix;
    }
    return nullptr;
}

auto VersionDescriptor::referenced_paths() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(data_files.size() + index_files.size());
    for (const auto& f : data_files) out.push_back(f.path);
    for (const auto& ix : index_files) out.push_back(ix.path);
    return out;
}

auto encode_descriptor(const VersionDescriptor& d) -> std::string {
    json j;
    j["version_id"] = d.version_id;
    j["created_at"] = d.created_at_ms;
    j["dimension"] = d.dimension;
    j["metric"] = std::string(kernels::to_string(d.metric));
    j["parent_version"] = d.parent_version;
    j["writer"] = d.writer;
    j["data_files"] = json::array();
    for (const auto& f : d.data_files) {
        j["data_files"].push_back({
            {"path", f.path},
            {"partition", f.partition},
            {"seq", f.seq},
            {"rows", f.rows},
            {"bytes", f.bytes},
            {"footer_offset", f.footer_offset},
            {"footer_length", f.footer_length},
            {"min_id", f.min_id},
            {"max_id", f.max_id},
            {"deleted_ids", bitmap_to_json(f.deleted_ids)},
        });
    }
    j["index_files"] = json::array();
    for (const auto& ix : d.index_files) {
        j["index_files"].push_back({{"path", ix.path}, {"seq", ix.seq}, {"data_file", ix.data_file}});
    }
    j["deleted_ids"] = bitmap_to_json(d.deleted_ids);
    j["wal_generation"] = d.wal_generation;
    j["next_seq"] = d.next_seq;
    j["total_vectors"] = d.total_vectors;
    return j.dump(2);
}

auto decode_descriptor(std::span<const std::uint8_t> bytes) -> std::expected<VersionDescriptor, core::error> {
    try {
        const json j = json::parse(bytes.begin(), bytes.end());
        VersionDescriptor d;
        d.version_id = j.at("version_id").get<std::uint64_t>();
        d.created_at_ms = j.at("created_at").get<std::int64_t>();
        d.dimension = j.at("dimension").get<std::uint32_t>();
        auto metric = kernels::parse_metric(j.at("metric").get<std::string>());
        if (!metric) {
            return core::fail(core::error_code::data_integrity, "unknown metric in descriptor", "version.descriptor");
        }
        d.metric = *metric;
        d.parent_version = j.value("parent_version", std::uint64_t{0});
        d.writer = j.value("writer", std::string{});
        for (const auto& jf : j.at("data_files")) {
            DataFileRef f;
            f.path = jf.at("path").get<std::string>();
            f.partition = jf.at("partition").get<std::uint32_t>();
            f.seq = jf.at("seq").get<std::uint64_t>();
            f.rows = jf.at("rows").get<std::uint64_t>();
            f.bytes = jf.at("bytes").get<std::uint64_t>();
            f.footer_offset = jf.at("footer_offset").get<std::uint64_t>();
            f.footer_length = jf.at("footer_length").get<std::uint64_t>();
            f.min_id = jf.at("min_id").get<std::uint64_t>();
            f.max_id = jf.at("max_id").get<std::uint64_t>();
            f.deleted_ids = bitmap_from_json(jf.at("deleted_ids"));
            d.data_files.push_back(std::move(f));
        }
        for (const auto& jx : j.at("index_files")) {
            d.index_files.push_back(IndexFileRef{jx.at("path").get<std::string>(), jx.at("seq").get<std::uint64_t>(),
                                                 jx.at("data_file").get<std::string>()});
        }
        d.wal_generation = j.at("wal_generation").get<std::uint64_t>();
        d.next_seq = j.at("next_seq").get<std::uint64_t>();
        d.recompute_totals();
        if (d.total_vectors != j.at("total_vectors").get<std::uint64_t>()) {
            return core::fail(core::error_code::data_integrity, "descriptor totals disagree with file list",
                              "version.descriptor");
        }
        return d;
    } catch (const json::exception& e) {
        return core::fail(core::error_code::data_integrity, std::string("malformed version descriptor: ") + e.what(),
                          "version.descriptor");
    }
}

} // namespace vexlake::version
