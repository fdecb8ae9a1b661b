#include <catch2/catch_all.hpp>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <vexlake/compaction/compactor.hpp>
#include <vexlake/storage/data_file.hpp>
#include <vexlake/storage/memory_object_store.hpp>
#include <vexlake/storage/segment_writer.hpp>

using namespace vexlake;
using compaction::CompactionPolicy;
using compaction::Compactor;
using core::error_code;
using version::DataFileRef;
using version::VersionDescriptor;

namespace {

constexpr std::size_t kDim = 4;

index::HnswBuildParams tiny_hnsw() {
  index::HnswBuildParams p;
  p.M = 4;
  p.max_M0 = 8;
  p.efConstruction = 16;
  return p;
}

struct Namespace {
  std::shared_ptr<storage::MemoryObjectStore> mem = std::make_shared<storage::MemoryObjectStore>();
  std::shared_ptr<storage::StorageClient> client = std::make_shared<storage::StorageClient>(mem);
  std::unique_ptr<version::VersionManager> vm = open();

  std::unique_ptr<version::VersionManager> open() {
    version::VersionManagerOptions o;
    o.dimension = kDim;
    o.metric = kernels::Metric::L2;
    auto r = version::VersionManager::open(client, o);
    REQUIRE(r.has_value());
    return std::move(*r);
  }

  // Writes ids [first, first + n) as one data file (vector i = [i, 0, 0, 0], payload = {i % 256}) and commits it.
  DataFileRef add_file(std::uint64_t first, std::uint64_t n) {
    std::vector<float> vecs(n * kDim, 0.0f);
    std::vector<std::vector<std::uint8_t>> payloads(n);
    std::vector<storage::RowRef> rows;
    for (std::uint64_t i = 0; i < n; ++i) {
      vecs[i * kDim] = static_cast<float>(first + i);
      payloads[i] = {static_cast<std::uint8_t>((first + i) % 256)};
    }
    for (std::uint64_t i = 0; i < n; ++i) {
      rows.push_back({first + i, std::span<const float>(vecs).subspan(i * kDim, kDim), payloads[i]});
    }
    auto seg = storage::write_segment(*client, 0, [this] { return vm->allocate_seq(); }, kDim, kernels::Metric::L2, tiny_hnsw(),
                                      std::move(rows));
    REQUIRE(seg.has_value());
    REQUIRE(seg->index.has_value());
    REQUIRE(vm->commit([&](VersionDescriptor& d) -> std::expected<void, core::error> {
      d.data_files.push_back(seg->data);
      d.index_files.push_back(*seg->index);
      return {};
    }).has_value());
    return seg->data;
  }

  void tombstone(version::VersionManager& writer, const std::string& path, std::vector<std::uint64_t> ids) {
    REQUIRE(writer.commit([&](VersionDescriptor& d) -> std::expected<void, core::error> {
      auto* f = d.find_data_file(path);
      REQUIRE(f != nullptr);
      for (auto id : ids) f->deleted_ids.add(id);
      return {};
    }).has_value());
  }

  std::size_t count(const std::string& prefix) { return client->list(prefix)->size(); }
};

DataFileRef fake_file(std::uint64_t seq, std::uint64_t rows, std::uint64_t deleted = 0, std::uint32_t partition = 0) {
  DataFileRef f;
  f.path = "data/" + std::to_string(partition) + "/" + std::to_string(seq) + ".vxd";
  f.partition = partition;
  f.seq = seq;
  f.rows = rows;
  for (std::uint64_t i = 0; i < deleted; ++i) f.deleted_ids.add(seq * 100000 + i);
  return f;
}

CompactionPolicy small_policy() {
  CompactionPolicy p;
  p.min_files = 4;
  p.small_file_rows = 1000;
  p.target_rows = 10000;
  p.tombstone_ratio = 0.25;
  return p;
}

} // namespace

TEST_CASE("planner waits for enough small files per partition", "[compaction][plan]") {
  VersionDescriptor v;
  for (std::uint64_t s = 1; s <= 3; ++s) v.data_files.push_back(fake_file(s, 100));
  v.data_files.push_back(fake_file(9, 100, 0, 1));   // other partition
  REQUIRE(compaction::plan_compaction(v, small_policy()).empty());

  v.data_files.push_back(fake_file(4, 100));
  auto groups = compaction::plan_compaction(v, small_policy());
  REQUIRE(groups.size() == 1);
  REQUIRE(groups[0].partition == 0);
  REQUIRE(groups[0].inputs.size() == 4);
  // Inputs are merged in sequence order.
  for (std::size_t i = 1; i < 4; ++i) REQUIRE(groups[0].inputs[i - 1].seq < groups[0].inputs[i].seq);
}

TEST_CASE("planner rewrites tombstone-heavy files", "[compaction][plan]") {
  VersionDescriptor v;
  v.data_files.push_back(fake_file(1, 5000, 1000));   // 20%: below threshold
  v.data_files.push_back(fake_file(2, 5000, 1500));   // 30%
  auto groups = compaction::plan_compaction(v, small_policy());
  REQUIRE(groups.size() == 1);
  REQUIRE(groups[0].inputs.size() == 1);
  REQUIRE(groups[0].inputs[0].seq == 2);

  SECTION("heavy files join a small-file merge in the same partition") {
    for (std::uint64_t s = 3; s <= 6; ++s) v.data_files.push_back(fake_file(s, 100));
    groups = compaction::plan_compaction(v, small_policy());
    REQUIRE(groups.size() == 1);
    REQUIRE(groups[0].inputs.size() == 5);
  }
}

TEST_CASE("planner chunks merges by target rows", "[compaction][plan]") {
  auto policy = small_policy();
  VersionDescriptor v;
  for (std::uint64_t s = 1; s <= 6; ++s) v.data_files.push_back(fake_file(s, 100));

  policy.target_rows = 250;
  auto groups = compaction::plan_compaction(v, policy);
  REQUIRE(groups.size() == 3);
  for (const auto& g : groups) REQUIRE(g.inputs.size() == 2);

  // A trailing chunk of one clean file would be a plain copy and is skipped.
  v.data_files.pop_back();
  policy.target_rows = 400;
  groups = compaction::plan_compaction(v, policy);
  REQUIRE(groups.size() == 1);
  REQUIRE(groups[0].inputs.size() == 4);
}

TEST_CASE("merge keeps live rows and drops tombstoned ones", "[compaction]") {
  Namespace ns;
  std::vector<DataFileRef> inputs;
  for (std::uint64_t f = 0; f < 4; ++f) inputs.push_back(ns.add_file(f * 10, 5));
  ns.tombstone(*ns.vm, inputs[1].path, {10, 12});
  REQUIRE(ns.count("data/") == 4);

  version::DescriptorPtr seen;
  Compactor c(*ns.vm, ns.client, tiny_hnsw(), small_policy(),
              [&](const version::DescriptorPtr& d) { seen = d; });
  auto r = c.run_once();
  REQUIRE(r.has_value());
  REQUIRE(r->groups == 1);
  REQUIRE(r->input_files == 4);
  REQUIRE(r->output_files == 1);
  REQUIRE(r->rows_written == 18);
  REQUIRE(r->rows_dropped == 2);
  REQUIRE(r->version_id == ns.vm->current_id());
  REQUIRE(seen);
  REQUIRE(seen->version_id == r->version_id);

  const auto cur = ns.vm->current();
  REQUIRE(cur->data_files.size() == 1);
  REQUIRE(cur->index_files.size() == 1);
  REQUIRE(cur->total_vectors == 18);
  REQUIRE(cur->deleted_ids.isEmpty());
  // Superseded inputs were collected.
  REQUIRE(ns.count("data/") == 1);
  REQUIRE(ns.count("index/") == 1);

  auto bytes = ns.client->get_file(cur->data_files[0].path);
  REQUIRE(bytes.has_value());
  auto contents = storage::decode_data_file(*bytes);
  REQUIRE(contents.has_value());
  REQUIRE(contents->rows.ids.size() == 18);
  for (std::size_t i = 0; i < contents->rows.ids.size(); ++i) {
    const auto id = contents->rows.ids[i];
    REQUIRE(id != 10);
    REQUIRE(id != 12);
    REQUIRE(contents->rows.vectors[i * kDim] == static_cast<float>(id));
    REQUIRE(contents->payloads[i] == std::vector<std::uint8_t>{static_cast<std::uint8_t>(id)});
  }

  // Nothing left to do.
  auto again = c.run_once();
  REQUIRE(again.has_value());
  REQUIRE(again->groups == 0);
  REQUIRE(again->version_id == 0);
}

TEST_CASE("tombstones added during a merge carry onto its output", "[compaction]") {
  Namespace ns;
  std::vector<DataFileRef> inputs;
  for (std::uint64_t f = 0; f < 4; ++f) inputs.push_back(ns.add_file(f * 10, 5));

  // A second writer deletes ids after this manager last looked.
  auto other = ns.open();
  ns.tombstone(*other, inputs[2].path, {21, 23});

  Compactor c(*ns.vm, ns.client, tiny_hnsw(), small_policy());
  auto r = c.run_once();
  REQUIRE(r.has_value());
  REQUIRE(r->rows_written == 20);
  const auto cur = ns.vm->current();
  REQUIRE(cur->version_id == 6);
  REQUIRE(cur->data_files.size() == 1);
  REQUIRE(cur->data_files[0].deleted_ids.contains(21));
  REQUIRE(cur->data_files[0].deleted_ids.contains(23));
  REQUIRE(cur->total_vectors == 18);
}

TEST_CASE("a vanished input abandons the round and removes its output", "[compaction]") {
  Namespace ns;
  std::vector<DataFileRef> inputs;
  for (std::uint64_t f = 0; f < 4; ++f) inputs.push_back(ns.add_file(f * 10, 5));

  auto other = ns.open();
  REQUIRE(other->commit([&](VersionDescriptor& d) -> std::expected<void, core::error> {
    std::erase_if(d.data_files, [&](const DataFileRef& f) { return f.path == inputs[0].path; });
    std::erase_if(d.index_files, [&](const version::IndexFileRef& ix) { return ix.data_file == inputs[0].path; });
    return {};
  }).has_value());

  Compactor c(*ns.vm, ns.client, tiny_hnsw(), small_policy());
  auto r = c.run_once();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::precondition_failed);
  REQUIRE(ns.count("data/") == 4);
  REQUIRE(ns.count("index/") == 4);
  REQUIRE(ns.vm->current()->data_files.size() == 3);
}

TEST_CASE("unreadable inputs fail the round without publishing", "[compaction]") {
  Namespace ns;
  std::vector<DataFileRef> inputs;
  for (std::uint64_t f = 0; f < 4; ++f) inputs.push_back(ns.add_file(f * 10, 5));
  ns.mem->corrupt(inputs[3].path, storage::kDataFileHeaderSize + 1, 0x40);
  const auto before = ns.vm->current_id();

  Compactor c(*ns.vm, ns.client, tiny_hnsw(), small_policy());
  auto r = c.run_once();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::data_integrity);
  REQUIRE(ns.vm->current_id() == before);
  REQUIRE(ns.count("data/") == 4);
}

TEST_CASE("background loop compacts on its interval", "[compaction][background]") {
  Namespace ns;
  for (std::uint64_t f = 0; f < 4; ++f) ns.add_file(f * 10, 3);
  const auto before = ns.vm->current_id();

  auto policy = small_policy();
  policy.interval = std::chrono::milliseconds(10);
  Compactor c(*ns.vm, ns.client, tiny_hnsw(), policy);
  c.start();
  REQUIRE(c.running());
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (ns.vm->current_id() == before && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  c.stop();
  REQUIRE_FALSE(c.running());
  REQUIRE(ns.vm->current_id() == before + 1);
  REQUIRE(ns.vm->current()->data_files.size() == 1);
}
