#include <catch2/catch_all.hpp>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <vexlake/storage/layout.hpp>
#include <vexlake/storage/memory_object_store.hpp>
#include <vexlake/version/version_manager.hpp>

using namespace vexlake;
using core::error_code;
using storage::MemoryObjectStore;
using version::VersionDescriptor;
using version::VersionManager;

namespace {

struct Namespace {
  std::shared_ptr<MemoryObjectStore> mem = std::make_shared<MemoryObjectStore>();
  std::shared_ptr<storage::StorageClient> client = std::make_shared<storage::StorageClient>(mem);

  std::unique_ptr<VersionManager> open(std::uint32_t dim = 8, kernels::Metric m = kernels::Metric::L2) {
    version::VersionManagerOptions o;
    o.dimension = dim;
    o.metric = m;
    auto vm = VersionManager::open(client, o);
    REQUIRE(vm.has_value());
    return std::move(*vm);
  }

  // Writes a placeholder object and returns a reference describing it.
  version::DataFileRef add_file(std::uint64_t seq, std::uint64_t rows) {
    version::DataFileRef f;
    f.path = storage::data_file_path(0, seq);
    f.seq = seq;
    f.rows = rows;
    f.min_id = seq * 1000;
    f.max_id = seq * 1000 + rows - 1;
    const std::uint8_t byte = 0;
    REQUIRE(mem->put_if_absent(f.path, std::span<const std::uint8_t>(&byte, 1)).has_value());
    return f;
  }
};

auto append_file(version::DataFileRef f) {
  return [f](VersionDescriptor& d) -> std::expected<void, core::error> {
    d.data_files.push_back(f);
    return {};
  };
}

} // namespace

TEST_CASE("fresh namespace starts at the implicit empty version", "[version]") {
  Namespace ns;
  auto vm = ns.open();
  REQUIRE(vm->current_id() == 0);
  REQUIRE(vm->current()->data_files.empty());
  REQUIRE(vm->current()->dimension == 8);
  REQUIRE_FALSE(ns.mem->exists(storage::version_path(0)));
}

TEST_CASE("each commit publishes the next version id", "[version]") {
  Namespace ns;
  auto vm = ns.open();
  auto v1 = vm->commit(append_file(ns.add_file(vm->allocate_seq(), 10)));
  REQUIRE(v1.has_value());
  REQUIRE((*v1)->version_id == 1);
  REQUIRE((*v1)->parent_version == 0);
  REQUIRE((*v1)->total_vectors == 10);
  auto v2 = vm->commit(append_file(ns.add_file(vm->allocate_seq(), 5)));
  REQUIRE(v2.has_value());
  REQUIRE((*v2)->version_id == 2);
  REQUIRE((*v2)->total_vectors == 15);
  REQUIRE(vm->current_id() == 2);

  REQUIRE(ns.mem->exists(storage::version_path(1)));
  REQUIRE(ns.mem->exists(storage::version_path(2)));
  REQUIRE(*ns.client->get_file(std::string(storage::kLatestPath)) == std::vector<std::uint8_t>{'2'});

  SECTION("publishing a non-successor is a conflict") {
    VersionDescriptor stale = *vm->current();
    stale.version_id = 2;
    REQUIRE(vm->publish(stale).error().code == error_code::conflict);
  }
  SECTION("a failing mutation aborts without publishing") {
    auto r = vm->commit([](VersionDescriptor&) -> std::expected<void, core::error> {
      return core::fail(error_code::precondition_failed, "nope", "test");
    });
    REQUIRE(r.error().code == error_code::precondition_failed);
    REQUIRE(vm->current_id() == 2);
    REQUIRE_FALSE(ns.mem->exists(storage::version_path(3)));
  }
  SECTION("descriptors round-trip through reopen") {
    auto reopened = ns.open();
    REQUIRE(reopened->current_id() == 2);
    REQUIRE(reopened->current()->data_files.size() == 2);
    REQUIRE(reopened->current()->next_seq >= 3);
  }
}

TEST_CASE("concurrent writers serialize through conflict and retry", "[version][conflict]") {
  Namespace ns;
  auto a = ns.open();
  auto b = ns.open();
  REQUIRE(a->writer_id() != b->writer_id());

  REQUIRE(a->commit(append_file(ns.add_file(1, 3))).has_value());

  int attempts = 0;
  auto f2 = ns.add_file(2, 4);
  auto r = b->commit([&](VersionDescriptor& d) -> std::expected<void, core::error> {
    ++attempts;
    d.data_files.push_back(f2);
    return {};
  });
  REQUIRE(r.has_value());
  REQUIRE(attempts == 2);
  REQUIRE((*r)->version_id == 2);
  REQUIRE((*r)->data_files.size() == 2);   // re-applied on top of the winner
  REQUIRE((*r)->total_vectors == 7);

  REQUIRE(a->refresh().value() == 2);
  REQUIRE(a->current()->data_files.size() == 2);
}

TEST_CASE("a lost transient reply on our own publish is recognised", "[version]") {
  Namespace ns;
  auto vm = ns.open();
  // The descriptor is already stored, as if an earlier attempt landed but its reply was lost;
  // the writer nonce identifies it as ours.
  auto f = ns.add_file(1, 2);
  VersionDescriptor next = *vm->current();
  next.version_id = 1;
  next.data_files.push_back(f);
  next.recompute_totals();
  next.writer = vm->writer_id();
  REQUIRE(ns.mem->put_if_absent(storage::version_path(1),
                                [&] {
                                  auto s = version::encode_descriptor(next);
                                  return std::vector<std::uint8_t>(s.begin(), s.end());
                                }())
              .has_value());
  auto r = vm->publish(next);
  REQUIRE(r.has_value());
  REQUIRE(vm->current_id() == 1);
}

TEST_CASE("open reads past a stale hint and a lagging listing", "[version]") {
  Namespace ns;
  ns.mem->set_list_lag(100);
  {
    auto vm = ns.open();
    for (std::uint64_t i = 1; i <= 3; ++i) REQUIRE(vm->commit(append_file(ns.add_file(i, 1))).has_value());
  }
  ns.mem->set_list_lag(0);

  SECTION("stale hint") {
    const std::uint8_t one = '1';
    REQUIRE(ns.mem->put_overwrite(std::string(storage::kLatestPath), std::span<const std::uint8_t>(&one, 1)).has_value());
    REQUIRE(ns.open()->current_id() == 3);
  }
  SECTION("missing hint") {
    REQUIRE(ns.mem->remove(std::string(storage::kLatestPath)).has_value());
    REQUIRE(ns.open()->current_id() == 3);
  }
}

TEST_CASE("open rejects a namespace with a different shape", "[version]") {
  Namespace ns;
  {
    auto vm = ns.open(8, kernels::Metric::L2);
    REQUIRE(vm->commit(append_file(ns.add_file(1, 1))).has_value());
  }
  version::VersionManagerOptions o;
  o.dimension = 16;
  o.metric = kernels::Metric::L2;
  REQUIRE(VersionManager::open(ns.client, o).error().code == error_code::config_invalid);
  o.dimension = 8;
  o.metric = kernels::Metric::Cosine;
  REQUIRE(VersionManager::open(ns.client, o).error().code == error_code::config_invalid);
}

TEST_CASE("damaged descriptors are reported as integrity errors", "[version]") {
  Namespace ns;
  {
    auto vm = ns.open();
    REQUIRE(vm->commit(append_file(ns.add_file(1, 1))).has_value());
  }
  ns.mem->corrupt(storage::version_path(1), 0, 0xFF);
  version::VersionManagerOptions o;
  o.dimension = 8;
  o.metric = kernels::Metric::L2;
  REQUIRE(VersionManager::open(ns.client, o).error().code == error_code::data_integrity);
}

TEST_CASE("pins keep superseded files until released", "[version][gc]") {
  Namespace ns;
  auto vm = ns.open();
  auto old_file = ns.add_file(vm->allocate_seq(), 4);
  REQUIRE(vm->commit(append_file(old_file)).has_value());

  auto pin = vm->pin();
  REQUIRE(pin.version_id() == 1);
  REQUIRE(vm->pinned_count() == 1);

  auto new_file = ns.add_file(vm->allocate_seq(), 4);
  REQUIRE(vm->commit([&](VersionDescriptor& d) -> std::expected<void, core::error> {
    d.data_files = {new_file};
    return {};
  }).has_value());

  auto gc = vm->collect_garbage();
  REQUIRE(gc.has_value());
  REQUIRE(gc->removed == 0);
  REQUIRE(gc->retained_pinned == 1);
  REQUIRE(ns.mem->exists(old_file.path));
  // The pinned descriptor is unchanged by later commits.
  REQUIRE(pin.descriptor()->data_files.front().path == old_file.path);

  pin.release();
  REQUIRE(vm->pinned_count() == 0);
  gc = vm->collect_garbage();
  REQUIRE(gc->removed == 1);
  REQUIRE_FALSE(ns.mem->exists(old_file.path));
  REQUIRE(ns.mem->exists(new_file.path));

  // Already-collected paths are not removed twice.
  REQUIRE(vm->collect_garbage()->removed == 0);

  SECTION("pinning an explicit version") {
    auto p2 = vm->pin(2);
    REQUIRE(p2.has_value());
    REQUIRE(p2->version_id() == 2);
    REQUIRE(vm->pin(99).error().code == error_code::not_found);
    // Version 1 was forgotten once nothing needed it.
    REQUIRE(vm->pin(1).error().code == error_code::not_found);
  }
}

TEST_CASE("collected versions leave the in-memory table", "[version][gc]") {
  Namespace ns;
  auto vm = ns.open();
  auto replace_with = [&](version::DataFileRef f) {
    return [f](VersionDescriptor& d) -> std::expected<void, core::error> {
      d.data_files = {f};
      return {};
    };
  };

  for (int i = 0; i < 40; ++i) {
    REQUIRE(vm->commit(replace_with(ns.add_file(vm->allocate_seq(), 2))).has_value());
    REQUIRE(vm->collect_garbage().has_value());
    REQUIRE(vm->loaded_versions() == 1);
  }
  REQUIRE(vm->current_id() == 40);
  REQUIRE(vm->current()->data_files.size() == 1);
  REQUIRE(ns.mem->list(std::string(storage::kDataPrefix)).value().size() == 1);

  SECTION("a pin holds its version and everything newer") {
    auto pin = vm->pin();
    for (int i = 0; i < 5; ++i) {
      REQUIRE(vm->commit(replace_with(ns.add_file(vm->allocate_seq(), 2))).has_value());
      REQUIRE(vm->collect_garbage().has_value());
    }
    REQUIRE(vm->loaded_versions() == 6);
    REQUIRE(vm->get(40).has_value());
    REQUIRE(ns.mem->exists(pin.descriptor()->data_files.front().path));

    pin.release();
    auto gc = vm->collect_garbage();
    REQUIRE(gc.has_value());
    REQUIRE(gc->removed == 1);
    REQUIRE(vm->loaded_versions() == 1);
    REQUIRE(vm->get(40).error().code == error_code::not_found);
    REQUIRE(ns.mem->list(std::string(storage::kDataPrefix)).value().size() == 1);
  }

  SECTION("a failed remove keeps the version for the next round") {
    auto doomed = vm->current()->data_files.front().path;
    REQUIRE(vm->commit(replace_with(ns.add_file(vm->allocate_seq(), 2))).has_value());
    ns.mem->inject_failures(MemoryObjectStore::Op::Remove, ns.client->policy().max_attempts);
    auto gc = vm->collect_garbage();
    REQUIRE(gc.has_value());
    REQUIRE(gc->failed == 1);
    REQUIRE(vm->loaded_versions() == 2);
    REQUIRE(ns.mem->exists(doomed));

    gc = vm->collect_garbage();
    REQUIRE(gc->removed == 1);
    REQUIRE(vm->loaded_versions() == 1);
    REQUIRE_FALSE(ns.mem->exists(doomed));
  }
}

TEST_CASE("moved pins count once", "[version][gc]") {
  Namespace ns;
  auto vm = ns.open();
  auto a = vm->pin();
  auto b = std::move(a);
  REQUIRE_FALSE(static_cast<bool>(a));
  REQUIRE(vm->pinned_count() == 1);
  { auto c = std::move(b); }
  REQUIRE(vm->pinned_count() == 0);
}

TEST_CASE("orphan sweep removes only unreferenced settled files", "[version][gc]") {
  Namespace ns;
  auto vm = ns.open();
  const auto orphan_seq = vm->allocate_seq();
  auto orphan = ns.add_file(orphan_seq, 1);
  auto kept = ns.add_file(vm->allocate_seq(), 1);
  REQUIRE(vm->commit(append_file(kept)).has_value());
  const std::uint8_t byte = 0;
  REQUIRE(ns.mem->put_if_absent(storage::index_file_path(orphan_seq), std::span<const std::uint8_t>(&byte, 1))
              .has_value());
  // A file numbered past next_seq may belong to a flush that has not committed yet.
  auto in_flight = ns.add_file(1000, 1);

  auto swept = vm->sweep_orphans();
  REQUIRE(swept.has_value());
  REQUIRE(*swept == 2);
  REQUIRE_FALSE(ns.mem->exists(orphan.path));
  REQUIRE_FALSE(ns.mem->exists(storage::index_file_path(orphan_seq)));
  REQUIRE(ns.mem->exists(kept.path));
  REQUIRE(ns.mem->exists(in_flight.path));
  // Numbers already on storage are never handed out again.
  REQUIRE(vm->allocate_seq() == 1001);
}

TEST_CASE("descriptor json is stable and validated", "[version][descriptor]") {
  VersionDescriptor d;
  d.version_id = 4;
  d.dimension = 3;
  d.metric = kernels::Metric::InnerProduct;
  version::DataFileRef f;
  f.path = "data/0/00000000000000000001.vxd";
  f.seq = 1;
  f.rows = 10;
  f.deleted_ids.add(2);
  f.deleted_ids.add(5);
  d.data_files.push_back(f);
  d.index_files.push_back({"index/00000000000000000001.vxi", 1, f.path});
  d.recompute_totals();
  REQUIRE(d.total_vectors == 8);
  REQUIRE(d.deleted_ids.cardinality() == 2);

  const auto text = version::encode_descriptor(d);
  auto j = nlohmann::json::parse(text);
  REQUIRE(j["metric"] == "ip");
  REQUIRE(j["total_vectors"] == 8);

  auto back = version::decode_descriptor(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
  REQUIRE(back.has_value());
  REQUIRE(back->data_files.front().deleted_ids == f.deleted_ids);
  REQUIRE(back->index_for(f.path) != nullptr);

  j["total_vectors"] = 9;
  const auto bad = j.dump();
  REQUIRE(version::decode_descriptor(std::span<const std::uint8_t>(
              reinterpret_cast<const std::uint8_t*>(bad.data()), bad.size()))
              .error()
              .code == error_code::data_integrity);
}
