#include <catch2/catch_all.hpp>

#include <algorithm>
#include <chrono>
#include <limits>
#include <memory>
#include <set>
#include <vector>

#include <vexlake/engine.hpp>
#include <vexlake/storage/memory_object_store.hpp>
#include "tests/support/test_helpers.hpp"

using namespace vexlake;
using core::error_code;

namespace {

std::unique_ptr<Engine> open_engine(const EngineConfig& cfg, std::shared_ptr<storage::ObjectStore> store = nullptr) {
  auto e = Engine::open(cfg, std::move(store));
  REQUIRE(e.has_value());
  return std::move(*e);
}

std::vector<std::uint64_t> ids_of(const std::vector<SearchResult>& rs) {
  std::vector<std::uint64_t> out;
  for (const auto& r : rs) out.push_back(r.id);
  return out;
}

std::span<const float> row(const std::vector<float>& v, std::size_t i, std::size_t dim) {
  return std::span<const float>(v).subspan(i * dim, dim);
}

} // namespace

TEST_CASE("line of a thousand vectors ranks the origin first", "[engine][e2e]") {
  test_support::TempDir tmp("vexlake_e2e");
  const auto metric = GENERATE(kernels::Metric::L2, kernels::Metric::Cosine);
  auto engine = open_engine(test_support::small_engine_config(tmp.path(), 4, metric));

  for (std::uint64_t i = 0; i < 1000; ++i) {
    const float v[4]{1.0f, 0.0f, 0.0f, static_cast<float>(i)};
    REQUIRE(engine->insert(i, v).has_value());
  }
  const float q[4]{1.0f, 0.0f, 0.0f, 0.0f};

  auto check = [&](const std::vector<SearchResult>& rs) {
    REQUIRE(ids_of(rs) == std::vector<std::uint64_t>{0, 1, 2});
    if (metric == kernels::Metric::L2) {
      REQUIRE(rs[0].score == Catch::Approx(0.0f));
      REQUIRE(rs[1].score == Catch::Approx(1.0f));
      REQUIRE(rs[2].score == Catch::Approx(4.0f));
    } else {
      REQUIRE(rs[0].score == Catch::Approx(1.0f));
      REQUIRE(rs[0].score > rs[1].score);
      REQUIRE(rs[1].score > rs[2].score);
    }
  };

  auto buffered = engine->search(q, 3);
  REQUIRE(buffered.has_value());
  check(*buffered);

  REQUIRE(engine->flush().value() == 1);
  auto stored = engine->search(q, 3);
  REQUIRE(stored.has_value());
  check(*stored);
  REQUIRE(engine->stats().stored_vectors == 1000);
}

TEST_CASE("equal scores come back in ascending id order", "[engine][e2e]") {
  test_support::TempDir tmp("vexlake_e2e");
  auto engine = open_engine(test_support::small_engine_config(tmp.path(), 4, kernels::Metric::Cosine));
  // Parallel vectors of different length normalise to the same point.
  for (std::uint64_t id : {42u, 7u, 19u, 3u}) {
    const float v[4]{static_cast<float>(id), 0.0f, 0.0f, 0.0f};
    REQUIRE(engine->insert(id, v).has_value());
  }
  const float q[4]{2.0f, 0.0f, 0.0f, 0.0f};
  auto rs = engine->search(q, 3);
  REQUIRE(ids_of(*rs) == std::vector<std::uint64_t>{3, 7, 19});
  REQUIRE(engine->flush().has_value());
  rs = engine->search(q, 4);
  REQUIRE(ids_of(*rs) == std::vector<std::uint64_t>{3, 7, 19, 42});
}

TEST_CASE("deleted ids never come back", "[engine][e2e][delete]") {
  test_support::TempDir tmp("vexlake_e2e");
  const std::size_t n = 400, dim = 8;
  auto cfg = test_support::small_engine_config(tmp.path(), dim, kernels::Metric::L2);
  auto engine = open_engine(cfg);
  auto vecs = test_support::random_vectors(n, dim, 3);
  for (std::size_t i = 0; i < n; ++i) REQUIRE(engine->insert(i, row(vecs, i, dim)).has_value());

  std::set<std::uint64_t> deleted;
  auto delete_some = [&](std::size_t from) {
    for (std::size_t i = from; i < n; i += 9) {
      REQUIRE(engine->remove(i).has_value());
      deleted.insert(i);
    }
  };
  auto verify = [&] {
    for (auto id : deleted) {
      auto rs = engine->search(row(vecs, id, dim), 10);
      REQUIRE(rs.has_value());
      for (const auto& r : *rs) REQUIRE(deleted.count(r.id) == 0);
      REQUIRE(engine->get(id).error().code == error_code::not_found);
    }
  };

  SECTION("deleted while still buffered") {
    delete_some(0);
    verify();
    REQUIRE(engine->flush().has_value());
    verify();
  }
  SECTION("deleted after the file was published") {
    REQUIRE(engine->flush().has_value());
    delete_some(4);
    verify();                       // tombstones still in the buffer
    REQUIRE(engine->flush().has_value());
    verify();                       // tombstones recorded on the data file
    REQUIRE(engine->stats().tombstones == deleted.size());
    REQUIRE(engine->stats().stored_vectors == n - deleted.size());
  }
  SECTION("survives reopen") {
    delete_some(2);
    REQUIRE(engine->shutdown().has_value());
    engine = open_engine(cfg);
    verify();
  }
  REQUIRE(engine->remove(*deleted.begin()).error().code == error_code::not_found);
}

TEST_CASE("a deleted id can be inserted again", "[engine][e2e][delete]") {
  test_support::TempDir tmp("vexlake_e2e");
  auto engine = open_engine(test_support::small_engine_config(tmp.path(), 4, kernels::Metric::L2));
  const float old_v[4]{5, 5, 5, 5};
  const float new_v[4]{-1, -1, -1, -1};
  const float other[4]{9, 9, 9, 9};
  REQUIRE(engine->insert(5, old_v).has_value());
  REQUIRE(engine->insert(6, other).has_value());
  REQUIRE(engine->flush().has_value());
  REQUIRE(engine->remove(5).has_value());
  REQUIRE(engine->insert(5, new_v).has_value());

  auto check = [&] {
    auto rec = engine->get(5);
    REQUIRE(rec.has_value());
    REQUIRE(rec->vector == std::vector<float>(new_v, new_v + 4));
    auto rs = engine->search(old_v, 5);
    REQUIRE(rs.has_value());
    REQUIRE(std::count_if(rs->begin(), rs->end(), [](const SearchResult& r) { return r.id == 5; }) == 1);
    auto hit = std::find_if(rs->begin(), rs->end(), [](const SearchResult& r) { return r.id == 5; });
    REQUIRE(hit->score == Catch::Approx(4 * 36.0f));
  };
  check();
  REQUIRE(engine->flush().has_value());
  check();
  REQUIRE(engine->stats().stored_vectors == 2);
}

TEST_CASE("crossing the byte threshold flushes exactly once", "[engine][e2e][flush]") {
  test_support::TempDir tmp("vexlake_e2e");
  auto cfg = test_support::small_engine_config(tmp.path(), 4, kernels::Metric::L2);
  // An insert without payload buffers 8 (id) + 16 (vector) bytes.
  cfg.flush_threshold_bytes = 24 * 100;
  auto engine = open_engine(cfg);

  for (std::uint64_t i = 0; i < 99; ++i) {
    const float v[4]{float(i), 0, 0, 0};
    REQUIRE(engine->insert(i, v).has_value());
  }
  REQUIRE(engine->stats().version_id == 0);
  REQUIRE(engine->stats().buffered_records == 99);

  const float v[4]{99, 0, 0, 0};
  REQUIRE(engine->insert(99, v).has_value());
  auto st = engine->stats();
  REQUIRE(st.version_id == 1);
  REQUIRE(st.data_files == 1);
  REQUIRE(st.index_files == 1);
  REQUIRE(st.stored_vectors == 100);
  REQUIRE(st.buffered_records == 0);

  for (std::uint64_t i = 100; i < 150; ++i) {
    const float w[4]{float(i), 0, 0, 0};
    REQUIRE(engine->insert(i, w).has_value());
  }
  REQUIRE(engine->stats().version_id == 1);
  // Explicit flush of an empty buffer publishes nothing.
  REQUIRE(engine->flush().value() == 2);
  REQUIRE(engine->flush().value() == 2);
}

TEST_CASE("pinned versions do not see later writes", "[engine][e2e][snapshot]") {
  test_support::TempDir tmp("vexlake_e2e");
  auto cfg = test_support::small_engine_config(tmp.path(), 4, kernels::Metric::L2);
  cfg.compaction.min_files = 2;
  auto engine = open_engine(cfg);

  for (std::uint64_t i = 0; i < 10; ++i) {
    const float v[4]{float(i), 0, 0, 0};
    REQUIRE(engine->insert(i, v).has_value());
  }
  REQUIRE(engine->flush().value() == 1);
  auto pin = engine->pin();
  REQUIRE(pin.version_id() == 1);
  REQUIRE(engine->stats().pinned_versions == 1);

  for (std::uint64_t i = 100; i < 110; ++i) {
    const float v[4]{0.5f, 0, 0, 0};
    REQUIRE(engine->insert(i, v).has_value());
  }
  REQUIRE(engine->remove(0).has_value());
  REQUIRE(engine->flush().value() == 2);

  const float q[4]{0, 0, 0, 0};
  auto now = engine->search(q, 3);
  REQUIRE(ids_of(*now) == std::vector<std::uint64_t>{100, 101, 102});

  auto then = engine->search_at(pin, q, 3);
  REQUIRE(then.has_value());
  REQUIRE(ids_of(*then) == std::vector<std::uint64_t>{0, 1, 2});

  SECTION("compaction does not disturb the pinned files") {
    auto r = engine->compact();
    REQUIRE(r.has_value());
    REQUIRE(r->output_files == 1);
    REQUIRE(engine->stats().data_files == 1);
    auto again = engine->search_at(pin, q, 3);
    REQUIRE(again.has_value());
    REQUIRE(ids_of(*again) == std::vector<std::uint64_t>{0, 1, 2});
    REQUIRE(ids_of(*engine->search(q, 3)) == std::vector<std::uint64_t>{100, 101, 102});
  }
  SECTION("buffered writes are invisible to a pin") {
    const float v[4]{0, 0, 0, 0};
    REQUIRE(engine->insert(500, v).has_value());
    REQUIRE(engine->search(q, 1)->front().id == 500);
    REQUIRE(engine->search_at(pin, q, 1)->front().id == 0);
  }
  pin.release();
  REQUIRE(engine->stats().pinned_versions == 0);
  REQUIRE(engine->search_at(pin, q, 1).error().code == error_code::invalid_argument);
}

TEST_CASE("cancelled and expired searches fail cleanly and release their pins", "[engine][e2e][cancel]") {
  test_support::TempDir tmp("vexlake_e2e");
  auto cfg = test_support::small_engine_config(tmp.path(), 8, kernels::Metric::L2);
  cfg.query_timeout = std::chrono::hours(1);
  auto engine = open_engine(cfg);
  auto vecs = test_support::random_vectors(600, 8, 5);
  for (std::size_t i = 0; i < 400; ++i) REQUIRE(engine->insert(i, row(vecs, i, 8)).has_value());
  REQUIRE(engine->flush().value() == 1);
  for (std::size_t i = 400; i < 600; ++i) REQUIRE(engine->insert(i, row(vecs, i, 8)).has_value());
  const auto q = row(vecs, 7, 8);

  // A generous configured deadline never trips.
  auto ok = engine->search(q, 5);
  REQUIRE(ok.has_value());
  REQUIRE(ok->front().id == 7);

  SECTION("caller cancels") {
    core::CancellationToken stop;
    stop.cancel();
    SearchOptions opts;
    opts.cancel = &stop;
    REQUIRE(engine->search(q, 5, 0, opts).error().code == error_code::cancelled);
    auto pin = engine->pin();
    REQUIRE(engine->search_at(pin, q, 5, 0, opts).error().code == error_code::cancelled);
    REQUIRE(engine->stats().pinned_versions == 1);
  }
  SECTION("deadline already passed") {
    auto expired = core::CancellationToken::with_timeout(std::chrono::milliseconds(0));
    SearchOptions opts;
    opts.cancel = &expired;
    opts.with_payload = true;
    REQUIRE(engine->search(q, 5, 0, opts).error().code == error_code::cancelled);
  }
  REQUIRE(engine->stats().pinned_versions == 0);

  // The engine keeps answering after a cancelled query.
  auto again = engine->search(q, 5);
  REQUIRE(again.has_value());
  REQUIRE(ids_of(*again) == ids_of(*ok));
}

TEST_CASE("payloads come back through get and search", "[engine][e2e][payload]") {
  test_support::TempDir tmp("vexlake_e2e");
  auto engine = open_engine(test_support::small_engine_config(tmp.path(), 4, kernels::Metric::L2));
  const float a[4]{0, 0, 0, 0};
  const float b[4]{1, 0, 0, 0};
  const std::vector<std::uint8_t> pa{'a', 'l', 'p', 'h', 'a'};
  const std::vector<std::uint8_t> pb{'b'};
  REQUIRE(engine->insert(1, a, pa).has_value());
  REQUIRE(engine->flush().has_value());
  REQUIRE(engine->insert(2, b, pb).has_value());
  REQUIRE(engine->insert(3, b).has_value());

  auto r1 = engine->get(1);
  REQUIRE(r1.has_value());
  REQUIRE(r1->payload == pa);
  REQUIRE(r1->vector == std::vector<float>(a, a + 4));
  REQUIRE(engine->get(2)->payload == pb);
  REQUIRE(engine->get(3)->payload.empty());
  REQUIRE(engine->get(77).error().code == error_code::not_found);

  SearchOptions with;
  with.with_payload = true;
  auto rs = engine->search(a, 3, 0, with);
  REQUIRE(rs.has_value());
  REQUIRE(ids_of(*rs) == std::vector<std::uint64_t>{1, 2, 3});
  REQUIRE((*rs)[0].payload == pa);
  REQUIRE((*rs)[1].payload == pb);
  REQUIRE((*rs)[2].payload.empty());

  auto plain = engine->search(a, 1);
  REQUIRE(plain->front().payload.empty());
}

TEST_CASE("clear drops everything and the namespace stays usable", "[engine][e2e]") {
  test_support::TempDir tmp("vexlake_e2e");
  auto mem = std::make_shared<storage::MemoryObjectStore>();
  auto cfg = test_support::small_engine_config(tmp.path(), 4, kernels::Metric::L2);
  auto engine = open_engine(cfg, mem);
  for (std::uint64_t i = 0; i < 20; ++i) {
    const float v[4]{float(i), 1, 0, 0};
    REQUIRE(engine->insert(i, v).has_value());
    if (i == 9) REQUIRE(engine->flush().has_value());
  }
  REQUIRE(engine->clear().has_value());
  auto st = engine->stats();
  REQUIRE(st.data_files == 0);
  REQUIRE(st.stored_vectors == 0);
  REQUIRE(st.buffered_records == 0);
  REQUIRE(mem->list("data/")->empty());

  const float q[4]{0, 1, 0, 0};
  REQUIRE(engine->search(q, 5)->empty());
  REQUIRE(engine->insert(3, q).has_value());
  REQUIRE(ids_of(*engine->search(q, 5)) == std::vector<std::uint64_t>{3});

  // Cleared writes are not resurrected by WAL replay.
  REQUIRE(engine->shutdown().has_value());
  engine = open_engine(cfg, mem);
  REQUIRE(ids_of(*engine->search(q, 5)) == std::vector<std::uint64_t>{3});
}

TEST_CASE("invalid calls are rejected up front", "[engine][e2e][errors]") {
  test_support::TempDir tmp("vexlake_e2e");
  auto engine = open_engine(test_support::small_engine_config(tmp.path(), 4, kernels::Metric::L2));
  const float v[4]{1, 2, 3, 4};
  const float short_v[3]{1, 2, 3};

  REQUIRE(engine->insert(1, short_v).error().code == error_code::dimension_mismatch);
  REQUIRE(engine->insert(1, v).has_value());
  REQUIRE(engine->insert(1, v).error().code == error_code::already_exists);
  REQUIRE(engine->flush().has_value());
  REQUIRE(engine->insert(1, v).error().code == error_code::already_exists);
  REQUIRE(engine->remove(2).error().code == error_code::not_found);
  REQUIRE(engine->search(short_v, 1).error().code == error_code::dimension_mismatch);
  REQUIRE(engine->search(v, 0).error().code == error_code::invalid_argument);

  // ef below k is raised to k.
  auto rs = engine->search(v, 1, 1);
  REQUIRE(rs.has_value());
  REQUIRE(rs->size() == 1);

  REQUIRE(engine->health_check());
  REQUIRE(engine->dimension() == 4);
  REQUIRE(engine->metric() == kernels::Metric::L2);
  REQUIRE(engine->shutdown().has_value());
  REQUIRE_FALSE(engine->health_check());
  REQUIRE(engine->insert(2, v).error().code == error_code::not_initialized);
  REQUIRE(engine->search(v, 1).error().code == error_code::not_initialized);
  REQUIRE(engine->shutdown().error().code == error_code::not_initialized);
}

TEST_CASE("k far beyond the row count returns every live row", "[engine][e2e]") {
  test_support::TempDir tmp("vexlake_e2e");
  auto engine = open_engine(test_support::small_engine_config(tmp.path(), 4, kernels::Metric::L2));
  for (std::uint64_t i = 0; i < 6; ++i) {
    const float v[4]{static_cast<float>(i), 0.0f, 0.0f, 0.0f};
    REQUIRE(engine->insert(i, v).has_value());
    if (i == 2) REQUIRE(engine->flush().has_value());
  }
  const float q[4]{0.0f, 0.0f, 0.0f, 0.0f};
  const std::uint32_t huge = std::numeric_limits<std::uint32_t>::max();

  auto rs = engine->search(q, huge);
  REQUIRE(rs.has_value());
  REQUIRE(ids_of(*rs) == std::vector<std::uint64_t>{0, 1, 2, 3, 4, 5});

  auto pin = engine->pin();
  rs = engine->search_at(pin, q, huge, huge);
  REQUIRE(rs.has_value());
  REQUIRE(ids_of(*rs) == std::vector<std::uint64_t>{0, 1, 2});
}

TEST_CASE("open rejects configurations that disagree with the namespace", "[engine][e2e][errors]") {
  test_support::TempDir tmp("vexlake_e2e");
  auto cfg = test_support::small_engine_config(tmp.path(), 4, kernels::Metric::L2);
  {
    auto engine = open_engine(cfg);
    const float v[4]{1, 2, 3, 4};
    REQUIRE(engine->insert(1, v).has_value());
  }
  cfg.dimension = 8;
  REQUIRE(Engine::open(cfg).error().code == error_code::config_invalid);
  cfg.dimension = 0;
  REQUIRE(Engine::open(cfg).error().code == error_code::config_invalid);
}
