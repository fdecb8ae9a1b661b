#include <catch2/catch_all.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <unordered_set>
#include <vector>

#include <vexlake/engine.hpp>
#include <vexlake/storage/memory_object_store.hpp>
#include "tests/support/test_helpers.hpp"

using namespace vexlake;
using core::error_code;

// Catch2 assertions are not used off the main thread; workers count failures instead.
TEST_CASE("writers, readers, flush and compaction run together without losing rows",
          "[engine][concurrency]") {
  test_support::TempDir tmp("vexlake_concurrency");
  auto mem = std::make_shared<storage::MemoryObjectStore>();
  const std::size_t dim = 8, writers = 4, per_writer = 500;
  auto cfg = test_support::small_engine_config(tmp.path(), dim, kernels::Metric::L2);
  // 8 (id) + 32 (vector) bytes per insert: a threshold flush every ~150 inserts.
  cfg.flush_threshold_bytes = 40 * 150;
  cfg.compaction.min_files = 2;
  cfg.compaction.interval = std::chrono::milliseconds(5);
  cfg.background_compaction = true;
  auto opened = Engine::open(cfg, mem);
  REQUIRE(opened.has_value());
  auto engine = std::move(*opened);

  const auto vecs = test_support::random_vectors(writers * per_writer, dim, 5);
  std::atomic<bool> writers_done{false};
  std::atomic<std::size_t> write_errors{0}, read_errors{0}, bad_results{0}, searches{0}, compactions{0};
  std::vector<std::vector<std::uint64_t>> deleted(writers);

  std::vector<std::thread> threads;
  for (std::size_t w = 0; w < writers; ++w) {
    threads.emplace_back([&, w] {
      for (std::size_t j = 0; j < per_writer; ++j) {
        const std::uint64_t id = w * per_writer + j;
        const std::span<const float> v(vecs.data() + id * dim, dim);
        if (!engine->insert(id, v)) ++write_errors;
        // Delete an earlier id of our own, which may already sit in a data file.
        if (j >= 20 && j % 10 == 0) {
          const std::uint64_t victim = id - 20;
          if (engine->remove(victim)) {
            deleted[w].push_back(victim);
          } else {
            ++write_errors;
          }
        }
      }
    });
  }
  for (int r = 0; r < 2; ++r) {
    threads.emplace_back([&, r] {
      std::size_t q = static_cast<std::size_t>(r);
      while (!writers_done.load()) {
        const std::span<const float> query(vecs.data() + (q % (writers * per_writer)) * dim, dim);
        auto rs = engine->search(query, 10);
        if (!rs) {
          ++read_errors;
        } else {
          std::unordered_set<std::uint64_t> seen;
          for (std::size_t i = 0; i < rs->size(); ++i) {
            if (!seen.insert((*rs)[i].id).second) ++bad_results;
            if (i > 0 && (*rs)[i].score < (*rs)[i - 1].score) ++bad_results;
          }
        }
        ++searches;
        q += 97;
      }
    });
  }
  threads.emplace_back([&] {
    while (!writers_done.load()) {
      if (!engine->compact()) ++read_errors;
      ++compactions;
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
  });

  for (std::size_t w = 0; w < writers; ++w) threads[w].join();
  writers_done.store(true);
  for (std::size_t t = writers; t < threads.size(); ++t) threads[t].join();

  REQUIRE(write_errors.load() == 0);
  REQUIRE(read_errors.load() == 0);
  REQUIRE(bad_results.load() == 0);
  REQUIRE(searches.load() > 0);
  REQUIRE(compactions.load() > 0);

  std::unordered_set<std::uint64_t> gone;
  for (const auto& d : deleted) gone.insert(d.begin(), d.end());
  const std::size_t total = writers * per_writer;

  REQUIRE(engine->stats().version_id > 1);
  REQUIRE(engine->flush().has_value());
  REQUIRE(engine->compact().has_value());
  auto st = engine->stats();
  REQUIRE(st.buffered_records == 0);
  REQUIRE(st.stored_vectors == total - gone.size());

  for (std::uint64_t id = 0; id < total; ++id) {
    auto rec = engine->get(id);
    if (gone.count(id)) {
      REQUIRE(rec.error().code == error_code::not_found);
    } else {
      REQUIRE(rec.has_value());
      REQUIRE(rec->vector == std::vector<float>(vecs.begin() + id * dim, vecs.begin() + (id + 1) * dim));
    }
  }
  REQUIRE(engine->shutdown().has_value());
}

TEST_CASE("a pin held across concurrent publishes keeps answering the same way",
          "[engine][concurrency][snapshot]") {
  test_support::TempDir tmp("vexlake_concurrency");
  auto mem = std::make_shared<storage::MemoryObjectStore>();
  const std::size_t dim = 4;
  auto cfg = test_support::small_engine_config(tmp.path(), dim, kernels::Metric::L2);
  cfg.compaction.min_files = 2;
  auto opened = Engine::open(cfg, mem);
  REQUIRE(opened.has_value());
  auto engine = std::move(*opened);

  for (std::uint64_t i = 0; i < 100; ++i) {
    const float v[4]{float(i), 0, 0, 0};
    REQUIRE(engine->insert(i, v).has_value());
  }
  REQUIRE(engine->flush().has_value());
  auto pin = engine->pin();
  const float q[4]{0, 0, 0, 0};
  auto before = engine->search_at(pin, q, 20);
  REQUIRE(before.has_value());

  std::atomic<bool> stop{false};
  std::atomic<std::size_t> mismatches{0}, failures{0};
  std::thread reader([&] {
    while (!stop.load()) {
      auto now = engine->search_at(pin, q, 20);
      if (!now) {
        ++failures;
      } else if (now->size() != before->size() ||
                 !std::equal(now->begin(), now->end(), before->begin(),
                             [](const SearchResult& a, const SearchResult& b) { return a.id == b.id; })) {
        ++mismatches;
      }
    }
  });

  for (std::uint64_t round = 0; round < 10; ++round) {
    for (std::uint64_t i = 0; i < 20; ++i) {
      const float v[4]{-0.5f, float(i), 0, 0};
      REQUIRE(engine->insert(1000 + round * 20 + i, v).has_value());
    }
    REQUIRE(engine->remove(round).has_value());
    REQUIRE(engine->flush().has_value());
    REQUIRE(engine->compact().has_value());
  }
  stop.store(true);
  reader.join();

  REQUIRE(failures.load() == 0);
  REQUIRE(mismatches.load() == 0);
  REQUIRE(engine->search(q, 1)->front().id == 1000);
  pin.release();
}
