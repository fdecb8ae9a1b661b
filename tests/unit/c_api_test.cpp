#include <catch2/catch_all.hpp>

#include <cstring>
#include <string>
#include <vector>

#include <vexlake/c/vexlake.h>
#include "tests/support/test_helpers.hpp"

namespace {

vexlake_open_params_t params_for(const test_support::TempDir& tmp, std::string& root) {
  root = (tmp.path() / "ns").string();
  vexlake_open_params_t p{};
  p.root = root.c_str();
  p.wal_dir = nullptr;
  p.dimension = 4;
  p.metric = VEXLAKE_METRIC_L2;
  p.default_ef = 32;
  p.flush_threshold_bytes = 0;
  return p;
}

} // namespace

TEST_CASE("C API version and argument checks", "[c_api]") {
  REQUIRE(std::string(vexlake_version()) == "0.3.0");

  vexlake_engine_t* e = nullptr;
  REQUIRE(vexlake_open(nullptr, &e) == VEXLAKE_E_INVALID_ARGUMENT);
  REQUIRE(std::strlen(vexlake_get_last_error()) > 0);
  REQUIRE(vexlake_close(nullptr) == VEXLAKE_OK);
  REQUIRE(vexlake_health_check(nullptr) == 0);

  const float v[4]{1, 2, 3, 4};
  REQUIRE(vexlake_insert(nullptr, 1, v, 4, nullptr, 0) == VEXLAKE_E_INVALID_ARGUMENT);
  REQUIRE(vexlake_delete(nullptr, 1) == VEXLAKE_E_INVALID_ARGUMENT);
  REQUIRE(vexlake_flush(nullptr, nullptr) == VEXLAKE_E_INVALID_ARGUMENT);
}

TEST_CASE("C API open rejects bad configuration", "[c_api]") {
  test_support::TempDir tmp("vexlake_c");
  std::string root;
  auto p = params_for(tmp, root);
  p.dimension = 0;
  vexlake_engine_t* e = nullptr;
  REQUIRE(vexlake_open(&p, &e) == VEXLAKE_E_CONFIG_INVALID);
  REQUIRE(e == nullptr);
  REQUIRE(std::string(vexlake_get_last_error()).find("dimension") != std::string::npos);
}

TEST_CASE("C API insert, search, delete and flush", "[c_api]") {
  test_support::TempDir tmp("vexlake_c");
  std::string root;
  auto p = params_for(tmp, root);
  vexlake_engine_t* e = nullptr;
  REQUIRE(vexlake_open(&p, &e) == VEXLAKE_OK);
  REQUIRE(e != nullptr);
  REQUIRE(vexlake_health_check(e) == 1);

  for (std::uint64_t i = 0; i < 50; ++i) {
    const float v[4]{1.0f, 0.0f, 0.0f, static_cast<float>(i)};
    const std::uint8_t payload[1]{static_cast<std::uint8_t>(i)};
    REQUIRE(vexlake_insert(e, i, v, 4, payload, 1) == VEXLAKE_OK);
  }
  const float dup[4]{0, 0, 0, 0};
  REQUIRE(vexlake_insert(e, 3, dup, 4, nullptr, 0) == VEXLAKE_E_ALREADY_EXISTS);
  REQUIRE(vexlake_insert(e, 99, dup, 3, nullptr, 0) == VEXLAKE_E_DIMENSION_MISMATCH);
  REQUIRE(vexlake_insert(e, 99, dup, 4, nullptr, 5) == VEXLAKE_E_INVALID_ARGUMENT);

  const float q[4]{1.0f, 0.0f, 0.0f, 0.0f};
  std::vector<std::uint64_t> ids(5);
  std::vector<float> scores(5);
  std::size_t n = 0;
  REQUIRE(vexlake_search(e, q, 4, 5, 0, ids.data(), scores.data(), &n) == VEXLAKE_OK);
  REQUIRE(n == 5);
  REQUIRE(ids == std::vector<std::uint64_t>{0, 1, 2, 3, 4});
  REQUIRE(scores[0] == Catch::Approx(0.0f));
  REQUIRE(scores[1] == Catch::Approx(1.0f));

  REQUIRE(vexlake_delete(e, 0) == VEXLAKE_OK);
  REQUIRE(vexlake_delete(e, 0) == VEXLAKE_E_NOT_FOUND);

  std::uint64_t version = 0;
  REQUIRE(vexlake_flush(e, &version) == VEXLAKE_OK);
  REQUIRE(version == 1);

  REQUIRE(vexlake_search(e, q, 4, 5, 64, ids.data(), scores.data(), &n) == VEXLAKE_OK);
  REQUIRE(n == 5);
  REQUIRE(ids.front() == 1);

  REQUIRE(vexlake_search(e, q, 4, 0, 0, ids.data(), scores.data(), &n) == VEXLAKE_E_INVALID_ARGUMENT);
  REQUIRE(vexlake_search(e, q, 2, 5, 0, ids.data(), scores.data(), &n) == VEXLAKE_E_DIMENSION_MISMATCH);
  REQUIRE(vexlake_close(e) == VEXLAKE_OK);

  SECTION("data survives reopen") {
    vexlake_engine_t* again = nullptr;
    REQUIRE(vexlake_open(&p, &again) == VEXLAKE_OK);
    REQUIRE(vexlake_search(again, q, 4, 3, 0, ids.data(), scores.data(), &n) == VEXLAKE_OK);
    REQUIRE(n == 3);
    REQUIRE(ids[0] == 1);
    REQUIRE(vexlake_close(again) == VEXLAKE_OK);
  }
}
