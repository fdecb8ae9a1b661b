#include <catch2/catch_all.hpp>

#include <cmath>
#include <random>
#include <vector>

#include <vexlake/kernels/dispatch.hpp>
#include <vexlake/kernels/distance.hpp>

using namespace vexlake::kernels;
using Catch::Approx;

namespace {

// Scale of the accumulated terms; relative error is measured against this, not the (possibly cancelled) sum.
float magnitude_ip(std::span<const float> a, std::span<const float> b) {
  float m = 0.0f;
  for (std::size_t i = 0; i < a.size(); ++i) m += std::fabs(a[i] * b[i]);
  return m;
}

} // namespace

TEST_CASE("distance kernels known values", "[kernels][distance]") {
  float a1[1]{3.0f}; float b1[1]{-1.0f};
  REQUIRE(l2_sq(a1, b1) == Approx(16.0f));
  REQUIRE(inner_product(a1, b1) == Approx(-3.0f));

  float a2[2]{1.0f, 2.0f}; float b2[2]{4.0f, 6.0f};
  REQUIRE(l2_sq(a2, b2) == Approx(9.0f + 16.0f));
  REQUIRE(inner_product(a2, b2) == Approx(16.0f));

  float x[2]{1.0f, 0.0f}; float y[2]{0.0f, 2.0f};
  REQUIRE(cosine_similarity(x, y) == Approx(0.0f).margin(1e-7f));
  REQUIRE(cosine_similarity(x, x) == Approx(1.0f));
  REQUIRE(cosine_distance(x, y) == Approx(1.0f));
}

TEST_CASE("cosine of a zero vector is defined", "[kernels][distance]") {
  float z[4]{0, 0, 0, 0};
  float v[4]{1, 2, 3, 4};
  REQUIRE(cosine_similarity(z, v) == 0.0f);
  REQUIRE(cosine_similarity(z, z) == 0.0f);
  REQUIRE(cosine_distance(z, v) == Approx(1.0f));

  std::vector<float> zero(8, 0.0f);
  normalize(zero);
  for (float f : zero) REQUIRE(f == 0.0f);
}

TEST_CASE("normalize produces unit length", "[kernels][distance]") {
  std::vector<float> v{3.0f, 4.0f, 0.0f};
  normalize(v);
  REQUIRE(norm_sq(v) == Approx(1.0f));
  REQUIRE(v[0] == Approx(0.6f));
}

TEST_CASE("rank keys order every metric best-first", "[kernels][distance]") {
  REQUIRE(rank_key(Metric::L2, 1.0f) < rank_key(Metric::L2, 2.0f));
  REQUIRE(rank_key(Metric::InnerProduct, 2.0f) < rank_key(Metric::InnerProduct, 1.0f));
  REQUIRE(rank_key(Metric::Cosine, 0.9f) < rank_key(Metric::Cosine, 0.1f));
  REQUIRE(score_from_key(Metric::Cosine, rank_key(Metric::Cosine, 0.5f)) == 0.5f);
  REQUIRE(parse_metric("cosine") == Metric::Cosine);
  REQUIRE(parse_metric("ip") == Metric::InnerProduct);
  REQUIRE_FALSE(parse_metric("manhattan").has_value());
}

TEST_CASE("backend selection is stable and unknown names fall back to scalar", "[kernels][dispatch]") {
  const auto& s1 = select_backend("scalar");
  const auto& s2 = select_backend("scalar");
  REQUIRE(&s1 == &s2);
  REQUIRE(&select_backend("does-not-exist") == &s1);
  REQUIRE(&select_backend_auto() == &select_backend_auto());
}

TEST_CASE("every backend matches scalar within 1e-5 relative error", "[kernels][parity]") {
  const auto& scalar = get_scalar_ops();
  const auto& best = select_backend_auto();
  const auto& avx2 = select_backend("avx2");   // scalar when unsupported

  std::mt19937 rng(2024);
  std::uniform_real_distribution<float> dist(-10.0f, 10.0f);
  for (std::size_t d : {1u, 3u, 7u, 8u, 15u, 16u, 31u, 64u, 100u, 128u, 768u, 1536u}) {
    for (int trial = 0; trial < 20; ++trial) {
      std::vector<float> a(d), b(d);
      for (auto& x : a) x = dist(rng);
      for (auto& x : b) x = dist(rng);
      const float l2_ref = scalar.l2_sq(a, b);
      const float ip_ref = scalar.inner_product(a, b);
      const float cos_ref = scalar.cosine_similarity(a, b);
      const float scale = magnitude_ip(a, b);

      for (const KernelOps* ops : {&best, &avx2}) {
        INFO("backend " << ops->name << " dim " << d);
        REQUIRE(std::fabs(ops->l2_sq(a, b) - l2_ref) <= 1e-5f * l2_ref + 1e-6f);
        REQUIRE(std::fabs(ops->inner_product(a, b) - ip_ref) <= 1e-5f * scale + 1e-6f);
        REQUIRE(std::fabs(ops->cosine_similarity(a, b) - cos_ref) <= 1e-5f + 1e-6f);
      }
    }
  }
}

TEST_CASE("batch kernels agree with pairwise kernels", "[kernels][dispatch]") {
  const std::size_t dim = 37, n = 50;
  std::mt19937 rng(7);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<float> q(dim), rows(n * dim);
  for (auto& x : q) x = dist(rng);
  for (auto& x : rows) x = dist(rng);

  const auto& ops = select_backend_auto();
  std::vector<float> l2(n), ip(n);
  ops.batch_l2_sq(q, rows.data(), n, dim, l2.data());
  ops.batch_inner_product(q, rows.data(), n, dim, ip.data());
  for (std::size_t i = 0; i < n; ++i) {
    std::span<const float> row(rows.data() + i * dim, dim);
    REQUIRE(l2[i] == Approx(ops.l2_sq(q, row)).epsilon(1e-5));
    REQUIRE(ip[i] == Approx(ops.inner_product(q, row)).margin(1e-5));
  }
}
