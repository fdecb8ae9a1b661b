#pragma once

/** \file distance.hpp
 *  \brief Scalar reference distance kernels (L2^2, inner product, cosine) and metric helpers.
 *
 * Preconditions
 * - a.size() == b.size() > 0
 * - All inputs are finite
 * Cosine similarity of a zero vector against anything is defined as 0 (no division fault).
 * Determinism: pure functions, no allocations, no exceptions on hot paths.
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace vexlake::kernels {

/** \brief Similarity metric fixed at engine initialization. */
enum class Metric : std::uint8_t { L2 = 0, InnerProduct = 1, Cosine = 2 };

auto to_string(Metric m) noexcept -> std::string_view;
auto parse_metric(std::string_view name) noexcept -> std::optional<Metric>;

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for instruction-level parallelism
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    const float d0 = pa[i] - pb[i];
    const float d1 = pa[i + 1] - pb[i + 1];
    const float d2 = pa[i + 2] - pb[i + 2];
    const float d3 = pa[i + 3] - pb[i + 3];
    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }
  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) {
    const float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

/** \brief Dot product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    s0 += pa[i] * pb[i];
    s1 += pa[i + 1] * pb[i + 1];
    s2 += pa[i + 2] * pb[i + 2];
    s3 += pa[i + 3] * pb[i + 3];
  }
  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) s += pa[i] * pb[i];
  return s;
}

/** \brief Cosine similarity in [-1, 1]; 0 when either vector has zero norm. */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  float ab = 0.0f, aa = 0.0f, bb = 0.0f;
  for (std::size_t i = 0; i < a.size(); ++i) {
    ab += a[i] * b[i];
    aa += a[i] * a[i];
    bb += b[i] * b[i];
  }
  if (aa <= 0.0f || bb <= 0.0f) return 0.0f;
  return ab / (std::sqrt(aa) * std::sqrt(bb));
}

/** \brief 1 - cosine_similarity. */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return 1.0f - cosine_similarity(a, b);
}

/** \brief Squared L2 norm. */
inline float norm_sq(std::span<const float> a) noexcept { return inner_product(a, a); }

/** \brief Scale `v` to unit length in place. Zero vectors are left untouched. */
inline void normalize(std::span<float> v) noexcept {
  const float n2 = norm_sq(v);
  if (n2 <= 0.0f) return;
  const float inv = 1.0f / std::sqrt(n2);
  for (float& x : v) x *= inv;
}

/** \brief Reference metric score: squared distance for L2, similarity otherwise. */
inline float distance(std::span<const float> a, std::span<const float> b, Metric m) noexcept {
  switch (m) {
    case Metric::L2: return l2_sq(a, b);
    case Metric::InnerProduct: return inner_product(a, b);
    case Metric::Cosine: return cosine_similarity(a, b);
  }
  return 0.0f;
}

/** \brief True when a larger score ranks first. */
constexpr bool higher_is_better(Metric m) noexcept { return m != Metric::L2; }

/** \brief Ranking key where smaller always ranks first; maps scores to a common order. */
constexpr float rank_key(Metric m, float score) noexcept {
  return higher_is_better(m) ? -score : score;
}

/** \brief Inverse of rank_key. */
constexpr float score_from_key(Metric m, float key) noexcept {
  return higher_is_better(m) ? -key : key;
}

} // namespace vexlake::kernels
