#include "vexlake/kernels/backends/avx2.hpp"

#if defined(VEXLAKE_HAS_AVX2)

#include <immintrin.h>

#include <cmath>

namespace vexlake::kernels {

namespace {

/** \brief Horizontal sum of 8 floats in an AVX2 register. */
[[gnu::always_inline]] inline auto hsum_ps(__m256 v) noexcept -> float {
  const __m128 hi = _mm256_extractf128_ps(v, 1);
  const __m128 lo = _mm256_castps256_ps128(v);
  const __m128 sum = _mm_add_ps(hi, lo);
  const __m128 shuf = _mm_movehdup_ps(sum);
  const __m128 sums = _mm_add_ps(sum, shuf);
  const __m128 shuf2 = _mm_movehl_ps(sums, sums);
  return _mm_cvtss_f32(_mm_add_ss(sums, shuf2));
}

[[gnu::hot]] auto avx2_l2_sq(std::span<const float> a, std::span<const float> b) noexcept -> float {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // Two independent accumulators hide FMA latency
  __m256 acc0 = _mm256_setzero_ps();
  __m256 acc1 = _mm256_setzero_ps();
  std::size_t i = 0;
  for (; i + 16 <= n; i += 16) {
    const __m256 d0 = _mm256_sub_ps(_mm256_loadu_ps(pa + i), _mm256_loadu_ps(pb + i));
    const __m256 d1 = _mm256_sub_ps(_mm256_loadu_ps(pa + i + 8), _mm256_loadu_ps(pb + i + 8));
    acc0 = _mm256_fmadd_ps(d0, d0, acc0);
    acc1 = _mm256_fmadd_ps(d1, d1, acc1);
  }
  for (; i + 8 <= n; i += 8) {
    const __m256 d = _mm256_sub_ps(_mm256_loadu_ps(pa + i), _mm256_loadu_ps(pb + i));
    acc0 = _mm256_fmadd_ps(d, d, acc0);
  }
  float result = hsum_ps(_mm256_add_ps(acc0, acc1));
  for (; i < n; ++i) {
    const float d = pa[i] - pb[i];
    result += d * d;
  }
  return result;
}

[[gnu::hot]] auto avx2_inner_product(std::span<const float> a, std::span<const float> b) noexcept -> float {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  __m256 acc0 = _mm256_setzero_ps();
  __m256 acc1 = _mm256_setzero_ps();
  std::size_t i = 0;
  for (; i + 16 <= n; i += 16) {
    acc0 = _mm256_fmadd_ps(_mm256_loadu_ps(pa + i), _mm256_loadu_ps(pb + i), acc0);
    acc1 = _mm256_fmadd_ps(_mm256_loadu_ps(pa + i + 8), _mm256_loadu_ps(pb + i + 8), acc1);
  }
  for (; i + 8 <= n; i += 8) {
    acc0 = _mm256_fmadd_ps(_mm256_loadu_ps(pa + i), _mm256_loadu_ps(pb + i), acc0);
  }
  float result = hsum_ps(_mm256_add_ps(acc0, acc1));
  for (; i < n; ++i) result += pa[i] * pb[i];
  return result;
}

/** \brief Fused single-pass cosine: dot, |a|^2 and |b|^2 accumulated together. */
[[gnu::hot]] auto avx2_cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept -> float {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  __m256 dot = _mm256_setzero_ps();
  __m256 na = _mm256_setzero_ps();
  __m256 nb = _mm256_setzero_ps();
  std::size_t i = 0;
  for (; i + 8 <= n; i += 8) {
    const __m256 va = _mm256_loadu_ps(pa + i);
    const __m256 vb = _mm256_loadu_ps(pb + i);
    dot = _mm256_fmadd_ps(va, vb, dot);
    na = _mm256_fmadd_ps(va, va, na);
    nb = _mm256_fmadd_ps(vb, vb, nb);
  }
  float ab = hsum_ps(dot);
  float aa = hsum_ps(na);
  float bb = hsum_ps(nb);
  for (; i < n; ++i) {
    ab += pa[i] * pb[i];
    aa += pa[i] * pa[i];
    bb += pb[i] * pb[i];
  }
  if (aa <= 0.0f || bb <= 0.0f) return 0.0f;
  return ab / (std::sqrt(aa) * std::sqrt(bb));
}

auto avx2_cosine_distance(std::span<const float> a, std::span<const float> b) noexcept -> float {
  return 1.0f - avx2_cosine_similarity(a, b);
}

void avx2_batch_l2_sq(std::span<const float> query, const float* vectors,
                      std::size_t nvec, std::size_t dim, float* out) noexcept {
  for (std::size_t v = 0; v < nvec; ++v) {
    if (v + 1 < nvec) _mm_prefetch(reinterpret_cast<const char*>(vectors + (v + 1) * dim), _MM_HINT_T0);
    out[v] = avx2_l2_sq(query, std::span<const float>(vectors + v * dim, dim));
  }
}

void avx2_batch_inner_product(std::span<const float> query, const float* vectors,
                              std::size_t nvec, std::size_t dim, float* out) noexcept {
  for (std::size_t v = 0; v < nvec; ++v) {
    if (v + 1 < nvec) _mm_prefetch(reinterpret_cast<const char*>(vectors + (v + 1) * dim), _MM_HINT_T0);
    out[v] = avx2_inner_product(query, std::span<const float>(vectors + v * dim, dim));
  }
}

} // namespace

const KernelOps& get_avx2_ops() noexcept {
  static const KernelOps ops{
      "avx2",
      &avx2_l2_sq, &avx2_inner_product, &avx2_cosine_similarity, &avx2_cosine_distance,
      &avx2_batch_l2_sq, &avx2_batch_inner_product};
  return ops;
}

} // namespace vexlake::kernels

#endif
