#pragma once

/** \file dispatch.hpp
 *  \brief SIMD-ready kernel interface and dispatcher. Scalar is the reference backend.
 *
 * Preconditions for all ops: a.size() == b.size() > 0; inputs finite.
 * Cosine ops return similarity 0 (distance 1) for zero-norm inputs.
 * Determinism: pure functions, O(d) complexity; no allocations; no exceptions on hot paths.
 */

#include <cstddef>
#include <span>
#include <string_view>

#include "vexlake/kernels/distance.hpp"

namespace vexlake::kernels {

struct KernelOps {
  std::string_view name;
  float (*l2_sq)(std::span<const float>, std::span<const float>) noexcept;
  float (*inner_product)(std::span<const float>, std::span<const float>) noexcept;
  float (*cosine_similarity)(std::span<const float>, std::span<const float>) noexcept;
  float (*cosine_distance)(std::span<const float>, std::span<const float>) noexcept;

  // Batch operations: one query against nvec row-major vectors of width dim
  void (*batch_l2_sq)(std::span<const float> query,
                      const float* vectors, std::size_t nvec, std::size_t dim,
                      float* out) noexcept;
  void (*batch_inner_product)(std::span<const float> query,
                              const float* vectors, std::size_t nvec, std::size_t dim,
                              float* out) noexcept;
};

const KernelOps& get_scalar_ops() noexcept;

// Returns a stable reference valid for the process lifetime. Unknown or unsupported
// names fall back to scalar.
const KernelOps& select_backend(std::string_view name = "scalar") noexcept;

/** \brief Auto-selects a backend from CPU features, honouring VEXLAKE_KERNEL_BACKEND.
 *  Thread-safe initialization and stable reference semantics apply.
 */
const KernelOps& select_backend_auto() noexcept;

/** \brief Metric score through a backend (squared distance for L2, similarity otherwise). */
inline float score(const KernelOps& ops, Metric m,
                   std::span<const float> a, std::span<const float> b) noexcept {
  switch (m) {
    case Metric::L2: return ops.l2_sq(a, b);
    case Metric::InnerProduct: return ops.inner_product(a, b);
    case Metric::Cosine: return ops.cosine_similarity(a, b);
  }
  return 0.0f;
}

} // namespace vexlake::kernels
