#include "vexlake/kernels/dispatch.hpp"
#include "vexlake/kernels/backends/avx2.hpp"
#include "vexlake/core/platform_utils.hpp"

#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
#include <cpuid.h>
#endif

#include <cctype>
#include <iostream>
#include <string>

namespace vexlake::kernels {

auto to_string(Metric m) noexcept -> std::string_view {
  switch (m) {
    case Metric::L2: return "l2";
    case Metric::InnerProduct: return "ip";
    case Metric::Cosine: return "cosine";
  }
  return "unknown";
}

auto parse_metric(std::string_view name) noexcept -> std::optional<Metric> {
  if (name == "l2" || name == "L2" || name == "euclidean") return Metric::L2;
  if (name == "ip" || name == "dot" || name == "inner_product") return Metric::InnerProduct;
  if (name == "cosine" || name == "cos") return Metric::Cosine;
  return std::nullopt;
}

namespace {

inline float scalar_l2(std::span<const float> a, std::span<const float> b) noexcept { return l2_sq(a, b); }
inline float scalar_ip(std::span<const float> a, std::span<const float> b) noexcept { return inner_product(a, b); }
inline float scalar_cos(std::span<const float> a, std::span<const float> b) noexcept { return cosine_similarity(a, b); }
inline float scalar_cosd(std::span<const float> a, std::span<const float> b) noexcept { return cosine_distance(a, b); }

void scalar_batch_l2_sq(std::span<const float> query, const float* vectors,
                        std::size_t nvec, std::size_t dim, float* out) noexcept {
  for (std::size_t v = 0; v < nvec; ++v) {
    out[v] = l2_sq(query, std::span<const float>(vectors + v * dim, dim));
  }
}

void scalar_batch_inner_product(std::span<const float> query, const float* vectors,
                                std::size_t nvec, std::size_t dim, float* out) noexcept {
  for (std::size_t v = 0; v < nvec; ++v) {
    out[v] = inner_product(query, std::span<const float>(vectors + v * dim, dim));
  }
}

struct CpuFeatures {
  bool has_avx2{false};
  bool has_fma{false};
};

/** \brief Detect CPU features at runtime using CPUID. Cached for the process lifetime. */
[[gnu::cold]] auto detect_cpu_features() noexcept -> CpuFeatures {
  CpuFeatures features{};
#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
  unsigned int eax = 0, ebx = 0, ecx = 0, edx = 0;
  if (__get_cpuid(0, &eax, &ebx, &ecx, &edx)) {
    const unsigned int max_level = eax;
    // AVX2: CPUID.07H:EBX[bit 5]
    if (max_level >= 7) {
      __cpuid_count(7, 0, eax, ebx, ecx, edx);
      features.has_avx2 = (ebx & (1u << 5)) != 0;
    }
    // FMA: CPUID.01H:ECX[bit 12]
    if (__get_cpuid(1, &eax, &ebx, &ecx, &edx)) {
      features.has_fma = (ecx & (1u << 12)) != 0;
    }
  }
#endif
  return features;
}

const CpuFeatures& get_cpu_features() noexcept {
  static const CpuFeatures features = detect_cpu_features();
  return features;
}

/** \brief VEXLAKE_KERNEL_BACKEND override (scalar|avx2|auto, case-insensitive). */
auto get_backend_name_override() noexcept -> std::string {
  auto env = core::safe_getenv("VEXLAKE_KERNEL_BACKEND");
  if (!env) return {};
  std::string s = *env;
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s == "scalar" || s == "avx2") return s;
  return {}; // "auto" or unknown -> no override
}

} // namespace

const KernelOps& get_scalar_ops() noexcept {
  static const KernelOps ops{
      "scalar",
      &scalar_l2, &scalar_ip, &scalar_cos, &scalar_cosd,
      &scalar_batch_l2_sq, &scalar_batch_inner_product};
  return ops;
}

const KernelOps& select_backend(std::string_view name) noexcept {
#if defined(VEXLAKE_HAS_AVX2)
  if (name == "avx2") {
    const auto& features = get_cpu_features();
    if (features.has_avx2 && features.has_fma) return get_avx2_ops();
    if (core::debug_enabled()) {
      std::cerr << "[vexlake][kernels] avx2 requested but not supported; using scalar\n";
    }
  }
#endif
  return get_scalar_ops();
}

const KernelOps& select_backend_auto() noexcept {
  static const KernelOps& chosen = []() -> const KernelOps& {
    const std::string forced = get_backend_name_override();
    if (!forced.empty()) return select_backend(forced);
#if defined(VEXLAKE_HAS_AVX2)
    const auto& features = get_cpu_features();
    if (features.has_avx2 && features.has_fma) return get_avx2_ops();
#endif
    return get_scalar_ops();
  }();
  return chosen;
}

} // namespace vexlake::kernels
