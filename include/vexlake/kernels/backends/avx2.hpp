#pragma once

/** \file avx2.hpp
 *  \brief AVX2/FMA backend. Implemented in a translation unit built with -mavx2 -mfma;
 *  callers must only use it after CPUID confirms support (see select_backend).
 */

#include "vexlake/kernels/dispatch.hpp"

namespace vexlake::kernels {

#if defined(VEXLAKE_HAS_AVX2)
const KernelOps& get_avx2_ops() noexcept;
#endif

} // namespace vexlake::kernels
