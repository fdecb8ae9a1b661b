#pragma once

#include "vexlake/error.hpp"
#include "vexlake/c/vexlake.h"

namespace vexlake::core {

constexpr vexlake_status_t to_c_status(error_code ec) {
  switch (ec) {
    case error_code::ok: return VEXLAKE_OK;
    case error_code::invalid_argument:
    case error_code::out_of_range:
    case error_code::precondition_failed: return VEXLAKE_E_INVALID_ARGUMENT;
    case error_code::dimension_mismatch: return VEXLAKE_E_DIMENSION_MISMATCH;
    case error_code::not_initialized: return VEXLAKE_E_NOT_INITIALIZED;
    case error_code::not_found: return VEXLAKE_E_NOT_FOUND;
    case error_code::already_exists: return VEXLAKE_E_ALREADY_EXISTS;
    // Conflicts are retried internally; one that escapes is reported like an exhausted retry.
    case error_code::unavailable:
    case error_code::conflict:
    case error_code::resource_exhausted: return VEXLAKE_E_UNAVAILABLE;
    case error_code::durability_failed: return VEXLAKE_E_DURABILITY;
    case error_code::data_integrity: return VEXLAKE_E_DATA_INTEGRITY;
    case error_code::cancelled: return VEXLAKE_E_CANCELLED;
    case error_code::config_invalid: return VEXLAKE_E_CONFIG_INVALID;
    case error_code::io_failed:
    case error_code::io_eof: return VEXLAKE_E_IO;
    case error_code::internal:
    case error_code::unsupported: return VEXLAKE_E_INTERNAL;
  }
  return VEXLAKE_E_INTERNAL;
}

} // namespace vexlake::core
