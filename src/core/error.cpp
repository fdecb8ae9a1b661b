#include "vexlake/error.hpp"

namespace vexlake::core {

auto to_string(error_code ec) noexcept -> const char* {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::durability_failed: return "durability_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::already_exists: return "already_exists";
    case error_code::resource_exhausted: return "resource_exhausted";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::conflict: return "conflict";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_initialized: return "not_initialized";
    case error_code::out_of_range: return "out_of_range";
    case error_code::unsupported: return "unsupported";
    case error_code::dimension_mismatch: return "dimension_mismatch";
  }
  return "unknown";
}

} // namespace vexlake::core
