#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling (C API status values derive from them).
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>

namespace vexlake::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  durability_failed = 1004,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  already_exists = 4002,
  resource_exhausted = 5001,
  not_found = 6001,
  unavailable = 7001,
  conflict = 7002,
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
  not_initialized = 9003,
  out_of_range = 9004,
  unsupported = 9005,
  dimension_mismatch = 9006,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "storage.client" */
};

/** \brief Errors worth retrying at the storage/version boundaries. */
constexpr bool is_transient(error_code ec) noexcept {
  return ec == error_code::unavailable || ec == error_code::conflict;
}

/** \brief Convenience for `return fail(...)` inside expected-returning functions. */
inline auto fail(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

/** \brief Short name of an error code for logs and the C API. */
auto to_string(error_code ec) noexcept -> const char*;

} // namespace vexlake::core
