#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; callers branch on the code,
 *   never on the message text.
 * - Human-readable message and originating component for diagnostics.
 * - not_unique refines operation_failed: code that only cares about "the write
 *   failed" should test is_operation_error() instead of comparing codes.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace quarry::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  invalid_query = 1001,      /**< unresolvable field, unknown operator, malformed path */
  operation_failed = 2001,   /**< generic persistence failure, DENY delete rule */
  not_unique = 2002,         /**< duplicate-key violation reported by storage */
  does_not_exist = 3001,     /**< single-object lookup matched nothing */
  multiple_objects = 3002,   /**< single-object lookup matched more than one */
  validation_failed = 4001,  /**< value could not be coerced for a field */
  cursor_exhausted = 5001,   /**< iteration past the end of a consumed cursor */
  config_invalid = 6001,
  unsupported = 7001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "query.compile" */
};

/** \brief True for operation_failed and its refinements. */
constexpr bool is_operation_error(error_code ec) noexcept {
  return ec == error_code::operation_failed || ec == error_code::not_unique;
}

inline auto fail(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace quarry::core
