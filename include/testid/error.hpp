#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling (mirrored by the C API status codes).
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <string>

namespace testid::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  format_invalid = 3001,
  validation_failed = 4001,
  precondition_failed = 4002,
  internal = 9001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "unique_id.format" */
};

} // namespace testid::core
