#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - invariant_violation is thrown, never returned: it marks a broken internal
 *   invariant that callers cannot recover from.
 */

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <utility>

namespace prune::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  precondition_failed = 4001,
  internal = 9001,
  invalid_argument = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "notation.parse" */
};

/** \brief Short stable name of an error code, e.g. "config_invalid". */
auto to_string(error_code code) -> const char*;

/** \brief Thrown when an internal invariant of the rewrite engine is broken.
 *
 * Carries the same payload as a recoverable error so that diagnostics look
 * alike, but is never turned into a result value.
 */
class invariant_violation : public std::logic_error {
public:
  explicit invariant_violation(error err)
      : std::logic_error(err.component + ": " + err.message), error_(std::move(err)) {}

  [[nodiscard]] auto details() const noexcept -> const error& { return error_; }

private:
  error error_;
};

} // namespace prune::core
