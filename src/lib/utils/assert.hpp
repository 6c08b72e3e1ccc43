#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "invalid_input_exception.hpp"
#include "string.hpp"

/**
 * Assertions that stay meaningful in release builds and carry the source location in their message.
 *
 * --> Use Assert() for invariants that are cheap to check or too important to skip, e.g., the coverage guarantees of a
 *     partition plan.
 *
 * --> Use DebugAssert() for invariants that are only checked in debug builds (SEQPART_DEBUG).
 *
 * --> Use Fail() when an illegal code path is taken, e.g., in the default branch of a switch over an enum.
 *
 * --> Use AssertInput() to validate user input. It throws an InvalidInputException, which callers may want to catch
 *     and report instead of treating it as a bug.
 */

namespace seqpart {

namespace detail {

// The indirection allows throwing from destructors without compiler warnings.
[[noreturn]] inline void Fail(const std::string& message) { throw std::logic_error(message); }

}  // namespace detail

#define Fail(message)                                                                                              \
  seqpart::detail::Fail(seqpart::TrimSourceFilePath(__FILE__) + ":" + std::to_string(__LINE__) + " " + (message)); \
  static_assert(true, "End macro call with a semicolon")

[[noreturn]] inline void FailInput(const std::string& message) {
  throw InvalidInputException(std::string("Error: Invalid input; ") + message);
}

}  // namespace seqpart

#define Assert(expression, message)     \
  if (!static_cast<bool>(expression)) { \
    Fail(message);                      \
  }                                     \
  static_assert(true, "End macro call with a semicolon")

#define AssertInput(expression, message)                                                     \
  if (!static_cast<bool>(expression)) {                                                      \
    throw seqpart::InvalidInputException(std::string("Error: Invalid input; ") + (message)); \
  }                                                                                          \
  static_assert(true, "End macro call with a semicolon")

#if SEQPART_DEBUG
#define DebugAssert(expression, message) Assert(expression, message)
#else
#define DebugAssert(expression, message)
#endif
