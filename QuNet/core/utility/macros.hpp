#ifndef QUNET_CORE_UTILITY_MACROS_HPP
#define QUNET_CORE_UTILITY_MACROS_HPP

#include <QuNet/core/utility/exception.hpp>

#include <cstdlib>
#include <iostream>
#include <source_location>
#include <string>

// QUNET_ASSERT_BEHAVIOR_ selects what a failed QUNET_ASSERT does:
// THROW (default) throws qunet::Exception, ABORT prints and aborts,
// IGNORE compiles the checks out
#define QUNET_ASSERT_THROW 2
#define QUNET_ASSERT_ABORT 3
#define QUNET_ASSERT_IGNORE 4
#ifndef QUNET_ASSERT_BEHAVIOR_
#define QUNET_ASSERT_BEHAVIOR_ THROW
#endif
#define QUNET_ASSERT_SELECT_(x) QUNET_ASSERT_##x
#define QUNET_ASSERT_SELECT(x) QUNET_ASSERT_SELECT_(x)
#define QUNET_ASSERT_BEHAVIOR QUNET_ASSERT_SELECT(QUNET_ASSERT_BEHAVIOR_)

namespace qunet::detail {

/// reports a failed QUNET_ASSERT
[[noreturn]] inline void assert_failed(
    const char* expr, const std::string& message,
    std::source_location where = std::source_location::current()) {
  std::string what = std::string("QUNET_ASSERT(") + expr + ") failed";
  if (!message.empty()) what += ": " + message;
  what += std::string(" (") + where.file_name() + ":" +
          std::to_string(where.line()) + ")";
#if QUNET_ASSERT_BEHAVIOR == QUNET_ASSERT_ABORT
  std::cerr << what << std::endl;
  std::abort();
#else
  throw Exception(what);
#endif
}

}  // namespace qunet::detail

#if QUNET_ASSERT_BEHAVIOR == QUNET_ASSERT_IGNORE
#define QUNET_ASSERT(...) \
  do {                    \
  } while (0)
#else
/// QUNET_ASSERT(expr) or QUNET_ASSERT(expr, message)
#define QUNET_ASSERT(EXPR, ...)                                          \
  do {                                                                   \
    if (!(EXPR))                                                         \
      qunet::detail::assert_failed(#EXPR, std::string{__VA_ARGS__});     \
  } while (0)
#endif

/// marks a branch that valid input never reaches
#define QUNET_UNREACHABLE                                                \
  qunet::detail::assert_failed("false", "reached unreachable code")

#endif  // QUNET_CORE_UTILITY_MACROS_HPP
