#pragma once

#include "util/Exception.hpp"

#include <fmt/format.h>

#include <source_location>
#include <string>
#include <utility>

/*
 * Checked conditions that throw instead of aborting:
 *
 *   RELEASE_ASSERT(cond [, fmt, args...])  util::ReleaseAssertionError, always checked
 *   CLEAN_ASSERT(cond [, fmt, args...])    util::CleanAssertionError, always checked; use it for
 *                                          conditions on user input
 *   DEBUG_ASSERT(cond [, fmt, args...])    util::DebugAssertionError, checked only when the build
 *                                          defines DEBUG_BUILD=1
 *
 * The message arguments are evaluated only when the condition fails. A disabled DEBUG_ASSERT still
 * compiles its arguments, so it cannot rot.
 */

#if defined(DEBUG_BUILD) && DEBUG_BUILD
#define TTT_DEBUG_ASSERTS_ENABLED true
#else
#define TTT_DEBUG_ASSERTS_ENABLED false
#endif

#define TTT_ASSERT_IMPL(ENABLED, ERROR_T, COND, ...)                                            \
  do {                                                                                           \
    if ((ENABLED) && !(COND)) {                                                                  \
      util::detail::raise_assertion<ERROR_T>(#COND, std::source_location::current(),             \
                                             ##__VA_ARGS__);                                     \
    }                                                                                            \
  } while (0)

#define RELEASE_ASSERT(COND, ...) \
  TTT_ASSERT_IMPL(true, util::ReleaseAssertionError, COND, ##__VA_ARGS__)

#define CLEAN_ASSERT(COND, ...) TTT_ASSERT_IMPL(true, util::CleanAssertionError, COND, ##__VA_ARGS__)

#define DEBUG_ASSERT(COND, ...) \
  TTT_ASSERT_IMPL(TTT_DEBUG_ASSERTS_ENABLED, util::DebugAssertionError, COND, ##__VA_ARGS__)

namespace util {
namespace detail {

template <typename ErrorT>
[[noreturn]] void raise_assertion(const char* cond_str, const std::source_location& loc) {
  throw ErrorT("{} failed: {} [{}:{}]", ErrorT::kMacroName, cond_str, loc.file_name(), loc.line());
}

template <typename ErrorT, typename... Ts>
[[noreturn]] void raise_assertion(const char*, const std::source_location& loc,
                                  fmt::format_string<Ts...> fmt_str, Ts&&... ts) {
  std::string msg = fmt::format(fmt_str, std::forward<Ts>(ts)...);
  throw ErrorT("{} failed: {} [{}:{}]", ErrorT::kMacroName, msg, loc.file_name(), loc.line());
}

}  // namespace detail
}  // namespace util
