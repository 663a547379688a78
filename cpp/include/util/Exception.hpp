#pragma once

#include <fmt/format.h>

#include <exception>
#include <string>
#include <utility>

namespace util {

/*
 * Base of every exception thrown by this codebase. The message is built with fmt:
 *
 *   throw util::Exception("cell {} is out of range", index);
 */
class Exception : public std::exception {
 public:
  Exception() = default;

  template <typename... Ts>
  Exception(fmt::format_string<Ts...> fmt_str, Ts&&... ts)
      : what_(fmt::format(fmt_str, std::forward<Ts>(ts)...)) {}

  const char* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * Raised for problems the user caused rather than the program: a bad command line, an unparsable
 * board, a prompt that ran out of input. main() reports the message on stderr and exits with
 * status 1 instead of dying on an uncaught exception.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

class DebugAssertionError : public Exception {
 public:
  using Exception::Exception;
  static constexpr const char* kMacroName = "DEBUG_ASSERT";
};

class ReleaseAssertionError : public Exception {
 public:
  using Exception::Exception;
  static constexpr const char* kMacroName = "RELEASE_ASSERT";
};

// A failed CLEAN_ASSERT is a user error, so it is caught wherever CleanException is.
class CleanAssertionError : public CleanException {
 public:
  using CleanException::CleanException;
  static constexpr const char* kMacroName = "CLEAN_ASSERT";
};

}  // namespace util
