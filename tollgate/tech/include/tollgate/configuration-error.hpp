#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace tollgate {

// Raised synchronously to the caller that attempts an invalid construction or mutation
// (capacity below one, absent next handler, unnamed unit...). Never leaves shared state half-updated.
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const char* msg) : std::invalid_argument(msg) {}

  explicit ConfigurationError(const std::string& msg) : std::invalid_argument(msg) {}

  template <typename... Args>
    requires(sizeof...(Args) > 0)
  explicit ConfigurationError(std::format_string<Args...> fmt, Args&&... args)
      : std::invalid_argument(std::format(fmt, std::forward<Args>(args)...)) {}
};

}  // namespace tollgate
