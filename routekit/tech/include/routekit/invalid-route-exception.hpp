#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace routekit {

// Raised for any caller misuse while building a route table: malformed path, missing controller,
// root base path, or a controller mount without a base path.
class invalid_route : public std::invalid_argument {
 public:
  explicit invalid_route(const char* msg) : std::invalid_argument(msg) {}

  explicit invalid_route(const std::string& msg) : std::invalid_argument(msg) {}

  template <typename... Args>
    requires(sizeof...(Args) != 0)
  explicit invalid_route(fmt::format_string<Args...> fmt, Args&&... args)
      : std::invalid_argument(fmt::format(fmt, std::forward<Args>(args)...)) {}
};

}  // namespace routekit
