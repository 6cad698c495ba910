#pragma once

#include <string>
#include <string_view>

namespace routekit {

// Tells whether 'path' is an acceptable route path, that is if it fully matches (\w+/)*\w+/?
// where \w is [A-Za-z0-9_].
// Examples of valid paths: "users", "users/", "api/v2/users".
// Examples of invalid paths: "", "/", "/users", "users//profile", "user-profile", "a b".
[[nodiscard]] bool IsRoutePathValid(std::string_view path) noexcept;

// Returns 'path' with a single trailing slash, appending it only if missing.
// 'path' is expected to be valid according to IsRoutePathValid.
[[nodiscard]] std::string NormalizeRoutePath(std::string_view path);

// Plain concatenation of both parts, each of them is expected to already carry its own slashes.
[[nodiscard]] std::string PrependBasePath(std::string_view basePath, std::string_view path);

}  // namespace routekit
