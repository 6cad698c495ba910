#include "routekit/route-path.hpp"

#include <string>
#include <string_view>

#include "routekit/cctype.hpp"

namespace routekit {

bool IsRoutePathValid(std::string_view path) noexcept {
  if (path.empty()) {
    return false;
  }
  // The optional trailing slash is the only one allowed not to be preceded by a word character run.
  if (path.back() == '/') {
    path.remove_suffix(1U);
  }
  bool inSegment = false;
  for (char ch : path) {
    if (ch == '/') {
      if (!inSegment) {
        // leading slash or empty segment
        return false;
      }
      inSegment = false;
    } else if (isword(ch)) {
      inSegment = true;
    } else {
      return false;
    }
  }
  // the last segment must not be empty
  return inSegment;
}

std::string NormalizeRoutePath(std::string_view path) {
  std::string ret;
  ret.reserve(path.size() + 1U);
  ret.append(path);
  if (ret.empty() || ret.back() != '/') {
    ret.push_back('/');
  }
  return ret;
}

std::string PrependBasePath(std::string_view basePath, std::string_view path) {
  std::string ret;
  ret.reserve(basePath.size() + path.size());
  ret.append(basePath);
  ret.append(path);
  return ret;
}

}  // namespace routekit
