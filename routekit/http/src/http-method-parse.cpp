#include "http-method-parse.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

#include "routekit/cctype.hpp"
#include "routekit/http-method.hpp"

namespace routekit::http {

namespace {

// 'upperRhs' is expected to be already upper case.
bool CaseInsensitiveEqual(std::string_view lhs, std::string_view upperRhs) {
  if (lhs.size() != upperRhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (toupper(lhs[pos]) != upperRhs[pos]) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  switch (str.size()) {
    case 3:  // GET, PUT
      switch (toupper(str[0])) {
        case 'G':
          return CaseInsensitiveEqual(str, "GET") ? std::optional<Method>(Method::GET) : std::nullopt;
        case 'P':
          return CaseInsensitiveEqual(str, "PUT") ? std::optional<Method>(Method::PUT) : std::nullopt;
        default:
          return std::nullopt;
      }

    case 4:  // POST
      return CaseInsensitiveEqual(str, "POST") ? std::optional<Method>(Method::POST) : std::nullopt;

    case 5:  // PATCH
      return CaseInsensitiveEqual(str, "PATCH") ? std::optional<Method>(Method::PATCH) : std::nullopt;

    case 6:  // DELETE
      return CaseInsensitiveEqual(str, "DELETE") ? std::optional<Method>(Method::DELETE) : std::nullopt;

    case 7:  // OPTIONS
      return CaseInsensitiveEqual(str, "OPTIONS") ? std::optional<Method>(Method::OPTIONS) : std::nullopt;

    default:
      return std::nullopt;
  }
}

}  // namespace routekit::http
