#pragma once

#include <optional>
#include <string_view>

#include "routekit/http-method.hpp"

namespace routekit::http {

// Attempt to parse one of the supported verbs, ignoring case.
// Verbs outside of the supported set (HEAD, TRACE, CONNECT...) are not recognized.
std::optional<Method> MethodStrToOptEnum(std::string_view str);

}  // namespace routekit::http
