#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace routekit::http {

// The verbs a route can be registered under. Each one owns its own route table.
enum class Method : uint8_t { GET, POST, PUT, PATCH, DELETE, OPTIONS };

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 6;

constexpr MethodIdx MethodToIdx(Method method) { return static_cast<MethodIdx>(method); }

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<Method>(methodIdx); }

inline constexpr std::array<std::string_view, kNbMethods> kMethodStrings = {"GET",   "POST",   "PUT",
                                                                            "PATCH", "DELETE", "OPTIONS"};

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

inline constexpr std::array<Method, kNbMethods> kAllMethods = {Method::GET,   Method::POST,   Method::PUT,
                                                               Method::PATCH, Method::DELETE, Method::OPTIONS};

}  // namespace routekit::http
