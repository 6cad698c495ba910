#include "routekit/router-base.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "http-method-parse.hpp"
#include "routekit/controller.hpp"
#include "routekit/http-method.hpp"
#include "routekit/invalid-route-exception.hpp"
#include "routekit/log.hpp"
#include "routekit/route-path.hpp"
#include "routekit/router-config.hpp"

namespace routekit {

RouterBase::RouterBase(RouterConfig config) {
  config.validate();
  if (!config.basePath.empty()) {
    setBasePath(config.basePath);
  }
  _defaultController = std::move(config.defaultController);
}

std::string RouterBase::prependBasePath(std::string_view path) const { return PrependBasePath(_basePath, path); }

void RouterBase::setBasePath(std::string_view path) {
  if (path == "/" || !IsRoutePathValid(path)) {
    throw invalid_route("The path '{}' is an invalid route path", path);
  }
  std::string basePath;
  basePath.reserve(path.size() + 2U);
  basePath.push_back('/');
  basePath.append(NormalizeRoutePath(path));
  _basePath = std::move(basePath);
}

void RouterBase::mountController(ControllerPtr controller) {
  if (!hasBasePath()) {
    throw invalid_route("Controller mount attempted without a set base path.");
  }
  if (!controller) {
    throw invalid_route("Cannot mount a null controller on base path '{}'", _basePath);
  }
  _defaultController = std::move(controller);
}

RouterBase::ResolvedRoute RouterBase::resolve(http::Method method, std::string_view path,
                                              ControllerPtr controller) {
  if (!IsRoutePathValid(path)) {
    throw invalid_route("The path '{}' is an invalid route path", path);
  }
  std::string normalizedPath = NormalizeRoutePath(path);
  if (!controller && !_defaultController) {
    throw invalid_route("Null controller for route '{} {}' is not allowed.", http::MethodToStr(method),
                        normalizedPath);
  }
  if (controller) {
    _defaultController = std::move(controller);
  }

  ResolvedRoute resolved{hasBasePath() ? prependBasePath(normalizedPath) : std::move(normalizedPath),
                         _defaultController};

  log::debug("{} {} -> {}", http::MethodToStr(method), resolved.path, resolved.controller->name());
  return resolved;
}

std::optional<http::Method> RouterBase::ParseMethod(std::string_view methodName) {
  auto method = http::MethodStrToOptEnum(methodName);
  if (!method) {
    log::error("Unrecognized HTTP method '{}'", methodName);
  }
  return method;
}

}  // namespace routekit
