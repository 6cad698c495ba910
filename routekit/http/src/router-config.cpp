#include "routekit/router-config.hpp"

#include <string_view>
#include <utility>

#include "routekit/controller.hpp"
#include "routekit/invalid-route-exception.hpp"
#include "routekit/route-path.hpp"

namespace routekit {

void RouterConfig::validate() const {
  if (basePath.empty()) {
    return;
  }
  if (basePath == "/" || !IsRoutePathValid(basePath)) {
    throw invalid_route("RouterConfig.basePath '{}' is an invalid base path", basePath);
  }
}

RouterConfig& RouterConfig::withBasePath(std::string_view path) {
  basePath = path;
  return *this;
}

RouterConfig& RouterConfig::withDefaultController(ControllerPtr controller) {
  defaultController = std::move(controller);
  return *this;
}

}  // namespace routekit
