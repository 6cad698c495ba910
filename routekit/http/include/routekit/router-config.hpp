#pragma once

#include <string>
#include <string_view>

#include "routekit/controller.hpp"

namespace routekit {

// Initial state of a Router.
struct RouterConfig {
  // Throws invalid_route if the base path is set but cannot be used as a base path.
  void validate() const;

  // Base path applied to all routes registered after construction, in the same format as Router::on
  // (for instance "api" or "api/v2/"). Empty means no base path.
  std::string basePath;

  // Controller used for routes registered without an explicit controller.
  // Unlike Router::use, it does not require a base path.
  ControllerPtr defaultController;

  RouterConfig& withBasePath(std::string_view path);

  RouterConfig& withDefaultController(ControllerPtr controller);
};

}  // namespace routekit
