#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "routekit/controller.hpp"
#include "routekit/http-method.hpp"
#include "routekit/router-config.hpp"

namespace routekit {

// Verb independent part of a Router: current base path, current default controller
// and the rules turning a registration call into a final path and controller.
class RouterBase {
 public:
  // Current base path, always starting and ending with '/', or empty if none has been set.
  [[nodiscard]] std::string_view basePath() const noexcept { return _basePath; }

  [[nodiscard]] bool hasBasePath() const noexcept { return !_basePath.empty(); }

  // Controller used for routes registered without an explicit one. May be null.
  [[nodiscard]] const ControllerPtr& defaultController() const noexcept { return _defaultController; }

  // Returns the current base path directly followed by 'path', without any normalization.
  [[nodiscard]] std::string prependBasePath(std::string_view path) const;

 protected:
  struct ResolvedRoute {
    std::string path;
    ControllerPtr controller;
  };

  RouterBase() noexcept = default;

  explicit RouterBase(RouterConfig config);

  RouterBase(const RouterBase&) = default;
  RouterBase(RouterBase&&) noexcept = default;
  RouterBase& operator=(const RouterBase&) = default;
  RouterBase& operator=(RouterBase&&) noexcept = default;

  ~RouterBase() = default;

  // Sets the base path for all routes registered afterwards. Previously registered routes are left untouched.
  // Throws invalid_route if 'path' is "/" or is not a valid route path.
  void setBasePath(std::string_view path);

  // Sets the default controller. Throws invalid_route if no base path is set or if 'controller' is null.
  void mountController(ControllerPtr controller);

  // Computes the final path and controller of a route to be registered under 'method'.
  // A non null 'controller' becomes the new default controller.
  // Throws invalid_route for an invalid path or if no controller can be resolved. In that case, no state is modified.
  ResolvedRoute resolve(http::Method method, std::string_view path, ControllerPtr controller);

  // Parses a verb name. Unrecognized names are reported as errors in the log and give std::nullopt.
  static std::optional<http::Method> ParseMethod(std::string_view methodName);

 private:
  std::string _basePath;
  ControllerPtr _defaultController;
};

}  // namespace routekit
