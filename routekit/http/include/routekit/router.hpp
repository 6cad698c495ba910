#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <string_view>
#include <utility>

#include "routekit/controller.hpp"
#include "routekit/http-method.hpp"
#include "routekit/route-entry.hpp"
#include "routekit/route-table.hpp"
#include "routekit/router-base.hpp"
#include "routekit/router-config.hpp"

namespace routekit {

// Builds the per verb route tables consumed by a request dispatcher.
//
// Request and Response are the transport types handed over to actions. They are opaque to the router,
// which only stores actions and never invokes them.
//
// All registration methods return the router itself so that calls can be chained:
//
//   router.on("api").use(widgets).get("widgets", listWidgets).post("widgets", createWidget);
//
// Registration rules:
//   - the path must match (\w+/)*\w+/? and is stored with a trailing '/'
//   - if a base path is set (see on()), it is prepended to the path
//   - an explicit controller is used for the route AND becomes the default controller for the following ones
//   - without an explicit controller, the default controller is used. If there is none, invalid_route is thrown.
//
// Threading: registration is expected to be made from a single thread before the router is shared.
template <class Request, class Response>
class Router : public RouterBase {
 public:
  using Action = std::function<void(Request&, Response&)>;
  using Entry = RouteEntry<Action>;
  using Table = RouteTable<Action>;

  // Creates an empty Router without base path nor default controller.
  Router() noexcept = default;

  // Creates an empty Router pre-seeded with the base path and default controller of given configuration.
  // Throws invalid_route if the configured base path is invalid.
  explicit Router(RouterConfig config) : RouterBase(std::move(config)) {}

  Router& get(std::string_view path, Action action, ControllerPtr controller = nullptr) {
    return route(http::Method::GET, path, std::move(action), std::move(controller));
  }

  Router& post(std::string_view path, Action action, ControllerPtr controller = nullptr) {
    return route(http::Method::POST, path, std::move(action), std::move(controller));
  }

  Router& put(std::string_view path, Action action, ControllerPtr controller = nullptr) {
    return route(http::Method::PUT, path, std::move(action), std::move(controller));
  }

  Router& patch(std::string_view path, Action action, ControllerPtr controller = nullptr) {
    return route(http::Method::PATCH, path, std::move(action), std::move(controller));
  }

  // DELETE
  Router& del(std::string_view path, Action action, ControllerPtr controller = nullptr) {
    return route(http::Method::DELETE, path, std::move(action), std::move(controller));
  }

  Router& options(std::string_view path, Action action, ControllerPtr controller = nullptr) {
    return route(http::Method::OPTIONS, path, std::move(action), std::move(controller));
  }

  // Registers a route under given verb. The verb specific methods above are shortcuts of this one.
  Router& route(http::Method method, std::string_view path, Action action, ControllerPtr controller = nullptr) {
    ResolvedRoute resolved = resolve(method, path, std::move(controller));
    _tables[http::MethodToIdx(method)].append(
        Entry(std::move(resolved.path), std::move(resolved.controller), std::move(action)));
    return *this;
  }

  // Registers a route under a verb given by its name, case insensitive (for instance coming from a configuration file).
  // An unknown verb name is logged as an error and the route is ignored.
  Router& route(std::string_view methodName, std::string_view path, Action action,
                ControllerPtr controller = nullptr) {
    const auto method = ParseMethod(methodName);
    if (method) {
      route(*method, path, std::move(action), std::move(controller));
    }
    return *this;
  }

  // Sets the base path of the routes registered from now on, stored as "/" + path + "/".
  // Throws invalid_route if 'path' is "/" or invalid.
  Router& on(std::string_view path) {
    setBasePath(path);
    return *this;
  }

  // Sets the default controller of the routes registered from now on.
  // Throws invalid_route if no base path has been set before.
  Router& use(ControllerPtr controller) {
    mountController(std::move(controller));
    return *this;
  }

  // Routes registered under given verb, in registration order.
  [[nodiscard]] const Table& routes(http::Method method) const noexcept { return _tables[http::MethodToIdx(method)]; }

  // Total number of registered routes, all verbs included.
  [[nodiscard]] std::size_t size() const noexcept {
    std::size_t nbRoutes = 0;
    for (const Table& table : _tables) {
      nbRoutes += table.size();
    }
    return nbRoutes;
  }

 private:
  std::array<Table, http::kNbMethods> _tables;
};

}  // namespace routekit
