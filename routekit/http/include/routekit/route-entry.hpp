#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "routekit/controller.hpp"

namespace routekit {

// A registered route: final path (base path included), owning controller and the action to invoke.
// Immutable once built.
template <class Action>
class RouteEntry {
 public:
  using action_type = Action;

  RouteEntry(std::string path, ControllerPtr controller, Action action)
      : _path(std::move(path)), _controller(std::move(controller)), _action(std::move(action)) {}

  // Normalized path, always ending with '/'.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] const ControllerPtr& controller() const noexcept { return _controller; }

  [[nodiscard]] const Action& action() const noexcept { return _action; }

 private:
  std::string _path;
  ControllerPtr _controller;
  Action _action;
};

}  // namespace routekit
