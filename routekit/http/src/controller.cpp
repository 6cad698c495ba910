#include "routekit/controller.hpp"

#include <string>
#include <utility>

namespace routekit {

Controller::Controller(std::string name) : _name(std::move(name)) {
  if (_name.empty()) {
    _name = kDefaultName;
  }
}

Controller::~Controller() = default;

}  // namespace routekit
