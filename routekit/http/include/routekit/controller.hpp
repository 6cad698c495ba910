#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace routekit {

// A named group of route actions.
// Applications derive their own controllers from this class. The router itself only uses a controller
// as an identity token, to resolve which controller a newly registered route belongs to.
class Controller {
 public:
  Controller() = default;

  explicit Controller(std::string name);

  Controller(const Controller&) = default;
  Controller(Controller&&) noexcept = default;
  Controller& operator=(const Controller&) = default;
  Controller& operator=(Controller&&) noexcept = default;

  virtual ~Controller();

  // Name used in diagnostics. Never empty.
  [[nodiscard]] std::string_view name() const noexcept { return _name; }

 private:
  static constexpr std::string_view kDefaultName = "controller";

  std::string _name{kDefaultName};
};

using ControllerPtr = std::shared_ptr<Controller>;

}  // namespace routekit
