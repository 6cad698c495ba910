#include "routekit/controller.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace routekit {

TEST(ControllerTest, Name) {
  EXPECT_EQ(Controller("widgets").name(), "widgets");
  EXPECT_EQ(Controller().name(), "controller");
  EXPECT_EQ(Controller(std::string()).name(), "controller");
}

TEST(ControllerTest, DerivedControllerIsAController) {
  struct WidgetController : Controller {
    WidgetController() : Controller("widgets") {}
  };

  ControllerPtr controller = std::make_shared<WidgetController>();
  EXPECT_EQ(controller->name(), "widgets");
}

}  // namespace routekit
