#include <routekit/routekit.hpp>

#include <exception>
#include <memory>
#include <string>
#include <string_view>

using namespace routekit;

namespace {

// Stand-ins for the transport objects of a real server.
struct Request {
  std::string target;
};

struct Response {
  int status{};
  std::string body;
};

class WidgetController : public Controller {
 public:
  WidgetController() : Controller("WidgetController") {}

  void list(Request&, Response& resp) const {
    resp.status = 200;
    resp.body = "[]";
  }

  void create(Request&, Response& resp) const {
    resp.status = 201;
    resp.body = "{}";
  }
};

class GadgetController : public Controller {
 public:
  GadgetController() : Controller("GadgetController") {}
};

}  // namespace

int main(int argc, char** argv) {
  log::set_level(argc > 1 && std::string_view(argv[1]) == "-v" ? log::level::debug : log::level::info);

  auto widgets = std::make_shared<WidgetController>();
  auto gadgets = std::make_shared<GadgetController>();

  Router<Request, Response> router;
  try {
    router.on("api")
        .use(widgets)
        .get("widgets", [widgets](Request& req, Response& resp) { widgets->list(req, resp); })
        .post("widgets", [widgets](Request& req, Response& resp) { widgets->create(req, resp); })
        .get("gadgets", [](Request&, Response& resp) { resp.status = 200; }, gadgets)
        .options("gadgets", [](Request&, Response& resp) { resp.status = 204; });

    // Routes coming from a configuration file give the verb as text.
    router.route("delete", "gadgets", [](Request&, Response& resp) { resp.status = 204; });
  } catch (const std::exception& ex) {
    log::critical("Invalid route table: {}", ex.what());
    return 1;
  }

  for (http::Method method : http::kAllMethods) {
    for (const auto& entry : router.routes(method)) {
      Request req{std::string(entry.path())};
      Response resp;
      entry.action()(req, resp);
      log::info("{:<7} {:<16} {:<18} -> {}", http::MethodToStr(method), entry.path(), entry.controller()->name(),
                resp.status);
    }
  }
  log::info("{} routes registered", router.size());
  return 0;
}
