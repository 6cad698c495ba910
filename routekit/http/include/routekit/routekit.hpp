#pragma once

// IWYU pragma: begin_exports
#include "routekit/controller.hpp"
#include "routekit/http-method.hpp"
#include "routekit/invalid-route-exception.hpp"
#include "routekit/log.hpp"
#include "routekit/route-entry.hpp"
#include "routekit/route-path.hpp"
#include "routekit/route-table.hpp"
#include "routekit/router-config.hpp"
#include "routekit/router.hpp"
// IWYU pragma: end_exports
