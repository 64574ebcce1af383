#pragma once

#include <memory>

#include "burnlink/http/router.h"

namespace burnlink::links {
class LinkRegistry;
}

namespace burnlink::http {

/// Registers the health and metrics routes into the provided router.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<const links::LinkRegistry> registry);

}  // namespace burnlink::http
