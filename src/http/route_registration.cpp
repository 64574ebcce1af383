#include "burnlink/http/route_registration.h"

#include <string>

#include "burnlink/links/link_registry.h"
#include "burnlink/observability/metrics.h"

namespace burnlink::http {

void RegisterDefaultRoutes(Router& router, std::shared_ptr<const links::LinkRegistry> registry) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonResponse(boost::beast::http::status::ok, req.version(),
                                       "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id +
                                           "\"}");
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonResponse(boost::beast::http::status::ok, req.version(),
                                       "{\"status\":\"ready\",\"request_id\":\"" +
                                           ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [registry](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{boost::beast::http::status::ok, req.version()};
                   response.set(boost::beast::http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics(registry->Size());
                   response.prepare_payload();
                   return response;
               });
}

}  // namespace burnlink::http
