#pragma once

#include "http/HttpRequest.hpp"
#include "http/HttpResponse.hpp"
#include <functional>
#include <string>
#include <vector>

namespace reading_service {
namespace http {

using RequestHandler = std::function<HttpResponse(HttpRequest&)>;

struct RouteEntry {
    std::string path;
    RequestHandler handler;
};

// Routes on exact path (a single trailing slash is ignored). Every method
// reaches the mounted handler; the handler decides which verbs it serves.
class HttpRouter {
public:
    HttpRouter();

    void AddRoute(const std::string& path, RequestHandler handler);

    HttpResponse Route(HttpRequest& request);

    void SetNotFoundHandler(RequestHandler handler);

    size_t GetRouteCount() const { return m_routes.size(); }

    static std::string NormalizePath(const std::string& path);

private:
    HttpResponse Invoke(const RouteEntry& route, HttpRequest& request);

    std::vector<RouteEntry> m_routes;
    RequestHandler m_notFoundHandler;
};

} // namespace http
} // namespace reading_service
