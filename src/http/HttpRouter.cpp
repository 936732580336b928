#include "http/HttpRouter.hpp"
#include "utils/Logger.hpp"

namespace reading_service {
namespace http {

HttpRouter::HttpRouter() {
    m_notFoundHandler = [](HttpRequest& request) {
        return HttpResponse::NotFound("No handler for " + request.GetPath());
    };
}

void HttpRouter::AddRoute(const std::string& path, RequestHandler handler) {
    RouteEntry route;
    route.path = NormalizePath(path);
    route.handler = std::move(handler);
    m_routes.push_back(std::move(route));
}

HttpResponse HttpRouter::Route(HttpRequest& request) {
    const std::string path = NormalizePath(request.GetPath());

    for (const auto& route : m_routes) {
        if (route.path == path) {
            return Invoke(route, request);
        }
    }

    return m_notFoundHandler(request);
}

void HttpRouter::SetNotFoundHandler(RequestHandler handler) {
    m_notFoundHandler = std::move(handler);
}

std::string HttpRouter::NormalizePath(const std::string& path) {
    if (path.size() > 1 && path.back() == '/') {
        return path.substr(0, path.size() - 1);
    }
    return path.empty() ? "/" : path;
}

HttpResponse HttpRouter::Invoke(const RouteEntry& route, HttpRequest& request) {
    try {
        return route.handler(request);
    } catch (const std::exception& e) {
        utils::Logger::Error("Unhandled exception in route " + route.path + ": " + e.what());
        return HttpResponse::InternalServerError();
    }
}

} // namespace http
} // namespace reading_service
