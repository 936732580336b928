#pragma once

#include "http/HttpRequest.hpp"
#include "http/HttpResponse.hpp"

namespace reading_service {
namespace handlers {

// A handler answers every request it receives; failures become error responses.
class IRequestHandler {
public:
    virtual ~IRequestHandler() = default;
    virtual http::HttpResponse Handle(http::HttpRequest& request) = 0;
};

} // namespace handlers
} // namespace reading_service
