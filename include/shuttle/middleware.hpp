#ifndef SHUTTLE_MIDDLEWARE_HPP_
#define SHUTTLE_MIDDLEWARE_HPP_

#include <functional>
#include <memory>

#include <shuttle/http.hpp>

// The rest of the pipeline, ending in the transport
using Next = std::function<Response(Request const&)>;

// Intercepts a request on its way to the transport.
//
// An implementation decides whether to call next, how many times,
// and with which request; it may replace the response it gets back.
// Not calling next at all skips everything behind it.
class Middleware {
public:
    virtual ~Middleware() = default;

    virtual auto process(Request const& request, Next const& next) -> Response = 0;
};

using MiddlewarePtr = std::shared_ptr<Middleware>;

#endif  // SHUTTLE_MIDDLEWARE_HPP_
