#include <shuttle/basic_auth_middleware.hpp>

#include "utils.hpp"

BasicAuthMiddleware::BasicAuthMiddleware(std::string const& user, std::string const& password)
    : credentials_{"Basic " + shuttle::utils::base64Encode(user + ":" + password)}
{
}

auto BasicAuthMiddleware::process(Request const& request, Next const& next) -> Response
{
    if (request.hasHeader("Authorization")) {
        return next(request);
    }
    return next(request.withHeader("Authorization", credentials_));
}
