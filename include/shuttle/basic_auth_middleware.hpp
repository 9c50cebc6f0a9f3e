#ifndef SHUTTLE_BASIC_AUTH_MIDDLEWARE_HPP_
#define SHUTTLE_BASIC_AUTH_MIDDLEWARE_HPP_

#include <string>

#include <shuttle/middleware.hpp>

// Adds "Authorization: Basic ..." unless the request carries an Authorization already
class BasicAuthMiddleware : public Middleware {
public:
    BasicAuthMiddleware(std::string const& user, std::string const& password);

    auto process(Request const& request, Next const& next) -> Response override;

private:
    std::string credentials_;
};

#endif  // SHUTTLE_BASIC_AUTH_MIDDLEWARE_HPP_
