#ifndef SHUTTLE_LOGGING_MIDDLEWARE_HPP_
#define SHUTTLE_LOGGING_MIDDLEWARE_HPP_

#include <memory>

#include <spdlog/spdlog.h>

#include <shuttle/middleware.hpp>

// Logs each exchange at info level; the response passes through untouched
class LoggingMiddleware : public Middleware {
public:
    // spdlog's default logger when none is given
    explicit LoggingMiddleware(std::shared_ptr<spdlog::logger> logger = nullptr);

    auto process(Request const& request, Next const& next) -> Response override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

#endif  // SHUTTLE_LOGGING_MIDDLEWARE_HPP_
