#ifndef SHUTTLE_RETRY_MIDDLEWARE_HPP_
#define SHUTTLE_RETRY_MIDDLEWARE_HPP_

#include <chrono>
#include <set>

#include <shuttle/middleware.hpp>

// Calls next again after a TransportError or a retryable status.
//
// Requests with a non-seekable body are sent once; seekable bodies are
// rewound before every further attempt. The delay doubles each attempt.
class RetryMiddleware : public Middleware {
public:
    RetryMiddleware(int maxAttempts, std::chrono::milliseconds baseDelay,
                    std::set<int> retryStatuses = {429, 502, 503, 504});

    auto process(Request const& request, Next const& next) -> Response override;

private:
    int maxAttempts_;
    std::chrono::milliseconds baseDelay_;
    std::set<int> retryStatuses_;

    static auto canReplay(Request const& request) -> bool;
};

#endif  // SHUTTLE_RETRY_MIDDLEWARE_HPP_
