#include <shuttle/retry_middleware.hpp>

#include <thread>

#include <spdlog/spdlog.h>

#include <shuttle/exceptions.hpp>

RetryMiddleware::RetryMiddleware(int maxAttempts, std::chrono::milliseconds baseDelay,
                                 std::set<int> retryStatuses)
    : maxAttempts_{maxAttempts}
    , baseDelay_{baseDelay}
    , retryStatuses_{std::move(retryStatuses)}
{
    if (maxAttempts_ < 1) {
        throw ConfigurationError{"retry attempts must be at least 1"};
    }
}

auto RetryMiddleware::canReplay(Request const& request) -> bool
{
    return !request.body() || request.body()->isSeekable();
}

auto RetryMiddleware::process(Request const& request, Next const& next) -> Response
{
    auto const replayable = RetryMiddleware::canReplay(request);
    auto delay = baseDelay_;

    for (int attempt = 1; ; ++attempt) {
        auto const isLast = attempt >= maxAttempts_ || !replayable;

        if (attempt > 1) {
            std::this_thread::sleep_for(delay);
            delay *= 2;
            if (request.body()) {
                request.body()->rewind();
            }
        }

        try {
            auto response = next(request);
            if (isLast || retryStatuses_.count(response.statusCode()) == 0) {
                return response;
            }
            spdlog::warn("Attempt {} of {} {} returned {}, retrying",
                         attempt, request.method(), request.url().toRelativeString(), response.statusCode());
        }
        catch (TransportError const& e) {
            if (isLast) {
                throw;
            }
            spdlog::warn("Attempt {} of {} {} failed: {}, retrying",
                         attempt, request.method(), request.url().toRelativeString(), e.what());
        }
    }
}
