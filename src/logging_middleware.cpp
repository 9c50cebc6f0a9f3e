#include <shuttle/logging_middleware.hpp>

#include <chrono>
#include <exception>

LoggingMiddleware::LoggingMiddleware(std::shared_ptr<spdlog::logger> logger)
    : logger_{logger ? std::move(logger) : spdlog::default_logger()}
{
}

auto LoggingMiddleware::process(Request const& request, Next const& next) -> Response
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::steady_clock;

    auto const& url = request.url();
    auto const target = (url.scheme().empty() || url.host.empty()) ? url.toRelativeString() : url.toAbsoluteString();
    logger_->info("--> {} {}", request.method(), target);

    auto const start = steady_clock::now();
    try {
        auto response = next(request);

        auto const elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
        logger_->info("<-- {} {} ({} ms)", response.statusCode(), response.reasonPhrase(), elapsed);
        return response;
    }
    catch (std::exception const& e) {
        auto const elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
        logger_->error("<-- {} {} failed after {} ms: {}", request.method(), target, elapsed, e.what());
        throw;
    }
}
