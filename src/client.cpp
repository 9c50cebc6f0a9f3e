#include <shuttle/client.hpp>

#include <spdlog/spdlog.h>

#include <shuttle/curl_transport.hpp>
#include <shuttle/exceptions.hpp>
#include <shuttle/transport_factory.hpp>

Client::Client(ClientConfig config)
    : config_{std::move(config)}
    , handler_{this->resolveHandler()}
{
    for (auto const& middleware : config_.middleware()) {
        if (!middleware) {
            throw ConfigurationError{"middleware must not be null"};
        }
    }

    if (config_.debug()) {
        handler_->setDebug(true);
    }

    pipeline_ = Client::compilePipeline(
        config_.middleware(),
        [handler = handler_](Request const& request) { return handler->execute(request); });
}

auto Client::resolveHandler() const -> TransportPtr
{
    if (auto const& handler = config_.handler()) {
        if (!*handler) {
            throw ConfigurationError{"handler must not be null"};
        }
        return *handler;
    }

    if (auto const& name = config_.handlerName()) {
        auto handler = TransportFactory::create(*name);
        if (!handler) {
            throw ConfigurationError{"no such handler: " + *name};
        }
        return handler;
    }

    return std::make_shared<CurlTransport>();
}

auto Client::compilePipeline(std::vector<MiddlewarePtr> const& layers, Next kernel) -> Next
{
    // wrap from the innermost layer outwards, so the first layer runs first
    auto chain = std::move(kernel);
    for (auto iter = std::rbegin(layers); iter != std::rend(layers); ++iter) {
        chain = [middleware = *iter, next = std::move(chain)](Request const& request) {
            return middleware->process(request, next);
        };
    }

    spdlog::debug("Compiled pipeline with {} middleware", layers.size());
    return chain;
}

auto Client::defaultUserAgent() -> std::string const&
{
    static std::string const userAgent = std::string{SHUTTLE_USER_AGENT} + " C++/" + std::to_string(__cplusplus);
    return userAgent;
}

auto Client::sendRequest(Request const& request) const -> Response
{
    return pipeline_(request);
}

auto Client::buildRequest(std::string_view method, Url url,
                          StreamPtr body, RequestOptions const& options) const -> Request
{
    auto request = Request{method, std::move(url)}.withVersion(config_.httpVersion());

    for (auto const& [name, value] : config_.headers()) {
        request = request.withAddedHeader(name, value);
    }

    if (!request.hasHeader("User-Agent")) {
        request = request.withHeader("User-Agent", Client::defaultUserAgent());
    }

    if (body) {
        if (auto const contentType = body->contentType()) {
            request = request.withHeader("Content-Type", *contentType);
        }
        request = request.withBody(std::move(body));
    }

    for (auto const& [name, value] : options.headers) {
        request = request.withHeader(name, value);
    }

    return request;
}

auto Client::request(std::string_view method, std::string_view target,
                     StreamPtr body, RequestOptions const& options) -> Response
{
    auto const& baseUrl = config_.baseUrl();
    Url url{baseUrl ? *baseUrl + std::string{target} : std::string{target}};

    return this->sendRequest(this->buildRequest(method, std::move(url), std::move(body), options));
}

auto Client::request(std::string_view method, Url const& url,
                     StreamPtr body, RequestOptions const& options) -> Response
{
    return this->sendRequest(this->buildRequest(method, url, std::move(body), options));
}

auto Client::get(std::string_view target, RequestOptions const& options) -> Response
{
    return this->request("GET", target, nullptr, options);
}

auto Client::post(std::string_view target, StreamPtr body, RequestOptions const& options) -> Response
{
    return this->request("POST", target, std::move(body), options);
}

auto Client::put(std::string_view target, StreamPtr body, RequestOptions const& options) -> Response
{
    return this->request("PUT", target, std::move(body), options);
}

auto Client::patch(std::string_view target, StreamPtr body, RequestOptions const& options) -> Response
{
    return this->request("PATCH", target, std::move(body), options);
}

auto Client::del(std::string_view target, RequestOptions const& options) -> Response
{
    return this->request("DELETE", target, nullptr, options);
}

auto Client::head(std::string_view target, RequestOptions const& options) -> Response
{
    return this->request("HEAD", target, nullptr, options);
}

auto Client::options(std::string_view target, RequestOptions const& options) -> Response
{
    return this->request("OPTIONS", target, nullptr, options);
}
