#ifndef SHUTTLE_CLIENT_HPP_
#define SHUTTLE_CLIENT_HPP_

#include <string>
#include <string_view>
#include <vector>

#include <shuttle/client_config.hpp>
#include <shuttle/http.hpp>
#include <shuttle/middleware.hpp>
#include <shuttle/stream.hpp>
#include <shuttle/transport.hpp>
#include <shuttle/url.hpp>

#define SHUTTLE_USER_AGENT "Shuttle/1.0"

struct RequestOptions {
    // replace same-named default headers, in this order
    HeaderList headers;
};

// Synchronous HTTP client.
//
// Every request runs through the configured middleware in declared order
// and ends in the handler (transport). The pipeline is compiled once at
// construction; afterwards the client holds no mutable state of its own.
class Client {
public:
    // throws ConfigurationError
    explicit Client(ClientConfig config = ClientConfig::Builder{}.build());

    auto config() const -> ClientConfig const& { return config_; }
    auto handler() const -> TransportPtr const& { return handler_; }

    // "Shuttle/1.0 C++/<standard>"
    static auto defaultUserAgent() -> std::string const&;

    // The target is prefixed with the base URL verbatim when one is configured.
    auto request(std::string_view method, std::string_view target,
                 StreamPtr body = nullptr, RequestOptions const& options = {}) -> Response;
    auto request(std::string_view method, Url const& url,
                 StreamPtr body = nullptr, RequestOptions const& options = {}) -> Response;

    auto get(std::string_view target, RequestOptions const& options = {}) -> Response;
    auto post(std::string_view target, StreamPtr body, RequestOptions const& options = {}) -> Response;
    auto put(std::string_view target, StreamPtr body, RequestOptions const& options = {}) -> Response;
    auto patch(std::string_view target, StreamPtr body, RequestOptions const& options = {}) -> Response;
    auto del(std::string_view target, RequestOptions const& options = {}) -> Response;
    auto head(std::string_view target, RequestOptions const& options = {}) -> Response;
    auto options(std::string_view target, RequestOptions const& options = {}) -> Response;

    // the only way a request reaches the handler
    auto sendRequest(Request const& request) const -> Response;

    static auto compilePipeline(std::vector<MiddlewarePtr> const& layers, Next kernel) -> Next;

private:
    ClientConfig config_;
    TransportPtr handler_;
    Next pipeline_;

    auto resolveHandler() const -> TransportPtr;
    auto buildRequest(std::string_view method, Url url,
                      StreamPtr body, RequestOptions const& options) const -> Request;
};

#endif  // SHUTTLE_CLIENT_HPP_
