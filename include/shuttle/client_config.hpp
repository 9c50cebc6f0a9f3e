#ifndef SHUTTLE_CLIENT_CONFIG_HPP_
#define SHUTTLE_CLIENT_CONFIG_HPP_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <shuttle/http.hpp>
#include <shuttle/middleware.hpp>
#include <shuttle/transport.hpp>

using HeaderList = std::vector<std::pair<std::string, std::string>>;

class ClientConfig {
public:
    class Builder;

    ClientConfig(std::optional<TransportPtr> handler, std::optional<std::string> handlerName,
                 HttpVersion httpVersion, std::optional<std::string> baseUrl,
                 HeaderList headers, std::vector<MiddlewarePtr> middleware, bool debug)
        : handler_{std::move(handler)}, handlerName_{std::move(handlerName)}
        , httpVersion_{httpVersion}, baseUrl_{std::move(baseUrl)}
        , headers_{std::move(headers)}, middleware_{std::move(middleware)}
        , debug_{debug}
    {
    }

    // set means explicitly given, possibly as nullptr
    auto handler() const -> std::optional<TransportPtr> const& { return handler_; }
    auto handlerName() const -> std::optional<std::string> const& { return handlerName_; }

    auto httpVersion() const { return httpVersion_; }
    auto baseUrl() const -> std::optional<std::string> const& { return baseUrl_; }
    auto headers() const -> HeaderList const& { return headers_; }
    auto middleware() const -> std::vector<MiddlewarePtr> const& { return middleware_; }
    auto debug() const { return debug_; }

private:
    std::optional<TransportPtr> handler_;
    std::optional<std::string> handlerName_;
    HttpVersion httpVersion_;
    std::optional<std::string> baseUrl_;
    HeaderList headers_;
    std::vector<MiddlewarePtr> middleware_;
    bool debug_;
};

class ClientConfig::Builder {
public:
    auto build() const {
        return ClientConfig{
            handler_, handlerName_,
            httpVersion_, baseUrl_,
            headers_, middleware_,
            debug_,
        };
    }

    // handler() and handlerName() replace each other
    auto handler(TransportPtr value) -> Builder& { handler_ = std::move(value); handlerName_.reset(); return *this; }
    auto handlerName(std::string name) -> Builder& { handlerName_ = std::move(name); handler_.reset(); return *this; }

    auto httpVersion(HttpVersion value) -> Builder& { httpVersion_ = value; return *this; }
    auto httpVersion(std::string_view value) -> Builder& { httpVersion_ = parseHttpVersion(value); return *this; }
    auto baseUrl(std::string value) -> Builder& { baseUrl_ = std::move(value); return *this; }
    auto header(std::string name, std::string value) -> Builder& { headers_.emplace_back(std::move(name), std::move(value)); return *this; }
    auto middleware(MiddlewarePtr value) -> Builder& { middleware_.push_back(std::move(value)); return *this; }
    auto debug(bool value) -> Builder& { debug_ = value; return *this; }

private:
    std::optional<TransportPtr> handler_;
    std::optional<std::string> handlerName_;
    HttpVersion httpVersion_{HttpVersion::VERSION_1_1};
    std::optional<std::string> baseUrl_;
    HeaderList headers_;
    std::vector<MiddlewarePtr> middleware_;
    bool debug_{false};
};

#endif  // SHUTTLE_CLIENT_CONFIG_HPP_
