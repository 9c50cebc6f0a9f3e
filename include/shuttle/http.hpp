#ifndef SHUTTLE_HTTP_HPP_
#define SHUTTLE_HTTP_HPP_

#include <optional>
#include <string>
#include <string_view>

#include <shuttle/headers.hpp>
#include <shuttle/stream.hpp>
#include <shuttle/url.hpp>

enum class HttpVersion { VERSION_1_0, VERSION_1_1, VERSION_2 };

// accepts "1", "1.0", "1.1", "2" and "2.0"; throws UnknownVersionError otherwise
auto parseHttpVersion(std::string_view text) -> HttpVersion;
auto toString(HttpVersion version) -> std::string;

// Immutable outgoing message. Every with*() returns a modified copy;
// copies share the body stream.
class Request {
public:
    Request(std::string_view method, Url url,
            StreamPtr body = nullptr, HttpVersion version = HttpVersion::VERSION_1_1);

    auto method() const -> std::string const& { return method_; }
    auto url() const -> Url const& { return url_; }
    auto version() const -> HttpVersion { return version_; }
    auto headers() const -> Headers const& { return headers_; }
    auto body() const -> StreamPtr const& { return body_; }

    auto hasHeader(std::string_view name) const -> bool { return headers_.has(name); }
    auto headerLine(std::string_view name) const -> std::string { return headers_.line(name); }

    auto withMethod(std::string_view method) const -> Request;
    auto withUrl(Url url) const -> Request;
    auto withVersion(HttpVersion version) const -> Request;
    auto withHeader(std::string_view name, std::string_view value) const -> Request;
    auto withAddedHeader(std::string_view name, std::string_view value) const -> Request;
    auto withoutHeader(std::string_view name) const -> Request;
    auto withBody(StreamPtr body) const -> Request;

private:
    std::string method_;
    Url url_;
    HttpVersion version_;
    Headers headers_;
    StreamPtr body_;
};

class Response {
public:
    Response();

    // the reason phrase comes from ResponseStatus unless given
    explicit Response(int statusCode, StreamPtr body = nullptr, Headers headers = {},
                      HttpVersion version = HttpVersion::VERSION_1_1,
                      std::optional<std::string> reasonPhrase = std::nullopt);

    auto statusCode() const -> int { return statusCode_; }
    auto reasonPhrase() const -> std::string const& { return reasonPhrase_; }
    auto version() const -> HttpVersion { return version_; }
    auto headers() const -> Headers const& { return headers_; }

    // never null
    auto body() const -> StreamPtr const& { return body_; }

    auto hasHeader(std::string_view name) const -> bool { return headers_.has(name); }
    auto headerLine(std::string_view name) const -> std::string { return headers_.line(name); }

    // 1xx, 2xx and 3xx
    bool isSuccessful() const;

    auto withStatus(int code, std::optional<std::string> reasonPhrase = std::nullopt) const -> Response;
    auto withVersion(HttpVersion version) const -> Response;
    auto withHeader(std::string_view name, std::string_view value) const -> Response;
    auto withAddedHeader(std::string_view name, std::string_view value) const -> Response;
    auto withoutHeader(std::string_view name) const -> Response;
    auto withBody(StreamPtr body) const -> Response;

private:
    int statusCode_;
    std::string reasonPhrase_;
    HttpVersion version_;
    Headers headers_;
    StreamPtr body_;
};

#endif  // SHUTTLE_HTTP_HPP_
