#include <shuttle/http.hpp>

#include <shuttle/exceptions.hpp>
#include <shuttle/response_status.hpp>
#include "utils.hpp"

auto parseHttpVersion(std::string_view text) -> HttpVersion
{
    auto const trimmed = shuttle::utils::trim(text);

    if (trimmed == "1" || trimmed == "1.0") {
        return HttpVersion::VERSION_1_0;
    }
    if (trimmed == "1.1") {
        return HttpVersion::VERSION_1_1;
    }
    if (trimmed == "2" || trimmed == "2.0") {
        return HttpVersion::VERSION_2;
    }
    throw UnknownVersionError{std::string{text}};
}

auto toString(HttpVersion version) -> std::string
{
    switch (version) {
    case HttpVersion::VERSION_1_0:
        return "1.0";
    case HttpVersion::VERSION_1_1:
        return "1.1";
    case HttpVersion::VERSION_2:
        return "2";
    }
    throw UnknownVersionError{std::to_string(static_cast<int>(version))};
}

Request::Request(std::string_view method, Url url, StreamPtr body, HttpVersion version)
    : method_{shuttle::utils::toUpper(method)}
    , url_{std::move(url)}
    , version_{version}
    , body_{std::move(body)}
{
}

auto Request::withMethod(std::string_view method) const -> Request
{
    auto copy = *this;
    copy.method_ = shuttle::utils::toUpper(method);
    return copy;
}

auto Request::withUrl(Url url) const -> Request
{
    auto copy = *this;
    copy.url_ = std::move(url);
    return copy;
}

auto Request::withVersion(HttpVersion version) const -> Request
{
    auto copy = *this;
    copy.version_ = version;
    return copy;
}

auto Request::withHeader(std::string_view name, std::string_view value) const -> Request
{
    auto copy = *this;
    copy.headers_.set(name, value);
    return copy;
}

auto Request::withAddedHeader(std::string_view name, std::string_view value) const -> Request
{
    auto copy = *this;
    copy.headers_.add(name, value);
    return copy;
}

auto Request::withoutHeader(std::string_view name) const -> Request
{
    auto copy = *this;
    copy.headers_.remove(name);
    return copy;
}

auto Request::withBody(StreamPtr body) const -> Request
{
    auto copy = *this;
    copy.body_ = std::move(body);
    return copy;
}

Response::Response()
    : Response{200}
{
}

Response::Response(int statusCode, StreamPtr body, Headers headers,
                   HttpVersion version, std::optional<std::string> reasonPhrase)
    : statusCode_{statusCode}
    , reasonPhrase_{reasonPhrase ? std::move(*reasonPhrase) : ResponseStatus::phrase(statusCode)}
    , version_{version}
    , headers_{std::move(headers)}
    , body_{body ? std::move(body) : std::make_shared<BufferStream>()}
{
}

bool Response::isSuccessful() const
{
    return statusCode_ >= 100 && statusCode_ < 400;
}

auto Response::withStatus(int code, std::optional<std::string> reasonPhrase) const -> Response
{
    auto copy = *this;
    copy.statusCode_ = code;
    copy.reasonPhrase_ = reasonPhrase ? std::move(*reasonPhrase) : ResponseStatus::phrase(code);
    return copy;
}

auto Response::withVersion(HttpVersion version) const -> Response
{
    auto copy = *this;
    copy.version_ = version;
    return copy;
}

auto Response::withHeader(std::string_view name, std::string_view value) const -> Response
{
    auto copy = *this;
    copy.headers_.set(name, value);
    return copy;
}

auto Response::withAddedHeader(std::string_view name, std::string_view value) const -> Response
{
    auto copy = *this;
    copy.headers_.add(name, value);
    return copy;
}

auto Response::withoutHeader(std::string_view name) const -> Response
{
    auto copy = *this;
    copy.headers_.remove(name);
    return copy;
}

auto Response::withBody(StreamPtr body) const -> Response
{
    auto copy = *this;
    copy.body_ = body ? std::move(body) : std::make_shared<BufferStream>();
    return copy;
}
