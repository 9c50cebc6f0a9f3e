#include <shuttle/url.hpp>

#include <algorithm>
#include <charconv>

#include <shuttle/exceptions.hpp>
#include "utils.hpp"

static auto portFromScheme(std::string_view scheme) -> std::string_view
{
    if (scheme == "http") {
        return "80";
    }
    if (scheme == "https") {
        return "443";
    }
    return {};  // not recognized
}

Url::Url(std::string_view view)
{
    auto const takeFrom = [&view](size_t n) {
        std::string_view const tail{view.data() + n, view.size() - n};
        view = std::string_view{view.data(), n};
        return tail;
    };

    if (auto const n = view.find("://"); n != std::string_view::npos) {
        this->scheme(view.substr(0, n));
        view.remove_prefix(n + 3);
    }

    // anything before the first of "/?#" is the netloc, unless it is a bare path
    if (!view.empty() && view.front() != '/') {
        auto const endOfNetloc = std::min(view.find_first_of("/?#"), view.size());
        auto netloc = view.substr(0, endOfNetloc);
        view.remove_prefix(endOfNetloc);

        if (auto const n = netloc.rfind('@'); n != std::string_view::npos) {
            this->userinfo = std::string{netloc.substr(0, n)};
            netloc.remove_prefix(n + 1);
        }

        // bracketed IPv6 literals carry colons of their own
        auto const endOfHost = (!netloc.empty() && netloc.front() == '[') ? netloc.find(']') : 0;
        if (auto const n = netloc.find(':', endOfHost == std::string_view::npos ? 0 : endOfHost);
            n != std::string_view::npos)
        {
            this->host = std::string{netloc.substr(0, n)};
            this->port = std::string{netloc.substr(n + 1)};
        } else {
            this->host = std::string{netloc};
        }
    }

    if (this->port.empty() && !this->host.empty()) {
        this->port = std::string{portFromScheme(scheme_)};
    }

    if (auto const n = view.find('#'); n != std::string_view::npos) {
        this->fragment = std::string{takeFrom(n).substr(1)};
    }

    if (auto const n = view.find('?'); n != std::string_view::npos) {
        this->query = std::string{takeFrom(n).substr(1)};
    }

    this->path = view.empty() ? "/" : std::string{view};
}

Url::Url(std::string_view view, Url const& baseUrl)
    : Url{view}
{
    if (scheme_.empty() && userinfo.empty() && host.empty() && port.empty()) {
        scheme_ = baseUrl.scheme_;
        this->userinfo = baseUrl.userinfo;
        this->host = baseUrl.host;
        this->port = baseUrl.port;
    }
}

void Url::scheme(std::string_view value)
{
    scheme_ = shuttle::utils::toLower(value);
}

auto Url::portNumber() const -> uint16_t
{
    uint16_t value = 0;
    auto const *first = this->port.data();
    auto const *last = first + this->port.size();
    if (auto const [ptr, ec] = std::from_chars(first, last, value); ec != std::errc{} || ptr != last) {
        return 0;
    }
    return value;
}

auto Url::authority() const -> std::string
{
    if (port.empty()) {
        return host;
    }
    return host + ":" + port;
}

auto Url::toRelativeString(bool allowFragment) const -> std::string
{
    auto const withoutFragment = (this->path.empty() ? "/" : this->path)
        + (this->query.empty() ? "" : "?" + this->query);

    if (!allowFragment) {
        return withoutFragment;
    }
    return withoutFragment + (this->fragment.empty() ? "" : "#" + this->fragment);
}

auto Url::toAbsoluteString(bool allowFragment) const -> std::string
{
    return this->makeAbsoluteString(allowFragment, false);
}

auto Url::toExplicitString() const -> std::string
{
    return this->makeAbsoluteString(false, true);
}

auto Url::makeAbsoluteString(bool allowFragment, bool explicitPort) const -> std::string
{
    if (this->scheme().empty()) {
        throw ShuttleException{"missing scheme"};
    }
    if (this->host.empty()) {
        throw ShuttleException{"missing host"};
    }

    auto const omitPort = this->port.empty()
        || (!explicitPort && this->port == portFromScheme(this->scheme()));

    return this->scheme() + "://"
        + (this->userinfo.empty() ? "" : this->userinfo + "@")
        + this->host
        + (omitPort ? "" : ":" + this->port)
        + this->toRelativeString(allowFragment);
}
