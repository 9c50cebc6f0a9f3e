#ifndef SHUTTLE_URL_HPP_
#define SHUTTLE_URL_HPP_

#include <cstdint>
#include <string>
#include <string_view>

class Url {
public:
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;

public:
    Url() = default;

    explicit Url(std::string_view view);

    // view should be an absolute path, or a url string
    Url(std::string_view view, Url const& baseUrl);

    auto operator==(Url const& rhs) const -> bool {
        return scheme_ == rhs.scheme_ && this->userinfo == rhs.userinfo
            && this->host == rhs.host && this->port == rhs.port
            && this->path == rhs.path && this->query == rhs.query
            && this->fragment == rhs.fragment;
    }
    auto operator!=(Url const& rhs) const -> bool { return !(*this == rhs); }

    auto scheme() const -> std::string const& { return scheme_; }
    void scheme(std::string_view value);

    // 0 when the port is absent or not a number
    auto portNumber() const -> uint16_t;

    // host[:port]
    auto authority() const -> std::string;

    auto toRelativeString(bool allowFragment=false) const -> std::string;
    auto toAbsoluteString(bool allowFragment=false) const -> std::string;

    // like toAbsoluteString, but the port is always spelled out
    auto toExplicitString() const -> std::string;

private:
    std::string scheme_;

    auto makeAbsoluteString(bool allowFragment, bool explicitPort) const -> std::string;
};

#endif  // SHUTTLE_URL_HPP_
