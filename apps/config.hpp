#ifndef APP_CONFIG_HPP_
#define APP_CONFIG_HPP_

#include <string>
#include <vector>

#include <shuttle/curl_transport.hpp>
#include <shuttle/http.hpp>

struct Config
{
    std::string url;
    std::string baseUrl;

    std::string method{"GET"};
    std::vector<std::string> headers;  // "Name: value"
    std::string data;
    bool hasData{false};
    bool isJson{false};

    HttpVersion httpVersion{HttpVersion::VERSION_1_1};

    bool insecure{false};
    bool noFollow{false};
    long maxRedirs{10};
    long connectTimeout{120};
    size_t maxMemory{CurlTransport::DEFAULT_MAX_RESPONSE_BODY_MEMORY};

    std::string auth;
    int retry{0};

    bool isInclude{false};
    bool isVerbose{false};

    Config(int argc, char *argv[]);
};

#endif  // APP_CONFIG_HPP_
