#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include <shuttle/basic_auth_middleware.hpp>
#include <shuttle/body.hpp>
#include <shuttle/client.hpp>
#include <shuttle/client_config.hpp>
#include <shuttle/curl_transport.hpp>
#include <shuttle/exceptions.hpp>
#include <shuttle/logging_middleware.hpp>
#include <shuttle/retry_middleware.hpp>

#include "config.hpp"

int main(int argc, char *argv[])
try {
    Config config{argc, argv};

    spdlog::set_level(config.isVerbose ? spdlog::level::debug : spdlog::level::warn);

    CurlTransport::Options transportOptions;
    transportOptions.followRedirects = !config.noFollow;
    transportOptions.maxRedirects = config.maxRedirs;
    transportOptions.connectTimeout = std::chrono::seconds{config.connectTimeout};
    transportOptions.verifyPeer = !config.insecure;
    transportOptions.maxResponseBodyMemory = config.maxMemory;

    auto configBuilder = ClientConfig::Builder()
        .handler(std::make_shared<CurlTransport>(transportOptions))
        .httpVersion(config.httpVersion)
        .debug(config.isVerbose);

    if (!config.baseUrl.empty()) {
        configBuilder.baseUrl(config.baseUrl);
    }

    if (config.isVerbose) {
        configBuilder.middleware(std::make_shared<LoggingMiddleware>());
    }

    if (config.retry > 0) {
        configBuilder.middleware(std::make_shared<RetryMiddleware>(config.retry + 1, std::chrono::milliseconds{500}));
    }

    if (!config.auth.empty()) {
        auto const n = config.auth.find(':');
        if (n == std::string::npos) {
            throw std::runtime_error{"basic auth format should be `user:pass`"};
        }
        configBuilder.middleware(std::make_shared<BasicAuthMiddleware>(
            config.auth.substr(0, n), config.auth.substr(n + 1)));
    }

    RequestOptions options;
    for (auto const& header : config.headers) {
        auto const n = header.find(':');
        if (n == std::string::npos) {
            throw std::runtime_error{"header format should be `Name: value`: " + header};
        }
        auto const valueStart = header.find_first_not_of(' ', n + 1);
        options.headers.emplace_back(header.substr(0, n),
                                     valueStart == std::string::npos ? "" : header.substr(valueStart));
    }

    StreamPtr body;
    if (config.hasData) {
        if (config.isJson) {
            body = std::make_shared<JsonBody>(config.data);
        } else {
            body = std::make_shared<BufferBody>(config.data, "application/x-www-form-urlencoded");
        }
    }

    Client client{configBuilder.build()};
    auto const resp = client.request(config.method, config.url, body, options);

    std::printf("HTTP/%s %d %s\n", toString(resp.version()).c_str(),
                resp.statusCode(), resp.reasonPhrase().c_str());
    if (config.isInclude) {
        for (auto const& header : resp.headers()) {
            for (auto const& value : header.values) {
                std::printf("%s: %s\n", header.name.c_str(), value.c_str());
            }
        }
        std::printf("\n");
    }

    auto const content = resp.body()->getContents();
    std::fwrite(content.data(), 1, content.size(), stdout);

    return EXIT_SUCCESS;
}
catch (ShuttleException const& e) {
    spdlog::error("ShuttleException: {}", e.what());
    return EXIT_FAILURE;
}
catch (std::exception const& e) {
    spdlog::error("Exception: {}", e.what());
    return EXIT_FAILURE;
}
