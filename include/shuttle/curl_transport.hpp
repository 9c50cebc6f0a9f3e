#ifndef SHUTTLE_CURL_TRANSPORT_HPP_
#define SHUTTLE_CURL_TRANSPORT_HPP_

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <shuttle/stream.hpp>
#include <shuttle/transport.hpp>

// Everything handed to libcurl for one transfer, apart from the callbacks
struct CurlOptions {
    std::string url;
    long port{0};
    std::string method;
    long httpVersion{0};
    std::vector<std::string> headers;  // "Name: value", declared order
    std::optional<std::string> body;
    bool noBody{false};

    bool followLocation{true};
    long maxRedirects{0};
    long connectTimeout{0};  // seconds
    bool verifyPeer{true};
    std::string protocols;
    bool verbose{false};
};

// Transport backed by libcurl's easy interface.
//
// Every execute() works on its own easy handle, so a single instance
// may be shared between threads. The response body is kept in memory
// up to maxResponseBodyMemory bytes and spills to a temporary file above.
class CurlTransport : public Transport {
public:
    static constexpr size_t DEFAULT_MAX_RESPONSE_BODY_MEMORY = 2 * 1024 * 1024;

    struct Options {
        bool followRedirects{true};
        long maxRedirects{10};
        std::chrono::seconds connectTimeout{120};
        bool verifyPeer{true};
        size_t maxResponseBodyMemory{DEFAULT_MAX_RESPONSE_BODY_MEMORY};
    };

    static auto create() -> TransportPtr;

    CurlTransport();
    explicit CurlTransport(Options options);

    auto execute(Request const& request) -> Response override;

    auto setDebug(bool enabled) -> Transport& override;
    auto debug() const -> bool override { return debug_; }

    auto options() const -> Options const& { return options_; }
    void setMaxResponseBodyMemory(size_t bytes) { options_.maxResponseBodyMemory = bytes; }

    // No I/O happens here, apart from reading the request body.
    // Throws TransportError for a url without scheme or host.
    auto buildOptions(Request const& request) const -> CurlOptions;

    auto makeResponseBodyStream() const -> std::shared_ptr<TempStream>;

    // throws UnknownVersionError
    static auto curlHttpVersion(HttpVersion version) -> long;

    static auto buildHeaders(Request const& request) -> std::vector<std::string>;

private:
    Options options_;
    bool debug_{false};
};

#endif  // SHUTTLE_CURL_TRANSPORT_HPP_
