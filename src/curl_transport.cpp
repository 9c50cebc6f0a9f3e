#include <shuttle/curl_transport.hpp>

#include <array>
#include <exception>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <shuttle/exceptions.hpp>
#include "curl_global.hpp"
#include "response_builder.hpp"
#include "utils.hpp"

using shuttle::CurlEasyPtr;
using shuttle::CurlSlistPtr;
using shuttle::ResponseBuilder;

namespace {

template <typename T>
void setopt(CURL *handle, CURLoption option, T value)
{
    if (auto const rc = curl_easy_setopt(handle, option, value); rc != CURLE_OK) {
        throw TransportError{std::string{"curl_easy_setopt failed: "} + curl_easy_strerror(rc)};
    }
}

// exceptions must not unwind through libcurl, park them in the builder instead

auto headerCallback(char *data, size_t size, size_t count, void *userdata) -> size_t
{
    auto *builder = static_cast<ResponseBuilder *>(userdata);
    auto const bytes = size * count;
    try {
        builder->onHeaderLine({data, bytes});
    }
    catch (...) {
        builder->fail(std::current_exception());
        return 0;
    }
    return bytes;
}

auto writeCallback(char *data, size_t size, size_t count, void *userdata) -> size_t
{
    auto *builder = static_cast<ResponseBuilder *>(userdata);
    auto const bytes = size * count;
    try {
        builder->onBodyData(data, bytes);
    }
    catch (...) {
        builder->fail(std::current_exception());
        return 0;
    }
    return bytes;
}

auto debugCallback(CURL *, curl_infotype type, char *data, size_t size, void *) -> int
{
    char const *prefix = nullptr;
    switch (type) {
    case CURLINFO_TEXT:
        prefix = "*";
        break;
    case CURLINFO_HEADER_IN:
        prefix = "<";
        break;
    case CURLINFO_HEADER_OUT:
        prefix = ">";
        break;
    default:
        return 0;  // payload and TLS records
    }

    spdlog::info("{} {}", prefix, shuttle::utils::trim({data, size}));
    return 0;
}

}  // namespace

auto CurlTransport::create() -> TransportPtr
{
    return std::make_shared<CurlTransport>();
}

CurlTransport::CurlTransport()
    : CurlTransport{Options{}}
{
}

CurlTransport::CurlTransport(Options options)
    : options_{std::move(options)}
{
}

auto CurlTransport::setDebug(bool enabled) -> Transport&
{
    debug_ = enabled;
    return *this;
}

auto CurlTransport::curlHttpVersion(HttpVersion version) -> long
{
    switch (version) {
    case HttpVersion::VERSION_1_0:
        return CURL_HTTP_VERSION_1_0;
    case HttpVersion::VERSION_1_1:
        return CURL_HTTP_VERSION_1_1;
    case HttpVersion::VERSION_2:
        return CURL_HTTP_VERSION_2_0;
    }
    throw UnknownVersionError{std::to_string(static_cast<int>(version))};
}

auto CurlTransport::buildHeaders(Request const& request) -> std::vector<std::string>
{
    std::vector<std::string> lines;
    for (auto const& header : request.headers()) {
        for (auto const& value : header.values) {
            // "Name:" alone would make libcurl drop the header
            lines.push_back(value.empty() ? header.name + ";" : header.name + ": " + value);
        }
    }
    return lines;
}

auto CurlTransport::makeResponseBodyStream() const -> std::shared_ptr<TempStream>
{
    return std::make_shared<TempStream>(options_.maxResponseBodyMemory);
}

auto CurlTransport::buildOptions(Request const& request) const -> CurlOptions
{
    CurlOptions result;

    if (request.url().scheme().empty() || request.url().host.empty()) {
        throw TransportError{"scheme and host are required: " + request.url().toRelativeString()};
    }

    result.url = request.url().toExplicitString();
    result.port = request.url().portNumber();
    result.method = request.method();
    result.httpVersion = CurlTransport::curlHttpVersion(request.version());
    result.headers = CurlTransport::buildHeaders(request);

    if (request.method() == "HEAD") {
        result.noBody = true;
    } else if (request.body() && request.method() != "GET") {
        result.body = request.body()->toString();
    }

    result.followLocation = options_.followRedirects;
    result.maxRedirects = options_.maxRedirects;
    result.connectTimeout = static_cast<long>(options_.connectTimeout.count());
    result.verifyPeer = options_.verifyPeer;
    result.protocols = "http,https";
    result.verbose = debug_;

    return result;
}

auto CurlTransport::execute(Request const& request) -> Response
{
    shuttle::CurlGlobal::ensureInitialized();

    auto const options = this->buildOptions(request);
    spdlog::debug("Executing {} {}", options.method, options.url);

    CurlEasyPtr handle{curl_easy_init()};
    if (!handle) {
        throw TransportError{"curl_easy_init failed"};
    }
    auto *const curl = handle.get();

    CurlSlistPtr headerList;
    for (auto const& line : options.headers) {
        auto *head = curl_slist_append(headerList.get(), line.c_str());
        if (head == nullptr) {
            throw TransportError{"curl_slist_append failed"};
        }
        headerList.release();
        headerList.reset(head);
    }

    std::array<char, CURL_ERROR_SIZE> errorBuffer{};
    ResponseBuilder builder{this->makeResponseBodyStream()};

    setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer.data());
    setopt(curl, CURLOPT_NOSIGNAL, 1L);
    setopt(curl, CURLOPT_NOPROGRESS, 1L);

    setopt(curl, CURLOPT_URL, options.url.c_str());
    setopt(curl, CURLOPT_PORT, options.port);
    setopt(curl, CURLOPT_CUSTOMREQUEST, options.method.c_str());
    setopt(curl, CURLOPT_HTTP_VERSION, options.httpVersion);
    setopt(curl, CURLOPT_HTTPHEADER, headerList.get());

    if (options.noBody) {
        setopt(curl, CURLOPT_NOBODY, 1L);
    }
    if (options.body) {
        setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(options.body->size()));
        setopt(curl, CURLOPT_POSTFIELDS, options.body->data());
    }

    setopt(curl, CURLOPT_FOLLOWLOCATION, options.followLocation ? 1L : 0L);
    setopt(curl, CURLOPT_MAXREDIRS, options.maxRedirects);
    setopt(curl, CURLOPT_CONNECTTIMEOUT, options.connectTimeout);
    setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verifyPeer ? 1L : 0L);
    setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verifyPeer ? 2L : 0L);
    setopt(curl, CURLOPT_PROTOCOLS_STR, options.protocols.c_str());
    setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, options.protocols.c_str());

    setopt(curl, CURLOPT_HEADERFUNCTION, &headerCallback);
    setopt(curl, CURLOPT_HEADERDATA, static_cast<void *>(&builder));
    setopt(curl, CURLOPT_WRITEFUNCTION, &writeCallback);
    setopt(curl, CURLOPT_WRITEDATA, static_cast<void *>(&builder));

    if (options.verbose) {
        setopt(curl, CURLOPT_VERBOSE, 1L);
        setopt(curl, CURLOPT_DEBUGFUNCTION, &debugCallback);
    }

    auto const rc = curl_easy_perform(curl);

    if (auto const error = builder.error()) {
        std::rethrow_exception(error);
    }

    if (rc != CURLE_OK) {
        std::string const detail = errorBuffer[0] != '\0' ? errorBuffer.data() : curl_easy_strerror(rc);
        spdlog::debug("Transfer of {} failed with code {}: {}", options.url, static_cast<int>(rc), detail);
        throw TransportError{"curl_easy_perform failed: " + detail};
    }

    return builder.build();
}
