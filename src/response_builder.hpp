#ifndef SHUTTLE_RESPONSE_BUILDER_HPP_
#define SHUTTLE_RESPONSE_BUILDER_HPP_

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <shuttle/headers.hpp>
#include <shuttle/http.hpp>
#include <shuttle/stream.hpp>

namespace shuttle {

// Assembles a Response from the pieces an HTTP engine hands out:
// header lines one at a time, then body bytes.
class ResponseBuilder {
public:
    explicit ResponseBuilder(StreamPtr body);

    // status line, header line or the blank separator
    void onHeaderLine(std::string_view line);
    void onBodyData(char const *data, size_t size);

    auto hasStatus() const -> bool { return statusCode_ != 0; }

    // an error raised inside an engine callback, rethrown by the caller
    void fail(std::exception_ptr error) { error_ = error; }
    auto error() const -> std::exception_ptr { return error_; }

    // throws if no status line was seen
    auto build() -> Response;

private:
    StreamPtr body_;
    int statusCode_{0};
    std::optional<std::string> reasonPhrase_;
    HttpVersion version_{HttpVersion::VERSION_1_1};
    Headers headers_;
    std::exception_ptr error_;
};

}  // namespace shuttle

#endif  // SHUTTLE_RESPONSE_BUILDER_HPP_
