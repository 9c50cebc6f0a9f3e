#include "response_builder.hpp"

#include <regex>

#include <spdlog/spdlog.h>

#include <shuttle/exceptions.hpp>
#include "utils.hpp"

namespace shuttle {

// regex lack of string view support
using string_view_match_result = std::match_results<std::string_view::const_iterator>;

ResponseBuilder::ResponseBuilder(StreamPtr body)
    : body_{std::move(body)}
{
}

void ResponseBuilder::onHeaderLine(std::string_view line)
{
    line = utils::trim(line);
    if (line.empty()) {
        return;
    }

    // each redirect hop or interim response starts over with a status line
    static std::regex const statusPattern{R"regex(HTTP/(\d+(?:\.\d+)?)\s+(\d\d\d)(?:\s+(.*))?)regex"};
    string_view_match_result match;
    if (std::regex_match(std::begin(line), std::end(line), match, statusPattern)) {
        version_ = parseHttpVersion(match.str(1));
        statusCode_ = std::stoi(match.str(2));
        if (match[3].matched && match[3].length() > 0) {
            reasonPhrase_ = match.str(3);
        } else {
            reasonPhrase_.reset();
        }
        headers_ = Headers{};
        spdlog::debug("Status line received: {}", line);
        return;
    }

    static std::regex const headerPattern{R"regex(([^:\s]+)\s*:\s*(.*))regex"};
    if (!std::regex_match(std::begin(line), std::end(line), match, headerPattern)) {
        spdlog::warn("Bad header line: {}", line);
        return;
    }
    headers_.add(match.str(1), utils::trim(match.str(2)));
}

void ResponseBuilder::onBodyData(char const *data, size_t size)
{
    body_->write(data, size);
}

auto ResponseBuilder::build() -> Response
{
    if (!this->hasStatus()) {
        throw TransportError{"no status line received"};
    }

    if (body_->isSeekable()) {
        body_->rewind();
    }
    return Response{statusCode_, body_, headers_, version_, reasonPhrase_};
}

}  // namespace shuttle
