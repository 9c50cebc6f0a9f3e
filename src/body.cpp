#include <shuttle/body.hpp>

#include "utils.hpp"

BufferBody::BufferBody(std::string content, std::string contentType)
    : BufferStream{std::move(content)}
    , contentType_{std::move(contentType)}
{
}

JsonBody::JsonBody(std::string json)
    : BufferBody{std::move(json), "application/json"}
{
}

FormBody::FormBody(Fields const& fields)
    : BufferBody{FormBody::encode(fields), "application/x-www-form-urlencoded"}
{
}

auto FormBody::encode(Fields const& fields) -> std::string
{
    std::string result;
    for (auto const& [name, value] : fields) {
        if (!result.empty()) {
            result += '&';
        }
        result += shuttle::utils::formUrlEncode(name) + "=" + shuttle::utils::formUrlEncode(value);
    }
    return result;
}
