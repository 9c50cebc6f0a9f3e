#ifndef SHUTTLE_BODY_HPP_
#define SHUTTLE_BODY_HPP_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <shuttle/stream.hpp>

// In-memory request body that declares its media type
class BufferBody : public BufferStream {
public:
    explicit BufferBody(std::string content, std::string contentType = "text/plain");

    auto contentType() const -> std::optional<std::string> override { return contentType_; }

private:
    std::string contentType_;
};

// Takes an already serialized document
class JsonBody : public BufferBody {
public:
    explicit JsonBody(std::string json);
};

class FormBody : public BufferBody {
public:
    using Fields = std::vector<std::pair<std::string, std::string>>;

    explicit FormBody(Fields const& fields);

    static auto encode(Fields const& fields) -> std::string;
};

#endif  // SHUTTLE_BODY_HPP_
