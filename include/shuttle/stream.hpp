#ifndef SHUTTLE_STREAM_HPP_
#define SHUTTLE_STREAM_HPP_

#include <cstddef>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Byte source and sink holding a message body.
//
// Writes always append. Reads advance a cursor that only rewind() moves
// back, and rewind() is only available on seekable streams.
class Stream {
public:
    Stream() = default;
    virtual ~Stream() = default;

    Stream(Stream const&) = delete;
    Stream& operator=(Stream const&) = delete;

    void write(void const *data, size_t size);
    void write(std::string_view data);

    // at most size bytes, empty once the end is reached
    auto read(size_t size) -> std::string;

    // throws EndOfStreamError if fewer than size bytes remain
    auto readExactly(size_t size) -> std::string;

    // everything from the cursor to the end
    auto getContents() -> std::string;

    // the whole stream, rewinding first when possible
    auto toString() -> std::string;

    void rewind();

    virtual auto isSeekable() const -> bool = 0;
    virtual auto size() const -> std::optional<size_t> = 0;
    virtual auto eof() const -> bool = 0;

    // declared by bodies that know their media type
    virtual auto contentType() const -> std::optional<std::string> { return std::nullopt; }

protected:
    // throws on error
    virtual auto push(char const *data, size_t size) -> size_t = 0;

    // throws on error, returns 0 at the end of the stream
    virtual auto pull(char *data, size_t size) -> size_t = 0;

    virtual void seekToStart() = 0;
};

using StreamPtr = std::shared_ptr<Stream>;

class BufferStream : public Stream {
public:
    BufferStream() = default;
    explicit BufferStream(std::string content);

    auto isSeekable() const -> bool override { return true; }
    auto size() const -> std::optional<size_t> override { return data_.size(); }
    auto eof() const -> bool override { return read_ >= data_.size(); }

protected:
    auto push(char const *data, size_t size) -> size_t override;
    auto pull(char *data, size_t size) -> size_t override;
    void seekToStart() override { read_ = 0; }

private:
    std::string data_;
    size_t read_{0};
};

// Stays in memory up to maxMemory bytes, then moves to an anonymous
// temporary file for the rest of its life.
class TempStream : public Stream {
public:
    explicit TempStream(size_t maxMemory);

    auto maxMemory() const -> size_t { return maxMemory_; }
    auto isSpilled() const -> bool { return file_ != nullptr; }

    auto isSeekable() const -> bool override { return true; }
    auto size() const -> std::optional<size_t> override { return size_; }
    auto eof() const -> bool override { return read_ >= size_; }

protected:
    auto push(char const *data, size_t size) -> size_t override;
    auto pull(char *data, size_t size) -> size_t override;
    void seekToStart() override { read_ = 0; }

private:
    struct FileDeleter { void operator()(std::FILE *file) { std::fclose(file); } };
    using FilePtr = std::unique_ptr<std::FILE, FileDeleter>;

    size_t maxMemory_;
    std::string memory_;
    FilePtr file_;
    size_t size_{0};
    size_t read_{0};

    void spill();
};

#endif  // SHUTTLE_STREAM_HPP_
