#include <shuttle/stream.hpp>
#include <algorithm>
#include <array>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <shuttle/exceptions.hpp>

void Stream::write(void const *data, size_t size)
{
    size_t sent = 0;
    while (sent < size) {
        sent += this->push(static_cast<char const *>(data) + sent, size - sent);
    }
}

void Stream::write(std::string_view data)
{
    this->write(data.data(), data.size());
}

auto Stream::read(size_t size) -> std::string
{
    std::string result(size, '\0');
    size_t received = 0;
    while (received < size) {
        auto const n = this->pull(result.data() + received, size - received);
        if (n == 0) {
            break;
        }
        received += n;
    }
    result.resize(received);
    return result;
}

auto Stream::readExactly(size_t size) -> std::string
{
    auto result = this->read(size);
    if (result.size() < size) {
        throw EndOfStreamError{};
    }
    return result;
}

auto Stream::getContents() -> std::string
{
    std::string result;
    std::array<char, 8192> chunk;
    while (true) {
        auto const n = this->pull(chunk.data(), chunk.size());
        if (n == 0) {
            break;
        }
        result.append(chunk.data(), n);
    }
    return result;
}

auto Stream::toString() -> std::string
{
    if (this->isSeekable()) {
        this->seekToStart();
    }
    return this->getContents();
}

void Stream::rewind()
{
    if (!this->isSeekable()) {
        throw StreamError{"stream is not seekable"};
    }
    this->seekToStart();
}

BufferStream::BufferStream(std::string content)
    : data_{std::move(content)}
{
}

auto BufferStream::push(char const *data, size_t size) -> size_t
{
    data_.append(data, size);
    return size;
}

auto BufferStream::pull(char *data, size_t size) -> size_t
{
    assert(read_ <= data_.size());
    auto const n = std::min(size, data_.size() - read_);
    std::memcpy(data, data_.data() + read_, n);
    read_ += n;
    return n;
}

TempStream::TempStream(size_t maxMemory)
    : maxMemory_{maxMemory}
{
}

void TempStream::spill()
{
    file_ = FilePtr{std::tmpfile()};
    if (!file_) {
        throw StreamError{std::string{"cannot create temporary file: "} + std::strerror(errno)};
    }

    if (std::fwrite(memory_.data(), 1, memory_.size(), file_.get()) != memory_.size()) {
        throw StreamError{"cannot write temporary file"};
    }
    memory_.clear();
    memory_.shrink_to_fit();
}

auto TempStream::push(char const *data, size_t size) -> size_t
{
    if (!file_ && size_ + size > maxMemory_) {
        this->spill();
    }

    if (!file_) {
        memory_.append(data, size);
        size_ += size;
        return size;
    }

    if (std::fseek(file_.get(), 0, SEEK_END) != 0) {
        throw StreamError{"cannot seek temporary file"};
    }
    auto const n = std::fwrite(data, 1, size, file_.get());
    if (n == 0) {
        throw StreamError{"cannot write temporary file"};
    }
    size_ += n;
    return n;
}

auto TempStream::pull(char *data, size_t size) -> size_t
{
    auto const wanted = std::min(size, size_ - read_);
    if (wanted == 0) {
        return 0;
    }

    if (!file_) {
        std::memcpy(data, memory_.data() + read_, wanted);
        read_ += wanted;
        return wanted;
    }

    if (std::fseek(file_.get(), static_cast<long>(read_), SEEK_SET) != 0) {
        throw StreamError{"cannot seek temporary file"};
    }
    auto const n = std::fread(data, 1, wanted, file_.get());
    if (n == 0) {
        throw StreamError{"cannot read temporary file"};
    }
    read_ += n;
    return n;
}
