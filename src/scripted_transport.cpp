#include <shuttle/scripted_transport.hpp>

#include <spdlog/spdlog.h>

#include <shuttle/exceptions.hpp>

ScriptedTransport::ScriptedTransport(std::vector<Entry> entries)
    : queue_{std::make_move_iterator(std::begin(entries)), std::make_move_iterator(std::end(entries))}
{
}

void ScriptedTransport::enqueue(Response response)
{
    queue_.emplace_back(std::move(response));
}

void ScriptedTransport::enqueue(Responder responder)
{
    queue_.emplace_back(std::move(responder));
}

auto ScriptedTransport::execute(Request const& request) -> Response
{
    if (queue_.empty()) {
        throw QueueExhaustedError{};
    }

    auto entry = std::move(queue_.front());
    queue_.pop_front();

    spdlog::debug("Replaying scripted entry for {} {}, {} left",
                  request.method(), request.url().toRelativeString(), queue_.size());

    if (auto *responder = std::get_if<Responder>(&entry)) {
        return (*responder)(request);
    }
    return std::get<Response>(std::move(entry));
}

auto ScriptedTransport::setDebug(bool enabled) -> Transport&
{
    debug_ = enabled;
    return *this;
}
