#ifndef SHUTTLE_SCRIPTED_TRANSPORT_HPP_
#define SHUTTLE_SCRIPTED_TRANSPORT_HPP_

#include <cstddef>
#include <deque>
#include <functional>
#include <variant>
#include <vector>

#include <shuttle/transport.hpp>

// Replays queued responses in FIFO order, without any I/O.
class ScriptedTransport : public Transport {
public:
    using Responder = std::function<Response(Request const&)>;
    using Entry = std::variant<Response, Responder>;

    ScriptedTransport() = default;
    explicit ScriptedTransport(std::vector<Entry> entries);

    void enqueue(Response response);
    void enqueue(Responder responder);

    auto remaining() const -> size_t { return queue_.size(); }

    // throws QueueExhaustedError once the queue is empty
    auto execute(Request const& request) -> Response override;

    auto setDebug(bool enabled) -> Transport& override;
    auto debug() const -> bool override { return debug_; }

private:
    std::deque<Entry> queue_;
    bool debug_{false};
};

#endif  // SHUTTLE_SCRIPTED_TRANSPORT_HPP_
