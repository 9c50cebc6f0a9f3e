#ifndef SHUTTLE_TRANSPORT_HPP_
#define SHUTTLE_TRANSPORT_HPP_

#include <memory>

#include <shuttle/http.hpp>

// Turns a Request into a Response, over the network or otherwise.
//
// execute() throws TransportError when no response can be obtained.
// Sequential calls must not affect each other.
class Transport {
public:
    virtual ~Transport() = default;

    virtual auto execute(Request const& request) -> Response = 0;

    virtual auto setDebug(bool enabled) -> Transport& = 0;
    virtual auto debug() const -> bool = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

#endif  // SHUTTLE_TRANSPORT_HPP_
