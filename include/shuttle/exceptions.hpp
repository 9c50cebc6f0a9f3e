#ifndef SHUTTLE_EXCEPTIONS_HPP_
#define SHUTTLE_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>

class ShuttleException : public std::runtime_error {
public:
    ShuttleException(char const *message)
        : std::runtime_error{message}
    {
    }

    ShuttleException(std::string const& message)
        : std::runtime_error{message}
    {
    }
};

// Raised while a client is being configured, never during a call
class ConfigurationError : public ShuttleException {
public:
    using ShuttleException::ShuttleException;
};

class UnknownVersionError : public ConfigurationError {
public:
    explicit UnknownVersionError(std::string const& version)
        : ConfigurationError{"unknown http version: " + version}
    {
    }
};

// I/O failure reported by a transport; carries the engine's diagnostic
class TransportError : public ShuttleException {
public:
    using ShuttleException::ShuttleException;
};

class QueueExhaustedError : public ShuttleException {
public:
    QueueExhaustedError()
        : ShuttleException{"no more responses available in the scripted transport queue"}
    {
    }
};

class StreamError : public ShuttleException {
public:
    using ShuttleException::ShuttleException;
};

class EndOfStreamError : public StreamError {
public:
    EndOfStreamError()
        : StreamError{"end of stream reached"}
    {
    }
};

#endif  // SHUTTLE_EXCEPTIONS_HPP_
