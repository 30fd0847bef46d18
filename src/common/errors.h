#pragma once

#include <stdexcept>
#include <string>

namespace darwin::client {

// ---------------------------------------------------------------------------
// Error taxonomy. Core layers throw these; the client facades convert them
// into Result envelopes carrying the matching ErrorKind.
// ---------------------------------------------------------------------------
enum class ErrorKind {
    None,
    Connection,   // transport could not be established
    NotConnected, // operation needs a live session
    Timeout,      // synchronous call exceeded its deadline
    Transport,    // call cancelled by disconnect or write failure
    Parse,        // reply did not match the expected shape
    OrderNotFound,
    InvalidState, // illegal order transition
    Validation,   // malformed command parameters, caught before I/O
    Remote        // daemon answered a query with an error code
};

const char* toString(ErrorKind kind);

class ClientError : public std::runtime_error {
public:
    ClientError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ConnectionError : public ClientError {
public:
    explicit ConnectionError(const std::string& what)
        : ClientError(ErrorKind::Connection, what) {}
};

class NotConnectedError : public ClientError {
public:
    explicit NotConnectedError(const std::string& what)
        : ClientError(ErrorKind::NotConnected, what) {}
};

class TimeoutError : public ClientError {
public:
    explicit TimeoutError(const std::string& what)
        : ClientError(ErrorKind::Timeout, what) {}
};

class TransportError : public ClientError {
public:
    explicit TransportError(const std::string& what)
        : ClientError(ErrorKind::Transport, what) {}
};

class ParseError : public ClientError {
public:
    explicit ParseError(const std::string& what)
        : ClientError(ErrorKind::Parse, what) {}
};

class OrderNotFoundError : public ClientError {
public:
    explicit OrderNotFoundError(const std::string& what)
        : ClientError(ErrorKind::OrderNotFound, what) {}
};

class InvalidStateError : public ClientError {
public:
    explicit InvalidStateError(const std::string& what)
        : ClientError(ErrorKind::InvalidState, what) {}
};

class ValidationError : public ClientError {
public:
    explicit ValidationError(const std::string& what)
        : ClientError(ErrorKind::Validation, what) {}
};

class RemoteError : public ClientError {
public:
    explicit RemoteError(const std::string& what)
        : ClientError(ErrorKind::Remote, what) {}
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "None";
        case ErrorKind::Connection:    return "ConnectionError";
        case ErrorKind::NotConnected:  return "NotConnectedError";
        case ErrorKind::Timeout:       return "TimeoutError";
        case ErrorKind::Transport:     return "TransportError";
        case ErrorKind::Parse:         return "ParseError";
        case ErrorKind::OrderNotFound: return "OrderNotFoundError";
        case ErrorKind::InvalidState:  return "InvalidStateError";
        case ErrorKind::Validation:    return "ValidationError";
        case ErrorKind::Remote:        return "RemoteError";
    }
    return "Unknown";
}

} // namespace darwin::client
