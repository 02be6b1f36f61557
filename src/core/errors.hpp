#pragma once

#include <stdexcept>
#include <string>

// Remote answered with a status the operation does not accept.
class RemoteError : public std::runtime_error {
public:
    RemoteError(const std::string& what, int status, bool retryable)
        : std::runtime_error(what), status_(status), retryable_(retryable) {}

    int status() const { return status_; }
    bool retryable() const { return retryable_; }

private:
    int status_;
    bool retryable_;
};

// Request never produced a response (timeout, refused connection, ...).
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& what, bool retryable)
        : std::runtime_error(what), retryable_(retryable) {}

    bool retryable() const { return retryable_; }

private:
    bool retryable_;
};

// Local file could not be read or written. Never retried.
class LocalIOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
