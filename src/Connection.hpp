#pragma once
#include <chrono>
#include <stdexcept>
#include <string>

// Raised by Connection::write. timeout() tells a missed write deadline apart
// from a broken or closed stream.
class WriteError : public std::runtime_error {
public:
    WriteError(const std::string& message, bool timeout)
        : std::runtime_error(message), timeout_(timeout) {}

    bool timeout() const { return timeout_; }

private:
    bool timeout_;
};

// A bidirectional client stream handed over by the host, seen from the
// writing side only.
class Connection {
public:
    virtual ~Connection() = default;

    // Write all of bytes or throw WriteError. Must give up once timeout elapses.
    virtual void write(const std::string& bytes, std::chrono::milliseconds timeout) = 0;

    // Idempotent. May be called while a write is in flight on another thread.
    virtual void close() = 0;
};
