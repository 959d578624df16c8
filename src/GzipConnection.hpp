#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <zlib.h>
#include "Connection.hpp"

// Wraps a connection in a gzip stream. Every write is sync-flushed so the
// client can decode each frame as soon as it arrives. Once a write to the
// wrapped connection fails the stream is broken: that write and every later
// one throw a non-timeout WriteError.
class GzipConnection : public Connection {
public:
    explicit GzipConnection(std::unique_ptr<Connection> inner);
    ~GzipConnection() override;

    GzipConnection(const GzipConnection&) = delete;
    GzipConnection& operator=(const GzipConnection&) = delete;

    void write(const std::string& bytes, std::chrono::milliseconds timeout) override;

    // Writes the gzip trailer (best effort, skipped on a broken stream) and
    // closes the wrapped connection.
    void close() override;

private:
    std::string deflateChunk(const std::string& bytes, int flush);

    std::unique_ptr<Connection> inner_;
    z_stream stream_{};
    std::mutex mutex_;
    bool finished_ = false;
    bool broken_ = false;
};
