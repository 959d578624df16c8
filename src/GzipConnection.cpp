#include "GzipConnection.hpp"
#include <iostream>
#include <stdexcept>

namespace {
// 15 window bits plus 16 selects the gzip wrapper instead of raw zlib
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel = 8;
constexpr auto kTrailerTimeout = std::chrono::milliseconds(500);
}

GzipConnection::GzipConnection(std::unique_ptr<Connection> inner)
    : inner_(std::move(inner)) {
    if (deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits,
                     kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("gzip: deflateInit2 failed");
    }
}

GzipConnection::~GzipConnection() {
    close();
    deflateEnd(&stream_);
}

std::string GzipConnection::deflateChunk(const std::string& bytes, int flush) {
    std::string out;
    char buffer[16384];
    stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(bytes.data()));
    stream_.avail_in = static_cast<uInt>(bytes.size());
    do {
        stream_.next_out = reinterpret_cast<Bytef*>(buffer);
        stream_.avail_out = sizeof(buffer);
        int rc = deflate(&stream_, flush);
        if (rc == Z_STREAM_ERROR) {
            throw WriteError("gzip: deflate failed", false);
        }
        out.append(buffer, sizeof(buffer) - stream_.avail_out);
    } while (stream_.avail_out == 0);
    return out;
}

void GzipConnection::write(const std::string& bytes, std::chrono::milliseconds timeout) {
    std::string compressed;
    {
        std::lock_guard lock(mutex_);
        if (finished_) {
            throw WriteError("connection closed", false);
        }
        if (broken_) {
            throw WriteError("gzip stream broken by an earlier failed write", false);
        }
        compressed = deflateChunk(bytes, Z_SYNC_FLUSH);
    }
    try {
        inner_->write(compressed, timeout);
    } catch (const WriteError& e) {
        // the compressor already consumed this frame; nothing after it would decode
        {
            std::lock_guard lock(mutex_);
            broken_ = true;
        }
        throw WriteError(std::string("gzip: ") + e.what(), false);
    }
}

void GzipConnection::close() {
    std::string trailer;
    {
        std::lock_guard lock(mutex_);
        if (finished_) {
            return;
        }
        finished_ = true;
        if (!broken_) {
            try {
                trailer = deflateChunk(std::string(), Z_FINISH);
            } catch (const WriteError& e) {
                std::cerr << "GzipConnection: " << e.what() << std::endl;
            }
        }
    }
    if (!trailer.empty()) {
        try {
            inner_->write(trailer, kTrailerTimeout);
        } catch (const WriteError& e) {
            // the peer is usually gone already when a stream gets closed
            std::cerr << "GzipConnection: can't write gzip trailer: " << e.what() << std::endl;
        }
    }
    inner_->close();
}
