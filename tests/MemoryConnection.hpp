#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "../src/Connection.hpp"

// State shared between a MemoryConnection and the test that inspects it after
// ownership moved into a consumer.
struct MemoryStream {
    enum class Failure { None, Timeout, Broken };

    std::mutex mutex;
    std::condition_variable cv;
    std::string written;
    size_t writes = 0;
    // writes numbered >= failFrom fail with `failure`
    size_t failFrom = static_cast<size_t>(-1);
    Failure failure = Failure::None;
    // each write sleeps this long first
    std::chrono::milliseconds writeDelay{0};
    std::atomic<int> closeCalls{0};
    std::atomic<int> effectiveCloses{0};

    std::string contents() {
        std::lock_guard lock(mutex);
        return written;
    }

    // Wait until `written` contains needle.
    bool waitFor(const std::string& needle, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return written.find(needle) != std::string::npos; });
    }

    bool waitWrites(size_t n, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            {
                std::lock_guard lock(mutex);
                if (writes >= n) return true;
            }
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    bool waitClosed(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (effectiveCloses.load() == 0) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }
};

class MemoryConnection : public Connection {
public:
    explicit MemoryConnection(std::shared_ptr<MemoryStream> stream) : stream_(std::move(stream)) {}

    void write(const std::string& bytes, std::chrono::milliseconds) override {
        if (stream_->writeDelay.count() > 0) {
            std::this_thread::sleep_for(stream_->writeDelay);
        }
        std::lock_guard lock(stream_->mutex);
        if (closed_) {
            throw WriteError("connection closed", false);
        }
        size_t n = stream_->writes++;
        if (n >= stream_->failFrom) {
            if (stream_->failure == MemoryStream::Failure::Timeout) {
                throw WriteError("write deadline exceeded", true);
            }
            if (stream_->failure == MemoryStream::Failure::Broken) {
                throw WriteError("broken pipe", false);
            }
        }
        stream_->written += bytes;
        stream_->cv.notify_all();
    }

    void close() override {
        stream_->closeCalls++;
        std::lock_guard lock(stream_->mutex);
        if (!closed_) {
            closed_ = true;
            stream_->effectiveCloses++;
        }
    }

private:
    std::shared_ptr<MemoryStream> stream_;
    bool closed_ = false;
};
