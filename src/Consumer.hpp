#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "BoundedQueue.hpp"
#include "Connection.hpp"
#include "EventSourceSettings.hpp"
#include "HttpRequest.hpp"

class HandshakeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using HeadersFunc = std::function<std::vector<std::string>(const HttpRequest&)>;

/**
 * One connected client. The constructor writes the response head; start()
 * launches the delivery thread, which is the only code touching the
 * connection from then on.
 */
class Consumer {
public:
    using StaleHandler = std::function<void(Consumer&)>;

    // Throws HandshakeError (after closing the connection) if the response
    // head can't be written.
    Consumer(std::unique_ptr<Connection> connection, const HttpRequest& request,
             const EventSourceSettings& settings, const HeadersFunc& headers, bool gzip);
    ~Consumer();

    Consumer(const Consumer&) = delete;
    Consumer& operator=(const Consumer&) = delete;

    // onStale is called from the delivery thread, at most once.
    void start(StaleHandler onStale);

    // Non-blocking. False when the frame was dropped (queue full or closed).
    bool enqueue(std::string frame);

    // Close the inbound queue; the delivery thread closes the connection
    // once it has drained what is left. With discardPending the frames still
    // queued are dropped, so at most the write in flight delays the close.
    void close(bool discardPending = false);

    void join();

    bool stale() const { return stale_.load(); }
    bool finished() const { return finished_.load(); }

private:
    void handshake(const HttpRequest& request, const HeadersFunc& headers, bool gzip);
    void run();
    void markStale();

    std::unique_ptr<Connection> connection_;
    BoundedQueue<std::string> queue_;
    const std::chrono::milliseconds writeTimeout_;
    const std::chrono::milliseconds idleTimeout_;
    const bool closeOnWriteTimeout_;

    StaleHandler onStale_;
    std::thread thread_;
    std::atomic<bool> stale_{false};
    std::atomic<bool> finished_{false};
};
