#include "Consumer.hpp"
#include "GzipConnection.hpp"

Consumer::Consumer(std::unique_ptr<Connection> connection, const HttpRequest& request,
                   const EventSourceSettings& settings, const HeadersFunc& headers, bool gzip)
    : connection_(std::move(connection)),
      queue_(settings.queueCapacity),
      writeTimeout_(settings.writeTimeout),
      idleTimeout_(settings.idleTimeout),
      closeOnWriteTimeout_(settings.closeOnWriteTimeout) {
    try {
        handshake(request, headers, gzip);
    } catch (const std::runtime_error& e) {
        if (connection_) {
            connection_->close();
        }
        throw HandshakeError(std::string("handshake failed: ") + e.what());
    }
}

Consumer::~Consumer() {
    close();
    if (thread_.joinable()) {
        join();
    } else if (!finished_.load()) {
        // never started: nobody else will close the connection
        connection_->close();
    }
}

void Consumer::handshake(const HttpRequest& request, const HeadersFunc& headers, bool gzip) {
    connection_->write("HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\n", writeTimeout_);
    connection_->write("Vary: Accept-Encoding\r\n", writeTimeout_);
    if (gzip) {
        connection_->write("Content-Encoding: gzip\r\n", writeTimeout_);
    }
    if (headers) {
        for (const auto& header : headers(request)) {
            connection_->write(header + "\r\n", writeTimeout_);
        }
    }
    connection_->write("\r\n", writeTimeout_);

    // only the event frames go through the compressor
    if (gzip) {
        connection_ = std::make_unique<GzipConnection>(std::move(connection_));
    }
}

void Consumer::start(StaleHandler onStale) {
    onStale_ = std::move(onStale);
    thread_ = std::thread([this]() { run(); });
}

bool Consumer::enqueue(std::string frame) {
    if (stale_.load()) {
        return false;
    }
    return queue_.tryPush(std::move(frame));
}

void Consumer::close(bool discardPending) {
    queue_.close(discardPending);
}

void Consumer::join() {
    if (!thread_.joinable()) {
        return;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
        return;
    }
    thread_.join();
}

void Consumer::markStale() {
    if (stale_.exchange(true)) {
        return;
    }
    connection_->close();
    if (onStale_) {
        onStale_(*this);
    }
}

void Consumer::run() {
    std::string frame;
    while (true) {
        auto result = queue_.pop(frame, idleTimeout_);
        if (result == BoundedQueue<std::string>::PopResult::Closed) {
            connection_->close();
            break;
        }
        if (result == BoundedQueue<std::string>::PopResult::Timeout) {
            markStale();
            break;
        }
        if (stale_.load()) {
            break;
        }
        try {
            connection_->write(frame, writeTimeout_);
        } catch (const WriteError& e) {
            if (!e.timeout() || closeOnWriteTimeout_) {
                markStale();
                break;
            }
            // tolerated timeout: the frame is lost, the stream goes on
        }
    }
    finished_.store(true);
}
