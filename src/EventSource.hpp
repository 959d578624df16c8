#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "Connection.hpp"
#include "Consumer.hpp"
#include "EventSourceSettings.hpp"
#include "HttpRequest.hpp"
#include "SSEBroadcaster.hpp"

// Entry point for host code: hand it client connections, publish messages
// to everyone connected.
class EventSource {
public:
    explicit EventSource(EventSourceSettings settings = EventSourceSettings(),
                         HeadersFunc headers = nullptr);
    ~EventSource();

    EventSource(const EventSource&) = delete;
    EventSource& operator=(const EventSource&) = delete;

    // Takes ownership of the connection and starts streaming to it.
    // Throws HandshakeError if the response head can't be written. Returns
    // false, with the connection closed, once the event source is shut down.
    bool accept(std::unique_ptr<Connection> connection, const HttpRequest& request);

    void publishEvent(const std::string& data, const std::string& event, const std::string& id);
    void publishRetry(std::chrono::milliseconds interval);

    size_t consumerCount() const;

    // Closes every consumer connection and refuses further work.
    void shutdown();

    const EventSourceSettings& settings() const { return settings_; }

private:
    bool wantsGzip(const HttpRequest& request) const;

    const EventSourceSettings settings_;
    HeadersFunc headers_;
    SSEBroadcaster broadcaster_;
};
