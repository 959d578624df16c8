#include "EventSource.hpp"

EventSource::EventSource(EventSourceSettings settings, HeadersFunc headers)
    : settings_(settings), headers_(std::move(headers)) {
}

EventSource::~EventSource() {
    shutdown();
}

bool EventSource::wantsGzip(const HttpRequest& request) const {
    return settings_.gzip && request.header("Accept-Encoding").find("gzip") != std::string::npos;
}

bool EventSource::accept(std::unique_ptr<Connection> connection, const HttpRequest& request) {
    if (broadcaster_.closed()) {
        connection->close();
        return false;
    }
    auto consumer = std::make_shared<Consumer>(std::move(connection), request, settings_,
                                               headers_, wantsGzip(request));
    consumer->start([this](Consumer& c) { broadcaster_.markStale(c); });
    if (!broadcaster_.add(consumer)) {
        // shut down while the handshake was in progress
        consumer->close();
        consumer->join();
        return false;
    }
    return true;
}

void EventSource::publishEvent(const std::string& data, const std::string& event, const std::string& id) {
    broadcaster_.publish(EventMessage{id, event, data});
}

void EventSource::publishRetry(std::chrono::milliseconds interval) {
    broadcaster_.publish(RetryMessage{interval});
}

size_t EventSource::consumerCount() const {
    return broadcaster_.count();
}

void EventSource::shutdown() {
    broadcaster_.shutdown();
}
