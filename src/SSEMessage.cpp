#include "SSEMessage.hpp"
#include <algorithm>

namespace {

std::string stripNewlines(std::string value) {
    value.erase(std::remove(value.begin(), value.end(), '\n'), value.end());
    return value;
}

std::string encodeEvent(const EventMessage& m) {
    std::string frame;
    if (!m.id.empty()) {
        frame += "id: " + stripNewlines(m.id) + "\n";
    }
    if (!m.event.empty()) {
        frame += "event: " + stripNewlines(m.event) + "\n";
    }
    if (!m.data.empty()) {
        // a trailing newline still yields an empty "data: " line
        size_t start = 0;
        while (true) {
            size_t nl = m.data.find('\n', start);
            if (nl == std::string::npos) {
                frame += "data: " + m.data.substr(start) + "\n";
                break;
            }
            frame += "data: " + m.data.substr(start, nl - start) + "\n";
            start = nl + 1;
        }
    }
    frame += "\n";
    return frame;
}

std::string encodeRetry(const RetryMessage& m) {
    return "retry: " + std::to_string(m.interval.count()) + "\n\n";
}

} // namespace

std::string encodeMessage(const Message& message) {
    if (const auto* event = std::get_if<EventMessage>(&message)) {
        return encodeEvent(*event);
    }
    return encodeRetry(std::get<RetryMessage>(message));
}
