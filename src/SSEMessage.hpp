#pragma once
#include <chrono>
#include <string>
#include <variant>

struct EventMessage {
    std::string id;
    std::string event;
    std::string data;
};

struct RetryMessage {
    std::chrono::milliseconds interval;
};

using Message = std::variant<EventMessage, RetryMessage>;

// Render a message into its SSE wire frame. Each frame ends with a blank line.
std::string encodeMessage(const Message& message);
