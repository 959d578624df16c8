#pragma once
#include <chrono>
#include <string>
#include <json/json.h>

struct EventSourceSettings {
    // Deadline for a single write to a consumer.
    std::chrono::milliseconds writeTimeout{2000};
    // Drop the consumer on a write timeout instead of just the message.
    bool closeOnWriteTimeout = true;
    // A consumer that receives nothing for this long is dropped.
    std::chrono::milliseconds idleTimeout{30 * 60 * 1000};
    // Compress streams for clients that accept gzip.
    bool gzip = false;
    // Pending frames per consumer before new ones are dropped.
    size_t queueCapacity = 10;
};

// Read settings from the "eventsource" member of config (or from config
// itself when that member is absent). Missing keys keep their defaults.
// Throws std::runtime_error on wrongly typed or out-of-range values.
EventSourceSettings loadSettings(const Json::Value& config);

// Parse a JSON file and pass it to loadSettings.
EventSourceSettings loadSettingsFile(const std::string& path);
