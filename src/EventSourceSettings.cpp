#include "EventSourceSettings.hpp"
#include <fstream>
#include <stdexcept>

namespace {

std::chrono::milliseconds readDuration(const Json::Value& section, const char* key,
                                       std::chrono::milliseconds fallback) {
    if (!section.isMember(key)) {
        return fallback;
    }
    const Json::Value& v = section[key];
    if (!v.isIntegral() || v.asInt64() <= 0) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a positive integer");
    }
    return std::chrono::milliseconds(v.asInt64());
}

bool readBool(const Json::Value& section, const char* key, bool fallback) {
    if (!section.isMember(key)) {
        return fallback;
    }
    if (!section[key].isBool()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a boolean");
    }
    return section[key].asBool();
}

} // namespace

EventSourceSettings loadSettings(const Json::Value& config) {
    EventSourceSettings settings;
    if (config.isNull()) {
        return settings;
    }
    if (!config.isObject()) {
        throw std::runtime_error("config: expected a JSON object");
    }
    const Json::Value& section = config.isMember("eventsource") ? config["eventsource"] : config;
    if (!section.isObject()) {
        throw std::runtime_error("config: 'eventsource' must be an object");
    }

    settings.writeTimeout = readDuration(section, "write_timeout_ms", settings.writeTimeout);
    settings.idleTimeout = readDuration(section, "idle_timeout_ms", settings.idleTimeout);
    settings.closeOnWriteTimeout = readBool(section, "close_on_write_timeout", settings.closeOnWriteTimeout);
    settings.gzip = readBool(section, "gzip", settings.gzip);

    if (section.isMember("queue_capacity")) {
        const Json::Value& v = section["queue_capacity"];
        if (!v.isIntegral() || v.asInt64() <= 0) {
            throw std::runtime_error("config: 'queue_capacity' must be a positive integer");
        }
        settings.queueCapacity = static_cast<size_t>(v.asUInt64());
    }
    return settings;
}

EventSourceSettings loadSettingsFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("config: can't open " + path);
    }
    Json::Value config;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, file, &config, &errs)) {
        throw std::runtime_error("config: failed to parse " + path + ": " + errs);
    }
    return loadSettings(config);
}
