#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <json/json.h>
#include "../src/EventSourceSettings.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace {
bool rejects(const Json::Value& config) {
    try {
        loadSettings(config);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}
}

int main() {
    try {
        // defaults
        EventSourceSettings defaults = loadSettings(Json::Value());
        ASSERT_TRUE(defaults.writeTimeout == std::chrono::seconds(2));
        ASSERT_TRUE(defaults.closeOnWriteTimeout);
        ASSERT_TRUE(defaults.idleTimeout == std::chrono::minutes(30));
        ASSERT_TRUE(!defaults.gzip);
        ASSERT_TRUE(defaults.queueCapacity == 10);

        // overrides from the "eventsource" section, other keys keep defaults
        Json::Value config;
        config["eventsource"]["write_timeout_ms"] = 500;
        config["eventsource"]["close_on_write_timeout"] = false;
        config["eventsource"]["gzip"] = true;
        EventSourceSettings s = loadSettings(config);
        ASSERT_TRUE(s.writeTimeout == std::chrono::milliseconds(500));
        ASSERT_TRUE(!s.closeOnWriteTimeout);
        ASSERT_TRUE(s.gzip);
        ASSERT_TRUE(s.idleTimeout == std::chrono::minutes(30));

        // invalid values
        Json::Value negative;
        negative["idle_timeout_ms"] = -1;
        ASSERT_TRUE(rejects(negative));
        Json::Value wrongType;
        wrongType["eventsource"]["gzip"] = "yes";
        ASSERT_TRUE(rejects(wrongType));
        Json::Value zeroCapacity;
        zeroCapacity["queue_capacity"] = 0;
        ASSERT_TRUE(rejects(zeroCapacity));
        ASSERT_TRUE(rejects(Json::Value("not an object")));

        // from a file
        auto tmpFile = std::filesystem::temp_directory_path() / "eventsource_settings_test.json";
        {
            std::ofstream ofs(tmpFile);
            ofs << R"({"eventsource": {"idle_timeout_ms": 1000, "queue_capacity": 32}})";
        }
        EventSourceSettings fromFile = loadSettingsFile(tmpFile.string());
        ASSERT_TRUE(fromFile.idleTimeout == std::chrono::seconds(1));
        ASSERT_TRUE(fromFile.queueCapacity == 32);
        std::filesystem::remove(tmpFile);

        bool threw = false;
        try {
            loadSettingsFile(tmpFile.string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All settings tests passed" << std::endl;
    return 0;
}
