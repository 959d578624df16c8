#include <drogon/drogon.h>
#include <json/json.h>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>
#include "EventSource.hpp"
#include "EventSourceListener.hpp"
#include "EventSourceSettings.hpp"

namespace {

struct GreeterConfig {
    int httpPort = 8080;
    int eventsPort = 8081;
    EventSourceSettings settings;
};

GreeterConfig loadConfig(const std::string& path) {
    GreeterConfig config;
    std::ifstream configFile(path);
    if (!configFile) {
        std::cout << "No " << path << ", using defaults" << std::endl;
        return config;
    }
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
        std::cout << "Failed to parse " << path << ": " << errs << std::endl;
        return config;
    }
    std::cout << "Config file parsed successfully" << std::endl;

    config.settings = loadSettings(root);
    if (root.isMember("greeter")) {
        config.httpPort = root["greeter"].get("http_port", config.httpPort).asInt();
        config.eventsPort = root["greeter"].get("events_port", config.eventsPort).asInt();
    }
    return config;
}

} // namespace

int main() {
    using namespace drogon;

    GreeterConfig config;
    try {
        config = loadConfig("config.json");
    } catch (const std::exception& e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        return 1;
    }

    // the page is served from the drogon port, so the stream needs CORS
    EventSource es(config.settings, [](const ::HttpRequest&) {
        return std::vector<std::string>{
            "Access-Control-Allow-Origin: *",
            "Cache-Control: no-cache",
            "X-Accel-Buffering: no",
        };
    });

    EventSourceListener listener(es, "0.0.0.0", static_cast<unsigned short>(config.eventsPort), "/events");
    listener.start();

    std::atomic<bool> running{true};
    std::thread ticker([&es, &running]() {
        while (running.load()) {
            es.publishEvent("hello", "", "");
            std::cout << "Hello has been sent (consumers: " << es.consumerCount() << ")" << std::endl;
            for (int i = 0; i < 20 && running.load(); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
    });

    // Publish an arbitrary event: {"data": "...", "event": "...", "id": "..."}
    app().registerHandler("/publish",
        [&es](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            auto json = req->getJsonObject();
            if (!json || !(*json)["data"].isString()) {
                Json::Value error;
                error["error"] = "expected a JSON object with a string 'data'";
                auto resp = HttpResponse::newHttpJsonResponse(error);
                resp->setStatusCode(k400BadRequest);
                callback(resp);
                return;
            }
            es.publishEvent((*json)["data"].asString(),
                            (*json).get("event", "").asString(),
                            (*json).get("id", "").asString());
            Json::Value result;
            result["consumers"] = static_cast<Json::UInt64>(es.consumerCount());
            callback(HttpResponse::newHttpJsonResponse(result));
        },
        {Post});

    // Tell clients how long to wait before reconnecting: {"retry_ms": 3000}
    app().registerHandler("/retry",
        [&es](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            auto json = req->getJsonObject();
            if (!json || !(*json)["retry_ms"].isIntegral()) {
                auto resp = HttpResponse::newHttpResponse();
                resp->setStatusCode(k400BadRequest);
                callback(resp);
                return;
            }
            es.publishRetry(std::chrono::milliseconds((*json)["retry_ms"].asInt64()));
            auto resp = HttpResponse::newHttpResponse();
            resp->setStatusCode(k204NoContent);
            callback(resp);
        },
        {Post});

    app().setDocumentRoot("./public");
    app().addListener("0.0.0.0", static_cast<uint16_t>(config.httpPort));

    std::cout << "Open URL http://localhost:" << config.httpPort << "/ in your browser." << std::endl;
    std::cout << "  SSE endpoint: http://localhost:" << config.eventsPort << "/events" << std::endl;
    app().run();

    running.store(false);
    ticker.join();
    listener.stop();
    es.shutdown();
    return 0;
}
