#pragma once
#include <map>
#include <string>

// Metadata of the request that opened an event stream. Only used to pick
// extra headers and compression for the session.
struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::string version;
    std::map<std::string, std::string> headers; // keys lower-cased
    bool valid = false;

    // Case-insensitive header lookup, empty when absent.
    std::string header(const std::string& name) const;
};

// Parse a raw request head. Accepts both CRLF and bare LF line endings.
HttpRequest parseHttpRequest(const std::string& raw);
