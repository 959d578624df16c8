#include "HttpRequest.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string();
}

HttpRequest parseHttpRequest(const std::string& raw) {
    HttpRequest request;
    std::istringstream in(raw);
    std::string line;

    if (!std::getline(in, line)) {
        return request;
    }
    std::istringstream requestLine(trim(line));
    if (!(requestLine >> request.method >> request.path >> request.version)) {
        return request;
    }
    if (request.version.rfind("HTTP/", 0) != 0) {
        return request;
    }

    auto queryPos = request.path.find('?');
    if (queryPos != std::string::npos) {
        request.query = request.path.substr(queryPos + 1);
        request.path = request.path.substr(0, queryPos);
    }

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            return request;
        }
        request.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    request.valid = true;
    return request;
}
