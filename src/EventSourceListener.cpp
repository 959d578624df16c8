#include "EventSourceListener.hpp"
#include <cstddef>
#include <iostream>
#include <memory>
#include <utility>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include "HttpRequest.hpp"
#include "SocketConnection.hpp"

namespace {
constexpr auto kRequestTimeout = std::chrono::seconds(5);
constexpr size_t kMaxRequestHead = 65536;
constexpr auto kReplyTimeout = std::chrono::seconds(1);

using HeadIterator = boost::asio::buffers_iterator<boost::asio::streambuf::const_buffers_type>;

// The head ends at the first blank line, with CRLF or bare LF line endings.
std::pair<HeadIterator, bool> matchHeadEnd(HeadIterator begin, HeadIterator end) {
    for (HeadIterator it = begin; it != end; ++it) {
        if (*it != '\n') {
            continue;
        }
        HeadIterator next = it + 1;
        if (next != end && *next == '\r') {
            ++next;
        }
        if (next == end) {
            break;
        }
        if (*next == '\n') {
            return {next + 1, true};
        }
    }
    return {begin, false};
}

// A client whose request head is still on its way.
struct PendingRequest {
    PendingRequest(boost::asio::ip::tcp::socket s, size_t maxSize)
        : socket(std::move(s)), timer(socket.get_executor()), buffer(maxSize) {}

    boost::asio::ip::tcp::socket socket;
    boost::asio::steady_timer timer;
    boost::asio::streambuf buffer;
};

void reject(SocketConnection& connection, const std::string& status) {
    try {
        connection.write("HTTP/1.1 " + status + "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n",
                         kReplyTimeout);
    } catch (const WriteError& e) {
        std::cerr << "EventSourceListener: can't reply to " << connection.remoteAddress()
                  << ": " << e.what() << std::endl;
    }
    connection.close();
}
}

EventSourceListener::EventSourceListener(EventSource& source, const std::string& address,
                                         unsigned short port, std::string path)
    : source_(source),
      path_(std::move(path)),
      acceptor_(io_, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address(address), port)),
      port_(acceptor_.local_endpoint().port()) {
}

EventSourceListener::~EventSourceListener() {
    stop();
}

void EventSourceListener::start() {
    std::cout << "EventSourceListener: listening on port " << port() << std::endl;
    doAccept();
    thread_ = std::thread([this]() { io_.run(); });
}

void EventSourceListener::stop() {
    if (!thread_.joinable()) {
        return;
    }
    io_.stop();
    thread_.join();
    boost::system::error_code ec;
    acceptor_.close(ec);
    std::cout << "EventSourceListener: stopped" << std::endl;
}

void EventSourceListener::doAccept() {
    acceptor_.async_accept([this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            std::cerr << "EventSourceListener: accept failed: " << ec.message() << std::endl;
        } else {
            readHead(std::move(socket));
        }
        doAccept();
    });
}

void EventSourceListener::readHead(boost::asio::ip::tcp::socket socket) {
    auto pending = std::make_shared<PendingRequest>(std::move(socket), kMaxRequestHead);
    pending->timer.expires_after(kRequestTimeout);
    pending->timer.async_wait([pending](boost::system::error_code ec) {
        if (!ec) {
            // aborts the read below
            boost::system::error_code ignored;
            pending->socket.close(ignored);
        }
    });
    boost::asio::async_read_until(
        pending->socket, pending->buffer, matchHeadEnd,
        [this, pending](boost::system::error_code ec, size_t length) {
            pending->timer.cancel();
            if (ec) {
                // timed out, hung up, or sent more than kMaxRequestHead without a blank line
                boost::system::error_code ignored;
                pending->socket.close(ignored);
                return;
            }
            auto data = pending->buffer.data();
            auto begin = boost::asio::buffers_begin(data);
            std::string head(begin, begin + static_cast<std::ptrdiff_t>(length));
            dispatch(std::move(pending->socket), head);
        });
}

void EventSourceListener::dispatch(boost::asio::ip::tcp::socket socket, const std::string& head) {
    try {
        auto connection = std::make_unique<SocketConnection>(std::move(socket));
        HttpRequest request = parseHttpRequest(head);
        if (!request.valid) {
            reject(*connection, "400 Bad Request");
            return;
        }
        if (!path_.empty() && request.path != path_) {
            reject(*connection, "404 Not Found");
            return;
        }
        std::string remote = connection->remoteAddress();
        if (!source_.accept(std::move(connection), request)) {
            std::cerr << "EventSourceListener: event source is closed, dropped " << remote << std::endl;
        }
    } catch (const HandshakeError& e) {
        std::cerr << "EventSourceListener: can't create connection to a consumer: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "EventSourceListener: " << e.what() << std::endl;
    }
}
