#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "Connection.hpp"

// Connection over an accepted TCP socket. The socket is switched to
// non-blocking mode so every write can be bounded by a deadline. A deadline
// that passes before any byte went out is a timeout; one that passes mid-frame
// breaks the connection for good.
class SocketConnection : public Connection {
public:
    explicit SocketConnection(boost::asio::ip::tcp::socket socket);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    void write(const std::string& bytes, std::chrono::milliseconds timeout) override;
    void close() override;

    std::string remoteAddress() const { return remote_; }

private:
    bool waitFor(short events, std::chrono::steady_clock::time_point deadline);

    boost::asio::io_context io_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::ip::tcp::socket::native_handle_type fd_ = -1;
    std::string remote_;
    std::mutex mutex_;
    bool broken_ = false;
    std::atomic<bool> closed_{false};
};
