#include "SocketConnection.hpp"
#include <cerrno>
#include <cstring>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <poll.h>
#include <sys/socket.h>

SocketConnection::SocketConnection(boost::asio::ip::tcp::socket socket)
    : socket_(io_) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (!ec) {
        remote_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
    // the session may outlive the io_context that accepted the socket
    auto protocol = socket.local_endpoint(ec).protocol();
    socket_.assign(protocol, socket.release());
    fd_ = socket_.native_handle();
    socket_.set_option(boost::asio::socket_base::keep_alive(true), ec);
    socket_.non_blocking(true);
}

SocketConnection::~SocketConnection() {
    close();
}

bool SocketConnection::waitFor(short events, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = events;
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc > 0) {
            // errors and hang-ups surface on the next read/write call
            return true;
        }
        if (rc == 0) {
            return false;
        }
        if (errno != EINTR) {
            throw WriteError(std::string("poll failed: ") + std::strerror(errno), false);
        }
    }
}

void SocketConnection::write(const std::string& bytes, std::chrono::milliseconds timeout) {
    std::lock_guard lock(mutex_);
    if (closed_.load()) {
        throw WriteError("connection closed", false);
    }
    if (broken_) {
        throw WriteError("a previous write stopped mid-frame", false);
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t written = 0;
    while (written < bytes.size()) {
        boost::system::error_code ec;
        written += socket_.write_some(
            boost::asio::buffer(bytes.data() + written, bytes.size() - written), ec);
        if (!ec) {
            continue;
        }
        if (ec != boost::asio::error::would_block && ec != boost::asio::error::try_again) {
            throw WriteError(ec.message(), false);
        }
        if (!waitFor(POLLOUT, deadline)) {
            if (written == 0) {
                throw WriteError("write deadline exceeded", true);
            }
            // part of the frame is on the wire; the next frame would be glued to it
            broken_ = true;
            throw WriteError("write deadline exceeded mid-frame", false);
        }
        if (closed_.load()) {
            throw WriteError("connection closed", false);
        }
    }
}

void SocketConnection::close() {
    if (closed_.exchange(true)) {
        return;
    }
    // wakes up a writer blocked in poll() before the descriptor goes away
    ::shutdown(fd_, SHUT_RDWR);
    std::lock_guard lock(mutex_);
    boost::system::error_code ec;
    socket_.close(ec);
}
