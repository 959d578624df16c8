#pragma once
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "EventSource.hpp"

// Accepts TCP clients, reads their request head and hands the socket over to
// an EventSource. Heads are read asynchronously, so a client that connects and
// stays silent holds up nobody but itself. A port of 0 binds an ephemeral
// port; see port().
class EventSourceListener {
public:
    // Binds immediately; throws boost::system::system_error if that fails.
    // An empty path accepts any request target.
    EventSourceListener(EventSource& source, const std::string& address, unsigned short port,
                        std::string path = "");
    ~EventSourceListener();

    EventSourceListener(const EventSourceListener&) = delete;
    EventSourceListener& operator=(const EventSourceListener&) = delete;

    void start();
    void stop();

    unsigned short port() const { return port_; }

private:
    void doAccept();
    void readHead(boost::asio::ip::tcp::socket socket);
    void dispatch(boost::asio::ip::tcp::socket socket, const std::string& head);

    EventSource& source_;
    std::string path_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned short port_;
    std::thread thread_;
};
