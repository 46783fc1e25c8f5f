#pragma once

#include "chunkswarm/network/connection.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace chunkswarm::network {

// Accepts framed connections on one io_context thread. Message and close
// handlers run on that thread.
class TcpServer {
public:
    using CloseHandler = std::function<void(std::shared_ptr<Connection>)>;
    using MessageHandler = std::function<void(std::shared_ptr<Connection>, const MessageHeader&, std::vector<std::uint8_t>)>;

    // Port 0 binds an ephemeral port; see port() after start().
    explicit TcpServer(std::uint16_t port, const std::string& bind_address = "0.0.0.0");
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_; }

    std::uint16_t port() const { return port_; }
    size_t connection_count() const;

    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }

private:
    bool open_acceptor();
    void run();
    void do_accept();
    void adopt(tcp::socket socket);
    void forget(const std::shared_ptr<Connection>& connection);

    std::uint16_t port_;
    std::string bind_address_;
    std::atomic<bool> running_{false};

    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread thread_;

    mutable std::mutex connections_mutex_;
    std::set<std::shared_ptr<Connection>> connections_;

    CloseHandler close_handler_;
    MessageHandler message_handler_;
};

}
