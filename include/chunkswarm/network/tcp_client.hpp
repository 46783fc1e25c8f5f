#pragma once

#include "chunkswarm/network/connection.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace chunkswarm::network {

// Outbound framed connection driven by its own io thread. One connection
// at a time; connect() again after the previous one has closed.
class TcpClient {
public:
    using MessageHandler = Connection::MessageHandler;
    using DisconnectHandler = std::function<void(const std::string& reason)>;

    TcpClient() = default;
    ~TcpClient();

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    // Blocks until connected or the timeout elapses. Returns
    // error::timed_out when the deadline passes first.
    boost::system::error_code connect(const std::string& host, std::uint16_t port,
                                      std::chrono::milliseconds timeout);
    void disconnect();

    bool is_connected() const;
    std::shared_ptr<Connection> connection() const;

    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }

private:
    void ensure_io_thread();
    void attach(tcp::socket socket);

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread io_thread_;

    mutable std::mutex mutex_;
    std::shared_ptr<Connection> connection_;
    bool connecting_ = false;
    std::string target_;

    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;
};

}
