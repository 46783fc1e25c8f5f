#include "chunkswarm/network/tcp_client.hpp"
#include "chunkswarm/core/logger.hpp"
#include <boost/asio/connect.hpp>
#include <future>

namespace chunkswarm::network {

TcpClient::~TcpClient() {
    disconnect();
    work_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void TcpClient::ensure_io_thread() {
    if (io_thread_.joinable()) {
        return;
    }
    work_.emplace(boost::asio::make_work_guard(io_context_));
    io_thread_ = std::thread([this]() {
        for (;;) {
            try {
                io_context_.run();
                return;
            } catch (const std::exception& e) {
                LOG_ERROR("Handler for {} threw: {}", target_, e.what());
            }
        }
    });
}

boost::system::error_code TcpClient::connect(const std::string& host, std::uint16_t port,
                                             std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connecting_ || (connection_ && connection_->is_open())) {
            return boost::asio::error::already_connected;
        }
        connecting_ = true;
        target_ = host + ":" + std::to_string(port);
    }
    ensure_io_thread();
    LOG_DEBUG("Connecting to {}", target_);

    auto socket = std::make_shared<tcp::socket>(io_context_);
    auto resolver = std::make_shared<tcp::resolver>(io_context_);
    auto outcome = std::make_shared<std::promise<boost::system::error_code>>();
    auto done = outcome->get_future();

    resolver->async_resolve(host, std::to_string(port),
        [socket, resolver, outcome](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) {
                outcome->set_value(ec);
                return;
            }
            boost::asio::async_connect(*socket, endpoints,
                [outcome](boost::system::error_code connect_ec, const tcp::endpoint&) {
                    outcome->set_value(connect_ec);
                });
        });

    boost::system::error_code ec = boost::asio::error::timed_out;
    if (done.wait_for(timeout) == std::future_status::ready) {
        ec = done.get();
    } else {
        // The handlers still own the promise; cancelling lets them finish.
        boost::asio::post(io_context_, [socket, resolver]() {
            resolver->cancel();
            boost::system::error_code ignored;
            socket->close(ignored);
        });
    }

    if (!ec) {
        attach(std::move(*socket));
        LOG_INFO("Connected to {}", target_);
    } else {
        LOG_WARN("Cannot reach {}: {}", target_, ec.message());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    connecting_ = false;
    return ec;
}

void TcpClient::attach(tcp::socket socket) {
    auto connection = std::make_shared<Connection>(io_context_, std::move(socket));
    connection->set_message_handler([this](const MessageHeader& header, std::vector<std::uint8_t> payload) {
        if (message_handler_) {
            message_handler_(header, std::move(payload));
        }
    });
    connection->set_disconnect_handler([this](std::shared_ptr<Connection> closed) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (connection_ == closed) {
                connection_.reset();
            }
        }
        LOG_INFO("Disconnected from {}", target_);
        if (disconnect_handler_) {
            disconnect_handler_("connection to " + target_ + " closed");
        }
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = connection;
    }
    connection->start();
}

void TcpClient::disconnect() {
    if (auto current = connection()) {
        current->close();
    }
}

bool TcpClient::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_ && connection_->is_open();
}

std::shared_ptr<Connection> TcpClient::connection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

}
