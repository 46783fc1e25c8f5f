#include "chunkswarm/network/tcp_server.hpp"
#include "chunkswarm/core/logger.hpp"

namespace chunkswarm::network {

TcpServer::TcpServer(std::uint16_t port, const std::string& bind_address)
    : port_(port)
    , bind_address_(bind_address)
    , acceptor_(io_context_) {
}

TcpServer::~TcpServer() {
    stop();
}

bool TcpServer::open_acceptor() {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(bind_address_, ec);
    if (ec) {
        LOG_ERROR("Invalid bind address '{}': {}", bind_address_, ec.message());
        return false;
    }

    tcp::endpoint endpoint(address, port_);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG_ERROR("Cannot listen on {}:{}: {}", bind_address_, port_, ec.message());
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    port_ = acceptor_.local_endpoint().port();
    return true;
}

bool TcpServer::start() {
    if (running_) {
        LOG_WARN("TCP server on port {} already running", port_);
        return false;
    }
    if (!open_acceptor()) {
        return false;
    }

    running_ = true;
    io_context_.restart();
    do_accept();
    thread_ = std::thread([this]() { run(); });
    return true;
}

void TcpServer::run() {
    LOG_INFO("Listening on {}:{}", bind_address_, port_);
    // A throwing handler must not take the listener down with it.
    while (running_) {
        try {
            io_context_.run();
            break;
        } catch (const std::exception& e) {
            LOG_ERROR("Handler on port {} threw: {}", port_, e.what());
            if (io_context_.stopped()) {
                io_context_.restart();
            }
        }
    }
    LOG_INFO("Listener on port {} exited", port_);
}

void TcpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::vector<std::shared_ptr<Connection>> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        open.assign(connections_.begin(), connections_.end());
    }

    boost::asio::post(io_context_, [this, open]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        for (const auto& connection : open) {
            connection->close();
        }
        // Queued behind the closes so their handlers still run.
        boost::asio::post(io_context_, [this]() { io_context_.stop(); });
    });

    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.clear();
}

size_t TcpServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void TcpServer::do_accept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (!running_ || ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            LOG_WARN("Accept on port {} failed: {}", port_, ec.message());
        } else {
            adopt(std::move(socket));
        }
        do_accept();
    });
}

void TcpServer::adopt(tcp::socket socket) {
    auto connection = std::make_shared<Connection>(io_context_, std::move(socket));
    LOG_DEBUG("Accepted {}", connection->get_remote_endpoint());

    std::weak_ptr<Connection> weak = connection;
    connection->set_message_handler([this, weak](const MessageHeader& header, std::vector<std::uint8_t> payload) {
        if (auto conn = weak.lock(); conn && message_handler_) {
            message_handler_(conn, header, std::move(payload));
        }
    });
    connection->set_disconnect_handler([this](std::shared_ptr<Connection> conn) { forget(conn); });

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.insert(connection);
    }
    connection->start();
}

void TcpServer::forget(const std::shared_ptr<Connection>& connection) {
    LOG_DEBUG("Closed {}", connection->get_remote_endpoint());
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(connection);
    }
    if (close_handler_) {
        close_handler_(connection);
    }
}

}
