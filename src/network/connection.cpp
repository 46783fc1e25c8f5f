#include "chunkswarm/network/connection.hpp"
#include "chunkswarm/core/logger.hpp"
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <utility>

namespace chunkswarm::network {

namespace {

std::string describe_endpoint(const tcp::socket& socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

}

Connection::Connection(boost::asio::io_context& io_context, tcp::socket socket)
    : io_context_(io_context)
    , socket_(std::move(socket))
    , remote_endpoint_(describe_endpoint(socket_)) {
    boost::system::error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);
}

Connection::~Connection() {
    LOG_TRACE("Connection to {} released", remote_endpoint_);
}

void Connection::start() {
    boost::asio::post(io_context_, [self = shared_from_this()]() { self->read_header(); });
}

void Connection::close() {
    boost::asio::post(io_context_, [self = shared_from_this()]() { self->shutdown(); });
}

void Connection::send_message(const MessageHeader& header, std::vector<std::uint8_t> payload) {
    if (!is_open()) {
        LOG_DEBUG("Dropping {} for closed connection {}", message_type_name(static_cast<MessageType>(header.type)), remote_endpoint_);
        return;
    }

    auto frame = header.serialize();
    frame.insert(frame.end(), payload.begin(), payload.end());

    boost::asio::post(io_context_, [self = shared_from_this(), frame = std::move(frame)]() mutable {
        self->enqueue(std::move(frame));
    });
}

void Connection::enqueue(std::vector<std::uint8_t> frame) {
    if (!is_open()) {
        return;
    }
    if (queued_bytes_ + frame.size() > MAX_QUEUED_BYTES) {
        LOG_WARN("{} is not draining its socket ({} bytes queued), closing", remote_endpoint_, queued_bytes_);
        shutdown();
        return;
    }

    queued_bytes_ += frame.size();
    write_queue_.push_back(std::move(frame));
    if (write_queue_.size() == 1) {
        write_next();
    }
}

void Connection::write_next() {
    if (write_queue_.empty() || !is_open()) {
        return;
    }

    boost::asio::async_write(socket_, boost::asio::buffer(write_queue_.front()),
        [self = shared_from_this()](boost::system::error_code ec, std::size_t written) {
            if (ec) {
                self->fail(ec);
                return;
            }
            self->queued_bytes_ -= written;
            self->write_queue_.pop_front();
            self->write_next();
        });
}

void Connection::read_header() {
    if (!is_open()) {
        return;
    }

    boost::asio::async_read(socket_, boost::asio::buffer(header_buffer_),
        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            if (ec) {
                self->fail(ec);
                return;
            }

            MessageHeader header;
            try {
                header = MessageHeader::deserialize(self->header_buffer_);
            } catch (const std::exception& e) {
                LOG_WARN("Unreadable header from {}: {}", self->remote_endpoint_, e.what());
                self->shutdown();
                return;
            }
            if (!header.is_valid()) {
                LOG_WARN("Rejecting frame from {}: bad header", self->remote_endpoint_);
                self->shutdown();
                return;
            }

            if (header.payload_size == 0) {
                if (self->message_handler_) {
                    self->message_handler_(header, {});
                }
                self->read_header();
            } else {
                self->read_payload(header);
            }
        });
}

void Connection::read_payload(const MessageHeader& header) {
    payload_buffer_.resize(header.payload_size);

    boost::asio::async_read(socket_, boost::asio::buffer(payload_buffer_),
        [self = shared_from_this(), header](boost::system::error_code ec, std::size_t) {
            if (ec) {
                self->fail(ec);
                return;
            }
            if (!header.verify_checksum(self->payload_buffer_)) {
                LOG_WARN("Checksum mismatch on {} from {}", message_type_name(static_cast<MessageType>(header.type)), self->remote_endpoint_);
                self->shutdown();
                return;
            }

            LOG_TRACE("{} ({} bytes) from {}", message_type_name(static_cast<MessageType>(header.type)), header.payload_size,
                      self->remote_endpoint_);
            auto payload = std::exchange(self->payload_buffer_, {});
            if (self->message_handler_) {
                self->message_handler_(header, std::move(payload));
            }
            self->read_header();
        });
}

void Connection::shutdown() {
    if (!open_.exchange(false)) {
        return;
    }

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    write_queue_.clear();
    queued_bytes_ = 0;

    if (disconnect_handler_) {
        disconnect_handler_(shared_from_this());
    }
}

void Connection::fail(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_DEBUG("{} hung up", remote_endpoint_);
    } else if (error != boost::asio::error::operation_aborted) {
        LOG_WARN("Connection to {} failed: {}", remote_endpoint_, error.message());
    }
    shutdown();
}

}
