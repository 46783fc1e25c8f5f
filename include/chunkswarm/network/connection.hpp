#pragma once

#include "chunkswarm/network/protocol.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace chunkswarm::network {

using boost::asio::ip::tcp;

// Outgoing bytes a connection may buffer before it is treated as a stalled
// reader and closed.
constexpr size_t MAX_QUEUED_BYTES = 4 * MAX_PAYLOAD_SIZE;

// One framed TCP stream. All socket work runs on the io_context thread;
// send_message() and close() may be called from any thread.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using MessageHandler = std::function<void(const MessageHeader&, std::vector<std::uint8_t>)>;
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>)>;

    Connection(boost::asio::io_context& io_context, tcp::socket socket);
    ~Connection();

    void start();
    void close();

    void send_message(const MessageHeader& header, std::vector<std::uint8_t> payload);

    // Sends a typed payload. A non-zero reply_to marks it as the response
    // to that request id.
    template<MessagePayload T>
    std::uint64_t send(const T& message, std::uint64_t reply_to = 0) {
        auto payload = message.serialize();
        MessageHeader header(T::TYPE, static_cast<std::uint32_t>(payload.size()));
        if (reply_to != 0) {
            header.message_id = reply_to;
            header.flags = MessageFlags::RESPONSE;
        }
        header.calculate_checksum(payload);
        auto id = header.message_id;
        send_message(header, std::move(payload));
        return id;
    }

    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }

    bool is_open() const { return open_.load(); }
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }

private:
    void read_header();
    void read_payload(const MessageHeader& header);
    void enqueue(std::vector<std::uint8_t> frame);
    void write_next();
    void shutdown();
    void fail(const boost::system::error_code& error);

    boost::asio::io_context& io_context_;
    tcp::socket socket_;
    std::atomic<bool> open_{true};
    std::string remote_endpoint_;

    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;

    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> header_buffer_;
    std::vector<std::uint8_t> payload_buffer_;

    std::deque<std::vector<std::uint8_t>> write_queue_;
    size_t queued_bytes_ = 0;
};

}
