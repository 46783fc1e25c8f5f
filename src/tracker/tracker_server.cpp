#include "chunkswarm/tracker/tracker_server.hpp"
#include "chunkswarm/core/logger.hpp"

namespace chunkswarm::tracker {

namespace {

void send_message(network::Connection& connection, const TrackerMessage& message, std::uint64_t reply_to) {
    std::visit([&](const auto& msg) { connection.send(msg, reply_to); }, message);
}

}

TrackerServer::TrackerServer(Tracker& tracker, std::uint16_t port, const std::string& bind_address)
    : tracker_(tracker)
    , service_(tracker)
    , server_(port, bind_address) {
    server_.set_message_handler(
        [this](std::shared_ptr<network::Connection> connection, const network::MessageHeader& header,
               std::vector<std::uint8_t> payload) {
            on_message(std::move(connection), header, std::move(payload));
        });
    server_.set_close_handler(
        [this](std::shared_ptr<network::Connection> connection) {
            on_closed(std::move(connection));
        });
}

TrackerServer::~TrackerServer() {
    stop();
}

bool TrackerServer::start() {
    tracker_.set_notifier(this);
    tracker_.set_presence(this);
    if (!server_.start()) {
        tracker_.set_notifier(nullptr);
        tracker_.set_presence(nullptr);
        return false;
    }
    LOG_INFO("Tracker server started on port {}", server_.port());
    return true;
}

void TrackerServer::stop() {
    if (!server_.is_running()) {
        return;
    }
    server_.stop();
    tracker_.set_notifier(nullptr);
    tracker_.set_presence(nullptr);

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.clear();
    devices_.clear();
}

void TrackerServer::notify(const core::DeviceKey& target, const TrackerNotification& notification) {
    std::shared_ptr<network::Connection> connection;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = devices_.find(target);
        if (it != devices_.end()) {
            connection = it->second.lock();
        }
    }
    if (!connection || !connection->is_open()) {
        LOG_DEBUG("Device {} offline; dropping {}", target.to_string(), describe(notification));
        return;
    }

    if (auto* online = std::get_if<UploaderOnline>(&notification)) {
        connection->send(UploaderOnlineMessage{online->file_id, online->uploader});
    } else if (auto* deleted = std::get_if<ShareDeleted>(&notification)) {
        connection->send(ShareDeletedMessage{deleted->file_id, deleted->reason});
    } else if (auto* removed = std::get_if<SeederRemoved>(&notification)) {
        connection->send(SeederRemovedMessage{removed->file_id, removed->reason});
    } else if (auto* changed = std::get_if<ShareScopeChanged>(&notification)) {
        connection->send(ShareScopeChangedMessage{changed->file_id, changed->share_scope});
    }
}

bool TrackerServer::is_online(const core::DeviceKey& device) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = devices_.find(device);
    if (it == devices_.end()) {
        return false;
    }
    auto connection = it->second.lock();
    return connection && connection->is_open();
}

size_t TrackerServer::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void TrackerServer::on_message(std::shared_ptr<network::Connection> connection,
                               const network::MessageHeader& header,
                               std::vector<std::uint8_t> payload) {
    auto message = decode_tracker_message(header, payload);
    if (!message) {
        return;
    }

    if (auto* hello = std::get_if<HelloMessage>(&*message)) {
        on_hello(connection, header, *hello);
        return;
    }

    core::DeviceKey device;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(connection.get());
        if (it != sessions_.end()) {
            device = it->second;
        }
    }

    if (device.empty()) {
        LOG_WARN("Request from {} before hello", connection->get_remote_endpoint());
        StatusMessage reply;
        reply.status = core::ErrorCode::UNAUTHORIZED;
        reply.message = "hello required";
        connection->send(reply, header.message_id);
        return;
    }

    auto reply = service_.handle(device, *message);
    if (reply) {
        send_message(*connection, *reply, header.message_id);
    }
}

void TrackerServer::on_hello(const std::shared_ptr<network::Connection>& connection,
                             const network::MessageHeader& header,
                             const HelloMessage& hello) {
    HelloAckMessage ack;
    core::DeviceKey device(hello.user_id, hello.device_id);
    if (device.empty()) {
        ack.accepted = false;
        ack.message = "user and device are required";
        connection->send(ack, header.message_id);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto existing = sessions_.find(connection.get());
        if (existing != sessions_.end() && !(existing->second == device)) {
            ack.accepted = false;
            ack.message = "session already bound to " + existing->second.to_string();
        } else {
            sessions_[connection.get()] = device;
            devices_[device] = connection;
            ack.accepted = true;
        }
    }

    if (ack.accepted) {
        LOG_INFO("Session {} bound to {}", connection->get_remote_endpoint(), device.to_string());
    }
    connection->send(ack, header.message_id);
}

void TrackerServer::on_closed(std::shared_ptr<network::Connection> connection) {
    core::DeviceKey device;
    bool last_session = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(connection.get());
        if (it == sessions_.end()) {
            return;
        }
        device = it->second;
        sessions_.erase(it);

        // A newer session for the same device keeps it present.
        auto dev = devices_.find(device);
        if (dev != devices_.end()) {
            auto current = dev->second.lock();
            if (!current || current == connection) {
                devices_.erase(dev);
                last_session = true;
            }
        }
    }

    if (last_session) {
        tracker_.disconnect(device);
    }
}

}
