#include "chunkswarm/tracker/remote_tracker_client.hpp"
#include "chunkswarm/core/logger.hpp"

namespace chunkswarm::tracker {

using core::ErrorCode;
using core::Result;

RemoteTrackerClient::RemoteTrackerClient(core::DeviceKey device, std::chrono::milliseconds request_timeout)
    : device_(std::move(device))
    , request_timeout_(request_timeout) {
    client_.set_message_handler(
        [this](const network::MessageHeader& header, std::vector<std::uint8_t> payload) {
            on_message(header, std::move(payload));
        });
    client_.set_disconnect_handler(
        [this](const std::string& reason) {
            LOG_WARN("Tracker connection lost: {}", reason);
            fail_pending();
        });
}

RemoteTrackerClient::~RemoteTrackerClient() {
    disconnect();
}

template<typename Reply, typename Request>
Result RemoteTrackerClient::call(const Request& request, Reply& reply) {
    auto connection = client_.connection();
    if (!connection || !connection->is_open()) {
        return Result::fail(ErrorCode::TIMEOUT, "not connected to tracker");
    }

    auto payload = request.serialize();
    network::MessageHeader header(Request::TYPE, static_cast<std::uint32_t>(payload.size()));
    header.calculate_checksum(payload);

    auto pending = std::make_shared<Pending>();
    auto future = pending->get_future();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_[header.message_id] = pending;
    }

    auto request_id = header.message_id;
    connection->send_message(header, std::move(payload));

    if (future.wait_for(request_timeout_) == std::future_status::timeout) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(request_id);
        LOG_WARN("Tracker request {} timed out", network::message_type_name(Request::TYPE));
        return Result::fail(ErrorCode::TIMEOUT, "tracker did not answer in time");
    }

    auto response = future.get();
    if (!response) {
        return Result::fail(ErrorCode::TIMEOUT, "tracker connection lost");
    }
    if (auto* typed = std::get_if<Reply>(&*response)) {
        reply = std::move(*typed);
        return Result::ok();
    }
    if (auto* status = std::get_if<StatusMessage>(&*response)) {
        return Result(status->status == ErrorCode::SUCCESS ? ErrorCode::INVALID_STATE : status->status,
                      status->message);
    }
    return Result::fail(ErrorCode::INVALID_STATE, "unexpected tracker response");
}

template<typename Request>
Result RemoteTrackerClient::call_status(const Request& request) {
    StatusMessage reply;
    auto result = call(request, reply);
    if (!result) {
        return result;
    }
    return Result(reply.status, reply.message);
}

Result RemoteTrackerClient::connect(const std::string& host, std::uint16_t port,
                                    std::chrono::milliseconds connect_timeout) {
    if (auto ec = client_.connect(host, port, connect_timeout)) {
        return Result::fail(ErrorCode::TIMEOUT,
                            "unable to connect to tracker at " + host + ": " + ec.message());
    }

    HelloMessage hello;
    hello.user_id = device_.user_id;
    hello.device_id = device_.device_id;

    HelloAckMessage ack;
    auto result = call(hello, ack);
    if (!result) {
        client_.disconnect();
        return result;
    }
    if (!ack.accepted) {
        client_.disconnect();
        return Result::fail(ErrorCode::UNAUTHORIZED, ack.message);
    }

    LOG_INFO("Connected to tracker {}:{} as {}", host, port, device_.to_string());
    return Result::ok();
}

void RemoteTrackerClient::disconnect() {
    client_.disconnect();
    fail_pending();
}

Result RemoteTrackerClient::announce(const Announcement& announcement, FileRecordSummary& out) {
    AnnounceMessage msg;
    msg.file_id = announcement.file_id;
    msg.device = device_;
    msg.total_size = announcement.metadata.total_size;
    msg.checksum = announcement.metadata.checksum;
    msg.chunk_count = announcement.metadata.chunk_count;
    msg.bitmap = announcement.bitmap;
    msg.share_scope = announcement.share_scope;
    msg.upload_capacity = announcement.upload_capacity;

    FileSummaryMessage reply;
    auto result = call(msg, reply);
    if (!result) {
        return result;
    }
    out = reply.summary;
    return Result(reply.status, reply.message);
}

Result RemoteTrackerClient::reannounce(const core::FileId& file_id, const core::ChunkBitmap& bitmap,
                                       bool download_complete, FileRecordSummary& out) {
    ReannounceMessage msg;
    msg.file_id = file_id;
    msg.device = device_;
    msg.bitmap = bitmap;
    msg.download_complete = download_complete;

    FileSummaryMessage reply;
    auto result = call(msg, reply);
    if (!result) {
        return result;
    }
    out = reply.summary;
    return Result(reply.status, reply.message);
}

Result RemoteTrackerClient::check_exists(const std::vector<core::FileId>& file_ids, ExistenceReport& out) {
    CheckExistsMessage msg;
    msg.file_ids = file_ids;

    CheckExistsResultMessage reply;
    auto result = call(msg, reply);
    if (!result) {
        return result;
    }
    out.exists = std::move(reply.exists);
    out.missing = std::move(reply.missing);
    return Result::ok();
}

Result RemoteTrackerClient::get_available_chunks(const core::FileId& file_id, std::vector<SeederAvailability>& out) {
    GetAvailableChunksMessage msg;
    msg.file_id = file_id;

    AvailableChunksMessage reply;
    auto result = call(msg, reply);
    if (!result) {
        return result;
    }
    out = std::move(reply.seeders);
    return Result(reply.status, reply.message);
}

Result RemoteTrackerClient::delete_share(const core::FileId& file_id) {
    return call_status(DeleteShareMessage{file_id});
}

Result RemoteTrackerClient::unannounce(const core::FileId& file_id) {
    return call_status(UnannounceMessage{file_id});
}

Result RemoteTrackerClient::register_leecher(const core::FileId& file_id, const core::ChunkBitmap& requested) {
    return call_status(RegisterLeecherMessage{file_id, requested});
}

Result RemoteTrackerClient::unregister_leecher(const core::FileId& file_id) {
    return call_status(UnregisterLeecherMessage{file_id});
}

Result RemoteTrackerClient::record_activity(const core::FileId& file_id) {
    return call_status(RecordActivityMessage{file_id});
}

Result RemoteTrackerClient::update_share_scope(const core::FileId& file_id, const std::vector<core::UserId>& add,
                                               const std::vector<core::UserId>& remove,
                                               std::vector<core::UserId>& out) {
    UpdateShareScopeMessage msg;
    msg.file_id = file_id;
    msg.add = add;
    msg.remove = remove;

    ShareScopeResultMessage reply;
    auto result = call(msg, reply);
    if (!result) {
        return result;
    }
    out = std::move(reply.share_scope);
    return Result(reply.status, reply.message);
}

void RemoteTrackerClient::on_message(const network::MessageHeader& header, std::vector<std::uint8_t> payload) {
    auto message = decode_tracker_message(header, payload);
    if (!message) {
        return;
    }

    if (header.flags == network::MessageFlags::RESPONSE) {
        std::shared_ptr<Pending> pending;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(header.message_id);
            if (it != pending_.end()) {
                pending = it->second;
                pending_.erase(it);
            }
        }
        if (pending) {
            pending->set_value(std::move(*message));
        } else {
            LOG_DEBUG("Late tracker response {} ignored", header.message_id);
        }
        return;
    }

    if (auto* online = std::get_if<UploaderOnlineMessage>(&*message)) {
        dispatch_notification(to_notification(*online));
    } else if (auto* deleted = std::get_if<ShareDeletedMessage>(&*message)) {
        dispatch_notification(to_notification(*deleted));
    } else if (auto* removed = std::get_if<SeederRemovedMessage>(&*message)) {
        dispatch_notification(to_notification(*removed));
    } else if (auto* changed = std::get_if<ShareScopeChangedMessage>(&*message)) {
        dispatch_notification(to_notification(*changed));
    } else {
        LOG_DEBUG("Ignoring unsolicited {} from tracker", network::message_type_name(message_type_of(*message)));
    }
}

void RemoteTrackerClient::fail_pending() {
    std::map<std::uint64_t, std::shared_ptr<Pending>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& [id, promise] : pending) {
        promise->set_value(std::nullopt);
    }
}

}
