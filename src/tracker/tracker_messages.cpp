#include "chunkswarm/tracker/tracker_messages.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/network/wire.hpp"
#include <stdexcept>

namespace chunkswarm::tracker {

using namespace network::wire;

namespace {

void write_device(std::vector<std::uint8_t>& buffer, const core::DeviceKey& device) {
    write_string(buffer, device.user_id);
    write_string(buffer, device.device_id);
}

core::DeviceKey read_device(std::span<const std::uint8_t>& data) {
    auto user = read_string(data);
    auto device = read_string(data);
    return core::DeviceKey(std::move(user), std::move(device));
}

void write_bitmap(std::vector<std::uint8_t>& buffer, const core::ChunkBitmap& bitmap) {
    write_uint32(buffer, bitmap.size());
    write_bytes(buffer, bitmap.bytes());
}

core::ChunkBitmap read_bitmap(std::span<const std::uint8_t>& data) {
    auto count = read_uint32(data);
    auto bytes = read_bytes(data);
    auto bitmap = core::ChunkBitmap::from_bytes(count, bytes);
    if (!bitmap) {
        throw std::runtime_error("Malformed chunk bitmap");
    }
    return *bitmap;
}

void write_status(std::vector<std::uint8_t>& buffer, core::ErrorCode status, const std::string& message) {
    write_uint8(buffer, static_cast<std::uint8_t>(status));
    write_string(buffer, message);
}

core::ErrorCode read_status(std::span<const std::uint8_t>& data) {
    auto raw = read_uint8(data);
    if (raw > static_cast<std::uint8_t>(core::ErrorCode::INVALID_ARGUMENT)) {
        throw std::runtime_error("Unknown status code");
    }
    return static_cast<core::ErrorCode>(raw);
}

template<typename T>
std::optional<TrackerMessage> parse(std::span<const std::uint8_t> payload) {
    return TrackerMessage(T::deserialize(payload));
}

}

std::vector<std::uint8_t> HelloMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, user_id);
    write_string(buffer, device_id);
    return buffer;
}

HelloMessage HelloMessage::deserialize(std::span<const std::uint8_t> data) {
    HelloMessage msg;
    msg.user_id = read_string(data);
    msg.device_id = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> HelloAckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_bool(buffer, accepted);
    write_string(buffer, message);
    return buffer;
}

HelloAckMessage HelloAckMessage::deserialize(std::span<const std::uint8_t> data) {
    HelloAckMessage msg;
    msg.accepted = read_bool(data);
    msg.message = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> HeartbeatMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint64(buffer, timestamp);
    return buffer;
}

HeartbeatMessage HeartbeatMessage::deserialize(std::span<const std::uint8_t> data) {
    HeartbeatMessage msg;
    msg.timestamp = read_uint64(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> AnnounceMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_device(buffer, device);
    write_uint64(buffer, total_size);
    write_string(buffer, checksum);
    write_uint32(buffer, chunk_count);
    write_bitmap(buffer, bitmap);
    write_string_list(buffer, share_scope);
    write_uint32(buffer, upload_capacity);
    return buffer;
}

AnnounceMessage AnnounceMessage::deserialize(std::span<const std::uint8_t> data) {
    AnnounceMessage msg;
    msg.file_id = read_string(data);
    msg.device = read_device(data);
    msg.total_size = read_uint64(data);
    msg.checksum = read_string(data);
    msg.chunk_count = read_uint32(data);
    msg.bitmap = read_bitmap(data);
    msg.share_scope = read_string_list(data);
    msg.upload_capacity = read_uint32(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ReannounceMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_device(buffer, device);
    write_bitmap(buffer, bitmap);
    write_bool(buffer, download_complete);
    return buffer;
}

ReannounceMessage ReannounceMessage::deserialize(std::span<const std::uint8_t> data) {
    ReannounceMessage msg;
    msg.file_id = read_string(data);
    msg.device = read_device(data);
    msg.bitmap = read_bitmap(data);
    msg.download_complete = read_bool(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> CheckExistsMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string_list(buffer, file_ids);
    return buffer;
}

CheckExistsMessage CheckExistsMessage::deserialize(std::span<const std::uint8_t> data) {
    CheckExistsMessage msg;
    msg.file_ids = read_string_list(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> GetAvailableChunksMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    return buffer;
}

GetAvailableChunksMessage GetAvailableChunksMessage::deserialize(std::span<const std::uint8_t> data) {
    GetAvailableChunksMessage msg;
    msg.file_id = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> DeleteShareMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    return buffer;
}

DeleteShareMessage DeleteShareMessage::deserialize(std::span<const std::uint8_t> data) {
    DeleteShareMessage msg;
    msg.file_id = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> UnannounceMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    return buffer;
}

UnannounceMessage UnannounceMessage::deserialize(std::span<const std::uint8_t> data) {
    UnannounceMessage msg;
    msg.file_id = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> RegisterLeecherMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_bitmap(buffer, requested);
    return buffer;
}

RegisterLeecherMessage RegisterLeecherMessage::deserialize(std::span<const std::uint8_t> data) {
    RegisterLeecherMessage msg;
    msg.file_id = read_string(data);
    msg.requested = read_bitmap(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> UnregisterLeecherMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    return buffer;
}

UnregisterLeecherMessage UnregisterLeecherMessage::deserialize(std::span<const std::uint8_t> data) {
    UnregisterLeecherMessage msg;
    msg.file_id = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> RecordActivityMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    return buffer;
}

RecordActivityMessage RecordActivityMessage::deserialize(std::span<const std::uint8_t> data) {
    RecordActivityMessage msg;
    msg.file_id = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> UpdateShareScopeMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_string_list(buffer, add);
    write_string_list(buffer, remove);
    return buffer;
}

UpdateShareScopeMessage UpdateShareScopeMessage::deserialize(std::span<const std::uint8_t> data) {
    UpdateShareScopeMessage msg;
    msg.file_id = read_string(data);
    msg.add = read_string_list(data);
    msg.remove = read_string_list(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> FileSummaryMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_status(buffer, status, message);
    write_string(buffer, summary.file_id);
    write_uint64(buffer, summary.total_size);
    write_uint32(buffer, summary.chunk_count);
    write_string(buffer, summary.checksum);
    write_string(buffer, summary.uploader_id);
    write_uint32(buffer, summary.seeder_count);
    write_uint32(buffer, summary.complete_seeder_count);
    write_uint32(buffer, summary.leecher_count);
    write_uint64(buffer, static_cast<std::uint64_t>(core::to_unix_ms(summary.expires_at)));
    return buffer;
}

FileSummaryMessage FileSummaryMessage::deserialize(std::span<const std::uint8_t> data) {
    FileSummaryMessage msg;
    msg.status = read_status(data);
    msg.message = read_string(data);
    msg.summary.file_id = read_string(data);
    msg.summary.total_size = read_uint64(data);
    msg.summary.chunk_count = read_uint32(data);
    msg.summary.checksum = read_string(data);
    msg.summary.uploader_id = read_string(data);
    msg.summary.seeder_count = read_uint32(data);
    msg.summary.complete_seeder_count = read_uint32(data);
    msg.summary.leecher_count = read_uint32(data);
    msg.summary.expires_at = core::from_unix_ms(static_cast<std::int64_t>(read_uint64(data)));
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> CheckExistsResultMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string_list(buffer, exists);
    write_string_list(buffer, missing);
    return buffer;
}

CheckExistsResultMessage CheckExistsResultMessage::deserialize(std::span<const std::uint8_t> data) {
    CheckExistsResultMessage msg;
    msg.exists = read_string_list(data);
    msg.missing = read_string_list(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> AvailableChunksMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_status(buffer, status, message);
    write_uint32(buffer, static_cast<std::uint32_t>(seeders.size()));
    for (const auto& seeder : seeders) {
        write_device(buffer, seeder.device);
        write_bitmap(buffer, seeder.bitmap);
        write_uint32(buffer, seeder.upload_capacity);
        write_bool(buffer, seeder.download_complete);
        write_bool(buffer, seeder.reachable);
    }
    return buffer;
}

AvailableChunksMessage AvailableChunksMessage::deserialize(std::span<const std::uint8_t> data) {
    AvailableChunksMessage msg;
    msg.status = read_status(data);
    msg.message = read_string(data);
    // Smallest entry: two empty strings, bitmap header, capacity, two flags.
    auto count = read_count(data, 4 + 4 + 4 + 4 + 4 + 1 + 1);
    msg.seeders.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        SeederAvailability seeder;
        seeder.device = read_device(data);
        seeder.bitmap = read_bitmap(data);
        seeder.upload_capacity = read_uint32(data);
        seeder.download_complete = read_bool(data);
        seeder.reachable = read_bool(data);
        msg.seeders.push_back(std::move(seeder));
    }
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> StatusMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_status(buffer, status, message);
    return buffer;
}

StatusMessage StatusMessage::deserialize(std::span<const std::uint8_t> data) {
    StatusMessage msg;
    msg.status = read_status(data);
    msg.message = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ShareScopeResultMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_status(buffer, status, message);
    write_string_list(buffer, share_scope);
    return buffer;
}

ShareScopeResultMessage ShareScopeResultMessage::deserialize(std::span<const std::uint8_t> data) {
    ShareScopeResultMessage msg;
    msg.status = read_status(data);
    msg.message = read_string(data);
    msg.share_scope = read_string_list(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> UploaderOnlineMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_device(buffer, uploader);
    return buffer;
}

UploaderOnlineMessage UploaderOnlineMessage::deserialize(std::span<const std::uint8_t> data) {
    UploaderOnlineMessage msg;
    msg.file_id = read_string(data);
    msg.uploader = read_device(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ShareDeletedMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_string(buffer, reason);
    return buffer;
}

ShareDeletedMessage ShareDeletedMessage::deserialize(std::span<const std::uint8_t> data) {
    ShareDeletedMessage msg;
    msg.file_id = read_string(data);
    msg.reason = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> SeederRemovedMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_string(buffer, reason);
    return buffer;
}

SeederRemovedMessage SeederRemovedMessage::deserialize(std::span<const std::uint8_t> data) {
    SeederRemovedMessage msg;
    msg.file_id = read_string(data);
    msg.reason = read_string(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ShareScopeChangedMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_string_list(buffer, share_scope);
    return buffer;
}

ShareScopeChangedMessage ShareScopeChangedMessage::deserialize(std::span<const std::uint8_t> data) {
    ShareScopeChangedMessage msg;
    msg.file_id = read_string(data);
    msg.share_scope = read_string_list(data);
    expect_end(data);
    return msg;
}

std::optional<TrackerMessage> decode_tracker_message(const network::MessageHeader& header,
                                                     std::span<const std::uint8_t> payload) {
    auto type = header.known_type();
    if (!type) {
        LOG_DEBUG("Dropping frame with unknown message type 0x{:02x}", header.type);
        return std::nullopt;
    }

    try {
        switch (*type) {
            case network::MessageType::HELLO: return parse<HelloMessage>(payload);
            case network::MessageType::HELLO_ACK: return parse<HelloAckMessage>(payload);
            case network::MessageType::HEARTBEAT: return parse<HeartbeatMessage>(payload);
            case network::MessageType::ANNOUNCE: return parse<AnnounceMessage>(payload);
            case network::MessageType::REANNOUNCE: return parse<ReannounceMessage>(payload);
            case network::MessageType::CHECK_EXISTS: return parse<CheckExistsMessage>(payload);
            case network::MessageType::GET_AVAILABLE_CHUNKS: return parse<GetAvailableChunksMessage>(payload);
            case network::MessageType::DELETE_SHARE: return parse<DeleteShareMessage>(payload);
            case network::MessageType::UNANNOUNCE: return parse<UnannounceMessage>(payload);
            case network::MessageType::REGISTER_LEECHER: return parse<RegisterLeecherMessage>(payload);
            case network::MessageType::UNREGISTER_LEECHER: return parse<UnregisterLeecherMessage>(payload);
            case network::MessageType::RECORD_ACTIVITY: return parse<RecordActivityMessage>(payload);
            case network::MessageType::UPDATE_SHARE_SCOPE: return parse<UpdateShareScopeMessage>(payload);
            case network::MessageType::FILE_SUMMARY_RESULT: return parse<FileSummaryMessage>(payload);
            case network::MessageType::CHECK_EXISTS_RESULT: return parse<CheckExistsResultMessage>(payload);
            case network::MessageType::AVAILABLE_CHUNKS_RESULT: return parse<AvailableChunksMessage>(payload);
            case network::MessageType::STATUS_RESULT: return parse<StatusMessage>(payload);
            case network::MessageType::SHARE_SCOPE_RESULT: return parse<ShareScopeResultMessage>(payload);
            case network::MessageType::UPLOADER_ONLINE: return parse<UploaderOnlineMessage>(payload);
            case network::MessageType::SHARE_DELETED: return parse<ShareDeletedMessage>(payload);
            case network::MessageType::SEEDER_REMOVED: return parse<SeederRemovedMessage>(payload);
            case network::MessageType::SHARE_SCOPE_CHANGED: return parse<ShareScopeChangedMessage>(payload);
            default:
                LOG_DEBUG("Dropping non-tracker message {}", network::message_type_name(*type));
                return std::nullopt;
        }
    } catch (const std::exception& e) {
        LOG_WARN("Dropping malformed {} message: {}", network::message_type_name(*type), e.what());
        return std::nullopt;
    }
}

network::MessageType message_type_of(const TrackerMessage& message) {
    return std::visit([](const auto& msg) {
        return std::decay_t<decltype(msg)>::TYPE;
    }, message);
}

TrackerNotification to_notification(const UploaderOnlineMessage& message) {
    return UploaderOnline{message.file_id, message.uploader};
}

TrackerNotification to_notification(const ShareDeletedMessage& message) {
    return ShareDeleted{message.file_id, message.reason};
}

TrackerNotification to_notification(const SeederRemovedMessage& message) {
    return SeederRemoved{message.file_id, message.reason};
}

TrackerNotification to_notification(const ShareScopeChangedMessage& message) {
    return ShareScopeChanged{message.file_id, message.share_scope};
}

}
