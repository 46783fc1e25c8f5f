#pragma once

#include "chunkswarm/core/chunk_bitmap.hpp"
#include "chunkswarm/core/result.hpp"
#include "chunkswarm/core/types.hpp"
#include "chunkswarm/network/protocol.hpp"
#include "chunkswarm/tracker/tracker_types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace chunkswarm::tracker {

// Session handshake: binds the connection to one device.
struct HelloMessage {
    static constexpr network::MessageType TYPE = network::MessageType::HELLO;
    std::string user_id;
    std::string device_id;

    std::vector<std::uint8_t> serialize() const;
    static HelloMessage deserialize(std::span<const std::uint8_t> data);
};

struct HelloAckMessage {
    static constexpr network::MessageType TYPE = network::MessageType::HELLO_ACK;
    bool accepted = false;
    std::string message;

    std::vector<std::uint8_t> serialize() const;
    static HelloAckMessage deserialize(std::span<const std::uint8_t> data);
};

struct HeartbeatMessage {
    static constexpr network::MessageType TYPE = network::MessageType::HEARTBEAT;
    std::uint64_t timestamp = 0;

    std::vector<std::uint8_t> serialize() const;
    static HeartbeatMessage deserialize(std::span<const std::uint8_t> data);
};

struct AnnounceMessage {
    static constexpr network::MessageType TYPE = network::MessageType::ANNOUNCE;
    std::string file_id;
    core::DeviceKey device;
    std::uint64_t total_size = 0;
    std::string checksum;
    std::uint32_t chunk_count = 0;
    core::ChunkBitmap bitmap;
    std::vector<std::string> share_scope;
    std::uint32_t upload_capacity = DEFAULT_UPLOAD_CAPACITY;

    std::vector<std::uint8_t> serialize() const;
    static AnnounceMessage deserialize(std::span<const std::uint8_t> data);
};

struct ReannounceMessage {
    static constexpr network::MessageType TYPE = network::MessageType::REANNOUNCE;
    std::string file_id;
    core::DeviceKey device;
    core::ChunkBitmap bitmap;
    bool download_complete = false;

    std::vector<std::uint8_t> serialize() const;
    static ReannounceMessage deserialize(std::span<const std::uint8_t> data);
};

struct CheckExistsMessage {
    static constexpr network::MessageType TYPE = network::MessageType::CHECK_EXISTS;
    std::vector<std::string> file_ids;

    std::vector<std::uint8_t> serialize() const;
    static CheckExistsMessage deserialize(std::span<const std::uint8_t> data);
};

struct GetAvailableChunksMessage {
    static constexpr network::MessageType TYPE = network::MessageType::GET_AVAILABLE_CHUNKS;
    std::string file_id;

    std::vector<std::uint8_t> serialize() const;
    static GetAvailableChunksMessage deserialize(std::span<const std::uint8_t> data);
};

struct DeleteShareMessage {
    static constexpr network::MessageType TYPE = network::MessageType::DELETE_SHARE;
    std::string file_id;

    std::vector<std::uint8_t> serialize() const;
    static DeleteShareMessage deserialize(std::span<const std::uint8_t> data);
};

struct UnannounceMessage {
    static constexpr network::MessageType TYPE = network::MessageType::UNANNOUNCE;
    std::string file_id;

    std::vector<std::uint8_t> serialize() const;
    static UnannounceMessage deserialize(std::span<const std::uint8_t> data);
};

struct RegisterLeecherMessage {
    static constexpr network::MessageType TYPE = network::MessageType::REGISTER_LEECHER;
    std::string file_id;
    core::ChunkBitmap requested;

    std::vector<std::uint8_t> serialize() const;
    static RegisterLeecherMessage deserialize(std::span<const std::uint8_t> data);
};

struct UnregisterLeecherMessage {
    static constexpr network::MessageType TYPE = network::MessageType::UNREGISTER_LEECHER;
    std::string file_id;

    std::vector<std::uint8_t> serialize() const;
    static UnregisterLeecherMessage deserialize(std::span<const std::uint8_t> data);
};

struct RecordActivityMessage {
    static constexpr network::MessageType TYPE = network::MessageType::RECORD_ACTIVITY;
    std::string file_id;

    std::vector<std::uint8_t> serialize() const;
    static RecordActivityMessage deserialize(std::span<const std::uint8_t> data);
};

// Empty add and remove lists ask for the current scope only.
struct UpdateShareScopeMessage {
    static constexpr network::MessageType TYPE = network::MessageType::UPDATE_SHARE_SCOPE;
    std::string file_id;
    std::vector<std::string> add;
    std::vector<std::string> remove;

    std::vector<std::uint8_t> serialize() const;
    static UpdateShareScopeMessage deserialize(std::span<const std::uint8_t> data);
};

// Answer to announce and reannounce.
struct FileSummaryMessage {
    static constexpr network::MessageType TYPE = network::MessageType::FILE_SUMMARY_RESULT;
    core::ErrorCode status = core::ErrorCode::SUCCESS;
    std::string message;
    FileRecordSummary summary;

    std::vector<std::uint8_t> serialize() const;
    static FileSummaryMessage deserialize(std::span<const std::uint8_t> data);
};

struct CheckExistsResultMessage {
    static constexpr network::MessageType TYPE = network::MessageType::CHECK_EXISTS_RESULT;
    std::vector<std::string> exists;
    std::vector<std::string> missing;

    std::vector<std::uint8_t> serialize() const;
    static CheckExistsResultMessage deserialize(std::span<const std::uint8_t> data);
};

struct AvailableChunksMessage {
    static constexpr network::MessageType TYPE = network::MessageType::AVAILABLE_CHUNKS_RESULT;
    core::ErrorCode status = core::ErrorCode::SUCCESS;
    std::string message;
    std::vector<SeederAvailability> seeders;

    std::vector<std::uint8_t> serialize() const;
    static AvailableChunksMessage deserialize(std::span<const std::uint8_t> data);
};

// Bare outcome for deleteShare, unannounce, leecher and activity requests.
struct StatusMessage {
    static constexpr network::MessageType TYPE = network::MessageType::STATUS_RESULT;
    core::ErrorCode status = core::ErrorCode::SUCCESS;
    std::string message;

    std::vector<std::uint8_t> serialize() const;
    static StatusMessage deserialize(std::span<const std::uint8_t> data);
};

struct ShareScopeResultMessage {
    static constexpr network::MessageType TYPE = network::MessageType::SHARE_SCOPE_RESULT;
    core::ErrorCode status = core::ErrorCode::SUCCESS;
    std::string message;
    std::vector<std::string> share_scope;

    std::vector<std::uint8_t> serialize() const;
    static ShareScopeResultMessage deserialize(std::span<const std::uint8_t> data);
};

struct UploaderOnlineMessage {
    static constexpr network::MessageType TYPE = network::MessageType::UPLOADER_ONLINE;
    std::string file_id;
    core::DeviceKey uploader;

    std::vector<std::uint8_t> serialize() const;
    static UploaderOnlineMessage deserialize(std::span<const std::uint8_t> data);
};

struct ShareDeletedMessage {
    static constexpr network::MessageType TYPE = network::MessageType::SHARE_DELETED;
    std::string file_id;
    std::string reason;

    std::vector<std::uint8_t> serialize() const;
    static ShareDeletedMessage deserialize(std::span<const std::uint8_t> data);
};

struct SeederRemovedMessage {
    static constexpr network::MessageType TYPE = network::MessageType::SEEDER_REMOVED;
    std::string file_id;
    std::string reason;

    std::vector<std::uint8_t> serialize() const;
    static SeederRemovedMessage deserialize(std::span<const std::uint8_t> data);
};

struct ShareScopeChangedMessage {
    static constexpr network::MessageType TYPE = network::MessageType::SHARE_SCOPE_CHANGED;
    std::string file_id;
    std::vector<std::string> share_scope;

    std::vector<std::uint8_t> serialize() const;
    static ShareScopeChangedMessage deserialize(std::span<const std::uint8_t> data);
};

using TrackerMessage = std::variant<
    HelloMessage, HelloAckMessage, HeartbeatMessage,
    AnnounceMessage, ReannounceMessage, CheckExistsMessage, GetAvailableChunksMessage,
    DeleteShareMessage, UnannounceMessage, RegisterLeecherMessage, UnregisterLeecherMessage,
    RecordActivityMessage, UpdateShareScopeMessage,
    FileSummaryMessage, CheckExistsResultMessage, AvailableChunksMessage, StatusMessage,
    ShareScopeResultMessage,
    UploaderOnlineMessage, ShareDeletedMessage, SeederRemovedMessage, ShareScopeChangedMessage>;

// Parses a tracker-protocol frame. Unknown or non-tracker message types and
// malformed payloads yield nullopt and are logged, never thrown.
std::optional<TrackerMessage> decode_tracker_message(const network::MessageHeader& header,
                                                     std::span<const std::uint8_t> payload);

network::MessageType message_type_of(const TrackerMessage& message);

TrackerNotification to_notification(const UploaderOnlineMessage& message);
TrackerNotification to_notification(const ShareDeletedMessage& message);
TrackerNotification to_notification(const SeederRemovedMessage& message);
TrackerNotification to_notification(const ShareScopeChangedMessage& message);

}

static_assert(chunkswarm::network::MessagePayload<chunkswarm::tracker::AnnounceMessage>);
static_assert(chunkswarm::network::MessagePayload<chunkswarm::tracker::AvailableChunksMessage>);
static_assert(chunkswarm::network::MessagePayload<chunkswarm::tracker::ShareDeletedMessage>);
