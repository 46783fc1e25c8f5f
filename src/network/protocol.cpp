#include "chunkswarm/network/protocol.hpp"
#include "chunkswarm/network/wire.hpp"
#include <atomic>
#include <chrono>
#include <random>

namespace chunkswarm::network {

namespace {

constexpr std::array<std::uint32_t, 256> make_crc_table() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
        }
        table[i] = c;
    }
    return table;
}

constexpr auto CRC_TABLE = make_crc_table();

std::uint64_t get_timestamp_ns() {
    auto now = std::chrono::system_clock::now();
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count());
}

}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    std::uint32_t crc = 0xFFFFFFFF;
    for (auto byte : data) {
        crc = CRC_TABLE[(crc ^ byte) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

std::uint64_t next_message_id() {
    static std::atomic<std::uint64_t> counter{[] {
        std::random_device rd;
        return (static_cast<std::uint64_t>(rd()) << 32) | 1;
    }()};
    return counter.fetch_add(1);
}

std::optional<MessageType> to_message_type(std::uint8_t raw) {
    switch (static_cast<MessageType>(raw)) {
        case MessageType::HELLO:
        case MessageType::HELLO_ACK:
        case MessageType::HEARTBEAT:
        case MessageType::ANNOUNCE:
        case MessageType::REANNOUNCE:
        case MessageType::CHECK_EXISTS:
        case MessageType::GET_AVAILABLE_CHUNKS:
        case MessageType::DELETE_SHARE:
        case MessageType::UNANNOUNCE:
        case MessageType::REGISTER_LEECHER:
        case MessageType::UNREGISTER_LEECHER:
        case MessageType::RECORD_ACTIVITY:
        case MessageType::UPDATE_SHARE_SCOPE:
        case MessageType::FILE_SUMMARY_RESULT:
        case MessageType::CHECK_EXISTS_RESULT:
        case MessageType::AVAILABLE_CHUNKS_RESULT:
        case MessageType::STATUS_RESULT:
        case MessageType::SHARE_SCOPE_RESULT:
        case MessageType::UPLOADER_ONLINE:
        case MessageType::SHARE_DELETED:
        case MessageType::SEEDER_REMOVED:
        case MessageType::SHARE_SCOPE_CHANGED:
        case MessageType::CHUNK_REQUEST:
        case MessageType::CHUNK_DATA:
        case MessageType::CHUNK_UNAVAILABLE:
        case MessageType::DOWNLOAD_COMPLETE:
            return static_cast<MessageType>(raw);
    }
    return std::nullopt;
}

std::string_view message_type_name(MessageType type) {
    switch (type) {
        case MessageType::HELLO: return "hello";
        case MessageType::HELLO_ACK: return "hello_ack";
        case MessageType::HEARTBEAT: return "heartbeat";
        case MessageType::ANNOUNCE: return "announce";
        case MessageType::REANNOUNCE: return "reannounce";
        case MessageType::CHECK_EXISTS: return "check_exists";
        case MessageType::GET_AVAILABLE_CHUNKS: return "get_available_chunks";
        case MessageType::DELETE_SHARE: return "delete_share";
        case MessageType::UNANNOUNCE: return "unannounce";
        case MessageType::REGISTER_LEECHER: return "register_leecher";
        case MessageType::UNREGISTER_LEECHER: return "unregister_leecher";
        case MessageType::RECORD_ACTIVITY: return "record_activity";
        case MessageType::UPDATE_SHARE_SCOPE: return "update_share_scope";
        case MessageType::FILE_SUMMARY_RESULT: return "file_summary_result";
        case MessageType::CHECK_EXISTS_RESULT: return "check_exists_result";
        case MessageType::AVAILABLE_CHUNKS_RESULT: return "available_chunks_result";
        case MessageType::STATUS_RESULT: return "status_result";
        case MessageType::SHARE_SCOPE_RESULT: return "share_scope_result";
        case MessageType::UPLOADER_ONLINE: return "uploader_online";
        case MessageType::SHARE_DELETED: return "share_deleted";
        case MessageType::SEEDER_REMOVED: return "seeder_removed";
        case MessageType::SHARE_SCOPE_CHANGED: return "share_scope_changed";
        case MessageType::CHUNK_REQUEST: return "chunk_request";
        case MessageType::CHUNK_DATA: return "chunk_data";
        case MessageType::CHUNK_UNAVAILABLE: return "chunk_unavailable";
        case MessageType::DOWNLOAD_COMPLETE: return "download_complete";
    }
    return "unknown";
}

MessageHeader::MessageHeader()
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(static_cast<std::uint8_t>(MessageType::HEARTBEAT))
    , flags(MessageFlags::NONE)
    , message_id(next_message_id())
    , payload_size(0)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

MessageHeader::MessageHeader(MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(static_cast<std::uint8_t>(msg_type))
    , flags(MessageFlags::NONE)
    , message_id(next_message_id())
    , payload_size(payload_len)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

bool MessageHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION && payload_size <= MAX_PAYLOAD_SIZE;
}

void MessageHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    auto crc = crc32(payload);
    checksum[0] = (crc >> 24) & 0xFF;
    checksum[1] = (crc >> 16) & 0xFF;
    checksum[2] = (crc >> 8) & 0xFF;
    checksum[3] = crc & 0xFF;
}

bool MessageHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    auto actual_crc = (static_cast<std::uint32_t>(checksum[0]) << 24) |
                      (static_cast<std::uint32_t>(checksum[1]) << 16) |
                      (static_cast<std::uint32_t>(checksum[2]) << 8) |
                      static_cast<std::uint32_t>(checksum[3]);
    return crc32(payload) == actual_crc;
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);

    wire::write_uint32(buffer, magic);
    wire::write_uint16(buffer, version);
    wire::write_uint8(buffer, type);
    wire::write_uint8(buffer, static_cast<std::uint8_t>(flags));
    wire::write_uint64(buffer, message_id);
    wire::write_uint32(buffer, payload_size);
    wire::write_uint64(buffer, timestamp);
    buffer.insert(buffer.end(), checksum.begin(), checksum.end());

    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for message header");
    }

    MessageHeader header;
    auto span = data;

    header.magic = wire::read_uint32(span);
    header.version = wire::read_uint16(span);
    header.type = wire::read_uint8(span);
    header.flags = static_cast<MessageFlags>(wire::read_uint8(span));
    header.message_id = wire::read_uint64(span);
    header.payload_size = wire::read_uint32(span);
    header.timestamp = wire::read_uint64(span);
    header.checksum = wire::read_array<4>(span);

    return header;
}

}
