#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace chunkswarm::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x43535752; // "CSWR"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 32;
constexpr std::uint32_t MAX_PAYLOAD_SIZE = 4 * 1024 * 1024;

enum class MessageType : std::uint8_t {
    HELLO                   = 0x01,
    HELLO_ACK               = 0x02,
    HEARTBEAT               = 0x03,

    ANNOUNCE                = 0x10,
    REANNOUNCE              = 0x11,
    CHECK_EXISTS            = 0x12,
    GET_AVAILABLE_CHUNKS    = 0x13,
    DELETE_SHARE            = 0x14,
    UNANNOUNCE              = 0x15,
    REGISTER_LEECHER        = 0x16,
    UNREGISTER_LEECHER      = 0x17,
    RECORD_ACTIVITY         = 0x18,
    UPDATE_SHARE_SCOPE      = 0x19,

    FILE_SUMMARY_RESULT     = 0x20,
    CHECK_EXISTS_RESULT     = 0x21,
    AVAILABLE_CHUNKS_RESULT = 0x22,
    STATUS_RESULT           = 0x23,
    SHARE_SCOPE_RESULT      = 0x24,

    UPLOADER_ONLINE         = 0x30,
    SHARE_DELETED           = 0x31,
    SEEDER_REMOVED          = 0x32,
    SHARE_SCOPE_CHANGED     = 0x33,

    CHUNK_REQUEST           = 0x40,
    CHUNK_DATA              = 0x41,
    CHUNK_UNAVAILABLE       = 0x42,
    DOWNLOAD_COMPLETE       = 0x43
};

std::optional<MessageType> to_message_type(std::uint8_t raw);
std::string_view message_type_name(MessageType type);

enum class MessageFlags : std::uint8_t {
    NONE            = 0x00,
    RESPONSE        = 0x01
};

struct MessageHeader {
    std::uint32_t magic;
    std::uint16_t version;
    std::uint8_t type;             // raw so unknown types survive parsing
    MessageFlags flags;
    std::uint64_t message_id;      // request id; responses echo it
    std::uint32_t payload_size;
    std::uint64_t timestamp;       // unix nanoseconds
    std::array<std::uint8_t, 4> checksum; // CRC32 of payload

    MessageHeader();
    MessageHeader(MessageType msg_type, std::uint32_t payload_len);

    bool is_valid() const;
    std::optional<MessageType> known_type() const { return to_message_type(type); }
    void calculate_checksum(std::span<const std::uint8_t> payload);
    bool verify_checksum(std::span<const std::uint8_t> payload) const;

    std::vector<std::uint8_t> serialize() const;
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
};

template<typename T>
concept MessagePayload = requires(const T t) {
    { T::TYPE } -> std::convertible_to<MessageType>;
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
};

std::uint32_t crc32(std::span<const std::uint8_t> data);
std::uint64_t next_message_id();

}
