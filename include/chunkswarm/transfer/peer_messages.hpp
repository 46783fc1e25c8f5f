#pragma once

#include "chunkswarm/crypto/encryption.hpp"
#include "chunkswarm/network/protocol.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace chunkswarm::transfer {

struct ChunkRequestMessage {
    static constexpr network::MessageType TYPE = network::MessageType::CHUNK_REQUEST;
    std::string file_id;
    std::uint32_t chunk_index = 0;

    std::vector<std::uint8_t> serialize() const;
    static ChunkRequestMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkDataMessage {
    static constexpr network::MessageType TYPE = network::MessageType::CHUNK_DATA;
    std::string file_id;
    std::uint32_t chunk_index = 0;
    crypto::EncryptedChunk chunk;

    std::vector<std::uint8_t> serialize() const;
    static ChunkDataMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkUnavailableMessage {
    static constexpr network::MessageType TYPE = network::MessageType::CHUNK_UNAVAILABLE;
    std::string file_id;
    std::uint32_t chunk_index = 0;

    std::vector<std::uint8_t> serialize() const;
    static ChunkUnavailableMessage deserialize(std::span<const std::uint8_t> data);
};

// Sent by a downloader entering its drain phase so seeders can drop queued sends.
struct DownloadCompleteMessage {
    static constexpr network::MessageType TYPE = network::MessageType::DOWNLOAD_COMPLETE;
    std::string file_id;

    std::vector<std::uint8_t> serialize() const;
    static DownloadCompleteMessage deserialize(std::span<const std::uint8_t> data);
};

using PeerMessage = std::variant<ChunkRequestMessage, ChunkDataMessage,
                                 ChunkUnavailableMessage, DownloadCompleteMessage>;

struct PeerFrame {
    network::MessageHeader header;
    std::vector<std::uint8_t> payload;
};

PeerFrame encode_peer_message(const PeerMessage& message);

// Unknown, non-peer and malformed frames yield nullopt and are logged.
std::optional<PeerMessage> decode_peer_message(const network::MessageHeader& header,
                                               std::span<const std::uint8_t> payload);

const std::string& file_id_of(const PeerMessage& message);

} // namespace chunkswarm::transfer

static_assert(chunkswarm::network::MessagePayload<chunkswarm::transfer::ChunkDataMessage>);
static_assert(chunkswarm::network::MessagePayload<chunkswarm::transfer::DownloadCompleteMessage>);
