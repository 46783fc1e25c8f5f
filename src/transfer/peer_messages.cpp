#include "chunkswarm/transfer/peer_messages.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/network/wire.hpp"

namespace chunkswarm::transfer {

using namespace network::wire;

std::vector<std::uint8_t> ChunkRequestMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_uint32(buffer, chunk_index);
    return buffer;
}

ChunkRequestMessage ChunkRequestMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkRequestMessage msg;
    msg.file_id = read_string(data);
    msg.chunk_index = read_uint32(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ChunkDataMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(file_id.size() + chunk.total_size() + 16);
    write_string(buffer, file_id);
    write_uint32(buffer, chunk_index);
    write_raw(buffer, chunk.nonce);
    write_raw(buffer, chunk.tag);
    write_bytes(buffer, chunk.ciphertext);
    return buffer;
}

ChunkDataMessage ChunkDataMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkDataMessage msg;
    msg.file_id = read_string(data);
    msg.chunk_index = read_uint32(data);
    msg.chunk.nonce = read_array<crypto::CHACHA20_NONCE_SIZE>(data);
    msg.chunk.tag = read_array<crypto::AEAD_TAG_SIZE>(data);
    msg.chunk.ciphertext = read_bytes(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> ChunkUnavailableMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_uint32(buffer, chunk_index);
    return buffer;
}

ChunkUnavailableMessage ChunkUnavailableMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkUnavailableMessage msg;
    msg.file_id = read_string(data);
    msg.chunk_index = read_uint32(data);
    expect_end(data);
    return msg;
}

std::vector<std::uint8_t> DownloadCompleteMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    return buffer;
}

DownloadCompleteMessage DownloadCompleteMessage::deserialize(std::span<const std::uint8_t> data) {
    DownloadCompleteMessage msg;
    msg.file_id = read_string(data);
    expect_end(data);
    return msg;
}

PeerFrame encode_peer_message(const PeerMessage& message) {
    return std::visit([](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        PeerFrame frame;
        frame.payload = msg.serialize();
        frame.header = network::MessageHeader(T::TYPE, static_cast<std::uint32_t>(frame.payload.size()));
        frame.header.calculate_checksum(frame.payload);
        return frame;
    }, message);
}

std::optional<PeerMessage> decode_peer_message(const network::MessageHeader& header,
                                               std::span<const std::uint8_t> payload) {
    auto type = header.known_type();
    if (!type) {
        LOG_DEBUG("Dropping peer frame with unknown type 0x{:02x}", header.type);
        return std::nullopt;
    }

    try {
        switch (*type) {
            case network::MessageType::CHUNK_REQUEST:
                return PeerMessage(ChunkRequestMessage::deserialize(payload));
            case network::MessageType::CHUNK_DATA:
                return PeerMessage(ChunkDataMessage::deserialize(payload));
            case network::MessageType::CHUNK_UNAVAILABLE:
                return PeerMessage(ChunkUnavailableMessage::deserialize(payload));
            case network::MessageType::DOWNLOAD_COMPLETE:
                return PeerMessage(DownloadCompleteMessage::deserialize(payload));
            default:
                LOG_DEBUG("Dropping non-peer message {} on peer channel", network::message_type_name(*type));
                return std::nullopt;
        }
    } catch (const std::exception& e) {
        LOG_WARN("Dropping malformed {} from peer: {}", network::message_type_name(*type), e.what());
        return std::nullopt;
    }
}

const std::string& file_id_of(const PeerMessage& message) {
    return std::visit([](const auto& msg) -> const std::string& { return msg.file_id; }, message);
}

} // namespace chunkswarm::transfer
