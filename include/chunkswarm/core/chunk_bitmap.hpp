#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunkswarm::core {

// Fixed-length set of chunk indices. Serialized MSB-first per byte so
// index 0 is the high bit of the first byte.
class ChunkBitmap {
public:
    ChunkBitmap() = default;
    explicit ChunkBitmap(std::uint32_t chunk_count, bool all_set = false);

    static ChunkBitmap full(std::uint32_t chunk_count) { return ChunkBitmap(chunk_count, true); }
    static std::optional<ChunkBitmap> from_bytes(std::uint32_t chunk_count, std::span<const std::uint8_t> bytes);
    static ChunkBitmap from_indices(std::uint32_t chunk_count, const std::vector<std::uint32_t>& indices);

    std::uint32_t size() const { return chunk_count_; }
    bool test(std::uint32_t index) const;
    // Returns false if the bit was already set or the index is out of range.
    bool set(std::uint32_t index);
    void reset(std::uint32_t index);
    void clear();

    std::uint32_t count() const { return set_count_; }
    bool complete() const { return chunk_count_ > 0 && set_count_ == chunk_count_; }
    bool none() const { return set_count_ == 0; }

    std::vector<std::uint32_t> set_indices() const;
    std::vector<std::uint32_t> missing_indices() const;
    ChunkBitmap& merge(const ChunkBitmap& other);

    const std::vector<std::uint8_t>& bytes() const { return bits_; }
    std::string to_string() const;

    bool operator==(const ChunkBitmap& other) const {
        return chunk_count_ == other.chunk_count_ && bits_ == other.bits_;
    }

private:
    std::uint32_t chunk_count_ = 0;
    std::uint32_t set_count_ = 0;
    std::vector<std::uint8_t> bits_;
};

}
