#include "chunkswarm/core/chunk_bitmap.hpp"
#include <algorithm>
#include <bit>

namespace chunkswarm::core {

namespace {

constexpr std::uint8_t mask_for(std::uint32_t index) {
    return static_cast<std::uint8_t>(0x80u >> (index % 8));
}

}

ChunkBitmap::ChunkBitmap(std::uint32_t chunk_count, bool all_set)
    : chunk_count_(chunk_count), bits_((chunk_count + 7) / 8, 0) {
    if (all_set) {
        for (std::uint32_t i = 0; i < chunk_count_; ++i) {
            bits_[i / 8] |= mask_for(i);
        }
        set_count_ = chunk_count_;
    }
}

std::optional<ChunkBitmap> ChunkBitmap::from_bytes(std::uint32_t chunk_count,
                                                   std::span<const std::uint8_t> bytes) {
    if (bytes.size() != (chunk_count + 7) / 8) {
        return std::nullopt;
    }

    ChunkBitmap bitmap(chunk_count);
    for (std::uint32_t i = 0; i < chunk_count; ++i) {
        if (bytes[i / 8] & mask_for(i)) {
            bitmap.set(i);
        }
    }

    // Padding bits past chunk_count must be zero.
    if (chunk_count % 8 != 0 && !bytes.empty()) {
        std::uint8_t padding = static_cast<std::uint8_t>(0xFFu >> (chunk_count % 8));
        if (bytes.back() & padding) {
            return std::nullopt;
        }
    }
    return bitmap;
}

ChunkBitmap ChunkBitmap::from_indices(std::uint32_t chunk_count, const std::vector<std::uint32_t>& indices) {
    ChunkBitmap bitmap(chunk_count);
    for (auto index : indices) {
        bitmap.set(index);
    }
    return bitmap;
}

bool ChunkBitmap::test(std::uint32_t index) const {
    if (index >= chunk_count_) {
        return false;
    }
    return (bits_[index / 8] & mask_for(index)) != 0;
}

bool ChunkBitmap::set(std::uint32_t index) {
    if (index >= chunk_count_ || test(index)) {
        return false;
    }
    bits_[index / 8] |= mask_for(index);
    ++set_count_;
    return true;
}

void ChunkBitmap::reset(std::uint32_t index) {
    if (!test(index)) {
        return;
    }
    bits_[index / 8] &= static_cast<std::uint8_t>(~mask_for(index));
    --set_count_;
}

void ChunkBitmap::clear() {
    std::fill(bits_.begin(), bits_.end(), 0);
    set_count_ = 0;
}

std::vector<std::uint32_t> ChunkBitmap::set_indices() const {
    std::vector<std::uint32_t> result;
    result.reserve(set_count_);
    for (std::uint32_t i = 0; i < chunk_count_; ++i) {
        if (test(i)) {
            result.push_back(i);
        }
    }
    return result;
}

std::vector<std::uint32_t> ChunkBitmap::missing_indices() const {
    std::vector<std::uint32_t> result;
    result.reserve(chunk_count_ - set_count_);
    for (std::uint32_t i = 0; i < chunk_count_; ++i) {
        if (!test(i)) {
            result.push_back(i);
        }
    }
    return result;
}

ChunkBitmap& ChunkBitmap::merge(const ChunkBitmap& other) {
    if (other.chunk_count_ != chunk_count_) {
        return *this;
    }
    set_count_ = 0;
    for (size_t i = 0; i < bits_.size(); ++i) {
        bits_[i] |= other.bits_[i];
        set_count_ += static_cast<std::uint32_t>(std::popcount(bits_[i]));
    }
    return *this;
}

std::string ChunkBitmap::to_string() const {
    std::string out;
    out.reserve(chunk_count_);
    for (std::uint32_t i = 0; i < chunk_count_; ++i) {
        out.push_back(test(i) ? '1' : '0');
    }
    return out;
}

}
