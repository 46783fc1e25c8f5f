#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <span>
#include <string>
#include <vector>

// Big-endian field codec shared by the tracker and peer message formats.
// Readers consume from the front of the span and throw WireError on
// malformed input; callers catch at the message boundary.
namespace chunkswarm::network::wire {

class WireError : public std::runtime_error {
public:
    WireError(const char* field, const char* problem)
        : std::runtime_error(std::string(field) + ": " + problem) {}
};

constexpr std::uint32_t MAX_STRING_SIZE = 1024 * 1024;
constexpr std::uint32_t MAX_LIST_SIZE = 1 << 20;
// Matches the frame payload limit; a byte field can never exceed its frame.
constexpr std::uint32_t MAX_PAYLOAD_BYTES = 4 * 1024 * 1024;

void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value);
void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value);
void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value);
void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value);
void write_bool(std::vector<std::uint8_t>& buffer, bool value);
void write_string(std::vector<std::uint8_t>& buffer, const std::string& str);
void write_bytes(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> data);
void write_raw(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> data);
void write_string_list(std::vector<std::uint8_t>& buffer, const std::vector<std::string>& list);

std::uint8_t read_uint8(std::span<const std::uint8_t>& data);
std::uint16_t read_uint16(std::span<const std::uint8_t>& data);
std::uint32_t read_uint32(std::span<const std::uint8_t>& data);
std::uint64_t read_uint64(std::span<const std::uint8_t>& data);
bool read_bool(std::span<const std::uint8_t>& data);
std::string read_string(std::span<const std::uint8_t>& data);
std::vector<std::uint8_t> read_bytes(std::span<const std::uint8_t>& data);
std::vector<std::string> read_string_list(std::span<const std::uint8_t>& data);
// Count prefix for a list; rejects counts that cannot fit in the remaining input.
std::uint32_t read_count(std::span<const std::uint8_t>& data, size_t min_element_size);

void expect_end(std::span<const std::uint8_t> data);

template<size_t N>
std::array<std::uint8_t, N> read_array(std::span<const std::uint8_t>& data) {
    if (data.size() < N) throw WireError("fixed field", "truncated");
    std::array<std::uint8_t, N> out;
    std::copy_n(data.begin(), N, out.begin());
    data = data.subspan(N);
    return out;
}

}
