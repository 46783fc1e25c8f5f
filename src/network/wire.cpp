#include "chunkswarm/network/wire.hpp"
#include <type_traits>

namespace chunkswarm::network::wire {

namespace {

template<typename T>
void put_be(std::vector<std::uint8_t>& buffer, T value) {
    static_assert(std::is_unsigned_v<T>);
    for (int shift = (sizeof(T) - 1) * 8; shift >= 0; shift -= 8) {
        buffer.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

template<typename T>
T take_be(std::span<const std::uint8_t>& data, const char* field) {
    static_assert(std::is_unsigned_v<T>);
    if (data.size() < sizeof(T)) {
        throw WireError(field, "truncated");
    }
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | data[i]);
    }
    data = data.subspan(sizeof(T));
    return value;
}

std::span<const std::uint8_t> take_sized(std::span<const std::uint8_t>& data, std::uint32_t limit,
                                         const char* field) {
    auto length = take_be<std::uint32_t>(data, field);
    if (length > limit) {
        throw WireError(field, "length over limit");
    }
    if (length > data.size()) {
        throw WireError(field, "truncated");
    }
    auto body = data.first(length);
    data = data.subspan(length);
    return body;
}

}

void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
    buffer.push_back(value);
}

void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
    put_be(buffer, value);
}

void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
    put_be(buffer, value);
}

void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
    put_be(buffer, value);
}

void write_bool(std::vector<std::uint8_t>& buffer, bool value) {
    buffer.push_back(value ? 1 : 0);
}

void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
    put_be(buffer, static_cast<std::uint32_t>(str.size()));
    buffer.insert(buffer.end(), str.begin(), str.end());
}

void write_bytes(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> data) {
    put_be(buffer, static_cast<std::uint32_t>(data.size()));
    write_raw(buffer, data);
}

void write_raw(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> data) {
    buffer.insert(buffer.end(), data.begin(), data.end());
}

void write_string_list(std::vector<std::uint8_t>& buffer, const std::vector<std::string>& list) {
    put_be(buffer, static_cast<std::uint32_t>(list.size()));
    for (const auto& item : list) {
        write_string(buffer, item);
    }
}

std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
    return take_be<std::uint8_t>(data, "uint8");
}

std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
    return take_be<std::uint16_t>(data, "uint16");
}

std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
    return take_be<std::uint32_t>(data, "uint32");
}

std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
    return take_be<std::uint64_t>(data, "uint64");
}

bool read_bool(std::span<const std::uint8_t>& data) {
    switch (take_be<std::uint8_t>(data, "bool")) {
        case 0: return false;
        case 1: return true;
        default: throw WireError("bool", "not 0 or 1");
    }
}

std::string read_string(std::span<const std::uint8_t>& data) {
    auto body = take_sized(data, MAX_STRING_SIZE, "string");
    return std::string(body.begin(), body.end());
}

std::vector<std::uint8_t> read_bytes(std::span<const std::uint8_t>& data) {
    auto body = take_sized(data, MAX_PAYLOAD_BYTES, "bytes");
    return std::vector<std::uint8_t>(body.begin(), body.end());
}

std::uint32_t read_count(std::span<const std::uint8_t>& data, size_t min_element_size) {
    auto count = take_be<std::uint32_t>(data, "list count");
    if (count > MAX_LIST_SIZE || (min_element_size > 0 && count > data.size() / min_element_size)) {
        throw WireError("list count", "exceeds remaining data");
    }
    return count;
}

std::vector<std::string> read_string_list(std::span<const std::uint8_t>& data) {
    auto count = read_count(data, sizeof(std::uint32_t));
    std::vector<std::string> list;
    list.reserve(count);
    while (count-- > 0) {
        list.push_back(read_string(data));
    }
    return list;
}

void expect_end(std::span<const std::uint8_t> data) {
    if (!data.empty()) {
        throw WireError("message", "trailing bytes");
    }
}

}
