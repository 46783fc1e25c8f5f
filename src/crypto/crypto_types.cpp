#include "chunkswarm/crypto/crypto_types.hpp"
#include <sodium.h>

namespace chunkswarm::crypto {

ScopedFileKey::~ScopedFileKey() {
    wipe(std::span(key_));
}

void wipe(std::span<std::uint8_t> bytes) {
    if (!bytes.empty()) {
        sodium_memzero(bytes.data(), bytes.size());
    }
}

}
