#include "chunkswarm/crypto/random.hpp"
#include "chunkswarm/crypto/hash.hpp"
#include "chunkswarm/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace chunkswarm::crypto {

bool SecureRandom::initialize() {
    // sodium_init() is itself idempotent and thread safe; 1 means already done.
    static const bool ready = [] {
        if (sodium_init() < 0) {
            LOG_ERROR("libsodium failed to initialize");
            return false;
        }
        LOG_DEBUG("libsodium ready");
        return true;
    }();
    return ready;
}

void SecureRandom::fill(std::span<std::uint8_t> output, const char* what) {
    if (!initialize()) {
        throw std::runtime_error(std::string("Cannot generate ") + what + ": libsodium unavailable");
    }
    randombytes_buf(output.data(), output.size());
}

FileKey SecureRandom::generate_file_key() {
    FileKey key;
    fill(key, "file key");
    return key;
}

ChaCha20Nonce SecureRandom::generate_nonce() {
    ChaCha20Nonce nonce;
    fill(nonce, "nonce");
    return nonce;
}

std::string SecureRandom::generate_id(size_t byte_count) {
    std::vector<std::uint8_t> bytes(byte_count);
    fill(bytes, "identifier");
    return hash_utils::to_hex(bytes);
}

}
