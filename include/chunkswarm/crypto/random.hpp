#pragma once

#include "chunkswarm/crypto/crypto_types.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace chunkswarm::crypto {

// libsodium's CSPRNG. The generators throw std::runtime_error only when
// libsodium cannot be initialized.
class SecureRandom {
public:
    // Safe to call more than once.
    static bool initialize();

    static FileKey generate_file_key();
    static ChaCha20Nonce generate_nonce();
    // Lowercase hex of byte_count random bytes; file ids use the default.
    static std::string generate_id(size_t byte_count = 16);

private:
    static void fill(std::span<std::uint8_t> output, const char* what);
};

}
