#include "crypto/Hash.hpp"

#include <sodium.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

using namespace rcs::crypto;

static void ensureSodium() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) throw std::runtime_error("libsodium initialization failed");
}

std::string Hash::blake2b(const std::filesystem::path& filepath, const uintmax_t maxBytes) {
    ensureSodium();

    constexpr size_t hash_len = crypto_generichash_BYTES;
    unsigned char hash[hash_len];

    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, hash_len);

    char buffer[8192];
    uintmax_t remaining = maxBytes;
    while (remaining > 0 && file.good()) {
        const auto want = static_cast<std::streamsize>(std::min<uintmax_t>(sizeof(buffer), remaining));
        file.read(buffer, want);
        const auto got = file.gcount();
        if (got <= 0) break;
        crypto_generichash_update(&state, reinterpret_cast<unsigned char*>(buffer), static_cast<unsigned long long>(got));
        remaining -= static_cast<uintmax_t>(got);
    }

    if (file.bad()) throw std::runtime_error("Failed to read file for hashing: " + filepath.string());

    crypto_generichash_final(&state, hash, hash_len);

    std::ostringstream result;
    for (size_t i = 0; i < hash_len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return result.str();
}
