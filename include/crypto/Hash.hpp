#pragma once

#include <cstdint>
#include <string>
#include <filesystem>

namespace rcs::crypto {

class Hash {
public:
    // BLAKE2b over at most maxBytes leading bytes of the file, hex encoded.
    static std::string blake2b(const std::filesystem::path& filepath, uintmax_t maxBytes);
};

}
