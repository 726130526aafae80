#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <filesystem>

namespace rcs::sync {

// Fast equality heuristic for two same-named track files: size first, then a
// BLAKE2b signature over a bounded prefix. Edits past the prefix with an
// unchanged size go unnoticed.
class Comparator {
public:
    explicit Comparator(uintmax_t prefixBytes = config::DEFAULT_SIGNATURE_PREFIX_BYTES);

    // Absent or unreadable files count as differing.
    [[nodiscard]] bool differs(const std::filesystem::path& a, const std::filesystem::path& b) const;

    [[nodiscard]] uintmax_t prefixBytes() const { return prefixBytes_; }

private:
    uintmax_t prefixBytes_;
};

}
