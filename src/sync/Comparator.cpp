#include "sync/Comparator.hpp"
#include "crypto/Hash.hpp"
#include "fs/ops.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace rcs::sync;
using namespace rcs::crypto;
using namespace rcs::log;

Comparator::Comparator(const uintmax_t prefixBytes) : prefixBytes_(prefixBytes) {
    if (prefixBytes_ == 0) throw std::invalid_argument("Comparator: prefix length must be greater than zero");
}

bool Comparator::differs(const std::filesystem::path& a, const std::filesystem::path& b) const {
    if (!fs::ops::isFile(a) || !fs::ops::isFile(b)) return true;

    std::error_code ecA, ecB;
    const auto sizeA = std::filesystem::file_size(a, ecA);
    const auto sizeB = std::filesystem::file_size(b, ecB);
    if (ecA || ecB) {
        Registry::sync()->warn("Cannot stat {} or {}: {}", a.string(), b.string(), (ecA ? ecA : ecB).message());
        return true;
    }

    if (sizeA != sizeB) return true;

    try {
        return Hash::blake2b(a, prefixBytes_) != Hash::blake2b(b, prefixBytes_);
    } catch (const std::exception& e) {
        Registry::sync()->warn("Content comparison failed, treating as changed: {}", e.what());
        return true;
    }
}
