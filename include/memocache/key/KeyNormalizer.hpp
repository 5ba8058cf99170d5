#pragma once

#include <cstdint>
#include <string>

namespace memocache {
namespace key {

// KeyNormalizer maps a logical key and a cache generation to the key actually
// stored in memcached: lowercase hex SHA-512 of "g<generation>:<logicalKey>".
// The result is always kNormalizedKeyLength characters, which keeps it under
// the memcached 250-byte key limit and free of whitespace/control characters.
// Bumping the generation makes every previously stored entry unreachable.
class KeyNormalizer {
public:
    static constexpr size_t kNormalizedKeyLength = 128;

    explicit KeyNormalizer(std::uint64_t generation = 1) : generation_(generation) {}

    std::string normalize(const std::string& logicalKey) const {
        return normalize(logicalKey, generation_);
    }

    static std::string normalize(const std::string& logicalKey, std::uint64_t generation);

    std::uint64_t generation() const { return generation_; }

private:
    std::uint64_t generation_;
};

} // namespace key
} // namespace memocache
