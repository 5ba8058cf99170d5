#include "memocache/key/KeyNormalizer.hpp"
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace memocache {
namespace key {

std::string KeyNormalizer::normalize(const std::string& logicalKey, std::uint64_t generation) {
    const std::string value = "g" + std::to_string(generation) + ":" + logicalKey;

    SHA512_CTX sha512;
    unsigned char hash[SHA512_DIGEST_LENGTH];

    SHA512_Init(&sha512);
    SHA512_Update(&sha512, value.data(), value.size());
    SHA512_Final(hash, &sha512);

    std::stringstream ss;
    for (int i = 0; i < SHA512_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace key
} // namespace memocache
