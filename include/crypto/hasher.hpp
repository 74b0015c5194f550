#ifndef WZB_HASHER_HPP
#define WZB_HASHER_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// SM3 produces a 32-byte digest.
constexpr size_t DIGEST_SIZE = 32;
using digest_t = std::array<uint8_t, DIGEST_SIZE>;

namespace Hasher {

/**
 * @brief Calculates the SM3 digest of a data buffer.
 * @param data The data to hash.
 * @return A 32-byte SM3 digest.
 */
digest_t sm3(const std::vector<uint8_t>& data);

    // SM3 of a string's raw bytes
    digest_t sm3(const std::string& data);

    // Uppercase hex, the form the gateway uses for ciphertexts and signatures
    std::string to_hex(const uint8_t* data, size_t len);
    std::string to_hex(const std::vector<uint8_t>& data);
    std::string to_hex(const digest_t& digest);

    // Accepts upper or lower case; throws std::invalid_argument on odd length or non-hex input
    std::vector<uint8_t> from_hex(const std::string& hex);

} // namespace Hasher

#endif //WZB_HASHER_HPP
