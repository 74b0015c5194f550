#ifndef WZB_NONCE_SOURCE_HPP
#define WZB_NONCE_SOURCE_HPP

#include <cstdint>
#include <vector>

// Supplies the per-signature ephemeral scalar k.
// Implementations must be safe to call from several threads at once and must
// never hand out the same k twice; a repeated k reveals the private key.
class NonceSource {
public:
    virtual ~NonceSource() = default;

    // Returns a big-endian scalar uniformly distributed in [1, order - 1].
    virtual std::vector<uint8_t> draw(const std::vector<uint8_t>& order) = 0;
};

// Backed by OpenSSL's private DRBG (per-thread instances, reseeded from the OS).
class SecureNonceSource : public NonceSource {
public:
    std::vector<uint8_t> draw(const std::vector<uint8_t>& order) override;
};

#endif // WZB_NONCE_SOURCE_HPP
