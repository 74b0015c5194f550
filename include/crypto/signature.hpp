#ifndef WZB_SIGNATURE_HPP
#define WZB_SIGNATURE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "curve_params.hpp"
#include "ec_group.hpp"
#include "hasher.hpp"
#include "nonce_source.hpp"

// Verifies SM2 signatures made with one public key. ZA is computed once at construction.
class Sm2Verifier {
public:
    // Throws SignatureError if the key is malformed or not on the curve.
    Sm2Verifier(const std::vector<uint8_t>& public_key,
                const CurveParams& curve = CurveParams::sm2p256v1(),
                const std::string& user_id = DEFAULT_USER_ID);

    const std::vector<uint8_t>& public_key() const { return public_key_; }
    const digest_t& identity_digest() const { return za_; }

    // e = SM3(ZA || message)
    digest_t message_digest(const std::string& message) const;

    /**
     * @brief Checks a DER-encoded, hex SM2 signature over a message.
     * @return false for a well-formed signature that does not match.
     * @throws SignatureError if the hex or DER structure is malformed.
     */
    bool verify(const std::string& message, const std::string& signature_hex) const;

private:
    ec_group_ptr group_;
    bn_ptr order_;
    ec_point_ptr point_;
    std::vector<uint8_t> public_key_;  // 04 || X || Y
    digest_t za_;
};

// Signs with a fixed SM2 private key. Safe for concurrent use as long as the nonce source is.
class Sm2Signer {
public:
    // Throws ConfigError unless the key is hex for a scalar in [1, n - 2].
    Sm2Signer(const std::string& private_key_hex,
              std::shared_ptr<NonceSource> nonce_source = std::make_shared<SecureNonceSource>(),
              const CurveParams& curve = CurveParams::sm2p256v1(),
              const std::string& user_id = DEFAULT_USER_ID);

    // P = dG as 04 || X || Y.
    static std::vector<uint8_t> derive_public_key(const std::string& private_key_hex,
                                                  const CurveParams& curve = CurveParams::sm2p256v1());

    const std::vector<uint8_t>& public_key() const { return verifier_.public_key(); }
    const digest_t& identity_digest() const { return verifier_.identity_digest(); }

    /**
     * @brief Signs SM3(ZA || message) with a fresh nonce.
     * @return Uppercase hex of DER SEQUENCE { INTEGER r, INTEGER s }.
     */
    std::string sign(const std::string& message) const;

    bool verify(const std::string& message, const std::string& signature_hex) const {
        return verifier_.verify(message, signature_hex);
    }

private:
    static bn_ptr parse_private_key(const std::string& private_key_hex, const BIGNUM* order);

    ec_group_ptr group_;
    bn_ptr order_;
    bn_ptr private_key_;
    bn_ptr inv_one_plus_d_;  // (1 + d)^-1 mod n
    std::shared_ptr<NonceSource> nonce_source_;
    Sm2Verifier verifier_;
};

#endif // WZB_SIGNATURE_HPP
