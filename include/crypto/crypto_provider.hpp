#ifndef WZB_CRYPTO_PROVIDER_HPP
#define WZB_CRYPTO_PROVIDER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nonce_source.hpp"
#include "signature.hpp"
#include "sm4_codec.hpp"

/**
 * @brief The four primitive operations the gateway protocol needs.
 *
 * BankClient only talks to this interface, so an alternate backend (HSM,
 * hardware token, test double) can be dropped in without touching the call flow.
 */
class CryptoProvider {
public:
    virtual ~CryptoProvider() = default;

    // Returns the signature text the gateway expects in x-aob-signature.
    virtual std::string sign(const std::string& data) const = 0;

    // True if `signature` is the bank's signature over `data`.
    virtual bool verify(const std::string& data, const std::string& signature) const = 0;

    // Returns the hex ciphertext carried in bizContent.
    virtual std::string encrypt(const std::string& plaintext) const = 0;

    virtual std::vector<uint8_t> decrypt(const std::string& cipher_hex) const = 0;
};

// Hex-encoded key material as provisioned by the bank.
struct KeyMaterial {
    std::string sm2_private_key;
    std::string sm2_bank_public_key;  // optional; needed only to verify responses
    std::string sm4_key;
    std::string sm4_iv;
};

// SM2 (sign/verify over SM3 with ZA), SM4-CBC (encrypt/decrypt) on OpenSSL.
class SmCryptoProvider : public CryptoProvider {
public:
    // Throws ConfigError for missing or malformed key material.
    explicit SmCryptoProvider(const KeyMaterial& keys,
                              std::shared_ptr<NonceSource> nonce_source = std::make_shared<SecureNonceSource>(),
                              const CurveParams& curve = CurveParams::sm2p256v1(),
                              const std::string& user_id = DEFAULT_USER_ID);

    std::string sign(const std::string& data) const override;

    // Throws ConfigError when no bank public key was configured.
    bool verify(const std::string& data, const std::string& signature) const override;

    std::string encrypt(const std::string& plaintext) const override;
    std::vector<uint8_t> decrypt(const std::string& cipher_hex) const override;

    const Sm2Signer& signer() const { return signer_; }
    const Sm4Codec& codec() const { return codec_; }

private:
    Sm2Signer signer_;
    std::optional<Sm2Verifier> bank_verifier_;
    Sm4Codec codec_;
};

#endif // WZB_CRYPTO_PROVIDER_HPP
