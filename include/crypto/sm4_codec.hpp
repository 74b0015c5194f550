#ifndef WZB_SM4_CODEC_HPP
#define WZB_SM4_CODEC_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "../common/canonical_json.hpp"

// SM4-CBC with PKCS#7 padding under a key and IV fixed for the codec's lifetime.
// Ciphertexts travel as uppercase hex.
class Sm4Codec {
public:
    static constexpr size_t KEY_SIZE = 16;
    static constexpr size_t IV_SIZE = 16;

    // Throws ConfigError unless both are exactly 16 bytes.
    Sm4Codec(std::vector<uint8_t> key, std::vector<uint8_t> iv);
    Sm4Codec(const std::string& key_hex, const std::string& iv_hex);
    ~Sm4Codec();

    Sm4Codec(const Sm4Codec&) = default;
    Sm4Codec& operator=(const Sm4Codec&) = default;

    std::string encrypt(const std::string& plaintext) const;
    std::string encrypt(const std::vector<uint8_t>& plaintext) const;

    // Throws DecryptError on bad hex, bad length or bad padding.
    std::vector<uint8_t> decrypt(const std::string& cipher_hex) const;

    /**
     * @brief Canonical-encodes a business body and encrypts it into a bizContent value.
     */
    std::string encrypt_body(const FieldMap& body) const;

    /**
     * @brief Reverses encrypt_body. Every failure, including non-JSON plaintext,
     * surfaces as DecryptError.
     */
    FieldMap decrypt_body(const std::string& cipher_hex) const;

private:
    std::vector<uint8_t> key_;
    std::vector<uint8_t> iv_;
};

#endif // WZB_SM4_CODEC_HPP
