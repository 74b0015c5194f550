#include "crypto/sm4_codec.hpp"
#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace {

struct EVP_CIPHER_CTX_Deleter { void operator()(EVP_CIPHER_CTX* c) { EVP_CIPHER_CTX_free(c); } };

std::vector<uint8_t> parse_hex_key(const std::string& hex, const char* what) {
    try {
        return Hasher::from_hex(hex);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string(what) + " is not valid hex: " + e.what());
    }
}

} // namespace

Sm4Codec::Sm4Codec(std::vector<uint8_t> key, std::vector<uint8_t> iv)
    : key_(std::move(key)), iv_(std::move(iv)) {
    if (key_.size() != KEY_SIZE) {
        throw ConfigError("SM4 key must be " + std::to_string(KEY_SIZE) + " bytes, got " + std::to_string(key_.size()));
    }
    if (iv_.size() != IV_SIZE) {
        throw ConfigError("SM4 IV must be " + std::to_string(IV_SIZE) + " bytes, got " + std::to_string(iv_.size()));
    }
}

Sm4Codec::Sm4Codec(const std::string& key_hex, const std::string& iv_hex)
    : Sm4Codec(parse_hex_key(key_hex, "SM4 key"), parse_hex_key(iv_hex, "SM4 IV")) {}

Sm4Codec::~Sm4Codec() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

std::string Sm4Codec::encrypt(const std::string& plaintext) const {
    return encrypt(std::vector<uint8_t>(plaintext.begin(), plaintext.end()));
}

std::string Sm4Codec::encrypt(const std::vector<uint8_t>& plaintext) const {
    std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw EncryptError("EVP_CIPHER_CTX_new failed");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_sm4_cbc(), nullptr, key_.data(), iv_.data()) != 1) {
        throw EncryptError("SM4-CBC encrypt init failed");
    }

    // Padding always adds between 1 and 16 bytes.
    std::vector<uint8_t> ct(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ct.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            throw EncryptError("SM4-CBC EncryptUpdate failed");
        }
    }
    int flen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), ct.data() + len, &flen) != 1) {
        throw EncryptError("SM4-CBC EncryptFinal failed");
    }
    ct.resize(static_cast<size_t>(len + flen));
    return Hasher::to_hex(ct);
}

std::vector<uint8_t> Sm4Codec::decrypt(const std::string& cipher_hex) const {
    std::vector<uint8_t> ct;
    try {
        ct = Hasher::from_hex(cipher_hex);
    } catch (const std::invalid_argument& e) {
        throw DecryptError(std::string("bizContent is not valid hex: ") + e.what());
    }
    if (ct.empty() || ct.size() % IV_SIZE != 0) {
        throw DecryptError("Ciphertext length " + std::to_string(ct.size()) + " is not a positive multiple of the block size");
    }

    std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw DecryptError("EVP_CIPHER_CTX_new failed");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_sm4_cbc(), nullptr, key_.data(), iv_.data()) != 1) {
        throw DecryptError("SM4-CBC decrypt init failed");
    }

    std::vector<uint8_t> pt(ct.size() + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), pt.data(), &len, ct.data(), static_cast<int>(ct.size())) != 1) {
        throw DecryptError("SM4-CBC DecryptUpdate failed");
    }
    int flen = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), pt.data() + len, &flen) != 1) {
        throw DecryptError("SM4-CBC padding check failed (wrong key/IV or corrupted ciphertext)");
    }
    pt.resize(static_cast<size_t>(len + flen));
    return pt;
}

std::string Sm4Codec::encrypt_body(const FieldMap& body) const {
    return encrypt(CanonicalJson::encode(body));
}

FieldMap Sm4Codec::decrypt_body(const std::string& cipher_hex) const {
    std::vector<uint8_t> plaintext = decrypt(cipher_hex);
    try {
        return CanonicalJson::decode(plaintext);
    } catch (const DecodeError& e) {
        throw DecryptError(std::string("Decrypted bizContent is not JSON: ") + e.what());
    }
}
