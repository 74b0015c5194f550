#include "crypto/crypto_provider.hpp"
#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include <stdexcept>

namespace {

const std::string& require(const std::string& value, const char* name) {
    if (value.empty()) {
        throw ConfigError(std::string("Missing key material: ") + name);
    }
    return value;
}

std::optional<Sm2Verifier> make_bank_verifier(const std::string& public_key_hex, const CurveParams& curve,
                                              const std::string& user_id) {
    if (public_key_hex.empty()) {
        return std::nullopt;
    }
    try {
        return Sm2Verifier(Hasher::from_hex(public_key_hex), curve, user_id);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("Bank public key is not valid hex: ") + e.what());
    } catch (const SignatureError& e) {
        throw ConfigError(std::string("Bank public key is unusable: ") + e.what());
    }
}

} // namespace

SmCryptoProvider::SmCryptoProvider(const KeyMaterial& keys, std::shared_ptr<NonceSource> nonce_source,
                                   const CurveParams& curve, const std::string& user_id)
    : signer_(require(keys.sm2_private_key, "sm2_private_key"), std::move(nonce_source), curve, user_id),
      bank_verifier_(make_bank_verifier(keys.sm2_bank_public_key, curve, user_id)),
      codec_(require(keys.sm4_key, "sm4_key"), require(keys.sm4_iv, "sm4_iv")) {}

std::string SmCryptoProvider::sign(const std::string& data) const {
    try {
        return signer_.sign(data);
    } catch (const BankError&) {
        throw;
    } catch (const std::exception& e) {
        throw SignatureError(CallPhase::SIGN, std::string("SM2 signing failed: ") + e.what());
    }
}

bool SmCryptoProvider::verify(const std::string& data, const std::string& signature) const {
    if (!bank_verifier_) {
        throw ConfigError("Response carries a signature but no bank public key is configured");
    }
    try {
        return bank_verifier_->verify(data, signature);
    } catch (const BankError&) {
        throw;
    } catch (const std::exception& e) {
        throw SignatureError(CallPhase::VERIFY, std::string("SM2 verification failed: ") + e.what());
    }
}

std::string SmCryptoProvider::encrypt(const std::string& plaintext) const {
    return codec_.encrypt(plaintext);
}

std::vector<uint8_t> SmCryptoProvider::decrypt(const std::string& cipher_hex) const {
    return codec_.decrypt(cipher_hex);
}
