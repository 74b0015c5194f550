#include "crypto/signature.hpp"
#include "crypto/identity_digest.hpp"
#include "common/errors.hpp"
#include <openssl/ecdsa.h>
#include <stdexcept>

namespace {

struct ECDSA_SIG_Deleter { void operator()(ECDSA_SIG* s) { ECDSA_SIG_free(s); } };
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, ECDSA_SIG_Deleter>;

// r == 0, r + k == n and s == 0 each occur with probability ~2^-256; a source
// that keeps producing them is broken.
constexpr int MAX_SIGN_ATTEMPTS = 16;

bn_ptr group_order(const EC_GROUP* group) {
    bn_ptr order(BN_dup(EC_GROUP_get0_order(group)));
    if (!order) {
        throw std::runtime_error("BN_dup failed");
    }
    return order;
}

// e + x1 mod n, where x1 is the affine x coordinate of `point`.
bn_ptr mix_with_x(const EC_GROUP* group, const EC_POINT* point, const BIGNUM* e,
                  const BIGNUM* n, BN_CTX* ctx) {
    bn_ptr x1 = EcGroup::new_bn();
    if (!EC_POINT_get_affine_coordinates(group, point, x1.get(), nullptr, ctx)) {
        throw std::runtime_error("EC_POINT_get_affine_coordinates failed");
    }
    bn_ptr r = EcGroup::new_bn();
    if (!BN_mod_add(r.get(), e, x1.get(), n, ctx)) {
        throw std::runtime_error("BN_mod_add failed");
    }
    return r;
}

} // namespace

// --- Sm2Verifier ---

Sm2Verifier::Sm2Verifier(const std::vector<uint8_t>& public_key, const CurveParams& curve,
                         const std::string& user_id)
    : group_(EcGroup::create(curve)),
      order_(group_order(group_.get())),
      za_(IdentityDigest::compute(public_key, user_id, curve)) {
    std::vector<uint8_t> coords = IdentityDigest::normalize_public_key(public_key, curve);
    public_key_.reserve(coords.size() + 1);
    public_key_.push_back(0x04);
    public_key_.insert(public_key_.end(), coords.begin(), coords.end());

    bn_ctx_ptr ctx = EcGroup::new_ctx();
    point_ = EcGroup::point_from_bytes(group_.get(), public_key_, ctx.get());
    if (!point_) {
        throw SignatureError(CallPhase::VERIFY, "Public key is not a point on the curve");
    }
}

digest_t Sm2Verifier::message_digest(const std::string& message) const {
    std::vector<uint8_t> buf(za_.begin(), za_.end());
    buf.insert(buf.end(), message.begin(), message.end());
    return Hasher::sm3(buf);
}

bool Sm2Verifier::verify(const std::string& message, const std::string& signature_hex) const {
    std::vector<uint8_t> der;
    try {
        der = Hasher::from_hex(signature_hex);
    } catch (const std::invalid_argument& e) {
        throw SignatureError(CallPhase::VERIFY, std::string("Signature is not valid hex: ") + e.what());
    }

    const unsigned char* p = der.data();
    ecdsa_sig_ptr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())));
    if (!sig || p != der.data() + der.size()) {
        throw SignatureError(CallPhase::VERIFY, "Signature is not a DER SEQUENCE of two INTEGERs");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);
    const BIGNUM* n = order_.get();
    if (BN_is_zero(r) || BN_is_negative(r) || BN_cmp(r, n) >= 0 ||
        BN_is_zero(s) || BN_is_negative(s) || BN_cmp(s, n) >= 0) {
        return false;
    }

    bn_ctx_ptr ctx = EcGroup::new_ctx();
    bn_ptr t = EcGroup::new_bn();
    if (!BN_mod_add(t.get(), r, s, n, ctx.get())) {
        throw std::runtime_error("BN_mod_add failed");
    }
    if (BN_is_zero(t.get())) {
        return false;
    }

    // (x1, y1) = sG + tP
    ec_point_ptr point = EcGroup::new_point(group_.get());
    if (!EC_POINT_mul(group_.get(), point.get(), s, point_.get(), t.get(), ctx.get())) {
        throw std::runtime_error("EC_POINT_mul failed");
    }
    if (EC_POINT_is_at_infinity(group_.get(), point.get())) {
        return false;
    }

    digest_t digest = message_digest(message);
    bn_ptr e = EcGroup::bn_from_bytes(digest.data(), digest.size());
    bn_ptr expected = mix_with_x(group_.get(), point.get(), e.get(), n, ctx.get());
    return BN_cmp(expected.get(), r) == 0;
}

// --- Sm2Signer ---

bn_ptr Sm2Signer::parse_private_key(const std::string& private_key_hex, const BIGNUM* order) {
    if (private_key_hex.empty() || private_key_hex.size() > 2 * CurveParams::FIELD_SIZE) {
        throw ConfigError("SM2 private key must be 1 to 64 hex characters");
    }
    bn_ptr d;
    try {
        d = EcGroup::bn_from_hex(private_key_hex);
    } catch (const std::invalid_argument&) {
        throw ConfigError("SM2 private key is not valid hex");
    }
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);

    // d = n - 1 would make 1 + d non-invertible.
    bn_ptr upper = EcGroup::new_bn();
    if (!BN_sub(upper.get(), order, BN_value_one())) {
        throw std::runtime_error("BN_sub failed");
    }
    if (BN_is_negative(d.get()) || BN_is_zero(d.get()) || BN_cmp(d.get(), upper.get()) >= 0) {
        throw ConfigError("SM2 private key is outside [1, n-2]");
    }
    return d;
}

std::vector<uint8_t> Sm2Signer::derive_public_key(const std::string& private_key_hex, const CurveParams& curve) {
    ec_group_ptr group = EcGroup::create(curve);
    bn_ptr d = parse_private_key(private_key_hex, EC_GROUP_get0_order(group.get()));
    bn_ctx_ptr ctx = EcGroup::new_ctx();
    ec_point_ptr pub = EcGroup::new_point(group.get());
    if (!EC_POINT_mul(group.get(), pub.get(), d.get(), nullptr, nullptr, ctx.get())) {
        throw std::runtime_error("EC_POINT_mul failed");
    }
    return EcGroup::point_to_uncompressed(group.get(), pub.get(), ctx.get());
}

Sm2Signer::Sm2Signer(const std::string& private_key_hex, std::shared_ptr<NonceSource> nonce_source,
                     const CurveParams& curve, const std::string& user_id)
    : group_(EcGroup::create(curve)),
      order_(group_order(group_.get())),
      private_key_(parse_private_key(private_key_hex, order_.get())),
      inv_one_plus_d_(EcGroup::new_bn()),
      nonce_source_(std::move(nonce_source)),
      verifier_(derive_public_key(private_key_hex, curve), curve, user_id) {
    if (!nonce_source_) {
        throw ConfigError("SM2 signer requires a nonce source");
    }
    bn_ctx_ptr ctx = EcGroup::new_ctx();
    bn_ptr one_plus_d = EcGroup::new_bn();
    if (!BN_add(one_plus_d.get(), private_key_.get(), BN_value_one()) ||
        !BN_mod_inverse(inv_one_plus_d_.get(), one_plus_d.get(), order_.get(), ctx.get())) {
        throw std::runtime_error("Cannot invert 1 + d");
    }
}

std::string Sm2Signer::sign(const std::string& message) const {
    digest_t digest = verifier_.message_digest(message);
    bn_ptr e = EcGroup::bn_from_bytes(digest.data(), digest.size());
    const BIGNUM* n = order_.get();
    std::vector<uint8_t> order_bytes = EcGroup::bn_to_bytes(n, CurveParams::FIELD_SIZE);
    bn_ctx_ptr ctx = EcGroup::new_ctx();

    for (int attempt = 0; attempt < MAX_SIGN_ATTEMPTS; ++attempt) {
        std::vector<uint8_t> k_bytes = nonce_source_->draw(order_bytes);
        bn_ptr k = EcGroup::bn_from_bytes(k_bytes.data(), k_bytes.size());
        BN_set_flags(k.get(), BN_FLG_CONSTTIME);
        if (BN_is_zero(k.get()) || BN_cmp(k.get(), n) >= 0) {
            throw SignatureError(CallPhase::SIGN, "Nonce source returned a scalar outside [1, n-1]");
        }

        ec_point_ptr kg = EcGroup::new_point(group_.get());
        if (!EC_POINT_mul(group_.get(), kg.get(), k.get(), nullptr, nullptr, ctx.get())) {
            throw std::runtime_error("EC_POINT_mul failed");
        }

        // r = (e + x1) mod n
        bn_ptr r = mix_with_x(group_.get(), kg.get(), e.get(), n, ctx.get());
        bn_ptr r_plus_k = EcGroup::new_bn();
        if (!BN_add(r_plus_k.get(), r.get(), k.get())) {
            throw std::runtime_error("BN_add failed");
        }
        if (BN_is_zero(r.get()) || BN_cmp(r_plus_k.get(), n) == 0) {
            continue;
        }

        // s = (1 + d)^-1 * (k - r*d) mod n
        bn_ptr rd = EcGroup::new_bn();
        bn_ptr k_minus_rd = EcGroup::new_bn();
        bn_ptr s = EcGroup::new_bn();
        if (!BN_mod_mul(rd.get(), r.get(), private_key_.get(), n, ctx.get()) ||
            !BN_mod_sub(k_minus_rd.get(), k.get(), rd.get(), n, ctx.get()) ||
            !BN_mod_mul(s.get(), inv_one_plus_d_.get(), k_minus_rd.get(), n, ctx.get())) {
            throw std::runtime_error("SM2 scalar arithmetic failed");
        }
        if (BN_is_zero(s.get())) {
            continue;
        }

        ecdsa_sig_ptr sig(ECDSA_SIG_new());
        if (!sig || !ECDSA_SIG_set0(sig.get(), r.get(), s.get())) {
            throw std::runtime_error("ECDSA_SIG_set0 failed");
        }
        // Ownership of r and s moved into sig.
        r.release();
        s.release();

        int der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
        if (der_len <= 0) {
            throw std::runtime_error("i2d_ECDSA_SIG failed");
        }
        std::vector<uint8_t> der(static_cast<size_t>(der_len));
        unsigned char* out = der.data();
        if (i2d_ECDSA_SIG(sig.get(), &out) != der_len) {
            throw std::runtime_error("i2d_ECDSA_SIG failed");
        }
        return Hasher::to_hex(der);
    }
    throw SignatureError(CallPhase::SIGN, "Nonce source failed to yield a usable nonce");
}
