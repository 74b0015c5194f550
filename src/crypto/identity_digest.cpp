#include "crypto/identity_digest.hpp"
#include "crypto/ec_group.hpp"
#include "common/errors.hpp"

namespace IdentityDigest {

namespace {
    constexpr size_t COORDS_SIZE = 2 * CurveParams::FIELD_SIZE;

    void append_field(std::vector<uint8_t>& out, const std::string& hex) {
        bn_ptr value = EcGroup::bn_from_hex(hex);
        std::vector<uint8_t> bytes = EcGroup::bn_to_bytes(value.get(), CurveParams::FIELD_SIZE);
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
}

std::vector<uint8_t> normalize_public_key(const std::vector<uint8_t>& public_key, const CurveParams& curve) {
    if (public_key.size() == COORDS_SIZE + 1 && public_key[0] == 0x04) {
        return std::vector<uint8_t>(public_key.begin() + 1, public_key.end());
    }
    if (public_key.size() == COORDS_SIZE) {
        return public_key;
    }
    if (public_key.size() == CurveParams::FIELD_SIZE + 1 &&
        (public_key[0] == 0x02 || public_key[0] == 0x03)) {
        ec_group_ptr group = EcGroup::create(curve);
        bn_ctx_ptr ctx = EcGroup::new_ctx();
        ec_point_ptr point = EcGroup::point_from_bytes(group.get(), public_key, ctx.get());
        if (!point) {
            throw SignatureError(CallPhase::VERIFY, "Compressed public key is not on the curve");
        }
        std::vector<uint8_t> uncompressed = EcGroup::point_to_uncompressed(group.get(), point.get(), ctx.get());
        return std::vector<uint8_t>(uncompressed.begin() + 1, uncompressed.end());
    }
    throw SignatureError(CallPhase::VERIFY,
                         "Unsupported public key encoding of " + std::to_string(public_key.size()) + " bytes");
}

digest_t compute(const std::vector<uint8_t>& public_key, const std::string& user_id, const CurveParams& curve) {
    // ENTL is 16 bits wide.
    if (user_id.size() > 0xFFFF / 8) {
        throw SignatureError(CallPhase::SIGN, "Identity tag is too long");
    }
    std::vector<uint8_t> coords = normalize_public_key(public_key, curve);

    uint16_t entl = static_cast<uint16_t>(user_id.size() * 8);
    std::vector<uint8_t> msg;
    msg.reserve(2 + user_id.size() + 6 * CurveParams::FIELD_SIZE);
    msg.push_back(static_cast<uint8_t>(entl >> 8));
    msg.push_back(static_cast<uint8_t>(entl & 0xFF));
    msg.insert(msg.end(), user_id.begin(), user_id.end());
    append_field(msg, curve.a);
    append_field(msg, curve.b);
    append_field(msg, curve.gx);
    append_field(msg, curve.gy);
    msg.insert(msg.end(), coords.begin(), coords.end());

    return Hasher::sm3(msg);
}

} // namespace IdentityDigest
