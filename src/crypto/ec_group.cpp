#include "crypto/ec_group.hpp"
#include <stdexcept>

namespace EcGroup {

bn_ptr new_bn() {
    bn_ptr bn(BN_new());
    if (!bn) {
        throw std::runtime_error("BN_new failed");
    }
    return bn;
}

bn_ctx_ptr new_ctx() {
    bn_ctx_ptr ctx(BN_CTX_new());
    if (!ctx) {
        throw std::runtime_error("BN_CTX_new failed");
    }
    return ctx;
}

ec_point_ptr new_point(const EC_GROUP* group) {
    ec_point_ptr point(EC_POINT_new(group));
    if (!point) {
        throw std::runtime_error("EC_POINT_new failed");
    }
    return point;
}

bn_ptr bn_from_hex(const std::string& hex) {
    // BN_hex2bn would also take a leading '-'.
    if (hex.empty() || hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        throw std::invalid_argument("Invalid hex integer");
    }
    BIGNUM* raw = nullptr;
    int consumed = BN_hex2bn(&raw, hex.c_str());
    bn_ptr bn(raw);
    if (!bn || consumed <= 0 || static_cast<size_t>(consumed) != hex.size()) {
        throw std::invalid_argument("Invalid hex integer");
    }
    return bn;
}

bn_ptr bn_from_bytes(const uint8_t* data, size_t len) {
    bn_ptr bn(BN_bin2bn(data, static_cast<int>(len), nullptr));
    if (!bn) {
        throw std::runtime_error("BN_bin2bn failed");
    }
    return bn;
}

std::vector<uint8_t> bn_to_bytes(const BIGNUM* bn, size_t width) {
    std::vector<uint8_t> out(width, 0);
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(width)) < 0) {
        throw std::runtime_error("Integer does not fit in " + std::to_string(width) + " bytes");
    }
    return out;
}

ec_group_ptr create(const CurveParams& params) {
    bn_ptr p = bn_from_hex(params.p);
    bn_ptr a = bn_from_hex(params.a);
    bn_ptr b = bn_from_hex(params.b);
    bn_ptr gx = bn_from_hex(params.gx);
    bn_ptr gy = bn_from_hex(params.gy);
    bn_ptr n = bn_from_hex(params.n);
    bn_ctx_ptr ctx = new_ctx();

    ec_group_ptr group(EC_GROUP_new_curve_GFp(p.get(), a.get(), b.get(), ctx.get()));
    if (!group) {
        throw std::runtime_error("EC_GROUP_new_curve_GFp failed");
    }

    ec_point_ptr generator = new_point(group.get());
    if (!EC_POINT_set_affine_coordinates(group.get(), generator.get(), gx.get(), gy.get(), ctx.get())) {
        throw std::runtime_error("Generator is not on the curve");
    }

    bn_ptr cofactor = new_bn();
    BN_one(cofactor.get());
    if (!EC_GROUP_set_generator(group.get(), generator.get(), n.get(), cofactor.get())) {
        throw std::runtime_error("EC_GROUP_set_generator failed");
    }
    return group;
}

std::vector<uint8_t> point_to_uncompressed(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
    bn_ptr x = new_bn();
    bn_ptr y = new_bn();
    if (!EC_POINT_get_affine_coordinates(group, point, x.get(), y.get(), ctx)) {
        throw std::runtime_error("EC_POINT_get_affine_coordinates failed");
    }

    std::vector<uint8_t> out;
    out.reserve(1 + 2 * CurveParams::FIELD_SIZE);
    out.push_back(0x04);
    std::vector<uint8_t> xb = bn_to_bytes(x.get(), CurveParams::FIELD_SIZE);
    std::vector<uint8_t> yb = bn_to_bytes(y.get(), CurveParams::FIELD_SIZE);
    out.insert(out.end(), xb.begin(), xb.end());
    out.insert(out.end(), yb.begin(), yb.end());
    return out;
}

ec_point_ptr point_from_bytes(const EC_GROUP* group, const std::vector<uint8_t>& encoded, BN_CTX* ctx) {
    ec_point_ptr point = new_point(group);
    if (encoded.empty() ||
        !EC_POINT_oct2point(group, point.get(), encoded.data(), encoded.size(), ctx)) {
        return nullptr;
    }
    if (EC_POINT_is_at_infinity(group, point.get())) {
        return nullptr;
    }
    return point;
}

} // namespace EcGroup
