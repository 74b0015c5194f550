#ifndef WZB_EC_GROUP_HPP
#define WZB_EC_GROUP_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/bn.h>
#include <openssl/ec.h>

#include "curve_params.hpp"

// Helper deleters for unique_ptr
struct BN_Deleter { void operator()(BIGNUM* b) { BN_clear_free(b); } };
struct BN_CTX_Deleter { void operator()(BN_CTX* c) { BN_CTX_free(c); } };
struct EC_GROUP_Deleter { void operator()(EC_GROUP* g) { EC_GROUP_free(g); } };
struct EC_POINT_Deleter { void operator()(EC_POINT* p) { EC_POINT_clear_free(p); } };

using bn_ptr = std::unique_ptr<BIGNUM, BN_Deleter>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, BN_CTX_Deleter>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, EC_GROUP_Deleter>;
using ec_point_ptr = std::unique_ptr<EC_POINT, EC_POINT_Deleter>;

namespace EcGroup {

// Builds a prime-field group with generator and order from explicit parameters.
ec_group_ptr create(const CurveParams& params);

bn_ptr new_bn();
bn_ctx_ptr new_ctx();
ec_point_ptr new_point(const EC_GROUP* group);

bn_ptr bn_from_hex(const std::string& hex);
bn_ptr bn_from_bytes(const uint8_t* data, size_t len);

// Big-endian, left-padded with zeros to exactly `width` bytes.
std::vector<uint8_t> bn_to_bytes(const BIGNUM* bn, size_t width);

// Returns 04 || X || Y, each coordinate FIELD_SIZE bytes.
std::vector<uint8_t> point_to_uncompressed(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx);

// Parses an encoded point; returns nullptr if it is malformed or off the curve.
ec_point_ptr point_from_bytes(const EC_GROUP* group, const std::vector<uint8_t>& encoded, BN_CTX* ctx);

} // namespace EcGroup

#endif // WZB_EC_GROUP_HPP
