#ifndef WZB_IDENTITY_DIGEST_HPP
#define WZB_IDENTITY_DIGEST_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "curve_params.hpp"
#include "hasher.hpp"

namespace IdentityDigest {

/**
 * @brief Normalizes a public key to the bare 64-byte X || Y form.
 *
 * Accepts 04 || X || Y (65 bytes), X || Y (64 bytes) and compressed
 * 02/03 || X (33 bytes), which is decompressed on the given curve.
 * @throws SignatureError if the encoding has any other shape or is off the curve.
 */
std::vector<uint8_t> normalize_public_key(const std::vector<uint8_t>& public_key,
                                          const CurveParams& curve = CurveParams::sm2p256v1());

/**
 * @brief Computes ZA = SM3(ENTL || ID || a || b || Gx || Gy || Px || Py).
 *
 * ENTL is the bit length of the identity tag as a 2-byte big-endian integer.
 * Depends only on the public key, tag and curve, so callers may cache it per key pair.
 */
digest_t compute(const std::vector<uint8_t>& public_key,
                 const std::string& user_id = DEFAULT_USER_ID,
                 const CurveParams& curve = CurveParams::sm2p256v1());

} // namespace IdentityDigest

#endif // WZB_IDENTITY_DIGEST_HPP
