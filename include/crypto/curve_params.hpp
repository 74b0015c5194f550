#ifndef WZB_CURVE_PARAMS_HPP
#define WZB_CURVE_PARAMS_HPP

#include <cstddef>
#include <string>

// Identity tag mixed into ZA when the bank does not assign one.
// 16 bytes, the SM2 standard default also used by the gateway.
constexpr const char* DEFAULT_USER_ID = "1234567812345678";

/**
 * @brief Short Weierstrass domain parameters of a 256-bit prime curve, as hex.
 *
 * Passed explicitly to everything that hashes or multiplies on the curve so a
 * sandbox environment can substitute its own parameters.
 */
struct CurveParams {
    std::string p;
    std::string a;
    std::string b;
    std::string gx;
    std::string gy;
    std::string n;

    // Width in bytes of a coordinate or scalar.
    static constexpr size_t FIELD_SIZE = 32;

    // sm2p256v1 as published in GB/T 32918.5.
    static const CurveParams& sm2p256v1();
};

#endif // WZB_CURVE_PARAMS_HPP
