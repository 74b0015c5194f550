#include "crypto/hasher.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <memory>

namespace Hasher {

// Helper deleter
struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };

digest_t sm3(const std::vector<uint8_t>& data) {
    digest_t digest;
    std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter> ctx(EVP_MD_CTX_new());

    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    if (!EVP_DigestInit_ex(ctx.get(), EVP_sm3(), NULL)) {
        throw std::runtime_error("EVP_DigestInit_ex(SM3) failed");
    }

    if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }

    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) || len != DIGEST_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    return digest;
}

digest_t sm3(const std::string& data) {
    std::vector<uint8_t> data_vec(data.begin(), data.end());
    return sm3(data_vec);
}

std::string to_hex(const uint8_t* data, size_t len) {
    static const char kDigits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

std::string to_hex(const digest_t& digest) {
    return to_hex(digest.data(), digest.size());
}

namespace {
    int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::vector<uint8_t> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length");
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character at offset " + std::to_string(i));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace Hasher
