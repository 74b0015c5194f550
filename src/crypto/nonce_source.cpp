#include "crypto/nonce_source.hpp"
#include "crypto/ec_group.hpp"
#include <stdexcept>

std::vector<uint8_t> SecureNonceSource::draw(const std::vector<uint8_t>& order) {
    bn_ptr n = EcGroup::bn_from_bytes(order.data(), order.size());
    if (BN_cmp(n.get(), BN_value_one()) <= 0) {
        throw std::invalid_argument("Group order must be greater than one");
    }

    // k = 1 + uniform[0, n - 2]
    bn_ptr range = EcGroup::new_bn();
    if (!BN_sub(range.get(), n.get(), BN_value_one())) {
        throw std::runtime_error("BN_sub failed");
    }
    bn_ptr k = EcGroup::new_bn();
    BN_set_flags(k.get(), BN_FLG_CONSTTIME);
    if (!BN_priv_rand_range(k.get(), range.get())) {
        throw std::runtime_error("BN_priv_rand_range failed");
    }
    if (!BN_add_word(k.get(), 1)) {
        throw std::runtime_error("BN_add_word failed");
    }
    return EcGroup::bn_to_bytes(k.get(), order.size());
}
