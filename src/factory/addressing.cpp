#include "crosslock/addressing.hpp"
#include "crosslock/crypto.hpp"
#include <algorithm>

namespace crosslock {

const char* role_name(EscrowRole role) {
    switch (role) {
        case EscrowRole::Source: return "EscrowSrc";
        case EscrowRole::Destination: return "EscrowDst";
    }
    return "Unknown";
}

Hash256 Implementation::hash() const {
    std::string name = role_name(role);
    Bytes preimage(name.begin(), name.end());
    append_uint32(preimage, rescue_delay);
    append_address(preimage, access_token);
    return crypto::Blake2b256::hash(preimage);
}

static Address script_address(const Hash256& hash) {
    Address addr;
    addr.type = Address::Type::Script;
    std::copy(hash.begin(), hash.begin() + Address::SIZE, addr.payment_credential.begin());
    return addr;
}

Address ProxyAddressing::compute(const Address& deployer, const Hash256& salt,
                                 const Hash256& implementation) {
    Bytes preimage;
    preimage.reserve(1 + 1 + Address::SIZE + 2 * 32);
    preimage.push_back(0xff);
    append_address(preimage, deployer);
    preimage.insert(preimage.end(), salt.begin(), salt.end());
    preimage.insert(preimage.end(), implementation.begin(), implementation.end());
    return script_address(crypto::Blake2b256::hash(preimage));
}

Address ProxyAddressing::deployed_by(const Address& owner, uint64_t nonce) {
    // Blake2b of credential + nonce
    Bytes preimage(owner.payment_credential.begin(), owner.payment_credential.end());
    append_uint64(preimage, nonce);
    return script_address(crypto::Blake2b256::hash(preimage));
}

} // namespace crosslock
