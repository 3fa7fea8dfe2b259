#pragma once

#include <cstdint>
#include "crosslock/types.hpp"

namespace crosslock {

enum class EscrowRole : uint8_t {
    Source = 1,
    Destination = 2
};

const char* role_name(EscrowRole role);

/**
 * @brief Identity of the escrow logic a factory deploys for one role
 *
 * Two factories configured alike (same role, rescue delay and access
 * token) share the implementation hash, which is what lets both chains
 * derive identical escrow addresses.
 */
struct Implementation {
    EscrowRole role{EscrowRole::Source};
    uint32_t rescue_delay{0};
    Address access_token;

    Hash256 hash() const;
};

/**
 * @brief Deterministic deployment addresses
 *
 * address = Blake2b256(0xff || deployer || salt || implementation)[0:28],
 * typed Script. A pure function of its inputs, independent of any
 * chain state.
 */
class ProxyAddressing {
public:
    static Address compute(const Address& deployer, const Hash256& salt,
                           const Hash256& implementation);

    // Address of a contract deployed by a key-controlled account
    static Address deployed_by(const Address& owner, uint64_t nonce);
};

} // namespace crosslock
