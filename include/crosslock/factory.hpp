#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include "crosslock/types.hpp"
#include "crosslock/addressing.hpp"
#include "crosslock/escrow.hpp"
#include "crosslock/immutables.hpp"
#include "crosslock/registry.hpp"

namespace crosslock {

/**
 * @brief Conventional distances between stages the fill callback derives
 */
struct TimelockGaps {
    uint32_t src_public_withdrawal{0};     // after src withdrawal
    uint32_t src_public_cancellation{60};  // after src cancellation
    uint32_t dst_public_withdrawal{60};    // after dst withdrawal
};

struct FactoryConfig {
    Address owner;
    Address order_protocol;      // Only caller of on_fill_completed
    Address access_token;        // Capability token for public actions
    uint32_t src_rescue_delay{604800};
    uint32_t dst_rescue_delay{604800};
    TimelockGaps gaps;
};

/**
 * @brief Minimal view of a filled limit order
 */
struct Order {
    uint64_t salt{0};
    Address maker;
    Address receiver;            // Zero = maker receives on the destination chain
    Address maker_asset;
    Address taker_asset;
    uint64_t making_amount{0};
    uint64_t taking_amount{0};

    Hash256 hash() const;
};

/**
 * @brief Source-leg parameters derived from a fill
 */
struct FillPlan {
    Immutables immutables;                // Stamped with the deployment time
    DstImmutablesComplement complement;
    Address escrow;
};

/**
 * @brief Deploys and tracks the escrows of one chain
 *
 * Escrow addresses are content-addressed: a pure function of the factory
 * address, the role's implementation hash and the Immutables digest.
 * Factories configured alike on two chains share all three inputs, so a
 * resolver can predict the destination address before the source leg is
 * even created. Pausing stops creation only; deployed escrows keep
 * serving withdraw, cancel and rescue.
 */
class EscrowFactory {
public:
    EscrowFactory(std::shared_ptr<EscrowEnvironment> env, std::shared_ptr<Registry> registry,
                  FactoryConfig config);

    const Address& address() const { return address_; }
    const FactoryConfig& config() const { return config_; }

    // Rebuild live escrows from their persisted records
    size_t load();

    Implementation implementation(EscrowRole role) const;
    Address predict_address(const Immutables& immutables, EscrowRole role) const;

    // Order-protocol callback; deploys the source escrow
    Address on_fill_completed(const CallContext& ctx, const Order& order, const Address& taker,
                              uint64_t making_amount, uint64_t taking_amount,
                              const Bytes& extra_data);

    // Source immutables, complement and address a fill at `now` would produce
    FillPlan plan_fill(const Order& order, const Address& taker, uint64_t making_amount,
                       uint64_t taking_amount, const ExtraData& extra, uint64_t now) const;

    // Resolver entry point; `native_value` is the native amount attached
    // to the call and must equal the safety deposit, plus the amount when
    // the token is native
    Address create_dst_escrow(const CallContext& ctx, const Immutables& immutables,
                              uint64_t src_cancellation_timestamp, uint64_t native_value);

    std::optional<Address> escrow_for(const Hash256& hashlock) const;
    // Throws UnknownEscrow
    std::shared_ptr<Escrow> escrow_at(const Address& address) const;
    size_t escrow_count() const;

    // Owner-only administration
    void set_paused(const CallContext& ctx, bool paused);
    void add_resolver(const CallContext& ctx, const Address& resolver);
    void remove_resolver(const CallContext& ctx, const Address& resolver);
    void set_whitelist_bypass(const CallContext& ctx, bool bypass);

private:
    void check_owner(const CallContext& ctx) const;
    void check_creation_open(const Address& resolver) const;
    void deploy(EscrowRole role, const Address& escrow, const Immutables& immutables,
                Log created);

    // Native value a new escrow must hold; throws InsufficientEscrowBalance
    // when the total does not fit the native range
    static uint64_t native_required(const Immutables& immutables);

    std::shared_ptr<EscrowEnvironment> env_;
    std::shared_ptr<Registry> registry_;
    FactoryConfig config_;
    Address address_;

    std::mutex creation_mutex_;  // One creation at a time
    mutable std::shared_mutex escrows_mutex_;
    std::map<Address, std::shared_ptr<Escrow>> escrows_;
};

} // namespace crosslock
