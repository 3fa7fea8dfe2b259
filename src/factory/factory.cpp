#include "crosslock/factory.hpp"
#include "crosslock/errors.hpp"
#include "crosslock/logging.hpp"
#include <limits>

namespace crosslock {

// ============================================================================
// Order Implementation
// ============================================================================

Hash256 Order::hash() const {
    Bytes data;
    append_uint64(data, salt);
    append_address(data, maker);
    append_address(data, receiver);
    append_address(data, maker_asset);
    append_address(data, taker_asset);
    append_uint64(data, making_amount);
    append_uint64(data, taking_amount);
    return crypto::Blake2b256::hash(data);
}

// ============================================================================
// EscrowFactory Implementation
// ============================================================================

EscrowFactory::EscrowFactory(std::shared_ptr<EscrowEnvironment> env,
                             std::shared_ptr<Registry> registry, FactoryConfig config)
    : env_(std::move(env)),
      registry_(std::move(registry)),
      config_(std::move(config)),
      address_(ProxyAddressing::deployed_by(config_.owner, 0)) {
    logging::info("FACTORY", "Factory " + address_.to_hex() + " on chain " +
                  std::to_string(env_->chain_id));
}

size_t EscrowFactory::load() {
    std::unique_lock lock(escrows_mutex_);
    escrows_.clear();

    for (const auto& [key, value] : env_->db->scan(Bytes{'S'})) {
        Bytes suffix(key.begin() + 1, key.end());
        Reader reader(suffix);
        auto escrow = reader.read_address();
        auto rec = EscrowRecord::decode(value);
        if (!escrow || !rec) {
            logging::warn("FACTORY", "Skipping malformed escrow record");
            continue;
        }

        std::shared_ptr<Escrow> instance;
        if (rec->role == EscrowRole::Source) {
            instance = std::make_shared<EscrowSrc>(env_, *escrow, rec->immutables_digest,
                                                   rec->rescue_delay, rec->state);
        } else {
            instance = std::make_shared<EscrowDst>(env_, *escrow, rec->immutables_digest,
                                                   rec->rescue_delay, rec->state);
        }
        escrows_[*escrow] = instance;
    }

    logging::info("FACTORY", "Loaded " + std::to_string(escrows_.size()) + " escrows");
    return escrows_.size();
}

Implementation EscrowFactory::implementation(EscrowRole role) const {
    Implementation impl;
    impl.role = role;
    impl.rescue_delay = role == EscrowRole::Source ? config_.src_rescue_delay
                                                   : config_.dst_rescue_delay;
    impl.access_token = config_.access_token;
    return impl;
}

Address EscrowFactory::predict_address(const Immutables& immutables, EscrowRole role) const {
    return ProxyAddressing::compute(address_, immutables.hash(), implementation(role).hash());
}

FillPlan EscrowFactory::plan_fill(const Order& order, const Address& taker,
                                  uint64_t making_amount, uint64_t taking_amount,
                                  const ExtraData& extra, uint64_t now) const {
    constexpr uint64_t MAX_OFFSET = std::numeric_limits<uint32_t>::max();

    if (now > MAX_OFFSET) {
        throw Error(ErrorCode::InvalidCreationTime, "timestamp beyond 32 bits");
    }
    if (extra.src_cancellation_timestamp <= now || extra.dst_withdrawal_timestamp < now) {
        throw Error(ErrorCode::InvalidCreationTime, "timestamps already passed");
    }

    const auto& gaps = config_.gaps;
    uint64_t src_cancellation = extra.src_cancellation_timestamp - now;
    uint64_t dst_withdrawal = extra.dst_withdrawal_timestamp - now;
    if (src_cancellation + gaps.src_public_cancellation > MAX_OFFSET ||
        dst_withdrawal + gaps.dst_public_withdrawal > MAX_OFFSET) {
        throw Error(ErrorCode::InvalidCreationTime, "offset beyond 32 bits");
    }

    Timelocks::Offsets offsets{};
    offsets[static_cast<size_t>(Stage::SrcWithdrawal)] = 0;
    offsets[static_cast<size_t>(Stage::SrcPublicWithdrawal)] = gaps.src_public_withdrawal;
    offsets[static_cast<size_t>(Stage::SrcCancellation)] = static_cast<uint32_t>(src_cancellation);
    offsets[static_cast<size_t>(Stage::SrcPublicCancellation)] =
        static_cast<uint32_t>(src_cancellation + gaps.src_public_cancellation);
    offsets[static_cast<size_t>(Stage::DstWithdrawal)] = static_cast<uint32_t>(dst_withdrawal);
    offsets[static_cast<size_t>(Stage::DstPublicWithdrawal)] =
        static_cast<uint32_t>(dst_withdrawal + gaps.dst_public_withdrawal);
    // Destination cancellation shares the source cancellation instant
    offsets[static_cast<size_t>(Stage::DstCancellation)] = static_cast<uint32_t>(src_cancellation);

    FillPlan plan;
    plan.immutables.order_hash = order.hash();
    plan.immutables.hashlock = extra.hashlock;
    plan.immutables.maker = order.maker;
    plan.immutables.taker = taker;
    plan.immutables.token = order.maker_asset;
    plan.immutables.amount = making_amount;
    plan.immutables.safety_deposit = extra.src_safety_deposit;
    plan.immutables.timelocks =
        Timelocks::pack(offsets).with_deployed_at(static_cast<uint32_t>(now));
    plan.immutables.parameters = extra.parameters;

    plan.complement.maker = order.receiver.is_zero() ? order.maker : order.receiver;
    plan.complement.amount = taking_amount;
    plan.complement.token = extra.dst_token;
    plan.complement.safety_deposit = extra.dst_safety_deposit;
    plan.complement.chain_id = extra.dst_chain_id;
    plan.complement.parameters = extra.parameters;

    plan.escrow = predict_address(plan.immutables, EscrowRole::Source);
    return plan;
}

Address EscrowFactory::on_fill_completed(const CallContext& ctx, const Order& order,
                                         const Address& taker, uint64_t making_amount,
                                         uint64_t taking_amount, const Bytes& extra_data) {
    FillPlan plan;
    {
        std::lock_guard<std::mutex> lock(creation_mutex_);

        if (ctx.caller != config_.order_protocol) {
            throw Error(ErrorCode::OnlyOrderProtocol, ctx.caller.to_hex());
        }
        check_creation_open(taker);

        auto extra = ExtraData::decode(extra_data);
        if (!extra) {
            throw Error(ErrorCode::InvalidExtraData);
        }
        if (registry_->has_escrow(extra->hashlock)) {
            throw Error(ErrorCode::EscrowAlreadyExists, to_hex(extra->hashlock));
        }

        plan = plan_fill(order, taker, making_amount, taking_amount, *extra, env_->clock->now());
        if (!plan.immutables.timelocks.is_well_ordered()) {
            throw Error(ErrorCode::InvalidTimelocks);
        }
        uint64_t required = native_required(plan.immutables);

        LedgerTransaction tx(*env_->ledger);

        env_->ledger->transfer_from(plan.immutables.token, address_, order.maker, plan.escrow,
                                    making_amount);

        // The resolver sends the safety deposit ahead of the fill
        uint64_t held = env_->ledger->balance_of(Address::native(), plan.escrow);
        if (held < required) {
            throw Error(ErrorCode::InsufficientEscrowBalance,
                        "escrow holds " + std::to_string(held) + ", needs " +
                        std::to_string(required));
        }

        Bytes data;
        append_bytes(data, plan.immutables.encode());
        append_bytes(data, plan.complement.encode());
        deploy(EscrowRole::Source, plan.escrow, plan.immutables,
               EventJournal::entry(address_, {events::SRC_ESCROW_CREATED}, std::move(data)));

        tx.commit();
    }
    env_->journal->publish();

    logging::info("FACTORY", "Source escrow " + plan.escrow.to_hex() + " for hashlock " +
                  to_hex(plan.immutables.hashlock));
    return plan.escrow;
}

Address EscrowFactory::create_dst_escrow(const CallContext& ctx, const Immutables& immutables,
                                         uint64_t src_cancellation_timestamp,
                                         uint64_t native_value) {
    Address escrow_address;
    uint64_t now = 0;
    {
        std::lock_guard<std::mutex> lock(creation_mutex_);

        check_creation_open(ctx.caller);
        if (registry_->has_escrow(immutables.hashlock)) {
            throw Error(ErrorCode::EscrowAlreadyExists, to_hex(immutables.hashlock));
        }

        now = env_->clock->now();
        if (now > std::numeric_limits<uint32_t>::max()) {
            throw Error(ErrorCode::InvalidCreationTime, "timestamp beyond 32 bits");
        }

        Immutables stamped = immutables;
        stamped.timelocks = immutables.timelocks.with_deployed_at(static_cast<uint32_t>(now));

        if (!stamped.timelocks.is_well_ordered()) {
            throw Error(ErrorCode::InvalidTimelocks);
        }
        // Destination leg must become cancellable no later than the source leg
        if (stamped.timelocks.unlock_instant(Stage::DstCancellation) > src_cancellation_timestamp) {
            throw Error(ErrorCode::InvalidCreationTime,
                        "dst cancellation after src cancellation " +
                        std::to_string(src_cancellation_timestamp));
        }

        uint64_t required = native_required(stamped);
        if (native_value != required) {
            throw Error(ErrorCode::InsufficientEscrowBalance,
                        "attached " + std::to_string(native_value) + ", needs " +
                        std::to_string(required));
        }

        escrow_address = predict_address(stamped, EscrowRole::Destination);

        LedgerTransaction tx(*env_->ledger);

        env_->ledger->transfer(Address::native(), ctx.caller, escrow_address, native_value);
        if (!stamped.token.is_native()) {
            env_->ledger->transfer_from(stamped.token, address_, ctx.caller, escrow_address,
                                        stamped.amount);
        }

        Bytes data;
        append_address(data, escrow_address);
        data.insert(data.end(), stamped.hashlock.begin(), stamped.hashlock.end());
        append_address(data, stamped.taker);
        deploy(EscrowRole::Destination, escrow_address, stamped,
               EventJournal::entry(address_, {events::DST_ESCROW_CREATED}, std::move(data)));

        tx.commit();
    }
    env_->journal->publish();

    logging::info("FACTORY", "Destination escrow " + escrow_address.to_hex() +
                  " deployed at " + std::to_string(now));
    return escrow_address;
}

uint64_t EscrowFactory::native_required(const Immutables& immutables) {
    if (!immutables.token.is_native()) {
        return immutables.safety_deposit;
    }
    if (immutables.amount > std::numeric_limits<uint64_t>::max() - immutables.safety_deposit) {
        throw Error(ErrorCode::InsufficientEscrowBalance, "amount plus safety deposit overflows");
    }
    return immutables.amount + immutables.safety_deposit;
}

// Registry entry, escrow record and creation entry land in one batch
void EscrowFactory::deploy(EscrowRole role, const Address& escrow, const Immutables& immutables,
                           Log created) {
    auto impl = implementation(role);

    std::shared_ptr<Escrow> instance;
    if (role == EscrowRole::Source) {
        instance = std::make_shared<EscrowSrc>(env_, escrow, immutables.hash(), impl.rescue_delay);
    } else {
        instance = std::make_shared<EscrowDst>(env_, escrow, immutables.hash(), impl.rescue_delay);
    }

    storage::Database::WriteBatch batch;
    if (!registry_->stage_escrow(immutables.hashlock, escrow, batch)) {
        throw Error(ErrorCode::EscrowAlreadyExists, to_hex(immutables.hashlock));
    }
    batch.puts.emplace_back(Escrow::record_key(escrow), instance->record().encode());
    env_->journal->record({std::move(created)}, std::move(batch));

    std::unique_lock lock(escrows_mutex_);
    escrows_[escrow] = instance;
}

std::optional<Address> EscrowFactory::escrow_for(const Hash256& hashlock) const {
    return registry_->escrow_for(hashlock);
}

std::shared_ptr<Escrow> EscrowFactory::escrow_at(const Address& address) const {
    std::shared_lock lock(escrows_mutex_);
    auto it = escrows_.find(address);
    if (it == escrows_.end()) {
        throw Error(ErrorCode::UnknownEscrow, address.to_hex());
    }
    return it->second;
}

size_t EscrowFactory::escrow_count() const {
    std::shared_lock lock(escrows_mutex_);
    return escrows_.size();
}

void EscrowFactory::check_owner(const CallContext& ctx) const {
    if (ctx.caller != config_.owner) {
        throw Error(ErrorCode::OnlyOwner, ctx.caller.to_hex());
    }
}

void EscrowFactory::check_creation_open(const Address& resolver) const {
    if (registry_->paused()) {
        throw Error(ErrorCode::Paused);
    }
    if (!registry_->may_resolve(resolver)) {
        throw Error(ErrorCode::NotWhitelisted, resolver.to_hex());
    }
}

void EscrowFactory::set_paused(const CallContext& ctx, bool paused) {
    check_owner(ctx);
    registry_->set_paused(paused);
}

void EscrowFactory::add_resolver(const CallContext& ctx, const Address& resolver) {
    check_owner(ctx);
    registry_->add_resolver(resolver);
}

void EscrowFactory::remove_resolver(const CallContext& ctx, const Address& resolver) {
    check_owner(ctx);
    registry_->remove_resolver(resolver);
}

void EscrowFactory::set_whitelist_bypass(const CallContext& ctx, bool bypass) {
    check_owner(ctx);
    registry_->set_whitelist_bypass(bypass);
}

} // namespace crosslock
