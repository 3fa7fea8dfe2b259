#include "crosslock/escrow.hpp"
#include "crosslock/errors.hpp"

namespace crosslock {

const char* state_name(EscrowState state) {
    switch (state) {
        case EscrowState::Active: return "Active";
        case EscrowState::Withdrawn: return "Withdrawn";
        case EscrowState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

namespace events {
const Hash256 ESCROW_WITHDRAWAL = event_topic("EscrowWithdrawal(bytes32)");
const Hash256 ESCROW_CANCELLED = event_topic("EscrowCancelled()");
const Hash256 FUNDS_RESCUED = event_topic("FundsRescued(address,uint256)");
const Hash256 SRC_ESCROW_CREATED = event_topic("SrcEscrowCreated(Immutables,DstImmutablesComplement)");
const Hash256 DST_ESCROW_CREATED = event_topic("DstEscrowCreated(address,bytes32,address)");
} // namespace events

// ============================================================================
// EscrowRecord Implementation
// ============================================================================

Bytes EscrowRecord::encode() const {
    Bytes result;
    result.push_back(static_cast<uint8_t>(role));
    result.push_back(static_cast<uint8_t>(state));
    result.insert(result.end(), immutables_digest.begin(), immutables_digest.end());
    append_uint32(result, rescue_delay);
    return result;
}

std::optional<EscrowRecord> EscrowRecord::decode(const Bytes& data) {
    Reader reader(data);
    auto role = reader.read_uint8();
    auto state = reader.read_uint8();
    auto digest = reader.read_hash();
    auto delay = reader.read_uint32();
    if (!role || !state || !digest || !delay) return std::nullopt;

    if (*role != static_cast<uint8_t>(EscrowRole::Source) &&
        *role != static_cast<uint8_t>(EscrowRole::Destination)) {
        return std::nullopt;
    }
    if (*state > static_cast<uint8_t>(EscrowState::Cancelled)) return std::nullopt;

    EscrowRecord record;
    record.role = static_cast<EscrowRole>(*role);
    record.state = static_cast<EscrowState>(*state);
    record.immutables_digest = *digest;
    record.rescue_delay = *delay;
    return record;
}

// ============================================================================
// Escrow Implementation
// ============================================================================

Escrow::Escrow(std::shared_ptr<EscrowEnvironment> env, const Address& address,
               const Hash256& immutables_digest, uint32_t rescue_delay, EscrowState state)
    : env_(std::move(env)),
      address_(address),
      immutables_digest_(immutables_digest),
      rescue_delay_(rescue_delay),
      state_(state) {}

Bytes Escrow::record_key(const Address& address) {
    return storage::make_key('S', address);
}

EscrowRecord Escrow::record() const {
    EscrowRecord rec;
    rec.role = role();
    rec.state = state();
    rec.immutables_digest = immutables_digest_;
    rec.rescue_delay = rescue_delay_;
    return rec;
}

void Escrow::rescue_funds(const CallContext& ctx, const Address& token, uint64_t amount,
                          const Immutables& immutables) {
    execute("rescue_funds", [&] {
        check_immutables(immutables);
        check_taker(ctx, immutables);
        check_after(immutables.timelocks.rescue_start(rescue_delay_));

        pay(token, immutables.taker, amount);

        Bytes data;
        append_address(data, token);
        append_uint64(data, amount);
        emit(events::FUNDS_RESCUED, std::move(data));
    });
}

void Escrow::check_immutables(const Immutables& immutables) const {
    if (immutables.hash() != immutables_digest_) {
        throw Error(ErrorCode::InvalidImmutables, address_.to_hex());
    }
}

void Escrow::check_taker(const CallContext& ctx, const Immutables& immutables) const {
    if (ctx.caller != immutables.taker) {
        throw Error(ErrorCode::InvalidCaller, ctx.caller.to_hex() + " is not the taker");
    }
}

void Escrow::check_capability(const CallContext& ctx, PublicAction action) const {
    AuthorizationRequest request{ctx, env_->chain_id, address_, action, immutables_digest_};
    if (!env_->policy || !env_->policy->authorize(request)) {
        throw Error(ErrorCode::InvalidCaller, ctx.caller.to_hex() + " lacks the public capability");
    }
}

void Escrow::check_active() const {
    if (state() != EscrowState::Active) {
        throw Error(ErrorCode::EscrowFinalized, state_name(state()));
    }
}

void Escrow::check_after(uint64_t start) const {
    uint64_t t = now();
    if (t < start) {
        throw Error(ErrorCode::InvalidTime,
                    "now " + std::to_string(t) + " < " + std::to_string(start));
    }
}

void Escrow::check_before(uint64_t stop) const {
    uint64_t t = now();
    if (t >= stop) {
        throw Error(ErrorCode::InvalidTime,
                    "now " + std::to_string(t) + " >= " + std::to_string(stop));
    }
}

void Escrow::check_secret(const Secret& secret, const Immutables& immutables) const {
    if (crypto::Blake2b256::hash(secret.data(), secret.size()) != immutables.hashlock) {
        throw Error(ErrorCode::InvalidSecret);
    }
}

void Escrow::pay(const Address& token, const Address& to, uint64_t amount) {
    if (amount == 0) return;
    env_->ledger->transfer(token, address_, to, amount);
}

void Escrow::pay_safety_deposit(const Address& to, uint64_t amount) {
    pay(Address::native(), to, amount);
}

void Escrow::emit(const Hash256& topic, Bytes data) {
    pending_logs_.push_back(EventJournal::entry(address_, {topic}, std::move(data)));
}

void Escrow::finish_withdrawal(const Secret& secret) {
    emit(events::ESCROW_WITHDRAWAL, Bytes(secret.begin(), secret.end()));
    pending_state_ = EscrowState::Withdrawn;
}

void Escrow::finish_cancellation() {
    emit(events::ESCROW_CANCELLED, {});
    pending_state_ = EscrowState::Cancelled;
}

void Escrow::apply_pending() {
    storage::Database::WriteBatch batch;
    if (pending_state_) {
        EscrowRecord rec = record();
        rec.state = *pending_state_;
        batch.puts.emplace_back(record_key(address_), rec.encode());
    }

    env_->journal->record(std::move(pending_logs_), std::move(batch));
    pending_logs_.clear();

    if (pending_state_) {
        state_ = *pending_state_;
    }
}

} // namespace crosslock
