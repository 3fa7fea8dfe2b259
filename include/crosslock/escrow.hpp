#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "crosslock/types.hpp"
#include "crosslock/addressing.hpp"
#include "crosslock/auth.hpp"
#include "crosslock/clock.hpp"
#include "crosslock/immutables.hpp"
#include "crosslock/journal.hpp"
#include "crosslock/ledger.hpp"
#include "crosslock/logging.hpp"
#include "crosslock/storage.hpp"

namespace crosslock {

enum class EscrowState : uint8_t {
    Active = 0,
    Withdrawn = 1,
    Cancelled = 2
};

const char* state_name(EscrowState state);

/**
 * @brief Collaborators shared by every escrow and the factory of one chain
 */
struct EscrowEnvironment {
    uint64_t chain_id{0};
    std::shared_ptr<TokenLedger> ledger;
    std::shared_ptr<EventJournal> journal;
    std::shared_ptr<Clock> clock;
    std::shared_ptr<AuthorizationPolicy> policy;
    std::shared_ptr<storage::Database> db;
};

/**
 * @brief Persisted part of an escrow, keyed by its address
 */
struct EscrowRecord {
    EscrowRole role{EscrowRole::Source};
    EscrowState state{EscrowState::Active};
    Hash256 immutables_digest{};
    uint32_t rescue_delay{0};

    Bytes encode() const;
    static std::optional<EscrowRecord> decode(const Bytes& data);
};

namespace events {
extern const Hash256 ESCROW_WITHDRAWAL;   // EscrowWithdrawal(bytes32 secret)
extern const Hash256 ESCROW_CANCELLED;    // EscrowCancelled()
extern const Hash256 FUNDS_RESCUED;       // FundsRescued(address token, uint256 amount)
extern const Hash256 SRC_ESCROW_CREATED;  // SrcEscrowCreated(Immutables, DstImmutablesComplement)
extern const Hash256 DST_ESCROW_CREATED;  // DstEscrowCreated(address escrow, bytes32 hashlock, address taker)
} // namespace events

/**
 * @brief One swap leg holding locked value until withdraw or cancel
 *
 * The escrow keeps only the digest of its Immutables; every call supplies
 * the full record and is rejected with InvalidImmutables when it does not
 * hash to the captured digest. Each operation runs inside a ledger
 * transaction and either completes every transfer, journal entry and
 * state change or throws crosslock::Error leaving all of them untouched.
 * Journal entries and the new state are staged while the operation runs
 * and written in one batch before the transaction commits; subscribers
 * hear about them after the escrow lock is released.
 *
 * Checks run in a fixed order: immutables, caller, lifecycle, time, secret.
 */
class Escrow {
public:
    Escrow(std::shared_ptr<EscrowEnvironment> env, const Address& address,
           const Hash256& immutables_digest, uint32_t rescue_delay,
           EscrowState state = EscrowState::Active);
    virtual ~Escrow() = default;

    Escrow(const Escrow&) = delete;
    Escrow& operator=(const Escrow&) = delete;

    virtual EscrowRole role() const = 0;

    // Taker-only withdrawal during the private window
    virtual void withdraw(const CallContext& ctx, const Secret& secret,
                          const Immutables& immutables) = 0;

    // Capability-gated withdrawal during the public window
    virtual void public_withdraw(const CallContext& ctx, const Secret& secret,
                                 const Immutables& immutables) = 0;

    // Taker-only cancellation once the cancellation stage opens
    virtual void cancel(const CallContext& ctx, const Immutables& immutables) = 0;

    // Sweeps `amount` of `token` to the taker once the rescue delay elapsed.
    // Does not change the lifecycle state.
    void rescue_funds(const CallContext& ctx, const Address& token, uint64_t amount,
                      const Immutables& immutables);

    const Address& address() const { return address_; }
    const Hash256& immutables_digest() const { return immutables_digest_; }
    uint32_t rescue_delay() const { return rescue_delay_; }
    EscrowState state() const { return state_.load(); }
    bool is_active() const { return state() == EscrowState::Active; }

    EscrowRecord record() const;

    static Bytes record_key(const Address& address);

protected:
    template <typename Fn>
    void execute(const char* operation, Fn&& fn) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_logs_.clear();
            pending_state_.reset();

            LedgerTransaction tx(*env_->ledger);
            fn();
            apply_pending();
            tx.commit();
        }
        env_->journal->publish();
        logging::info("ESCROW", std::string(operation) + " on " + address_.to_hex());
    }

    // Precondition checks, each throws crosslock::Error
    void check_immutables(const Immutables& immutables) const;
    void check_taker(const CallContext& ctx, const Immutables& immutables) const;
    void check_capability(const CallContext& ctx, PublicAction action) const;
    void check_active() const;
    void check_after(uint64_t start) const;
    void check_before(uint64_t stop) const;
    void check_secret(const Secret& secret, const Immutables& immutables) const;

    // Value movement out of the escrow
    void pay(const Address& token, const Address& to, uint64_t amount);
    void pay_safety_deposit(const Address& to, uint64_t amount);

    // Stage a journal entry, and the terminal state for the finishers
    void emit(const Hash256& topic, Bytes data);
    void finish_withdrawal(const Secret& secret);
    void finish_cancellation();

    uint64_t now() const { return env_->clock->now(); }

    std::shared_ptr<EscrowEnvironment> env_;

private:
    // Writes the staged entries and state; throws leaving both unwritten
    void apply_pending();

    Address address_;
    Hash256 immutables_digest_;
    uint32_t rescue_delay_;
    std::atomic<EscrowState> state_;
    std::mutex mutex_;

    // Staged by the running operation, guarded by mutex_
    std::vector<Log> pending_logs_;
    std::optional<EscrowState> pending_state_;
};

/**
 * @brief Source leg: holds the maker's funds, released to the taker
 */
class EscrowSrc : public Escrow {
public:
    using Escrow::Escrow;

    EscrowRole role() const override { return EscrowRole::Source; }

    void withdraw(const CallContext& ctx, const Secret& secret,
                  const Immutables& immutables) override;

    // Withdrawal with the locked value sent to `target` instead of the taker
    void withdraw_to(const CallContext& ctx, const Secret& secret, const Address& target,
                     const Immutables& immutables);

    void public_withdraw(const CallContext& ctx, const Secret& secret,
                         const Immutables& immutables) override;

    void cancel(const CallContext& ctx, const Immutables& immutables) override;

    // Capability-gated cancellation, value back to the maker
    void public_cancel(const CallContext& ctx, const Immutables& immutables);

private:
    void do_withdraw(const CallContext& ctx, const Secret& secret, const Address& target,
                     const Immutables& immutables);
    void do_cancel(const CallContext& ctx, const Immutables& immutables);
};

/**
 * @brief Destination leg: holds the resolver's funds, released to the maker
 */
class EscrowDst : public Escrow {
public:
    using Escrow::Escrow;

    EscrowRole role() const override { return EscrowRole::Destination; }

    void withdraw(const CallContext& ctx, const Secret& secret,
                  const Immutables& immutables) override;
    void public_withdraw(const CallContext& ctx, const Secret& secret,
                         const Immutables& immutables) override;
    void cancel(const CallContext& ctx, const Immutables& immutables) override;

private:
    void do_withdraw(const CallContext& ctx, const Secret& secret,
                     const Immutables& immutables);
};

} // namespace crosslock
