#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "crosslock/types.hpp"
#include "crosslock/storage.hpp"

namespace crosslock {

/**
 * @brief Value-transfer primitives of one chain
 *
 * Balances are tracked per (token, holder); Address::native() is the
 * native asset. Failing transfers throw crosslock::Error with
 * InsufficientBalance / InsufficientAllowance and change nothing.
 */
class TokenLedger {
public:
    virtual ~TokenLedger() = default;

    virtual uint64_t balance_of(const Address& token, const Address& holder) const = 0;
    virtual uint64_t allowance(const Address& token, const Address& owner,
                               const Address& spender) const = 0;

    virtual void mint(const Address& token, const Address& to, uint64_t amount) = 0;
    virtual void transfer(const Address& token, const Address& from,
                          const Address& to, uint64_t amount) = 0;
    virtual void approve(const Address& token, const Address& owner,
                         const Address& spender, uint64_t amount) = 0;
    virtual void transfer_from(const Address& token, const Address& spender,
                               const Address& from, const Address& to, uint64_t amount) = 0;

    // Atomic operation support
    struct Snapshot {
        size_t journal_size;
    };
    virtual void begin() = 0;   // Serializes the calling thread's operation
    virtual Snapshot snapshot() const = 0;
    virtual void revert(const Snapshot& snap) = 0;
    virtual void end() = 0;
};

/**
 * @brief RAII scope making a sequence of ledger operations all-or-nothing
 *
 * Reverts every movement made inside the scope unless commit() was called.
 */
class LedgerTransaction {
public:
    explicit LedgerTransaction(TokenLedger& ledger);
    ~LedgerTransaction();

    LedgerTransaction(const LedgerTransaction&) = delete;
    LedgerTransaction& operator=(const LedgerTransaction&) = delete;

    void commit() { committed_ = true; }

private:
    TokenLedger& ledger_;
    TokenLedger::Snapshot snapshot_;
    bool committed_{false};
};

/**
 * @brief Database-backed ledger
 *
 * Every write inside an open transaction is journaled with the previous
 * value so it can be reverted. Operations are serialized per ledger.
 */
class BalanceLedger : public TokenLedger {
public:
    explicit BalanceLedger(std::shared_ptr<storage::Database> db);

    uint64_t balance_of(const Address& token, const Address& holder) const override;
    uint64_t allowance(const Address& token, const Address& owner,
                       const Address& spender) const override;

    void mint(const Address& token, const Address& to, uint64_t amount) override;
    void transfer(const Address& token, const Address& from,
                  const Address& to, uint64_t amount) override;
    void approve(const Address& token, const Address& owner,
                 const Address& spender, uint64_t amount) override;
    void transfer_from(const Address& token, const Address& spender,
                       const Address& from, const Address& to, uint64_t amount) override;

    void begin() override;
    Snapshot snapshot() const override;
    void revert(const Snapshot& snap) override;
    void end() override;

private:
    static constexpr uint8_t PREFIX_BALANCE = 'B';
    static constexpr uint8_t PREFIX_ALLOWANCE = 'A';

    static Bytes balance_key(const Address& token, const Address& holder);
    static Bytes allowance_key(const Address& token, const Address& owner, const Address& spender);

    uint64_t read(const Bytes& key) const;
    void write(const Bytes& key, uint64_t value);

    std::shared_ptr<storage::Database> db_;
    mutable std::recursive_mutex mutex_;
    size_t depth_{0};

    // Journal for reverts
    struct JournalEntry {
        Bytes key;
        std::optional<Bytes> prev_value;
    };
    std::vector<JournalEntry> journal_;
};

} // namespace crosslock
