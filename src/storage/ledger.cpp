#include "crosslock/ledger.hpp"
#include "crosslock/errors.hpp"
#include "crosslock/logging.hpp"
#include <limits>
#include <stdexcept>

namespace crosslock {

// ============================================================================
// LedgerTransaction Implementation
// ============================================================================

LedgerTransaction::LedgerTransaction(TokenLedger& ledger) : ledger_(ledger) {
    ledger_.begin();
    snapshot_ = ledger_.snapshot();
}

LedgerTransaction::~LedgerTransaction() {
    if (!committed_) {
        ledger_.revert(snapshot_);
    }
    ledger_.end();
}

// ============================================================================
// BalanceLedger Implementation
// ============================================================================

BalanceLedger::BalanceLedger(std::shared_ptr<storage::Database> db) : db_(std::move(db)) {}

Bytes BalanceLedger::balance_key(const Address& token, const Address& holder) {
    Bytes key;
    key.push_back(PREFIX_BALANCE);
    append_address(key, token);
    append_address(key, holder);
    return key;
}

Bytes BalanceLedger::allowance_key(const Address& token, const Address& owner,
                                   const Address& spender) {
    Bytes key;
    key.push_back(PREFIX_ALLOWANCE);
    append_address(key, token);
    append_address(key, owner);
    append_address(key, spender);
    return key;
}

uint64_t BalanceLedger::read(const Bytes& key) const {
    auto data = db_->get(key);
    if (!data || data->size() != 8) return 0;

    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | (*data)[i];
    }
    return value;
}

void BalanceLedger::write(const Bytes& key, uint64_t value) {
    // Record for journal (revert support)
    if (depth_ > 0) {
        journal_.push_back(JournalEntry{key, db_->get(key)});
    }

    Bytes encoded;
    append_uint64(encoded, value);
    if (!db_->put(key, encoded)) {
        throw std::runtime_error("ledger: database write failed");
    }
}

uint64_t BalanceLedger::balance_of(const Address& token, const Address& holder) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return read(balance_key(token, holder));
}

uint64_t BalanceLedger::allowance(const Address& token, const Address& owner,
                                  const Address& spender) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return read(allowance_key(token, owner, spender));
}

void BalanceLedger::mint(const Address& token, const Address& to, uint64_t amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto key = balance_key(token, to);
    uint64_t balance = read(key);
    if (balance > std::numeric_limits<uint64_t>::max() - amount) {
        throw std::overflow_error("ledger: balance overflow");
    }
    write(key, balance + amount);
}

void BalanceLedger::transfer(const Address& token, const Address& from,
                             const Address& to, uint64_t amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto from_key = balance_key(token, from);
    uint64_t from_balance = read(from_key);
    if (from_balance < amount) {
        throw Error(ErrorCode::InsufficientBalance,
                    from.to_hex() + " holds " + std::to_string(from_balance) +
                    ", needs " + std::to_string(amount));
    }

    auto to_key = balance_key(token, to);
    if (from_key != to_key) {
        uint64_t to_balance = read(to_key);
        if (to_balance > std::numeric_limits<uint64_t>::max() - amount) {
            throw std::overflow_error("ledger: balance overflow");
        }
        write(from_key, from_balance - amount);
        write(to_key, to_balance + amount);
    }

    logging::debug("LEDGER", "transfer " + std::to_string(amount) + " of " + token.to_hex() +
                   " " + from.to_hex() + " -> " + to.to_hex());
}

void BalanceLedger::approve(const Address& token, const Address& owner,
                            const Address& spender, uint64_t amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write(allowance_key(token, owner, spender), amount);
}

void BalanceLedger::transfer_from(const Address& token, const Address& spender,
                                  const Address& from, const Address& to, uint64_t amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto key = allowance_key(token, from, spender);
    uint64_t allowed = read(key);
    if (allowed < amount) {
        throw Error(ErrorCode::InsufficientAllowance,
                    spender.to_hex() + " may spend " + std::to_string(allowed) +
                    " of " + from.to_hex() + ", needs " + std::to_string(amount));
    }

    // Check the balance before touching the allowance so a failure leaves both intact
    if (read(balance_key(token, from)) < amount) {
        throw Error(ErrorCode::InsufficientBalance,
                    from.to_hex() + " cannot cover " + std::to_string(amount));
    }

    write(key, allowed - amount);
    transfer(token, from, to, amount);
}

void BalanceLedger::begin() {
    mutex_.lock();
    ++depth_;
}

TokenLedger::Snapshot BalanceLedger::snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return Snapshot{journal_.size()};
}

void BalanceLedger::revert(const Snapshot& snap) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // Revert journal entries back to snapshot point
    while (journal_.size() > snap.journal_size) {
        auto& entry = journal_.back();
        bool restored = entry.prev_value.has_value() ? db_->put(entry.key, *entry.prev_value)
                                                     : db_->del(entry.key);
        if (!restored) {
            logging::error("LEDGER", "Failed to restore entry during revert");
        }
        journal_.pop_back();
    }
}

void BalanceLedger::end() {
    if (--depth_ == 0) {
        journal_.clear();
    }
    mutex_.unlock();
}

} // namespace crosslock
