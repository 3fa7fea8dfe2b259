#pragma once

#include <memory>
#include <string>
#include "crosslock/types.hpp"
#include "crosslock/auth.hpp"
#include "crosslock/clock.hpp"
#include "crosslock/escrow.hpp"
#include "crosslock/factory.hpp"
#include "crosslock/journal.hpp"
#include "crosslock/ledger.hpp"
#include "crosslock/logging.hpp"
#include "crosslock/registry.hpp"
#include "crosslock/storage.hpp"

namespace crosslock {

/**
 * @brief Configuration of one chain hosting an escrow factory
 */
struct ChainConfig {
    // Identity
    std::string name{"source"};
    uint64_t chain_id{1};
    std::string data_dir{"./data/source"};
    bool persistent{false};

    // Factory
    FactoryConfig factory;

    // Logging
    logging::Level log_level{logging::Level::Info};

    // Load from file
    static ChainConfig from_file(const std::string& path);
    void save_to_file(const std::string& path) const;
};

/**
 * @brief One ledger with its factory
 *
 * Wires storage, value ledger, registry, journal, authorization policy
 * and factory of a single chain. The policy accepts either holders of
 * the access token or callers presenting a resolver endorsement.
 */
class Chain {
public:
    Chain(const ChainConfig& config, std::shared_ptr<Clock> clock);
    // Runs on `db` instead of opening the configured store
    Chain(const ChainConfig& config, std::shared_ptr<Clock> clock,
          std::shared_ptr<storage::Database> db);

    const ChainConfig& config() const { return config_; }
    const std::string& name() const { return config_.name; }
    uint64_t chain_id() const { return config_.chain_id; }

    std::shared_ptr<storage::Database> database() { return db_; }
    std::shared_ptr<TokenLedger> ledger() { return ledger_; }
    std::shared_ptr<EventJournal> journal() { return journal_; }
    std::shared_ptr<Registry> registry() { return registry_; }
    std::shared_ptr<EscrowFactory> factory() { return factory_; }
    std::shared_ptr<Clock> clock() { return clock_; }

    uint64_t balance_of(const Address& token, const Address& holder) const;
    uint64_t now() const { return clock_->now(); }

private:
    ChainConfig config_;
    std::shared_ptr<Clock> clock_;

    std::shared_ptr<storage::Database> db_;
    std::shared_ptr<BalanceLedger> ledger_;
    std::shared_ptr<EventJournal> journal_;
    std::shared_ptr<Registry> registry_;
    std::shared_ptr<AuthorizationPolicy> policy_;
    std::shared_ptr<EscrowEnvironment> env_;
    std::shared_ptr<EscrowFactory> factory_;
};

} // namespace crosslock
