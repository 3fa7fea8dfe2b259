#pragma once

#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include "crosslock/types.hpp"
#include "crosslock/storage.hpp"

namespace crosslock {

/**
 * @brief Factory registry of one chain
 *
 * Hashlock to escrow-address table, resolver whitelist, pause and
 * whitelist-bypass flags. Owned by the chain and handed to the factory
 * and the endorsement policy. Whitelist and flag changes are written
 * through to the database. Hashlock entries go into the creating
 * operation's batch, so they land together with the escrow record.
 * A restarted chain sees the same registry.
 */
class Registry {
public:
    explicit Registry(std::shared_ptr<storage::Database> db);

    // Reload cached flags and whitelist from the database
    void load();

    // Hashlock table
    std::optional<Address> escrow_for(const Hash256& hashlock) const;
    bool has_escrow(const Hash256& hashlock) const;
    // Adds the hashlock entry to `batch`; false when the hashlock is taken.
    // The entry exists once the caller writes the batch.
    bool stage_escrow(const Hash256& hashlock, const Address& escrow,
                      storage::Database::WriteBatch& batch) const;
    size_t escrow_count() const;

    // Resolver whitelist
    void add_resolver(const Address& resolver);
    void remove_resolver(const Address& resolver);
    bool is_whitelisted(const Address& resolver) const;
    std::vector<Address> resolvers() const;

    void set_paused(bool paused);
    bool paused() const;

    void set_whitelist_bypass(bool bypass);
    bool whitelist_bypass() const;

    // Whitelisted, or bypass enabled
    bool may_resolve(const Address& caller) const;

private:
    static constexpr uint8_t PREFIX_ESCROW = 'E';
    static constexpr uint8_t PREFIX_RESOLVER = 'W';
    static constexpr uint8_t PREFIX_FLAG = 'F';

    static constexpr uint8_t FLAG_PAUSED = 1;
    static constexpr uint8_t FLAG_BYPASS = 2;

    void store_flag(uint8_t flag, bool value);
    bool load_flag(uint8_t flag) const;

    std::shared_ptr<storage::Database> db_;
    mutable std::shared_mutex mutex_;

    std::set<Address> resolvers_;
    bool paused_{false};
    bool bypass_{false};
};

} // namespace crosslock
