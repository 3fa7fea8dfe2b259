#include "crosslock/registry.hpp"
#include "crosslock/logging.hpp"
#include <stdexcept>

namespace crosslock {

Registry::Registry(std::shared_ptr<storage::Database> db) : db_(std::move(db)) {
    load();
}

void Registry::load() {
    std::unique_lock lock(mutex_);

    resolvers_.clear();
    for (const auto& [key, value] : db_->scan(Bytes{PREFIX_RESOLVER})) {
        Bytes suffix(key.begin() + 1, key.end());
        Reader reader(suffix);
        auto resolver = reader.read_address();
        if (resolver) resolvers_.insert(*resolver);
    }

    paused_ = load_flag(FLAG_PAUSED);
    bypass_ = load_flag(FLAG_BYPASS);
}

std::optional<Address> Registry::escrow_for(const Hash256& hashlock) const {
    std::shared_lock lock(mutex_);
    auto data = db_->get(storage::make_key(PREFIX_ESCROW, hashlock));
    if (!data) return std::nullopt;
    Reader reader(*data);
    return reader.read_address();
}

bool Registry::has_escrow(const Hash256& hashlock) const {
    std::shared_lock lock(mutex_);
    return db_->exists(storage::make_key(PREFIX_ESCROW, hashlock));
}

bool Registry::stage_escrow(const Hash256& hashlock, const Address& escrow,
                            storage::Database::WriteBatch& batch) const {
    std::shared_lock lock(mutex_);
    auto key = storage::make_key(PREFIX_ESCROW, hashlock);
    if (db_->exists(key)) return false;

    Bytes value;
    append_address(value, escrow);
    batch.puts.emplace_back(std::move(key), std::move(value));
    return true;
}

size_t Registry::escrow_count() const {
    std::shared_lock lock(mutex_);
    return db_->scan(Bytes{PREFIX_ESCROW}).size();
}

void Registry::add_resolver(const Address& resolver) {
    std::unique_lock lock(mutex_);
    if (!db_->put(storage::make_key(PREFIX_RESOLVER, resolver), Bytes{1})) {
        throw std::runtime_error("registry: database write failed");
    }
    resolvers_.insert(resolver);
    logging::info("REGISTRY", "Resolver whitelisted: " + resolver.to_hex());
}

void Registry::remove_resolver(const Address& resolver) {
    std::unique_lock lock(mutex_);
    if (resolvers_.erase(resolver) == 0) return;
    if (!db_->del(storage::make_key(PREFIX_RESOLVER, resolver))) {
        throw std::runtime_error("registry: database delete failed");
    }
    logging::info("REGISTRY", "Resolver removed: " + resolver.to_hex());
}

bool Registry::is_whitelisted(const Address& resolver) const {
    std::shared_lock lock(mutex_);
    return resolvers_.count(resolver) > 0;
}

std::vector<Address> Registry::resolvers() const {
    std::shared_lock lock(mutex_);
    return std::vector<Address>(resolvers_.begin(), resolvers_.end());
}

void Registry::set_paused(bool paused) {
    std::unique_lock lock(mutex_);
    store_flag(FLAG_PAUSED, paused);
    paused_ = paused;
    logging::info("REGISTRY", paused ? "Escrow creation paused" : "Escrow creation resumed");
}

bool Registry::paused() const {
    std::shared_lock lock(mutex_);
    return paused_;
}

void Registry::set_whitelist_bypass(bool bypass) {
    std::unique_lock lock(mutex_);
    store_flag(FLAG_BYPASS, bypass);
    bypass_ = bypass;
    logging::info("REGISTRY", std::string("Whitelist bypass ") + (bypass ? "enabled" : "disabled"));
}

bool Registry::whitelist_bypass() const {
    std::shared_lock lock(mutex_);
    return bypass_;
}

bool Registry::may_resolve(const Address& caller) const {
    std::shared_lock lock(mutex_);
    return bypass_ || resolvers_.count(caller) > 0;
}

void Registry::store_flag(uint8_t flag, bool value) {
    if (!db_->put(Bytes{PREFIX_FLAG, flag}, Bytes{static_cast<uint8_t>(value ? 1 : 0)})) {
        throw std::runtime_error("registry: database write failed");
    }
}

bool Registry::load_flag(uint8_t flag) const {
    auto data = db_->get(Bytes{PREFIX_FLAG, flag});
    return data && !data->empty() && (*data)[0] != 0;
}

} // namespace crosslock
