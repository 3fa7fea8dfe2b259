#pragma once

#include <memory>
#include <optional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <fstream>
#include "crosslock/types.hpp"

namespace crosslock {
namespace storage {

/**
 * @brief Abstract key-value store
 *
 * Backs the ledger, the factory registry, escrow records and the event
 * journal of one chain. In-memory for tests, log-file backed otherwise.
 */
class Database {
public:
    virtual ~Database() = default;

    virtual bool put(const Bytes& key, const Bytes& value) = 0;
    virtual std::optional<Bytes> get(const Bytes& key) = 0;
    virtual bool del(const Bytes& key) = 0;
    virtual bool exists(const Bytes& key) = 0;

    // Applied as a unit: either every put and delete lands or none does
    struct WriteBatch {
        std::vector<std::pair<Bytes, Bytes>> puts;
        std::vector<Bytes> deletes;
    };
    virtual bool write_batch(const WriteBatch& batch) = 0;

    // Snapshot of all entries under a key prefix, in key order
    virtual std::vector<std::pair<Bytes, Bytes>> scan(const Bytes& prefix) = 0;
};

/**
 * @brief In-memory database for testing
 */
class MemoryDatabase : public Database {
public:
    bool put(const Bytes& key, const Bytes& value) override;
    std::optional<Bytes> get(const Bytes& key) override;
    bool del(const Bytes& key) override;
    bool exists(const Bytes& key) override;
    bool write_batch(const WriteBatch& batch) override;
    std::vector<std::pair<Bytes, Bytes>> scan(const Bytes& prefix) override;

private:
    mutable std::shared_mutex mutex_;
    std::map<Bytes, Bytes> data_;
};

/**
 * @brief Persistent database using an append-only log file.
 * Replays the log on open so state survives restarts.
 */
class PersistentDatabase : public Database {
public:
    explicit PersistentDatabase(const std::string& path);
    ~PersistentDatabase();

    bool put(const Bytes& key, const Bytes& value) override;
    std::optional<Bytes> get(const Bytes& key) override;
    bool del(const Bytes& key) override;
    bool exists(const Bytes& key) override;
    bool write_batch(const WriteBatch& batch) override;
    std::vector<std::pair<Bytes, Bytes>> scan(const Bytes& prefix) override;

    const std::string& path() const { return path_; }

private:
    static constexpr uint8_t OP_PUT = 1;
    static constexpr uint8_t OP_DEL = 2;

    void load();
    static Bytes encode_record(uint8_t op, const Bytes& key, const Bytes& value);
    bool append_log(const Bytes& records);

    std::string path_;
    mutable std::shared_mutex mutex_;
    std::map<Bytes, Bytes> data_;
    std::ofstream file_;
};

// Key helpers: single-byte table prefix followed by the key material
Bytes make_key(uint8_t prefix, const Bytes& suffix);
Bytes make_key(uint8_t prefix, const Address& addr);
Bytes make_key(uint8_t prefix, const Hash256& hash);

std::shared_ptr<Database> open_database(const std::string& data_dir, bool persistent);

} // namespace storage
} // namespace crosslock
