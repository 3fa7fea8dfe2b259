#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include "crosslock/types.hpp"
#include "crosslock/storage.hpp"

namespace crosslock {

/**
 * @brief Append-only event journal of one chain
 *
 * Entries are numbered from zero in append order and never rewritten.
 * Observers (a resolver watching for the secret reveal, the simulator)
 * either poll with since() or subscribe.
 *
 * Recording and notification are separate steps. An operation records
 * its entries together with its other database writes in one batch, and
 * publishes only after it committed and released its locks. Subscribers
 * therefore never see an entry that was rolled back, and are called in
 * sequence order. A subscriber that throws is logged and skipped.
 * Subscribers must not append from inside the callback.
 */
class EventJournal {
public:
    using Subscriber = std::function<void(const Log&)>;

    explicit EventJournal(std::shared_ptr<storage::Database> db);

    // Unnumbered entry for record()
    static Log entry(const Address& emitter, std::vector<Hash256> topics, Bytes data);

    // Numbers `pending` and writes it with `batch` in one database batch.
    // Throws std::runtime_error and stores nothing when the write fails.
    std::vector<Log> record(std::vector<Log> pending, storage::Database::WriteBatch batch = {});

    // Delivers every recorded entry the subscribers have not seen yet
    void publish();

    // record() and publish() of a single entry
    Log append(const Address& emitter, std::vector<Hash256> topics, Bytes data);

    size_t size() const;
    std::vector<Log> since(uint64_t sequence) const;
    std::vector<Log> for_emitter(const Address& emitter) const;
    std::vector<Log> with_topic(const Hash256& topic) const;

    void subscribe(Subscriber subscriber);

private:
    static constexpr uint8_t PREFIX_JOURNAL = 'J';

    void load();

    std::shared_ptr<storage::Database> db_;
    mutable std::shared_mutex mutex_;
    std::vector<Log> entries_;
    std::vector<Subscriber> subscribers_;

    std::mutex notify_mutex_;  // Orders notifications
    size_t notified_{0};
};

} // namespace crosslock
