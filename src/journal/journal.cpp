#include "crosslock/journal.hpp"
#include "crosslock/logging.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace crosslock {

EventJournal::EventJournal(std::shared_ptr<storage::Database> db) : db_(std::move(db)) {
    load();
}

void EventJournal::load() {
    std::unique_lock lock(mutex_);
    entries_.clear();

    // Keys are 'J' + big-endian sequence, so the scan returns append order
    for (const auto& [key, value] : db_->scan(Bytes{PREFIX_JOURNAL})) {
        auto log = Log::decode(value);
        if (!log || log->sequence != entries_.size()) {
            logging::warn("JOURNAL", "Stopping replay at malformed entry " +
                          std::to_string(entries_.size()));
            break;
        }
        entries_.push_back(std::move(*log));
    }

    // Replayed entries predate every subscriber
    notified_ = entries_.size();

    if (!entries_.empty()) {
        logging::debug("JOURNAL", "Replayed " + std::to_string(entries_.size()) + " entries");
    }
}

Log EventJournal::entry(const Address& emitter, std::vector<Hash256> topics, Bytes data) {
    Log log;
    log.address = emitter;
    log.topics = std::move(topics);
    log.data = std::move(data);
    return log;
}

std::vector<Log> EventJournal::record(std::vector<Log> pending,
                                      storage::Database::WriteBatch batch) {
    std::unique_lock lock(mutex_);

    uint64_t sequence = entries_.size();
    for (auto& log : pending) {
        log.sequence = sequence++;

        Bytes key;
        key.push_back(PREFIX_JOURNAL);
        append_uint64(key, log.sequence);
        batch.puts.emplace_back(std::move(key), log.encode());
    }

    if (!db_->write_batch(batch)) {
        throw std::runtime_error("journal: database write failed");
    }
    entries_.insert(entries_.end(), pending.begin(), pending.end());
    return pending;
}

void EventJournal::publish() {
    std::lock_guard<std::mutex> order(notify_mutex_);

    std::vector<Log> fresh;
    std::vector<Subscriber> subscribers;
    {
        std::shared_lock lock(mutex_);
        if (notified_ >= entries_.size()) return;
        fresh.assign(entries_.begin() + static_cast<std::ptrdiff_t>(notified_), entries_.end());
        subscribers = subscribers_;
    }
    notified_ += fresh.size();

    for (const auto& log : fresh) {
        for (const auto& subscriber : subscribers) {
            try {
                subscriber(log);
            } catch (const std::exception& e) {
                logging::error("JOURNAL", "Subscriber failed on entry " +
                               std::to_string(log.sequence) + ": " + e.what());
            }
        }
    }
}

Log EventJournal::append(const Address& emitter, std::vector<Hash256> topics, Bytes data) {
    auto recorded = record({entry(emitter, std::move(topics), std::move(data))});
    publish();
    return recorded.front();
}

size_t EventJournal::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::vector<Log> EventJournal::since(uint64_t sequence) const {
    std::shared_lock lock(mutex_);
    if (sequence >= entries_.size()) return {};
    return std::vector<Log>(entries_.begin() + static_cast<std::ptrdiff_t>(sequence), entries_.end());
}

std::vector<Log> EventJournal::for_emitter(const Address& emitter) const {
    std::shared_lock lock(mutex_);
    std::vector<Log> result;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(result),
                 [&](const Log& log) { return log.address == emitter; });
    return result;
}

std::vector<Log> EventJournal::with_topic(const Hash256& topic) const {
    std::shared_lock lock(mutex_);
    std::vector<Log> result;
    for (const auto& log : entries_) {
        if (!log.topics.empty() && log.topics[0] == topic) {
            result.push_back(log);
        }
    }
    return result;
}

void EventJournal::subscribe(Subscriber subscriber) {
    std::unique_lock lock(mutex_);
    subscribers_.push_back(std::move(subscriber));
}

} // namespace crosslock
