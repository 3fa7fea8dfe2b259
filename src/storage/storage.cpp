#include "crosslock/storage.hpp"
#include "crosslock/logging.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#ifdef _WIN32
#include <direct.h>
#define MKDIR(dir) _mkdir(dir)
#else
#include <sys/stat.h>
#define MKDIR(dir) mkdir(dir, 0777)
#endif

namespace crosslock {
namespace storage {

static bool has_prefix(const Bytes& key, const Bytes& prefix) {
    if (key.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), key.begin());
}

static std::vector<std::pair<Bytes, Bytes>> scan_map(const std::map<Bytes, Bytes>& data,
                                                     const Bytes& prefix) {
    std::vector<std::pair<Bytes, Bytes>> out;
    for (auto it = data.lower_bound(prefix); it != data.end(); ++it) {
        if (!has_prefix(it->first, prefix)) break;
        out.emplace_back(it->first, it->second);
    }
    return out;
}

// ============================================================================
// MemoryDatabase Implementation
// ============================================================================

bool MemoryDatabase::put(const Bytes& key, const Bytes& value) {
    std::unique_lock lock(mutex_);
    data_[key] = value;
    return true;
}

std::optional<Bytes> MemoryDatabase::get(const Bytes& key) {
    std::shared_lock lock(mutex_);
    auto it = data_.find(key);
    if (it != data_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool MemoryDatabase::del(const Bytes& key) {
    std::unique_lock lock(mutex_);
    return data_.erase(key) > 0;
}

bool MemoryDatabase::exists(const Bytes& key) {
    std::shared_lock lock(mutex_);
    return data_.find(key) != data_.end();
}

bool MemoryDatabase::write_batch(const WriteBatch& batch) {
    std::unique_lock lock(mutex_);
    for (const auto& [key, value] : batch.puts) {
        data_[key] = value;
    }
    for (const auto& key : batch.deletes) {
        data_.erase(key);
    }
    return true;
}

std::vector<std::pair<Bytes, Bytes>> MemoryDatabase::scan(const Bytes& prefix) {
    std::shared_lock lock(mutex_);
    return scan_map(data_, prefix);
}

// ============================================================================
// PersistentDatabase Implementation
// ============================================================================

PersistentDatabase::PersistentDatabase(const std::string& path) : path_(path) {
    // Ensure every directory on the path exists
    for (size_t slash = path.find_first_of("/\\", 1); slash != std::string::npos;
         slash = path.find_first_of("/\\", slash + 1)) {
        std::string dir = path.substr(0, slash);
        MKDIR(dir.c_str());
    }
    load();
    file_.open(path_, std::ios::binary | std::ios::app);
    if (!file_.is_open()) {
        throw std::runtime_error("cannot open database log " + path_);
    }
}

PersistentDatabase::~PersistentDatabase() {
    if (file_.is_open()) file_.close();
}

void PersistentDatabase::load() {
    std::ifstream infile(path_, std::ios::binary);
    if (!infile.is_open()) return;

    Bytes log((std::istreambuf_iterator<char>(infile)), std::istreambuf_iterator<char>());
    Reader reader(log);
    size_t records = 0;

    while (reader.remaining() > 0) {
        auto op = reader.read_uint8();
        auto key = reader.read_bytes();
        if (!op || !key) break;

        if (*op == OP_PUT) {
            auto value = reader.read_bytes();
            if (!value) break;
            data_[*key] = std::move(*value);
        } else if (*op == OP_DEL) {
            data_.erase(*key);
        } else {
            break;
        }
        ++records;
    }

    if (reader.remaining() > 0) {
        logging::warn("STORAGE", "Ignoring truncated tail of " + path_);
    }
    logging::debug("STORAGE", "Replayed " + std::to_string(records) + " records from " + path_);
}

Bytes PersistentDatabase::encode_record(uint8_t op, const Bytes& key, const Bytes& value) {
    Bytes record;
    record.push_back(op);
    append_bytes(record, key);
    if (op == OP_PUT) {
        append_bytes(record, value);
    }
    return record;
}

bool PersistentDatabase::append_log(const Bytes& records) {
    if (!file_.is_open()) return false;

    file_.write(reinterpret_cast<const char*>(records.data()),
                static_cast<std::streamsize>(records.size()));
    file_.flush();
    return file_.good();
}

bool PersistentDatabase::put(const Bytes& key, const Bytes& value) {
    std::unique_lock lock(mutex_);
    if (!append_log(encode_record(OP_PUT, key, value))) return false;
    data_[key] = value;
    return true;
}

std::optional<Bytes> PersistentDatabase::get(const Bytes& key) {
    std::shared_lock lock(mutex_);
    auto it = data_.find(key);
    if (it != data_.end()) return it->second;
    return std::nullopt;
}

bool PersistentDatabase::del(const Bytes& key) {
    std::unique_lock lock(mutex_);
    if (data_.find(key) == data_.end()) return false;
    if (!append_log(encode_record(OP_DEL, key, {}))) return false;
    data_.erase(key);
    return true;
}

bool PersistentDatabase::exists(const Bytes& key) {
    std::shared_lock lock(mutex_);
    return data_.find(key) != data_.end();
}

bool PersistentDatabase::write_batch(const WriteBatch& batch) {
    std::unique_lock lock(mutex_);

    // One append for the whole batch; the map changes only once it is on disk
    Bytes records;
    for (const auto& [key, value] : batch.puts) {
        auto record = encode_record(OP_PUT, key, value);
        records.insert(records.end(), record.begin(), record.end());
    }
    for (const auto& key : batch.deletes) {
        auto record = encode_record(OP_DEL, key, {});
        records.insert(records.end(), record.begin(), record.end());
    }
    if (!records.empty() && !append_log(records)) return false;

    for (const auto& [key, value] : batch.puts) {
        data_[key] = value;
    }
    for (const auto& key : batch.deletes) {
        data_.erase(key);
    }
    return true;
}

std::vector<std::pair<Bytes, Bytes>> PersistentDatabase::scan(const Bytes& prefix) {
    std::shared_lock lock(mutex_);
    return scan_map(data_, prefix);
}

// ============================================================================
// Helpers
// ============================================================================

Bytes make_key(uint8_t prefix, const Bytes& suffix) {
    Bytes key;
    key.reserve(1 + suffix.size());
    key.push_back(prefix);
    key.insert(key.end(), suffix.begin(), suffix.end());
    return key;
}

Bytes make_key(uint8_t prefix, const Address& addr) {
    Bytes key;
    key.push_back(prefix);
    append_address(key, addr);
    return key;
}

Bytes make_key(uint8_t prefix, const Hash256& hash) {
    Bytes key;
    key.push_back(prefix);
    key.insert(key.end(), hash.begin(), hash.end());
    return key;
}

std::shared_ptr<Database> open_database(const std::string& data_dir, bool persistent) {
    if (!persistent) {
        return std::make_shared<MemoryDatabase>();
    }
    std::string path = data_dir + "/chain.log";
    logging::info("STORAGE", "Opening database at " + path);
    return std::make_shared<PersistentDatabase>(path);
}

} // namespace storage
} // namespace crosslock
