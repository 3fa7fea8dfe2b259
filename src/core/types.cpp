#include "crosslock/types.hpp"
#include "crosslock/crypto.hpp"
#include <algorithm>

namespace crosslock {

// ============================================================================
// Hex helpers
// ============================================================================

std::string to_hex(const uint8_t* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Bytes> from_hex(const std::string& str) {
    std::string hex = str;
    if (hex.starts_with("0x")) {
        hex = hex.substr(2);
    }
    if (hex.size() % 2 != 0) return std::nullopt;

    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

// ============================================================================
// Address Implementation
// ============================================================================

Address Address::from_public_key(const crypto::Ed25519::PublicKey& pk) {
    Address addr;
    addr.type = Type::Enterprise;

    // Blake2b-224 style truncation of the public key hash
    auto full_hash = crypto::Blake2b256::hash(pk.data(), pk.size());
    std::copy(full_hash.begin(), full_hash.begin() + SIZE, addr.payment_credential.begin());

    return addr;
}

std::optional<Address> Address::from_hex(const std::string& str) {
    auto bytes = crosslock::from_hex(str);
    if (!bytes) return std::nullopt;

    Address addr;
    if (bytes->size() == SIZE + 1) {
        // Type-prefixed form produced by to_hex()
        auto type = (*bytes)[0];
        if (type != static_cast<uint8_t>(Type::Enterprise) &&
            type != static_cast<uint8_t>(Type::Script)) {
            return std::nullopt;
        }
        addr.type = static_cast<Type>(type);
        std::copy(bytes->begin() + 1, bytes->end(), addr.payment_credential.begin());
    } else if (bytes->size() == SIZE) {
        std::copy(bytes->begin(), bytes->end(), addr.payment_credential.begin());
    } else {
        return std::nullopt;
    }
    return addr;
}

bool Address::is_zero() const {
    return std::all_of(payment_credential.begin(), payment_credential.end(),
                       [](uint8_t b) { return b == 0; });
}

std::string Address::to_hex() const {
    uint8_t type_byte = static_cast<uint8_t>(type);
    return "0x" + crosslock::to_hex(&type_byte, 1) + crosslock::to_hex(payment_credential);
}

// ============================================================================
// Codec helpers
// ============================================================================

void append_uint64(Bytes& out, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

void append_uint32(Bytes& out, uint32_t v) {
    for (int i = 3; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

void append_bytes(Bytes& out, const Bytes& b) {
    append_uint64(out, b.size());
    out.insert(out.end(), b.begin(), b.end());
}

void append_address(Bytes& out, const Address& addr) {
    out.push_back(static_cast<uint8_t>(addr.type));
    out.insert(out.end(), addr.payment_credential.begin(), addr.payment_credential.end());
}

void append_word(Bytes& out, const Word256& w) {
    for (uint64_t limb : w) {
        append_uint64(out, limb);
    }
}

std::optional<uint8_t> Reader::read_uint8() {
    if (remaining() < 1) return std::nullopt;
    return data_[offset_++];
}

std::optional<uint32_t> Reader::read_uint32() {
    if (remaining() < 4) return std::nullopt;
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v = (v << 8) | data_[offset_++];
    }
    return v;
}

std::optional<uint64_t> Reader::read_uint64() {
    if (remaining() < 8) return std::nullopt;
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | data_[offset_++];
    }
    return v;
}

std::optional<Bytes> Reader::read_bytes() {
    auto len = read_uint64();
    if (!len || *len > remaining()) return std::nullopt;
    return read_fixed(static_cast<size_t>(*len));
}

std::optional<Bytes> Reader::read_fixed(size_t len) {
    if (remaining() < len) return std::nullopt;
    Bytes out(data_.begin() + offset_, data_.begin() + offset_ + len);
    offset_ += len;
    return out;
}

std::optional<Address> Reader::read_address() {
    auto type = read_uint8();
    if (!type) return std::nullopt;
    if (*type != static_cast<uint8_t>(Address::Type::Enterprise) &&
        *type != static_cast<uint8_t>(Address::Type::Script)) {
        return std::nullopt;
    }
    auto cred = read_fixed(Address::SIZE);
    if (!cred) return std::nullopt;

    Address addr;
    addr.type = static_cast<Address::Type>(*type);
    std::copy(cred->begin(), cred->end(), addr.payment_credential.begin());
    return addr;
}

std::optional<Word256> Reader::read_word() {
    Word256 w{};
    for (auto& limb : w) {
        auto v = read_uint64();
        if (!v) return std::nullopt;
        limb = *v;
    }
    return w;
}

std::optional<Hash256> Reader::read_hash() {
    auto bytes = read_fixed(32);
    if (!bytes) return std::nullopt;
    Hash256 h{};
    std::copy(bytes->begin(), bytes->end(), h.begin());
    return h;
}

Bytes Reader::rest() {
    Bytes out(data_.begin() + offset_, data_.end());
    offset_ = data_.size();
    return out;
}

// ============================================================================
// Log Implementation
// ============================================================================

Hash256 event_topic(const std::string& signature) {
    return crypto::Blake2b256::hash(signature);
}

Bytes Log::encode() const {
    Bytes result;
    append_uint64(result, sequence);
    append_address(result, address);

    result.push_back(static_cast<uint8_t>(topics.size()));
    for (const auto& topic : topics) {
        result.insert(result.end(), topic.begin(), topic.end());
    }

    append_bytes(result, data);
    return result;
}

std::optional<Log> Log::decode(const Bytes& data) {
    Reader reader(data);
    Log log;

    auto sequence = reader.read_uint64();
    auto address = reader.read_address();
    auto topic_count = reader.read_uint8();
    if (!sequence || !address || !topic_count) return std::nullopt;

    log.sequence = *sequence;
    log.address = *address;
    for (uint8_t t = 0; t < *topic_count; ++t) {
        auto topic = reader.read_hash();
        if (!topic) return std::nullopt;
        log.topics.push_back(*topic);
    }

    auto payload = reader.read_bytes();
    if (!payload) return std::nullopt;
    log.data = std::move(*payload);
    return log;
}

} // namespace crosslock
