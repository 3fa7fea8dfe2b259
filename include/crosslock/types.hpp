#pragma once

#include <vector>
#include <string>
#include <array>
#include <cstdint>
#include <optional>
#include "crosslock/crypto.hpp"

namespace crosslock {

using Bytes = std::vector<uint8_t>;
using Hash256 = crypto::Blake2b256::HashBytes;
using Secret = std::array<uint8_t, 32>;

// 256-bit word (4 x 64-bit limbs, limb 3 is least significant)
using Word256 = std::array<uint64_t, 4>;

/**
 * @brief Crosslock Address
 *
 * 28-byte credential, either derived from an Ed25519 public key
 * (Enterprise) or from a deterministic deployment (Script).
 * The all-zero Enterprise address names the chain's native asset.
 */
struct Address {
    enum class Type : uint8_t {
        Enterprise = 0x01, // Key-controlled account
        Script = 0x02      // Deployed escrow or factory
    };

    static constexpr size_t SIZE = 28;

    Type type{Type::Enterprise};
    std::array<uint8_t, SIZE> payment_credential{};

    static std::optional<Address> from_hex(const std::string& str);
    static Address from_public_key(const crypto::Ed25519::PublicKey& pk);
    static Address native() { return Address{}; }

    bool is_zero() const;          // Zero credential, any type
    bool is_native() const { return *this == native(); }
    bool operator==(const Address& other) const = default;
    bool operator<(const Address& other) const {
        if (type != other.type) return type < other.type;
        return payment_credential < other.payment_credential;
    }

    // For use as map key
    std::string to_hex() const;
};

/**
 * @brief Journal entry emitted by an escrow or a factory
 */
struct Log {
    uint64_t sequence{0};
    Address address;
    std::vector<Hash256> topics;
    Bytes data;

    Bytes encode() const;
    static std::optional<Log> decode(const Bytes& data);
};

// Event topic: Blake2b-256 of the event signature
Hash256 event_topic(const std::string& signature);

std::string to_hex(const uint8_t* data, size_t len);
std::optional<Bytes> from_hex(const std::string& str);

template <size_t N>
std::string to_hex(const std::array<uint8_t, N>& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

// Big-endian codec helpers shared by all encoders
void append_uint64(Bytes& out, uint64_t v);
void append_uint32(Bytes& out, uint32_t v);
void append_bytes(Bytes& out, const Bytes& b);  // length-prefixed
void append_address(Bytes& out, const Address& addr);
void append_word(Bytes& out, const Word256& w);

/**
 * @brief Bounds-checked big-endian reader
 *
 * Every read returns std::nullopt once the input is exhausted.
 */
class Reader {
public:
    explicit Reader(const Bytes& data) : data_(data) {}

    std::optional<uint8_t> read_uint8();
    std::optional<uint32_t> read_uint32();
    std::optional<uint64_t> read_uint64();
    std::optional<Bytes> read_bytes();  // length-prefixed
    std::optional<Bytes> read_fixed(size_t len);
    std::optional<Address> read_address();
    std::optional<Word256> read_word();
    std::optional<Hash256> read_hash();

    size_t remaining() const { return data_.size() - offset_; }
    Bytes rest();

private:
    const Bytes& data_;
    size_t offset_{0};
};

} // namespace crosslock
