#pragma once

#include <optional>
#include "crosslock/types.hpp"
#include "crosslock/timelocks.hpp"

namespace crosslock {

/**
 * @brief Frozen parameter record of one escrow
 *
 * The digest of this record is both the deployment salt of the escrow
 * and the commitment every escrow call is checked against.
 */
struct Immutables {
    Hash256 order_hash{};
    Hash256 hashlock{};          // Blake2b256(secret)
    Address maker;
    Address taker;
    Address token;               // Address::native() = native asset
    uint64_t amount{0};
    uint64_t safety_deposit{0};  // Always paid in the native asset
    Timelocks timelocks;
    Bytes parameters;            // Opaque, hashed length-prefixed

    // Canonical encoding, every field fixed-width except the
    // length-prefixed parameters blob
    Bytes encode() const;
    static std::optional<Immutables> decode(const Bytes& data);

    Hash256 hash() const;

    bool operator==(const Immutables& other) const = default;
};

/**
 * @brief Destination-side fields that differ from the source Immutables
 */
struct DstImmutablesComplement {
    Address maker;               // Receives the destination funds
    uint64_t amount{0};
    Address token;
    uint64_t safety_deposit{0};
    uint64_t chain_id{0};
    Bytes parameters;

    Bytes encode() const;
    static std::optional<DstImmutablesComplement> decode(const Bytes& data);

    bool operator==(const DstImmutablesComplement& other) const = default;
};

/**
 * @brief Destination Immutables a resolver submits for a source fill
 *
 * Shares order hash, hashlock and timelock offsets with the source leg;
 * the destination factory stamps its own deployment timestamp.
 */
Immutables destination_immutables(const Immutables& src,
                                  const DstImmutablesComplement& complement,
                                  const Address& resolver);

/**
 * @brief Fixed-layout payload handed over by the order-matching protocol
 *
 * Five 32-byte big-endian words followed by the opaque parameters blob:
 *   hashlock | dst chain id | dst token | packed deposits | packed timelocks
 *   deposits  = (dst safety deposit << 128) | src safety deposit
 *   timelocks = (src cancellation timestamp << 128) | dst withdrawal timestamp
 */
struct ExtraData {
    static constexpr size_t FIXED_SIZE = 5 * 32;

    Hash256 hashlock{};
    uint64_t dst_chain_id{0};
    Address dst_token;
    uint64_t src_safety_deposit{0};
    uint64_t dst_safety_deposit{0};
    uint64_t src_cancellation_timestamp{0};
    uint64_t dst_withdrawal_timestamp{0};
    Bytes parameters;

    Bytes encode() const;

    // Rejects truncated payloads and values wider than 64 bits
    static std::optional<ExtraData> decode(const Bytes& data);
};

} // namespace crosslock
