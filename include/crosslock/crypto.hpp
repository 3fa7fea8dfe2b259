#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include <string>

namespace crosslock {
namespace crypto {

/**
 * @brief Blake2b-256 hash implementation
 *
 * Crosslock uses Blake2b-256 for all hashing operations:
 * - Hashlocks (hash of the swap secret)
 * - Immutables digests and deployment salts
 * - Deterministic address derivation
 * - Event topics
 */
class Blake2b256 {
public:
    static constexpr size_t HASH_SIZE = 32;
    using HashBytes = std::array<uint8_t, HASH_SIZE>;

    static HashBytes hash(const uint8_t* data, size_t len);
    static HashBytes hash(const std::vector<uint8_t>& data);
    static HashBytes hash(const std::string& data);
};

/**
 * @brief Ed25519 signature scheme (OpenSSL EVP backend)
 *
 * Used for resolver endorsements of public escrow actions.
 */
class Ed25519 {
public:
    static constexpr size_t PUBLIC_KEY_SIZE = 32;
    static constexpr size_t SECRET_KEY_SIZE = 64;
    static constexpr size_t SIGNATURE_SIZE = 64;
    static constexpr size_t SEED_SIZE = 32;

    using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
    using SecretKey = std::array<uint8_t, SECRET_KEY_SIZE>;  // seed || public key
    using Signature = std::array<uint8_t, SIGNATURE_SIZE>;
    using Seed = std::array<uint8_t, SEED_SIZE>;

    struct KeyPair {
        PublicKey public_key;
        SecretKey secret_key;
    };

    static KeyPair generate_keypair();
    static KeyPair keypair_from_seed(const Seed& seed);
    static Signature sign(const uint8_t* message, size_t len, const SecretKey& sk);
    static bool verify(const uint8_t* message, size_t len, const Signature& sig, const PublicKey& pk);
};

} // namespace crypto
} // namespace crosslock
