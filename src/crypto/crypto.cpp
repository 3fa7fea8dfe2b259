#include "crosslock/crypto.hpp"
#include <cstring>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace crosslock {
namespace crypto {

// ============================================================================
// Blake2b-256 Implementation (RFC 7693, unkeyed, 32-byte digest)
// ============================================================================

static const uint64_t blake2b_IV[8] = {
    0x6a09e667f3bcc908ULL, 0xbb67ae8584caa73bULL,
    0x3c6ef372fe94f82bULL, 0xa54ff53a5f1d36f1ULL,
    0x510e527fade682d1ULL, 0x9b05688c2b3e6c1fULL,
    0x1f83d9abfb41bd6bULL, 0x5be0cd19137e2179ULL
};

static const uint8_t blake2b_sigma[12][16] = {
    { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15 },
    { 14, 10, 4, 8, 9, 15, 13, 6, 1, 12, 0, 2, 11, 7, 5, 3 },
    { 11, 8, 12, 0, 5, 2, 15, 13, 10, 14, 3, 6, 7, 1, 9, 4 },
    { 7, 9, 3, 1, 13, 12, 11, 14, 2, 6, 5, 10, 4, 0, 15, 8 },
    { 9, 0, 5, 7, 2, 4, 10, 15, 14, 1, 11, 12, 6, 8, 3, 13 },
    { 2, 12, 6, 10, 0, 11, 8, 3, 4, 13, 7, 5, 15, 14, 1, 9 },
    { 12, 5, 1, 15, 14, 13, 4, 10, 0, 7, 6, 3, 9, 2, 8, 11 },
    { 13, 11, 7, 14, 12, 1, 3, 9, 5, 0, 15, 4, 8, 6, 2, 10 },
    { 6, 15, 14, 9, 11, 3, 0, 8, 12, 2, 13, 7, 1, 4, 10, 5 },
    { 10, 2, 8, 4, 7, 6, 1, 5, 15, 11, 9, 14, 3, 12, 13, 0 },
    { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15 },
    { 14, 10, 4, 8, 9, 15, 13, 6, 1, 12, 0, 2, 11, 7, 5, 3 }
};

static inline uint64_t rotr64(uint64_t x, int n) {
    return (x >> n) | (x << (64 - n));
}

static inline uint64_t load64_le(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
    }
    return v;
}

static inline void store64_le(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

static void blake2b_compress(uint64_t h[8], const uint8_t block[128],
                              uint64_t t0, uint64_t t1, bool is_last) {
    uint64_t v[16];
    uint64_t m[16];

    for (int i = 0; i < 8; ++i) {
        v[i] = h[i];
        v[i + 8] = blake2b_IV[i];
    }

    v[12] ^= t0;
    v[13] ^= t1;
    if (is_last) v[14] = ~v[14];

    for (int i = 0; i < 16; ++i) {
        m[i] = load64_le(block + 8 * i);
    }

    #define G(r, i, a, b, c, d) do { \
        a += b + m[blake2b_sigma[r][2*i]]; \
        d = rotr64(d ^ a, 32); \
        c += d; \
        b = rotr64(b ^ c, 24); \
        a += b + m[blake2b_sigma[r][2*i+1]]; \
        d = rotr64(d ^ a, 16); \
        c += d; \
        b = rotr64(b ^ c, 63); \
    } while(0)

    for (int r = 0; r < 12; ++r) {
        G(r, 0, v[0], v[4], v[8],  v[12]);
        G(r, 1, v[1], v[5], v[9],  v[13]);
        G(r, 2, v[2], v[6], v[10], v[14]);
        G(r, 3, v[3], v[7], v[11], v[15]);
        G(r, 4, v[0], v[5], v[10], v[15]);
        G(r, 5, v[1], v[6], v[11], v[12]);
        G(r, 6, v[2], v[7], v[8],  v[13]);
        G(r, 7, v[3], v[4], v[9],  v[14]);
    }

    #undef G

    for (int i = 0; i < 8; ++i) {
        h[i] ^= v[i] ^ v[i + 8];
    }
}

Blake2b256::HashBytes Blake2b256::hash(const uint8_t* data, size_t len) {
    uint64_t h[8];
    for (int i = 0; i < 8; ++i) {
        h[i] = blake2b_IV[i];
    }
    // Parameter block: digest length = 32, key length = 0, fanout = 1, depth = 1
    h[0] ^= 0x01010020;

    uint8_t block[128] = {0};
    uint64_t t = 0;

    while (len > 128) {
        t += 128;
        blake2b_compress(h, data, t, 0, false);
        data += 128;
        len -= 128;
    }

    if (len > 0) {
        std::memcpy(block, data, len);
    }
    t += len;
    blake2b_compress(h, block, t, 0, true);

    HashBytes result;
    for (int i = 0; i < 4; ++i) {
        store64_le(result.data() + 8 * i, h[i]);
    }
    return result;
}

Blake2b256::HashBytes Blake2b256::hash(const std::vector<uint8_t>& data) {
    return hash(data.data(), data.size());
}

Blake2b256::HashBytes Blake2b256::hash(const std::string& data) {
    return hash(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

// ============================================================================
// Ed25519 Implementation
// ============================================================================

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr private_key_from_seed(const uint8_t* seed) {
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              seed, Ed25519::SEED_SIZE));
    if (!pkey) {
        throw std::runtime_error("ed25519: cannot load private key");
    }
    return pkey;
}

} // namespace

Ed25519::KeyPair Ed25519::generate_keypair() {
    Seed seed{};
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
        throw std::runtime_error("ed25519: RAND_bytes failed");
    }
    return keypair_from_seed(seed);
}

Ed25519::KeyPair Ed25519::keypair_from_seed(const Seed& seed) {
    KeyPair kp{};
    auto pkey = private_key_from_seed(seed.data());

    size_t pk_len = kp.public_key.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), kp.public_key.data(), &pk_len) != 1 ||
        pk_len != PUBLIC_KEY_SIZE) {
        throw std::runtime_error("ed25519: cannot derive public key");
    }

    // Secret key layout: seed || public key
    std::copy(seed.begin(), seed.end(), kp.secret_key.begin());
    std::copy(kp.public_key.begin(), kp.public_key.end(),
              kp.secret_key.begin() + SEED_SIZE);
    return kp;
}

Ed25519::Signature Ed25519::sign(const uint8_t* message, size_t len,
                                  const SecretKey& sk) {
    auto pkey = private_key_from_seed(sk.data());
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        throw std::runtime_error("ed25519: sign init failed");
    }

    Signature sig{};
    size_t sig_len = sig.size();
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, message, len) != 1 ||
        sig_len != SIGNATURE_SIZE) {
        throw std::runtime_error("ed25519: sign failed");
    }
    return sig;
}

bool Ed25519::verify(const uint8_t* message, size_t len,
                      const Signature& sig, const PublicKey& pk) {
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             pk.data(), pk.size()));
    if (!pkey) return false;

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), sig.data(), sig.size(), message, len) == 1;
}

} // namespace crypto
} // namespace crosslock
