#include "crosslock/immutables.hpp"
#include "crosslock/crypto.hpp"

namespace crosslock {

// ============================================================================
// Immutables Implementation
// ============================================================================

Bytes Immutables::encode() const {
    Bytes result;
    result.reserve(32 + 32 + 3 * 29 + 16 + 32 + 8 + parameters.size());

    result.insert(result.end(), order_hash.begin(), order_hash.end());
    result.insert(result.end(), hashlock.begin(), hashlock.end());
    append_address(result, maker);
    append_address(result, taker);
    append_address(result, token);
    append_uint64(result, amount);
    append_uint64(result, safety_deposit);
    append_word(result, timelocks.raw());

    // Length prefix keeps two different trailing blobs from colliding
    append_bytes(result, parameters);
    return result;
}

std::optional<Immutables> Immutables::decode(const Bytes& data) {
    Reader reader(data);
    Immutables im;

    auto order_hash = reader.read_hash();
    auto hashlock = reader.read_hash();
    auto maker = reader.read_address();
    auto taker = reader.read_address();
    auto token = reader.read_address();
    auto amount = reader.read_uint64();
    auto deposit = reader.read_uint64();
    auto timelocks = reader.read_word();
    auto parameters = reader.read_bytes();

    if (!order_hash || !hashlock || !maker || !taker || !token ||
        !amount || !deposit || !timelocks || !parameters) {
        return std::nullopt;
    }
    if (reader.remaining() != 0) return std::nullopt;

    im.order_hash = *order_hash;
    im.hashlock = *hashlock;
    im.maker = *maker;
    im.taker = *taker;
    im.token = *token;
    im.amount = *amount;
    im.safety_deposit = *deposit;
    im.timelocks = Timelocks::from_raw(*timelocks);
    im.parameters = std::move(*parameters);
    return im;
}

Hash256 Immutables::hash() const {
    return crypto::Blake2b256::hash(encode());
}

// ============================================================================
// DstImmutablesComplement Implementation
// ============================================================================

Bytes DstImmutablesComplement::encode() const {
    Bytes result;
    append_address(result, maker);
    append_uint64(result, amount);
    append_address(result, token);
    append_uint64(result, safety_deposit);
    append_uint64(result, chain_id);
    append_bytes(result, parameters);
    return result;
}

std::optional<DstImmutablesComplement> DstImmutablesComplement::decode(const Bytes& data) {
    Reader reader(data);
    DstImmutablesComplement c;

    auto maker = reader.read_address();
    auto amount = reader.read_uint64();
    auto token = reader.read_address();
    auto deposit = reader.read_uint64();
    auto chain_id = reader.read_uint64();
    auto parameters = reader.read_bytes();
    if (!maker || !amount || !token || !deposit || !chain_id || !parameters) {
        return std::nullopt;
    }

    c.maker = *maker;
    c.amount = *amount;
    c.token = *token;
    c.safety_deposit = *deposit;
    c.chain_id = *chain_id;
    c.parameters = std::move(*parameters);
    return c;
}

Immutables destination_immutables(const Immutables& src,
                                  const DstImmutablesComplement& complement,
                                  const Address& resolver) {
    Immutables dst;
    dst.order_hash = src.order_hash;
    dst.hashlock = src.hashlock;
    dst.maker = complement.maker;
    dst.taker = resolver;
    dst.token = complement.token;
    dst.amount = complement.amount;
    dst.safety_deposit = complement.safety_deposit;
    dst.timelocks = src.timelocks.with_deployed_at(0);
    dst.parameters = complement.parameters;
    return dst;
}

// ============================================================================
// ExtraData Implementation
// ============================================================================

namespace {

void append_u64_word(Bytes& out, uint64_t v) {
    out.insert(out.end(), 24, 0);
    append_uint64(out, v);
}

// (high << 128) | low, each half 128 bits wide
void append_packed_pair(Bytes& out, uint64_t high, uint64_t low) {
    append_word(out, Word256{0, high, 0, low});
}

} // namespace

Bytes ExtraData::encode() const {
    Bytes result;
    result.reserve(FIXED_SIZE + parameters.size());

    result.insert(result.end(), hashlock.begin(), hashlock.end());
    append_u64_word(result, dst_chain_id);

    // Address word: 3 zero bytes, type byte, 28-byte credential
    result.insert(result.end(), 3, 0);
    append_address(result, dst_token);

    append_packed_pair(result, dst_safety_deposit, src_safety_deposit);
    append_packed_pair(result, src_cancellation_timestamp, dst_withdrawal_timestamp);

    result.insert(result.end(), parameters.begin(), parameters.end());
    return result;
}

std::optional<ExtraData> ExtraData::decode(const Bytes& data) {
    if (data.size() < FIXED_SIZE) return std::nullopt;

    Reader reader(data);
    ExtraData extra;

    auto hashlock = reader.read_hash();
    auto chain_id = reader.read_word();
    auto padding = reader.read_fixed(3);
    auto token = reader.read_address();
    auto deposits = reader.read_word();
    auto timelocks = reader.read_word();
    if (!hashlock || !chain_id || !padding || !token || !deposits || !timelocks) {
        return std::nullopt;
    }

    // Every value must fit 64 bits
    if ((*chain_id)[0] != 0 || (*chain_id)[1] != 0 || (*chain_id)[2] != 0) return std::nullopt;
    for (uint8_t b : *padding) {
        if (b != 0) return std::nullopt;
    }
    if ((*deposits)[0] != 0 || (*deposits)[2] != 0) return std::nullopt;
    if ((*timelocks)[0] != 0 || (*timelocks)[2] != 0) return std::nullopt;

    extra.hashlock = *hashlock;
    extra.dst_chain_id = (*chain_id)[3];
    extra.dst_token = *token;
    extra.dst_safety_deposit = (*deposits)[1];
    extra.src_safety_deposit = (*deposits)[3];
    extra.src_cancellation_timestamp = (*timelocks)[1];
    extra.dst_withdrawal_timestamp = (*timelocks)[3];
    extra.parameters = reader.rest();
    return extra;
}

} // namespace crosslock
