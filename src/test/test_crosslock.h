#pragma once

#include "crosslock/chain.hpp"
#include "crosslock/errors.hpp"

#include <boost/test/unit_test.hpp>

#include <memory>

namespace crosslock {
namespace test {

constexpr uint64_t T0 = 1700000000;

inline crypto::Ed25519::KeyPair test_keypair(uint8_t tag) {
    crypto::Ed25519::Seed seed;
    seed.fill(tag);
    return crypto::Ed25519::keypair_from_seed(seed);
}

inline Address test_account(uint8_t tag) {
    return Address::from_public_key(test_keypair(tag).public_key);
}

inline Secret test_secret(uint8_t fill = 0x42) {
    Secret s;
    s.fill(fill);
    return s;
}

inline Hash256 hashlock_of(const Secret& secret) {
    return crypto::Blake2b256::hash(secret.data(), secret.size());
}

inline CallContext as(const Address& caller) {
    return CallContext::from(caller);
}

/** Memory database whose batch writes fail while `fail_batches` is set */
struct FlakyDatabase : public storage::MemoryDatabase {
    bool fail_batches{false};

    bool write_batch(const WriteBatch& batch) override {
        if (fail_batches) return false;
        return MemoryDatabase::write_batch(batch);
    }
};

} // namespace test
} // namespace crosslock

// Passes when `expr` throws crosslock::Error carrying `error_code`
#define CHECK_REJECTED(expr, error_code)                                         \
    BOOST_CHECK_EXCEPTION(expr, ::crosslock::Error,                              \
                          [](const ::crosslock::Error& e) { return e.code() == (error_code); })

/** Quiet logging for the duration of a test */
struct BasicTestingSetup {
    BasicTestingSetup() { crosslock::logging::set_level(crosslock::logging::Level::Off); }
    ~BasicTestingSetup() { crosslock::logging::set_level(crosslock::logging::Level::Info); }
};

/**
 * Two in-memory chains sharing one manual clock, with a funded maker on the
 * source chain and a funded, whitelisted resolver on both.
 *
 * Source leg created at T0 by fill_source():
 *   withdrawal T0, public withdrawal T0, cancellation T0+3600,
 *   public cancellation T0+3660
 * Destination leg created at T0 by create_destination():
 *   withdrawal T0+300, public withdrawal T0+360, cancellation T0+3600
 */
struct SwapTestingSetup : public BasicTestingSetup {
    std::shared_ptr<crosslock::ManualClock> clock;

    crosslock::crypto::Ed25519::KeyPair resolver_key;
    crosslock::Address owner;
    crosslock::Address maker;
    crosslock::Address resolver;
    crosslock::Address order_protocol;
    crosslock::Address keeper;
    crosslock::Address stranger;

    crosslock::Address native;
    crosslock::Address access_token;
    crosslock::Address src_token;
    crosslock::Address dst_token;

    std::shared_ptr<crosslock::test::FlakyDatabase> src_db;
    std::shared_ptr<crosslock::test::FlakyDatabase> dst_db;
    std::unique_ptr<crosslock::Chain> src;
    std::unique_ptr<crosslock::Chain> dst;

    crosslock::Secret secret;
    crosslock::Hash256 hashlock;

    SwapTestingSetup();

    crosslock::ChainConfig make_config(const std::string& name, uint64_t chain_id) const;

    crosslock::Order make_order(uint64_t making = 100, uint64_t taking = 95) const;
    crosslock::ExtraData make_extra(uint64_t src_deposit = 1, uint64_t dst_deposit = 1) const;

    // Pre-funds the source safety deposit and runs the fill callback
    crosslock::Immutables fill_source(uint64_t amount = 100, uint64_t deposit = 1);

    crosslock::DstImmutablesComplement make_complement() const;

    // Deploys the destination leg now; returns the stamped Immutables
    crosslock::Immutables create_destination(const crosslock::Immutables& src_immutables);

    std::shared_ptr<crosslock::EscrowSrc> src_escrow() const;
    std::shared_ptr<crosslock::EscrowDst> dst_escrow() const;
};

inline SwapTestingSetup::SwapTestingSetup()
    : clock(std::make_shared<crosslock::ManualClock>(crosslock::test::T0)),
      resolver_key(crosslock::test::test_keypair(0x03)) {
    using namespace crosslock;
    using namespace crosslock::test;

    owner = test_account(0x01);
    maker = test_account(0x02);
    resolver = Address::from_public_key(resolver_key.public_key);
    order_protocol = test_account(0x04);
    keeper = test_account(0x05);
    stranger = test_account(0x06);

    native = Address::native();
    access_token = ProxyAddressing::deployed_by(owner, 1);
    src_token = ProxyAddressing::deployed_by(owner, 2);
    dst_token = ProxyAddressing::deployed_by(owner, 3);

    src_db = std::make_shared<FlakyDatabase>();
    dst_db = std::make_shared<FlakyDatabase>();
    src = std::make_unique<Chain>(make_config("source", 1), clock, src_db);
    dst = std::make_unique<Chain>(make_config("destination", 2), clock, dst_db);

    src->ledger()->mint(src_token, maker, 1000);
    src->ledger()->approve(src_token, maker, src->factory()->address(), 1000);
    src->ledger()->mint(native, resolver, 10);

    dst->ledger()->mint(dst_token, resolver, 1000);
    dst->ledger()->approve(dst_token, resolver, dst->factory()->address(), 1000);
    dst->ledger()->mint(native, resolver, 10);

    src->factory()->add_resolver(as(owner), resolver);
    dst->factory()->add_resolver(as(owner), resolver);

    secret = test_secret();
    hashlock = hashlock_of(secret);
}

inline crosslock::ChainConfig SwapTestingSetup::make_config(const std::string& name,
                                                            uint64_t chain_id) const {
    crosslock::ChainConfig config;
    config.name = name;
    config.chain_id = chain_id;
    config.persistent = false;
    config.factory.owner = owner;
    config.factory.order_protocol = order_protocol;
    config.factory.access_token = access_token;
    config.log_level = crosslock::logging::Level::Off;
    return config;
}

inline crosslock::Order SwapTestingSetup::make_order(uint64_t making, uint64_t taking) const {
    crosslock::Order order;
    order.salt = 7;
    order.maker = maker;
    order.maker_asset = src_token;
    order.taker_asset = dst_token;
    order.making_amount = making;
    order.taking_amount = taking;
    return order;
}

inline crosslock::ExtraData SwapTestingSetup::make_extra(uint64_t src_deposit,
                                                         uint64_t dst_deposit) const {
    crosslock::ExtraData extra;
    extra.hashlock = hashlock;
    extra.dst_chain_id = 2;
    extra.dst_token = dst_token;
    extra.src_safety_deposit = src_deposit;
    extra.dst_safety_deposit = dst_deposit;
    extra.src_cancellation_timestamp = clock->now() + 3600;
    extra.dst_withdrawal_timestamp = clock->now() + 300;
    return extra;
}

inline crosslock::Immutables SwapTestingSetup::fill_source(uint64_t amount, uint64_t deposit) {
    using namespace crosslock::test;

    auto order = make_order(amount, 95);
    auto extra = make_extra(deposit, 1);
    auto plan = src->factory()->plan_fill(order, resolver, amount, 95, extra, clock->now());

    src->ledger()->transfer(native, resolver, plan.escrow, deposit);
    src->factory()->on_fill_completed(as(order_protocol), order, resolver, amount, 95,
                                      extra.encode());
    return plan.immutables;
}

inline crosslock::DstImmutablesComplement SwapTestingSetup::make_complement() const {
    crosslock::DstImmutablesComplement complement;
    complement.maker = maker;
    complement.amount = 95;
    complement.token = dst_token;
    complement.safety_deposit = 1;
    complement.chain_id = 2;
    return complement;
}

inline crosslock::Immutables SwapTestingSetup::create_destination(
    const crosslock::Immutables& src_immutables) {
    using namespace crosslock;
    using namespace crosslock::test;

    auto immutables = destination_immutables(src_immutables, make_complement(), resolver);
    dst->factory()->create_dst_escrow(as(resolver), immutables,
                                      src_immutables.timelocks.unlock_instant(Stage::SrcCancellation),
                                      immutables.safety_deposit);
    immutables.timelocks = immutables.timelocks.with_deployed_at(
        static_cast<uint32_t>(clock->now()));
    return immutables;
}

inline std::shared_ptr<crosslock::EscrowSrc> SwapTestingSetup::src_escrow() const {
    auto address = src->factory()->escrow_for(hashlock);
    BOOST_REQUIRE(address.has_value());
    return std::dynamic_pointer_cast<crosslock::EscrowSrc>(src->factory()->escrow_at(*address));
}

inline std::shared_ptr<crosslock::EscrowDst> SwapTestingSetup::dst_escrow() const {
    auto address = dst->factory()->escrow_for(hashlock);
    BOOST_REQUIRE(address.has_value());
    return std::dynamic_pointer_cast<crosslock::EscrowDst>(dst->factory()->escrow_at(*address));
}
