#include "crosslock/factory.hpp"
#include "test/test_crosslock.h"

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace crosslock;
using crosslock::test::T0;
using crosslock::test::as;

BOOST_FIXTURE_TEST_SUITE(factory_tests, SwapTestingSetup)

BOOST_AUTO_TEST_CASE(source_address_is_predicted_before_deployment)
{
    auto order = make_order();
    auto extra = make_extra();
    auto plan = src->factory()->plan_fill(order, resolver, 100, 95, extra, clock->now());

    BOOST_CHECK(plan.escrow == src->factory()->predict_address(plan.immutables, EscrowRole::Source));
    BOOST_CHECK(plan.escrow.type == Address::Type::Script);
    BOOST_CHECK_EQUAL(plan.immutables.timelocks.deployed_at(), T0);

    auto im = fill_source();
    BOOST_CHECK(im == plan.immutables);

    auto deployed = src->factory()->escrow_for(hashlock);
    BOOST_REQUIRE(deployed);
    BOOST_CHECK(*deployed == plan.escrow);
    BOOST_CHECK_EQUAL(src->factory()->escrow_count(), 1u);
}

BOOST_AUTO_TEST_CASE(fill_derives_timelocks_and_complement)
{
    auto order = make_order();
    order.receiver = stranger;
    auto extra = make_extra(2, 3);
    auto plan = src->factory()->plan_fill(order, resolver, 100, 95, extra, clock->now());

    const auto& tl = plan.immutables.timelocks;
    BOOST_CHECK_EQUAL(tl.unlock_instant(Stage::SrcWithdrawal), T0);
    BOOST_CHECK_EQUAL(tl.unlock_instant(Stage::SrcPublicWithdrawal), T0);
    BOOST_CHECK_EQUAL(tl.unlock_instant(Stage::SrcCancellation), T0 + 3600);
    BOOST_CHECK_EQUAL(tl.unlock_instant(Stage::SrcPublicCancellation), T0 + 3660);
    BOOST_CHECK_EQUAL(tl.unlock_instant(Stage::DstWithdrawal), T0 + 300);
    BOOST_CHECK_EQUAL(tl.unlock_instant(Stage::DstPublicWithdrawal), T0 + 360);
    BOOST_CHECK_EQUAL(tl.unlock_instant(Stage::DstCancellation), T0 + 3600);
    BOOST_CHECK(tl.is_well_ordered());

    BOOST_CHECK(plan.immutables.maker == maker);
    BOOST_CHECK(plan.immutables.taker == resolver);
    BOOST_CHECK(plan.immutables.token == src_token);
    BOOST_CHECK_EQUAL(plan.immutables.safety_deposit, 2u);

    // Receiver set: it takes the destination funds
    BOOST_CHECK(plan.complement.maker == stranger);
    BOOST_CHECK_EQUAL(plan.complement.amount, 95u);
    BOOST_CHECK(plan.complement.token == dst_token);
    BOOST_CHECK_EQUAL(plan.complement.safety_deposit, 3u);
    BOOST_CHECK_EQUAL(plan.complement.chain_id, 2u);
}

BOOST_AUTO_TEST_CASE(fill_journals_source_creation)
{
    auto im = fill_source();

    auto created = src->journal()->with_topic(events::SRC_ESCROW_CREATED);
    BOOST_REQUIRE_EQUAL(created.size(), 1u);
    BOOST_CHECK(created[0].address == src->factory()->address());

    Reader reader(created[0].data);
    auto im_bytes = reader.read_bytes();
    auto complement_bytes = reader.read_bytes();
    BOOST_REQUIRE(im_bytes && complement_bytes);

    auto decoded = Immutables::decode(*im_bytes);
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(*decoded == im);

    auto complement = DstImmutablesComplement::decode(*complement_bytes);
    BOOST_REQUIRE(complement);
    BOOST_CHECK(*complement == make_complement());
}

BOOST_AUTO_TEST_CASE(both_chains_agree_on_destination_address)
{
    auto src_im = fill_source();
    auto dst_im = destination_immutables(src_im, make_complement(), resolver);
    dst_im.timelocks = dst_im.timelocks.with_deployed_at(static_cast<uint32_t>(T0));

    // Configured alike, so the source side can predict the destination leg
    auto predicted = src->factory()->predict_address(dst_im, EscrowRole::Destination);
    BOOST_CHECK(predicted == dst->factory()->predict_address(dst_im, EscrowRole::Destination));
    BOOST_CHECK(predicted != src->factory()->predict_address(dst_im, EscrowRole::Source));

    create_destination(src_im);
    auto deployed = dst->factory()->escrow_for(hashlock);
    BOOST_REQUIRE(deployed);
    BOOST_CHECK(*deployed == predicted);

    auto created = dst->journal()->with_topic(events::DST_ESCROW_CREATED);
    BOOST_REQUIRE_EQUAL(created.size(), 1u);
    Reader reader(created[0].data);
    auto escrow = reader.read_address();
    auto logged_hashlock = reader.read_hash();
    auto taker = reader.read_address();
    BOOST_REQUIRE(escrow && logged_hashlock && taker);
    BOOST_CHECK(*escrow == predicted);
    BOOST_CHECK(*logged_hashlock == hashlock);
    BOOST_CHECK(*taker == resolver);
}

BOOST_AUTO_TEST_CASE(duplicate_hashlock_is_rejected_without_value_movement)
{
    auto src_im = fill_source();
    create_destination(src_im);

    auto im = destination_immutables(src_im, make_complement(), resolver);
    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1),
                   ErrorCode::EscrowAlreadyExists);
    BOOST_CHECK_EQUAL(dst->balance_of(dst_token, resolver), 905u);
    BOOST_CHECK_EQUAL(dst->balance_of(native, resolver), 9u);

    // Reusing the hashlock on the source chain
    CHECK_REJECTED(src->factory()->on_fill_completed(as(order_protocol), make_order(), resolver,
                                                     100, 95, make_extra().encode()),
                   ErrorCode::EscrowAlreadyExists);
    BOOST_CHECK_EQUAL(src->balance_of(src_token, maker), 900u);
    BOOST_CHECK_EQUAL(src->factory()->escrow_count(), 1u);
}

BOOST_AUTO_TEST_CASE(only_order_protocol_fills)
{
    CHECK_REJECTED(src->factory()->on_fill_completed(as(resolver), make_order(), resolver,
                                                     100, 95, make_extra().encode()),
                   ErrorCode::OnlyOrderProtocol);
    BOOST_CHECK_EQUAL(src->factory()->escrow_count(), 0u);
}

BOOST_AUTO_TEST_CASE(fill_requires_prefunded_deposit)
{
    CHECK_REJECTED(src->factory()->on_fill_completed(as(order_protocol), make_order(), resolver,
                                                     100, 95, make_extra().encode()),
                   ErrorCode::InsufficientEscrowBalance);

    // The maker transfer was rolled back with the failed creation
    BOOST_CHECK_EQUAL(src->balance_of(src_token, maker), 1000u);
    BOOST_CHECK_EQUAL(src->ledger()->allowance(src_token, maker, src->factory()->address()), 1000u);
    BOOST_CHECK(!src->factory()->escrow_for(hashlock));
}

BOOST_AUTO_TEST_CASE(fill_rejects_malformed_extra_data)
{
    auto encoded = make_extra().encode();
    encoded.resize(ExtraData::FIXED_SIZE - 1);
    CHECK_REJECTED(src->factory()->on_fill_completed(as(order_protocol), make_order(), resolver,
                                                     100, 95, encoded),
                   ErrorCode::InvalidExtraData);
}

BOOST_AUTO_TEST_CASE(fill_rejects_stale_or_misordered_timestamps)
{
    auto extra = make_extra();
    extra.src_cancellation_timestamp = T0;
    CHECK_REJECTED(src->factory()->on_fill_completed(as(order_protocol), make_order(), resolver,
                                                     100, 95, extra.encode()),
                   ErrorCode::InvalidCreationTime);

    // Destination withdrawal after the shared cancellation instant
    extra = make_extra();
    extra.dst_withdrawal_timestamp = T0 + 4000;
    CHECK_REJECTED(src->factory()->on_fill_completed(as(order_protocol), make_order(), resolver,
                                                     100, 95, extra.encode()),
                   ErrorCode::InvalidTimelocks);
}

BOOST_AUTO_TEST_CASE(paused_factory_stops_creation_only)
{
    auto src_im = fill_source();
    auto escrow = src_escrow();

    CHECK_REJECTED(src->factory()->set_paused(as(stranger), true), ErrorCode::OnlyOwner);
    src->factory()->set_paused(as(owner), true);
    dst->factory()->set_paused(as(owner), true);

    auto im = destination_immutables(src_im, make_complement(), resolver);
    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1),
                   ErrorCode::Paused);

    // Deployed escrows keep working
    escrow->withdraw(as(resolver), secret, src_im);
    BOOST_CHECK(escrow->state() == EscrowState::Withdrawn);

    dst->factory()->set_paused(as(owner), false);
    create_destination(src_im);
    BOOST_CHECK_EQUAL(dst->factory()->escrow_count(), 1u);
}

BOOST_AUTO_TEST_CASE(creation_requires_whitelisted_resolver)
{
    auto src_im = fill_source();

    CHECK_REJECTED(dst->factory()->add_resolver(as(resolver), stranger), ErrorCode::OnlyOwner);
    dst->factory()->remove_resolver(as(owner), resolver);

    auto im = destination_immutables(src_im, make_complement(), resolver);
    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1),
                   ErrorCode::NotWhitelisted);

    CHECK_REJECTED(dst->factory()->set_whitelist_bypass(as(stranger), true), ErrorCode::OnlyOwner);
    dst->factory()->set_whitelist_bypass(as(owner), true);
    dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1);
    BOOST_CHECK(dst->factory()->escrow_for(hashlock));
}

BOOST_AUTO_TEST_CASE(unlisted_taker_cannot_receive_fill)
{
    src->factory()->remove_resolver(as(owner), resolver);
    CHECK_REJECTED(src->factory()->on_fill_completed(as(order_protocol), make_order(), resolver,
                                                     100, 95, make_extra().encode()),
                   ErrorCode::NotWhitelisted);
}

BOOST_AUTO_TEST_CASE(dst_cancellation_must_not_outlast_source)
{
    auto src_im = fill_source();
    auto im = destination_immutables(src_im, make_complement(), resolver);

    // A second later, the destination would become cancellable after the source
    clock->advance(1);
    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1),
                   ErrorCode::InvalidCreationTime);
    BOOST_CHECK_EQUAL(dst->balance_of(dst_token, resolver), 1000u);

    // The resolver shortens the destination window instead
    auto offsets = im.timelocks.offsets();
    offsets[static_cast<size_t>(Stage::DstCancellation)] -= 1;
    im.timelocks = Timelocks::pack(offsets);
    dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1);
    BOOST_CHECK(dst->factory()->escrow_for(hashlock));
}

BOOST_AUTO_TEST_CASE(dst_rejects_misordered_timelocks)
{
    auto src_im = fill_source();
    auto im = destination_immutables(src_im, make_complement(), resolver);

    auto offsets = im.timelocks.offsets();
    offsets[static_cast<size_t>(Stage::DstPublicWithdrawal)] = 10;
    im.timelocks = Timelocks::pack(offsets);
    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1),
                   ErrorCode::InvalidTimelocks);
}

BOOST_AUTO_TEST_CASE(dst_native_value_must_match)
{
    auto src_im = fill_source();
    auto im = destination_immutables(src_im, make_complement(), resolver);

    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 0),
                   ErrorCode::InsufficientEscrowBalance);
    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 2),
                   ErrorCode::InsufficientEscrowBalance);
    BOOST_CHECK_EQUAL(dst->balance_of(native, resolver), 10u);
    BOOST_CHECK(!dst->factory()->escrow_for(hashlock));
}

BOOST_AUTO_TEST_CASE(native_token_destination)
{
    auto src_im = fill_source();
    auto complement = make_complement();
    complement.token = native;
    complement.amount = 5;
    auto im = destination_immutables(src_im, complement, resolver);

    // Amount plus deposit travel as native value
    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1),
                   ErrorCode::InsufficientEscrowBalance);
    auto address = dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 6);

    BOOST_CHECK_EQUAL(dst->balance_of(native, address), 6u);
    BOOST_CHECK_EQUAL(dst->balance_of(native, resolver), 4u);
    BOOST_CHECK_EQUAL(dst->balance_of(dst_token, resolver), 1000u);

    im.timelocks = im.timelocks.with_deployed_at(static_cast<uint32_t>(T0));
    clock->set(T0 + 300);
    dst_escrow()->withdraw(as(resolver), secret, im);
    BOOST_CHECK_EQUAL(dst->balance_of(native, maker), 5u);
    BOOST_CHECK_EQUAL(dst->balance_of(native, resolver), 5u);
}

BOOST_AUTO_TEST_CASE(native_amount_and_deposit_must_not_wrap)
{
    auto src_im = fill_source();
    auto complement = make_complement();
    complement.token = native;
    complement.amount = 95;
    complement.safety_deposit = std::numeric_limits<uint64_t>::max() - 93;
    auto im = destination_immutables(src_im, complement, resolver);

    // 95 + (2^64 - 94) would wrap to 1
    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1),
                   ErrorCode::InsufficientEscrowBalance);
    BOOST_CHECK_EQUAL(dst->balance_of(native, resolver), 10u);
    BOOST_CHECK(!dst->factory()->escrow_for(hashlock));

    // Same on the source side with a native maker asset
    auto order = make_order();
    order.maker_asset = native;
    auto extra = make_extra(std::numeric_limits<uint64_t>::max() - 99);
    extra.hashlock = test::hashlock_of(test::test_secret(0x44));
    CHECK_REJECTED(src->factory()->on_fill_completed(as(order_protocol), order, resolver,
                                                     100, 95, extra.encode()),
                   ErrorCode::InsufficientEscrowBalance);
    BOOST_CHECK_EQUAL(src->factory()->escrow_count(), 1u);
}

BOOST_AUTO_TEST_CASE(script_typed_zero_token_is_not_native)
{
    Address script_zero;
    script_zero.type = Address::Type::Script;
    BOOST_CHECK(script_zero.is_zero());
    BOOST_CHECK(!script_zero.is_native());
    BOOST_CHECK(native.is_native());

    auto src_im = fill_source();
    auto complement = make_complement();
    complement.token = script_zero;
    complement.amount = 5;
    auto im = destination_immutables(src_im, complement, resolver);

    // Treated as an ordinary token: only the deposit travels as native value
    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 6),
                   ErrorCode::InsufficientEscrowBalance);
    CHECK_REJECTED(dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1),
                   ErrorCode::InsufficientAllowance);
    BOOST_CHECK_EQUAL(dst->balance_of(native, resolver), 10u);

    dst->ledger()->mint(script_zero, resolver, 5);
    dst->ledger()->approve(script_zero, resolver, dst->factory()->address(), 5);
    auto address = dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1);
    BOOST_CHECK_EQUAL(dst->balance_of(script_zero, address), 5u);
    BOOST_CHECK_EQUAL(dst->balance_of(native, address), 1u);

    im.timelocks = im.timelocks.with_deployed_at(static_cast<uint32_t>(T0));
    clock->set(T0 + 300);
    dst_escrow()->withdraw(as(resolver), secret, im);
    BOOST_CHECK_EQUAL(dst->balance_of(script_zero, maker), 5u);
    BOOST_CHECK_EQUAL(dst->balance_of(native, maker), 0u);
}

BOOST_AUTO_TEST_CASE(failed_creation_write_leaves_hashlock_free)
{
    auto order = make_order();
    auto extra = make_extra();
    auto plan = src->factory()->plan_fill(order, resolver, 100, 95, extra, clock->now());
    src->ledger()->transfer(native, resolver, plan.escrow, 1);

    src_db->fail_batches = true;
    BOOST_CHECK_THROW(src->factory()->on_fill_completed(as(order_protocol), order, resolver,
                                                        100, 95, extra.encode()),
                      std::runtime_error);

    BOOST_CHECK_EQUAL(src->balance_of(src_token, maker), 1000u);
    BOOST_CHECK_EQUAL(src->balance_of(src_token, plan.escrow), 0u);
    BOOST_CHECK_EQUAL(src->ledger()->allowance(src_token, maker, src->factory()->address()), 1000u);
    BOOST_CHECK(!src->factory()->escrow_for(hashlock));
    BOOST_CHECK_EQUAL(src->factory()->escrow_count(), 0u);
    BOOST_CHECK(src->journal()->with_topic(events::SRC_ESCROW_CREATED).empty());
    CHECK_REJECTED(src->factory()->escrow_at(plan.escrow), ErrorCode::UnknownEscrow);

    // The same fill goes through once storage recovers
    src_db->fail_batches = false;
    auto address = src->factory()->on_fill_completed(as(order_protocol), order, resolver,
                                                     100, 95, extra.encode());
    BOOST_CHECK(address == plan.escrow);
    BOOST_CHECK_EQUAL(src->balance_of(src_token, address), 100u);
    BOOST_CHECK_EQUAL(src->journal()->with_topic(events::SRC_ESCROW_CREATED).size(), 1u);
}

BOOST_AUTO_TEST_CASE(throwing_subscriber_does_not_split_creation)
{
    size_t seen = 0;
    src->journal()->subscribe([&](const Log&) {
        ++seen;
        throw std::runtime_error("indexer crashed");
    });

    auto im = fill_source();
    BOOST_CHECK_EQUAL(seen, 1u);

    auto deployed = src->factory()->escrow_for(hashlock);
    BOOST_REQUIRE(deployed);
    BOOST_CHECK_EQUAL(src->balance_of(src_token, *deployed), 100u);
    BOOST_CHECK_EQUAL(src->balance_of(src_token, maker), 900u);

    src_escrow()->withdraw(as(resolver), secret, im);
    BOOST_CHECK_EQUAL(src->balance_of(src_token, resolver), 100u);
}

BOOST_AUTO_TEST_CASE(racing_destination_creations_deploy_once)
{
    auto src_im = fill_source();
    auto im = destination_immutables(src_im, make_complement(), resolver);

    std::atomic<int> created{0};
    std::atomic<int> duplicates{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            try {
                dst->factory()->create_dst_escrow(as(resolver), im, T0 + 3600, 1);
                ++created;
            } catch (const Error& e) {
                if (e.code() == ErrorCode::EscrowAlreadyExists) ++duplicates;
            }
        });
    }
    for (auto& thread : threads) thread.join();

    BOOST_CHECK_EQUAL(created.load(), 1);
    BOOST_CHECK_EQUAL(duplicates.load(), 11);
    BOOST_CHECK_EQUAL(dst->factory()->escrow_count(), 1u);
    BOOST_CHECK_EQUAL(dst->journal()->with_topic(events::DST_ESCROW_CREATED).size(), 1u);

    auto deployed = dst->factory()->escrow_for(hashlock);
    BOOST_REQUIRE(deployed);
    BOOST_CHECK_EQUAL(dst->balance_of(dst_token, resolver), 905u);
    BOOST_CHECK_EQUAL(dst->balance_of(dst_token, *deployed), 95u);
    BOOST_CHECK_EQUAL(dst->balance_of(native, resolver), 9u);
    BOOST_CHECK_EQUAL(dst->balance_of(native, *deployed), 1u);
}

BOOST_AUTO_TEST_CASE(unknown_escrow_lookup)
{
    CHECK_REJECTED(src->factory()->escrow_at(stranger), ErrorCode::UnknownEscrow);
    BOOST_CHECK(!src->factory()->escrow_for(hashlock));
}

BOOST_AUTO_TEST_CASE(persistent_chain_reloads_escrows)
{
    auto dir = std::filesystem::temp_directory_path() /
               ("crosslock-reload-" + to_hex(crypto::Ed25519::generate_keypair().public_key).substr(0, 12));
    std::filesystem::remove_all(dir);

    auto config = make_config("source", 1);
    config.persistent = true;
    config.data_dir = dir.string();

    Immutables im;
    Address escrow_address;
    {
        auto chain = std::make_unique<Chain>(config, clock);
        chain->ledger()->mint(src_token, maker, 1000);
        chain->ledger()->approve(src_token, maker, chain->factory()->address(), 1000);
        chain->ledger()->mint(native, resolver, 10);
        chain->factory()->add_resolver(as(owner), resolver);

        auto order = make_order();
        auto extra = make_extra();
        auto plan = chain->factory()->plan_fill(order, resolver, 100, 95, extra, clock->now());
        chain->ledger()->transfer(native, resolver, plan.escrow, 1);
        escrow_address = chain->factory()->on_fill_completed(as(order_protocol), order, resolver,
                                                             100, 95, extra.encode());
        im = plan.immutables;
    }

    {
        auto chain = std::make_unique<Chain>(config, clock);
        BOOST_CHECK_EQUAL(chain->factory()->escrow_count(), 1u);
        BOOST_CHECK(chain->registry()->is_whitelisted(resolver));
        BOOST_CHECK_EQUAL(chain->journal()->with_topic(events::SRC_ESCROW_CREATED).size(), 1u);

        auto escrow = chain->factory()->escrow_at(escrow_address);
        BOOST_CHECK(escrow->role() == EscrowRole::Source);
        BOOST_CHECK(escrow->is_active());
        escrow->withdraw(as(resolver), secret, im);
        BOOST_CHECK_EQUAL(chain->balance_of(src_token, resolver), 100u);
    }

    {
        auto chain = std::make_unique<Chain>(config, clock);
        BOOST_CHECK(chain->factory()->escrow_at(escrow_address)->state() == EscrowState::Withdrawn);
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

BOOST_AUTO_TEST_SUITE_END()
