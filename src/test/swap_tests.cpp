#include "crosslock/chain.hpp"
#include "test/test_crosslock.h"

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <optional>
#include <tuple>

using namespace crosslock;
using crosslock::test::T0;
using crosslock::test::as;

BOOST_FIXTURE_TEST_SUITE(swap_tests, SwapTestingSetup)

BOOST_AUTO_TEST_CASE(swap_completes_once_maker_reveals_secret)
{
    auto src_im = fill_source();
    auto dst_im = create_destination(src_im);

    // The resolver watches the destination journal for the revealed secret
    std::optional<Secret> observed;
    dst->journal()->subscribe([&](const Log& log) {
        if (log.topics.empty() || log.topics.front() != events::ESCROW_WITHDRAWAL) return;
        if (log.data.size() != std::tuple_size<Secret>::value) return;
        Secret s;
        std::copy(log.data.begin(), log.data.end(), s.begin());
        observed = s;
    });

    // Maker releases the destination leg through a keeper holding the access token
    dst->ledger()->mint(access_token, keeper, 1);
    clock->set(T0 + 360);
    dst_escrow()->public_withdraw(as(keeper), secret, dst_im);
    BOOST_REQUIRE(observed);

    src_escrow()->withdraw(as(resolver), *observed, src_im);

    BOOST_CHECK_EQUAL(src->balance_of(src_token, maker), 900u);
    BOOST_CHECK_EQUAL(src->balance_of(src_token, resolver), 100u);
    BOOST_CHECK_EQUAL(src->balance_of(native, resolver), 10u);

    BOOST_CHECK_EQUAL(dst->balance_of(dst_token, maker), 95u);
    BOOST_CHECK_EQUAL(dst->balance_of(dst_token, resolver), 905u);
    BOOST_CHECK_EQUAL(dst->balance_of(native, resolver), 9u);
    BOOST_CHECK_EQUAL(dst->balance_of(native, keeper), 1u);

    BOOST_CHECK(src_escrow()->state() == EscrowState::Withdrawn);
    BOOST_CHECK(dst_escrow()->state() == EscrowState::Withdrawn);
}

BOOST_AUTO_TEST_CASE(unrevealed_swap_unwinds_on_both_chains)
{
    auto src_im = fill_source();
    auto dst_im = create_destination(src_im);

    clock->set(T0 + 3600);
    dst_escrow()->cancel(as(resolver), dst_im);
    src_escrow()->cancel(as(resolver), src_im);

    // Everyone ends where they started
    BOOST_CHECK_EQUAL(src->balance_of(src_token, maker), 1000u);
    BOOST_CHECK_EQUAL(src->balance_of(native, resolver), 10u);
    BOOST_CHECK_EQUAL(dst->balance_of(dst_token, resolver), 1000u);
    BOOST_CHECK_EQUAL(dst->balance_of(native, resolver), 10u);
    BOOST_CHECK_EQUAL(dst->balance_of(dst_token, maker), 0u);

    BOOST_CHECK(src_escrow()->state() == EscrowState::Cancelled);
    BOOST_CHECK(dst_escrow()->state() == EscrowState::Cancelled);
    BOOST_CHECK(dst->journal()->with_topic(events::ESCROW_WITHDRAWAL).empty());
}

BOOST_AUTO_TEST_CASE(keeper_unwinds_source_after_resolver_disappears)
{
    auto src_im = fill_source();
    create_destination(src_im);

    src->ledger()->mint(access_token, keeper, 1);
    clock->set(T0 + 3660);
    src_escrow()->public_cancel(as(keeper), src_im);

    BOOST_CHECK_EQUAL(src->balance_of(src_token, maker), 1000u);
    BOOST_CHECK_EQUAL(src->balance_of(native, keeper), 1u);
    BOOST_CHECK_EQUAL(src->balance_of(native, resolver), 9u);

    // Late destination withdrawal is no longer possible
    auto dst_im = destination_immutables(src_im, make_complement(), resolver);
    dst_im.timelocks = dst_im.timelocks.with_deployed_at(static_cast<uint32_t>(T0));
    CHECK_REJECTED(dst_escrow()->withdraw(as(resolver), secret, dst_im), ErrorCode::InvalidTime);
}

BOOST_AUTO_TEST_SUITE_END()
