#include "crosslock/escrow.hpp"

namespace crosslock {

void EscrowDst::withdraw(const CallContext& ctx, const Secret& secret,
                         const Immutables& immutables) {
    execute("withdraw", [&] {
        check_immutables(immutables);
        check_taker(ctx, immutables);
        check_active();
        check_after(immutables.timelocks.unlock_instant(Stage::DstWithdrawal));
        do_withdraw(ctx, secret, immutables);
    });
}

void EscrowDst::public_withdraw(const CallContext& ctx, const Secret& secret,
                                const Immutables& immutables) {
    execute("public_withdraw", [&] {
        check_immutables(immutables);
        check_capability(ctx, PublicAction::Withdraw);
        check_active();
        check_after(immutables.timelocks.unlock_instant(Stage::DstPublicWithdrawal));
        do_withdraw(ctx, secret, immutables);
    });
}

void EscrowDst::cancel(const CallContext& ctx, const Immutables& immutables) {
    execute("cancel", [&] {
        check_immutables(immutables);
        check_taker(ctx, immutables);
        check_active();
        check_after(immutables.timelocks.unlock_instant(Stage::DstCancellation));

        // The resolver funded this leg, so the value goes back to it
        pay(immutables.token, immutables.taker, immutables.amount);
        pay_safety_deposit(ctx.caller, immutables.safety_deposit);
        finish_cancellation();
    });
}

void EscrowDst::do_withdraw(const CallContext& ctx, const Secret& secret,
                            const Immutables& immutables) {
    check_before(immutables.timelocks.unlock_instant(Stage::DstCancellation));
    check_secret(secret, immutables);

    pay(immutables.token, immutables.maker, immutables.amount);
    pay_safety_deposit(ctx.caller, immutables.safety_deposit);
    finish_withdrawal(secret);
}

} // namespace crosslock
