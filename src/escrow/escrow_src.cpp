#include "crosslock/escrow.hpp"

namespace crosslock {

void EscrowSrc::withdraw(const CallContext& ctx, const Secret& secret,
                         const Immutables& immutables) {
    execute("withdraw", [&] {
        check_immutables(immutables);
        check_taker(ctx, immutables);
        do_withdraw(ctx, secret, ctx.caller, immutables);
    });
}

void EscrowSrc::withdraw_to(const CallContext& ctx, const Secret& secret, const Address& target,
                            const Immutables& immutables) {
    execute("withdraw_to", [&] {
        check_immutables(immutables);
        check_taker(ctx, immutables);
        do_withdraw(ctx, secret, target, immutables);
    });
}

void EscrowSrc::public_withdraw(const CallContext& ctx, const Secret& secret,
                                const Immutables& immutables) {
    execute("public_withdraw", [&] {
        check_immutables(immutables);
        check_capability(ctx, PublicAction::Withdraw);
        check_active();
        check_after(immutables.timelocks.unlock_instant(Stage::SrcPublicWithdrawal));
        check_before(immutables.timelocks.unlock_instant(Stage::SrcCancellation));
        check_secret(secret, immutables);

        pay(immutables.token, immutables.taker, immutables.amount);
        pay_safety_deposit(ctx.caller, immutables.safety_deposit);
        finish_withdrawal(secret);
    });
}

void EscrowSrc::cancel(const CallContext& ctx, const Immutables& immutables) {
    execute("cancel", [&] {
        check_immutables(immutables);
        check_taker(ctx, immutables);
        check_active();
        check_after(immutables.timelocks.unlock_instant(Stage::SrcCancellation));
        do_cancel(ctx, immutables);
    });
}

void EscrowSrc::public_cancel(const CallContext& ctx, const Immutables& immutables) {
    execute("public_cancel", [&] {
        check_immutables(immutables);
        check_capability(ctx, PublicAction::Cancel);
        check_active();
        check_after(immutables.timelocks.unlock_instant(Stage::SrcPublicCancellation));
        do_cancel(ctx, immutables);
    });
}

// Caller and immutables are already checked
void EscrowSrc::do_withdraw(const CallContext& ctx, const Secret& secret, const Address& target,
                            const Immutables& immutables) {
    check_active();
    check_after(immutables.timelocks.unlock_instant(Stage::SrcWithdrawal));
    check_before(immutables.timelocks.unlock_instant(Stage::SrcCancellation));
    check_secret(secret, immutables);

    pay(immutables.token, target, immutables.amount);
    pay_safety_deposit(ctx.caller, immutables.safety_deposit);
    finish_withdrawal(secret);
}

void EscrowSrc::do_cancel(const CallContext& ctx, const Immutables& immutables) {
    pay(immutables.token, immutables.maker, immutables.amount);
    pay_safety_deposit(ctx.caller, immutables.safety_deposit);
    finish_cancellation();
}

} // namespace crosslock
