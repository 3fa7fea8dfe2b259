#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <optional>
#include <vector>
#include "crosslock/chain.hpp"
#include "crosslock/errors.hpp"

using namespace crosslock;

namespace {

constexpr uint64_t GENESIS_TIME = 1700000000;

struct SimOptions {
    ChainConfig src;
    ChainConfig dst;
    std::string scenario{"withdraw"};
    std::string write_config_dir;
};

// Deterministic participant keys
crypto::Ed25519::KeyPair participant(uint8_t tag) {
    crypto::Ed25519::Seed seed;
    seed.fill(tag);
    return crypto::Ed25519::keypair_from_seed(seed);
}

Address account(uint8_t tag) {
    return Address::from_public_key(participant(tag).public_key);
}

struct Participants {
    Address owner = account(0x01);
    Address maker = account(0x02);
    Address resolver = account(0x03);
    Address order_protocol = account(0x04);
    Address keeper = account(0x05);
};

void print_banner() {
    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║                                               ║
    ║     CROSSLOCK  cross-chain atomic swaps       ║
    ║     hash-time-locked escrow simulator         ║
    ║                                               ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  --src-config <path>     Source chain config file\n"
              << "  --dst-config <path>     Destination chain config file\n"
              << "  --scenario <name>       withdraw, cancel or public (default: withdraw)\n"
              << "  --data-dir <path>       Persist both chains under this directory\n"
              << "  --write-config <dir>    Write default configs to <dir> and exit\n"
              << "  --log-level <level>     Log level: trace, debug, info, warn, error, off\n"
              << "  --help                  Show this help message\n"
              << std::endl;
}

SimOptions default_options() {
    Participants p;
    SimOptions options;

    options.src.name = "source";
    options.src.chain_id = 1;
    options.src.data_dir = "./data/source";
    options.dst.name = "destination";
    options.dst.chain_id = 2;
    options.dst.data_dir = "./data/destination";

    // Same owner and access token on both chains, so factory and escrow
    // addresses line up
    for (auto* config : {&options.src, &options.dst}) {
        config->factory.owner = p.owner;
        config->factory.order_protocol = p.order_protocol;
        config->factory.access_token = ProxyAddressing::deployed_by(p.owner, 1);
    }
    return options;
}

SimOptions parse_args(int argc, char* argv[]) {
    SimOptions options = default_options();
    std::optional<logging::Level> level;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "--src-config" && i + 1 < argc) {
            options.src = ChainConfig::from_file(argv[++i]);
        } else if (arg == "--dst-config" && i + 1 < argc) {
            options.dst = ChainConfig::from_file(argv[++i]);
        } else if (arg == "--scenario" && i + 1 < argc) {
            options.scenario = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            std::string dir = argv[++i];
            options.src.data_dir = dir + "/source";
            options.dst.data_dir = dir + "/destination";
            options.src.persistent = true;
            options.dst.persistent = true;
        } else if (arg == "--write-config" && i + 1 < argc) {
            options.write_config_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            level = logging::parse_level(argv[++i]);
            if (!level) {
                std::cerr << "[CROSSLOCK] Unknown log level " << argv[i] << std::endl;
            }
        } else {
            std::cerr << "[CROSSLOCK] Ignoring unknown option " << arg << std::endl;
        }
    }

    if (level) {
        options.src.log_level = *level;
        options.dst.log_level = *level;
    }
    return options;
}

void print_journal(Chain& chain) {
    std::cout << "\n[" << chain.name() << "] journal:" << std::endl;
    for (const auto& log : chain.journal()->since(0)) {
        std::string name = "?";
        if (!log.topics.empty()) {
            const auto& t = log.topics[0];
            if (t == events::SRC_ESCROW_CREATED) name = "SrcEscrowCreated";
            else if (t == events::DST_ESCROW_CREATED) name = "DstEscrowCreated";
            else if (t == events::ESCROW_WITHDRAWAL) name = "EscrowWithdrawal";
            else if (t == events::ESCROW_CANCELLED) name = "EscrowCancelled";
            else if (t == events::FUNDS_RESCUED) name = "FundsRescued";
        }
        std::cout << "  #" << std::setw(3) << log.sequence << "  " << std::left << std::setw(18)
                  << name << std::right << " " << log.address.to_hex() << std::endl;
    }
}

void print_balances(Chain& chain, const Address& token, const std::string& symbol,
                    const std::vector<std::pair<std::string, Address>>& holders) {
    std::cout << "\n[" << chain.name() << "] balances (" << symbol << " / native):" << std::endl;
    for (const auto& [label, holder] : holders) {
        std::cout << "  " << std::left << std::setw(10) << label << std::right
                  << std::setw(8) << chain.balance_of(token, holder)
                  << std::setw(8) << chain.balance_of(Address::native(), holder) << std::endl;
    }
}

// Resolver-side view of the source leg, read back from the journal
Immutables observed_src_immutables(Chain& chain, DstImmutablesComplement& complement) {
    auto entries = chain.journal()->with_topic(events::SRC_ESCROW_CREATED);
    if (entries.empty()) {
        throw std::runtime_error("no source escrow in journal");
    }
    Reader reader(entries.back().data);
    auto immutables_bytes = reader.read_bytes();
    auto complement_bytes = reader.read_bytes();
    if (!immutables_bytes || !complement_bytes) {
        throw std::runtime_error("malformed SrcEscrowCreated entry");
    }
    auto immutables = Immutables::decode(*immutables_bytes);
    auto decoded = DstImmutablesComplement::decode(*complement_bytes);
    if (!immutables || !decoded) {
        throw std::runtime_error("malformed SrcEscrowCreated entry");
    }
    complement = *decoded;
    return *immutables;
}

int run_swap(const SimOptions& options) {
    Participants p;
    auto clock = std::make_shared<ManualClock>(GENESIS_TIME);

    Chain src(options.src, clock);
    Chain dst(options.dst, clock);

    auto src_factory = src.factory();
    auto dst_factory = dst.factory();
    auto owner = CallContext::from(p.owner);
    const Address src_token = ProxyAddressing::deployed_by(p.owner, 2);
    const Address dst_token = ProxyAddressing::deployed_by(p.owner, 3);

    // Genesis balances and approvals
    src.ledger()->mint(src_token, p.maker, 1000);
    src.ledger()->approve(src_token, p.maker, src_factory->address(), 1000);
    src.ledger()->mint(Address::native(), p.resolver, 10);
    dst.ledger()->mint(dst_token, p.resolver, 1000);
    dst.ledger()->approve(dst_token, p.resolver, dst_factory->address(), 1000);
    dst.ledger()->mint(Address::native(), p.resolver, 10);
    src.ledger()->mint(options.src.factory.access_token, p.keeper, 1);
    dst.ledger()->mint(options.dst.factory.access_token, p.keeper, 1);

    src_factory->add_resolver(owner, p.resolver);
    dst_factory->add_resolver(owner, p.resolver);

    // Maker's secret
    Secret secret;
    secret.fill(0x5e);
    Hash256 hashlock = crypto::Blake2b256::hash(secret.data(), secret.size());

    Order order;
    order.salt = 1;
    order.maker = p.maker;
    order.maker_asset = src_token;
    order.taker_asset = dst_token;
    order.making_amount = 100;
    order.taking_amount = 95;

    ExtraData extra;
    extra.hashlock = hashlock;
    extra.dst_chain_id = dst.chain_id();
    extra.dst_token = dst_token;
    extra.src_safety_deposit = 1;
    extra.dst_safety_deposit = 1;
    extra.src_cancellation_timestamp = clock->now() + 3600;
    extra.dst_withdrawal_timestamp = clock->now() + 300;

    // Resolver funds the safety deposit at the predicted source address
    auto plan = src_factory->plan_fill(order, p.resolver, order.making_amount,
                                       order.taking_amount, extra, clock->now());
    src.ledger()->transfer(Address::native(), p.resolver, plan.escrow, extra.src_safety_deposit);

    std::cout << "[CROSSLOCK] Filling order, source escrow " << plan.escrow.to_hex() << std::endl;
    src_factory->on_fill_completed(CallContext::from(p.order_protocol), order, p.resolver,
                                   order.making_amount, order.taking_amount, extra.encode());

    // Resolver mirrors the source leg on the destination chain
    DstImmutablesComplement complement;
    Immutables src_immutables = observed_src_immutables(src, complement);
    Immutables dst_immutables = destination_immutables(src_immutables, complement, p.resolver);

    // Created in the same second as the source leg: the destination
    // cancellation instant may not pass the source one
    dst_factory->create_dst_escrow(CallContext::from(p.resolver), dst_immutables,
                                   src_immutables.timelocks.unlock_instant(Stage::SrcCancellation),
                                   complement.safety_deposit);
    dst_immutables.timelocks = dst_immutables.timelocks.with_deployed_at(
        static_cast<uint32_t>(clock->now()));
    auto dst_escrow = dst_factory->escrow_at(*dst_factory->escrow_for(hashlock));
    auto src_escrow = src_factory->escrow_at(*src_factory->escrow_for(hashlock));

    // Resolver learns the secret from the destination journal
    std::optional<Secret> revealed;
    dst.journal()->subscribe([&](const Log& log) {
        if (!log.topics.empty() && log.topics[0] == events::ESCROW_WITHDRAWAL &&
            log.data.size() == secret.size()) {
            Secret s;
            std::copy(log.data.begin(), log.data.end(), s.begin());
            revealed = s;
        }
    });

    if (options.scenario == "withdraw" || options.scenario == "public") {
        clock->set(dst_immutables.timelocks.unlock_instant(Stage::DstWithdrawal));
        std::cout << "[CROSSLOCK] Maker shares the secret, resolver withdraws on destination" << std::endl;
        dst_escrow->withdraw(CallContext::from(p.resolver), secret, dst_immutables);

        if (!revealed) {
            throw std::runtime_error("secret not observed on destination journal");
        }

        if (options.scenario == "withdraw") {
            src_escrow->withdraw(CallContext::from(p.resolver), *revealed, src_immutables);
        } else {
            std::cout << "[CROSSLOCK] Keeper completes the source leg publicly" << std::endl;
            src_escrow->public_withdraw(CallContext::from(p.keeper), *revealed, src_immutables);
        }
    } else if (options.scenario == "cancel") {
        clock->set(src_immutables.timelocks.unlock_instant(Stage::SrcCancellation));
        std::cout << "[CROSSLOCK] Swap expired, both legs cancel" << std::endl;
        dst_escrow->cancel(CallContext::from(p.resolver), dst_immutables);
        src_escrow->cancel(CallContext::from(p.resolver), src_immutables);
    } else {
        std::cerr << "[CROSSLOCK] Unknown scenario " << options.scenario << std::endl;
        return 1;
    }

    std::cout << "\n[CROSSLOCK] Source escrow: " << state_name(src_escrow->state())
              << ", destination escrow: " << state_name(dst_escrow->state()) << std::endl;

    print_balances(src, src_token, "SRC", {{"maker", p.maker}, {"resolver", p.resolver},
                                           {"keeper", p.keeper}, {"escrow", src_escrow->address()}});
    print_balances(dst, dst_token, "DST", {{"maker", p.maker}, {"resolver", p.resolver},
                                           {"escrow", dst_escrow->address()}});
    print_journal(src);
    print_journal(dst);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    print_banner();

    SimOptions options = parse_args(argc, argv);
    logging::set_level(options.src.log_level);

    try {
        if (!options.write_config_dir.empty()) {
            options.src.save_to_file(options.write_config_dir + "/source.toml");
            options.dst.save_to_file(options.write_config_dir + "/destination.toml");
            std::cout << "[CROSSLOCK] Wrote configs to " << options.write_config_dir << std::endl;
            return 0;
        }

        std::cout << "[CROSSLOCK] Scenario: " << options.scenario << std::endl;
        return run_swap(options);

    } catch (const Error& e) {
        std::cerr << "[CROSSLOCK] Rejected: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[CROSSLOCK] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
